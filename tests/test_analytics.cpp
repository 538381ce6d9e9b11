#include "test_env.hpp"

#include "../src/analytics.hpp"

#include <ctime>

namespace {
// Local noon `days_ago` days back, so the local calendar day is unambiguous.
double LocalNoon(int days_ago) {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    tm.tm_mday -= days_ago;
    tm.tm_hour = 12;
    tm.tm_min = 0;
    tm.tm_sec = 0;
    tm.tm_isdst = -1;
    return static_cast<double>(std::mktime(&tm));
}
} // namespace

class AnalyticsTest : public StoreTest {
  protected:
    void SetUp() override {
        StoreTest::SetUp();
        m_Analytics = std::make_unique<Analytics>(*m_Db);
    }

    void TearDown() override {
        m_Analytics.reset();
        StoreTest::TearDown();
    }

    void LogAt(double when, const std::string &subject, int minutes) {
        auto stmt = m_Db->Prepare("INSERT INTO study_logs (owner_id, subject, duration_minutes, "
                                  "notes, logged_at) VALUES (?, ?, ?, '', ?)");
        stmt.Bind(1, Owner()).Bind(2, subject).Bind(3, minutes).Bind(4, when);
        stmt.Run();
    }

    std::unique_ptr<Analytics> m_Analytics;
};

// ─────────────────────────────────────
TEST(StreakTest, ConsecutiveDaysEndingToday) {
    EXPECT_EQ(Analytics::ComputeStreak({"2024-03-10", "2024-03-09", "2024-03-08"}, "2024-03-10"),
              3);
}

// ─────────────────────────────────────
TEST(StreakTest, GapBreaksRun) {
    EXPECT_EQ(Analytics::ComputeStreak({"2024-03-10", "2024-03-08"}, "2024-03-10"), 1);
}

// ─────────────────────────────────────
TEST(StreakTest, RunMayEndYesterday) {
    EXPECT_EQ(Analytics::ComputeStreak({"2024-03-09"}, "2024-03-10"), 1);
    EXPECT_EQ(Analytics::ComputeStreak({"2024-03-08"}, "2024-03-10"), 0);
}

// ─────────────────────────────────────
TEST(StreakTest, CrossesMonthBoundary) {
    EXPECT_EQ(Analytics::ComputeStreak({"2024-03-01", "2024-02-29", "2024-02-28"}, "2024-03-01"),
              3);
}

// ─────────────────────────────────────
TEST(StreakTest, EmptyAndDuplicates) {
    EXPECT_EQ(Analytics::ComputeStreak({}, "2024-03-10"), 0);
    EXPECT_EQ(Analytics::ComputeStreak({"2024-03-10", "2024-03-10"}, "2024-03-10"), 1);
    EXPECT_STUDY_ERROR(Analytics::ComputeStreak({}, "10/03/2024"), ERR_VALIDATION);
}

// ─────────────────────────────────────
TEST(LearningPointsTest, Weights) {
    EXPECT_EQ(Analytics::ComputeLearningPoints(0, 0, 0), 0);
    EXPECT_EQ(Analytics::ComputeLearningPoints(2, 3, 4), 2 * 10 + 3 * 5 + 4);
}

// ─────────────────────────────────────
TEST_F(AnalyticsTest, EmptyAccountHasZeroes) {
    const AnalyticsSummary s = m_Analytics->Summarize(Owner());
    EXPECT_EQ(s.total_tasks, 0);
    EXPECT_DOUBLE_EQ(s.completion_rate, 0.0);
    EXPECT_DOUBLE_EQ(s.quiz_average, 0.0);
    EXPECT_EQ(s.streak_days, 0);
    EXPECT_TRUE(s.top_subjects.empty());
    EXPECT_EQ(s.learning_points, 0);
}

// ─────────────────────────────────────
TEST_F(AnalyticsTest, CompletionRate) {
    const Task a = m_Repo->CreateTask(Owner(), "A", std::nullopt, std::nullopt);
    m_Repo->CreateTask(Owner(), "B", std::nullopt, std::nullopt);
    m_Repo->CreateTask(Owner(), "C", std::nullopt, std::nullopt);
    const Task d = m_Repo->CreateTask(Owner(), "D", std::nullopt, std::nullopt);
    m_Repo->SetTaskCompleted(Owner(), a.id, true);
    m_Repo->SetTaskCompleted(Owner(), d.id, true);

    EXPECT_DOUBLE_EQ(m_Analytics->CompletionRate(Owner()), 0.5);
    EXPECT_EQ(m_Analytics->TotalTasks(Owner()), 4);
    EXPECT_EQ(m_Analytics->CompletedTasks(Owner()), 2);

    const std::string today = LocalDateString(NowEpoch());
    EXPECT_DOUBLE_EQ(m_Analytics->CompletionRate(Owner(), today, today), 0.5);
    EXPECT_DOUBLE_EQ(m_Analytics->CompletionRate(Owner(), std::string("2000-01-01"),
                                                 std::string("2000-12-31")),
                     0.0);
    EXPECT_STUDY_ERROR(m_Analytics->CompletionRate(Owner(), today, std::nullopt),
                       ERR_VALIDATION);
    EXPECT_STUDY_ERROR(m_Analytics->CompletionRate(Owner(), std::string("yesterday"), today),
                       ERR_VALIDATION);
}

// ─────────────────────────────────────
TEST_F(AnalyticsTest, StudyTotalsAndTopSubjects) {
    m_Repo->AddStudyLog(Owner(), "Math", 30, "");
    m_Repo->AddStudyLog(Owner(), "Math", 45, "");
    m_Repo->AddStudyLog(Owner(), "Physics", 60, "");
    m_Repo->AddStudyLog(Owner(), "Art", 10, "");
    m_Repo->AddStudyLog(Owner(), "Biology", 20, "");

    EXPECT_EQ(m_Analytics->TotalStudyMinutes(Owner()), 165);
    EXPECT_EQ(m_Analytics->StudySessions(Owner()), 5);

    auto top = m_Analytics->TopSubjects(Owner());
    ASSERT_EQ(top.size(), 3u);
    EXPECT_EQ(top[0].subject, "Math");
    EXPECT_EQ(top[0].minutes, 75);
    EXPECT_EQ(top[1].subject, "Physics");
    EXPECT_EQ(top[2].subject, "Biology");
}

// ─────────────────────────────────────
TEST_F(AnalyticsTest, QuizAverageIsFractionOfQuestions) {
    m_Repo->AddQuizResult(Owner(), "A", 3, 5);
    m_Repo->AddQuizResult(Owner(), "B", 5, 5);

    EXPECT_EQ(m_Analytics->QuizzesTaken(Owner()), 2);
    EXPECT_EQ(m_Analytics->CorrectAnswers(Owner()), 8);
    EXPECT_DOUBLE_EQ(m_Analytics->QuizAverage(Owner()), 0.8);
}

// ─────────────────────────────────────
TEST_F(AnalyticsTest, StreakFromStoredLogs) {
    LogAt(LocalNoon(0), "Math", 20);
    LogAt(LocalNoon(1), "Math", 20);
    LogAt(LocalNoon(1), "Physics", 20);
    LogAt(LocalNoon(2), "Math", 20);
    LogAt(LocalNoon(5), "Math", 20);

    EXPECT_EQ(m_Analytics->StudyStreak(Owner()), 3);
    EXPECT_EQ(m_Analytics->StudyDaysSince(Owner(), 7), 4);
    EXPECT_EQ(m_Analytics->StudyDaysSince(Owner(), 1), 1);
}

// ─────────────────────────────────────
TEST_F(AnalyticsTest, StreakEndingYesterdayStillCounts) {
    LogAt(LocalNoon(1), "Math", 20);
    LogAt(LocalNoon(2), "Math", 20);
    EXPECT_EQ(m_Analytics->StudyStreak(Owner()), 2);
}

// ─────────────────────────────────────
TEST_F(AnalyticsTest, SummaryLearningPoints) {
    const Task t = m_Repo->CreateTask(Owner(), "A", std::nullopt, std::nullopt);
    m_Repo->SetTaskCompleted(Owner(), t.id, true);
    m_Repo->AddStudyLog(Owner(), "Math", 30, "");
    m_Repo->AddQuizResult(Owner(), "Q", 4, 5);

    const AnalyticsSummary s = m_Analytics->Summarize(Owner());
    EXPECT_EQ(s.learning_points, 10 + 5 + 4);
    EXPECT_EQ(m_Analytics->LearningPoints(Owner()), s.learning_points);
    EXPECT_EQ(s.streak_days, 1);
    EXPECT_DOUBLE_EQ(s.completion_rate, 1.0);
}
