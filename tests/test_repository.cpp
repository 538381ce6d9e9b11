#include "test_env.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

class RepositoryTest : public StoreTest {};

// ─────────────────────────────────────
TEST_F(RepositoryTest, NewUserHasDefaultCategories) {
    auto categories = m_Repo->FetchCategories(Owner());
    ASSERT_EQ(categories.size(), Repository::DefaultCategoryNames().size());
    for (const auto &name : Repository::DefaultCategoryNames()) {
        EXPECT_TRUE(m_Repo->FindCategory(Owner(), name).has_value()) << name;
    }
}

// ─────────────────────────────────────
TEST_F(RepositoryTest, CategoryNamesAreUniquePerOwner) {
    m_Repo->AddCategory(Owner(), "Math");
    EXPECT_STUDY_ERROR(m_Repo->AddCategory(Owner(), "Math"), ERR_VALIDATION);
    EXPECT_STUDY_ERROR(m_Repo->AddCategory(Owner(), "  "), ERR_VALIDATION);
    EXPECT_STUDY_ERROR(m_Repo->AddCategory(Owner(), "Uncategorized"), ERR_VALIDATION);

    const User bob = m_Auth->Register("bob", "hunter22");
    EXPECT_NO_THROW(m_Repo->AddCategory(bob.id, "Math"));
}

// ─────────────────────────────────────
TEST_F(RepositoryTest, RenameCategoryShowsOnTasks) {
    const Category c = m_Repo->AddCategory(Owner(), "Chem");
    const Task t = m_Repo->CreateTask(Owner(), "Lab report", c.id, std::nullopt);
    m_Repo->RenameCategory(Owner(), c.id, "Chemistry");
    EXPECT_EQ(m_Repo->GetTask(Owner(), t.id).category_name, "Chemistry");
}

// ─────────────────────────────────────
TEST_F(RepositoryTest, DeletingCategoryMovesTasksToUncategorized) {
    const Category c = m_Repo->AddCategory(Owner(), "History");
    const Task t = m_Repo->CreateTask(Owner(), "Read chapter 3", c.id, std::nullopt);

    m_Repo->DeleteCategory(Owner(), c.id);

    const Task after = m_Repo->GetTask(Owner(), t.id);
    EXPECT_FALSE(after.category_id.has_value());
    EXPECT_EQ(after.category_name, "Uncategorized");
    EXPECT_FALSE(m_Repo->FindCategory(Owner(), "History").has_value());

    TaskFilter only_uncategorized;
    only_uncategorized.category_id = 0;
    auto tasks = m_Repo->FetchTasks(Owner(), only_uncategorized);
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0].id, t.id);
}

// ─────────────────────────────────────
TEST_F(RepositoryTest, CreateTaskValidatesInput) {
    EXPECT_STUDY_ERROR(m_Repo->CreateTask(Owner(), "   ", std::nullopt, std::nullopt),
                       ERR_VALIDATION);
    EXPECT_STUDY_ERROR(
        m_Repo->CreateTask(Owner(), "Essay", std::nullopt, std::string("next friday")),
        ERR_VALIDATION);
    EXPECT_STUDY_ERROR(
        m_Repo->CreateTask(Owner(), "Essay", std::nullopt, std::string("2024-02-30")),
        ERR_VALIDATION);
    EXPECT_STUDY_ERROR(m_Repo->CreateTask(Owner(), "Essay", int64_t{999999}, std::nullopt),
                       ERR_NOT_FOUND);

    const Task t = m_Repo->CreateTask(Owner(), "  Essay  ", std::nullopt, std::string(""));
    EXPECT_EQ(t.title, "Essay");
    EXPECT_FALSE(t.due_date.has_value());
    EXPECT_EQ(t.status, TASK_PENDING);
}

// ─────────────────────────────────────
TEST_F(RepositoryTest, CompletingTaskHidesItFromDefaultList) {
    const Task a = m_Repo->CreateTask(Owner(), "A", std::nullopt, std::nullopt);
    const Task b = m_Repo->CreateTask(Owner(), "B", std::nullopt, std::nullopt);

    m_Repo->SetTaskCompleted(Owner(), a.id, true);
    const Task done = m_Repo->GetTask(Owner(), a.id);
    EXPECT_EQ(done.status, TASK_COMPLETED);
    EXPECT_TRUE(done.completed_at.has_value());

    auto pending = m_Repo->FetchTasks(Owner());
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].id, b.id);

    TaskFilter all;
    all.show_completed = true;
    EXPECT_EQ(m_Repo->FetchTasks(Owner(), all).size(), 2u);

    m_Repo->SetTaskCompleted(Owner(), a.id, false);
    EXPECT_FALSE(m_Repo->GetTask(Owner(), a.id).completed_at.has_value());
}

// ─────────────────────────────────────
TEST_F(RepositoryTest, TasksOrderedByDueDateThenUndated) {
    const Task undated = m_Repo->CreateTask(Owner(), "Someday", std::nullopt, std::nullopt);
    const Task later = m_Repo->CreateTask(Owner(), "Later", std::nullopt, std::string("2031-05-02"));
    const Task sooner =
        m_Repo->CreateTask(Owner(), "Sooner", std::nullopt, std::string("2031-05-01"));

    auto tasks = m_Repo->FetchTasks(Owner());
    ASSERT_EQ(tasks.size(), 3u);
    EXPECT_EQ(tasks[0].id, sooner.id);
    EXPECT_EQ(tasks[1].id, later.id);
    EXPECT_EQ(tasks[2].id, undated.id);

    TaskFilter limited;
    limited.limit = 2;
    EXPECT_EQ(m_Repo->FetchTasks(Owner(), limited).size(), 2u);
}

// ─────────────────────────────────────
TEST_F(RepositoryTest, DueFiltersAndReminders) {
    const double now = NowEpoch();
    const std::string today = LocalDateString(now);
    const std::string yesterday = LocalDateString(now - 86400.0);
    const std::string in_three_days = LocalDateString(now + 3 * 86400.0);

    const Task overdue = m_Repo->CreateTask(Owner(), "Overdue", std::nullopt, yesterday);
    const Task due_today = m_Repo->CreateTask(Owner(), "Today", std::nullopt, today);
    const Task upcoming = m_Repo->CreateTask(Owner(), "Upcoming", std::nullopt, in_three_days);
    const Task finished = m_Repo->CreateTask(Owner(), "Finished", std::nullopt, yesterday);
    m_Repo->SetTaskCompleted(Owner(), finished.id, true);

    TaskFilter f;
    f.due = DUE_TODAY;
    auto tasks = m_Repo->FetchTasks(Owner(), f);
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0].id, due_today.id);

    f.due = DUE_UPCOMING;
    tasks = m_Repo->FetchTasks(Owner(), f);
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0].id, upcoming.id);

    f.due = DUE_OVERDUE;
    f.show_completed = true;
    tasks = m_Repo->FetchTasks(Owner(), f);
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0].id, overdue.id);

    auto reminders = m_Repo->FetchReminders(Owner());
    ASSERT_EQ(reminders.size(), 2u);
    EXPECT_EQ(reminders[0].id, overdue.id);
    EXPECT_EQ(reminders[1].id, due_today.id);
}

// ─────────────────────────────────────
TEST_F(RepositoryTest, OtherUsersRowsLookMissing) {
    const User bob = m_Auth->Register("bob", "hunter22");
    const Task t = m_Repo->CreateTask(Owner(), "Private", std::nullopt, std::nullopt);
    const StudyLog log = m_Repo->AddStudyLog(Owner(), "Physics", 30, "");
    const Category c = m_Repo->AddCategory(Owner(), "Mine");
    const QuizResult r = m_Repo->AddQuizResult(Owner(), "Algebra", 1, 2);
    const AIContent saved = m_Repo->AddAIContent(Owner(), CONTENT_EXPLANATION, "entropy", "Disorder.");
    m_Repo->AddChatMessage(Owner(), "user", "private question");

    EXPECT_STUDY_ERROR(m_Repo->GetTask(bob.id, t.id), ERR_NOT_FOUND);
    EXPECT_STUDY_ERROR(m_Repo->SetTaskCompleted(bob.id, t.id, true), ERR_NOT_FOUND);
    EXPECT_STUDY_ERROR(m_Repo->DeleteTask(bob.id, t.id), ERR_NOT_FOUND);
    EXPECT_STUDY_ERROR(m_Repo->DeleteStudyLog(bob.id, log.id), ERR_NOT_FOUND);
    EXPECT_STUDY_ERROR(m_Repo->DeleteCategory(bob.id, c.id), ERR_NOT_FOUND);
    EXPECT_STUDY_ERROR(m_Repo->CreateTask(bob.id, "Sneaky", c.id, std::nullopt), ERR_NOT_FOUND);

    EXPECT_TRUE(m_Repo->FetchTasks(bob.id).empty());
    EXPECT_TRUE(m_Repo->FetchStudyLogs(bob.id).empty());
    EXPECT_TRUE(m_Repo->FetchQuizResults(bob.id).empty());
    EXPECT_TRUE(m_Repo->FetchAIContent(bob.id).empty());
    EXPECT_TRUE(m_Repo->FetchChatHistory(bob.id).empty());

    EXPECT_STUDY_ERROR(m_Repo->GetQuizResult(bob.id, r.id), ERR_NOT_FOUND);
    EXPECT_STUDY_ERROR(m_Repo->GetAIContent(bob.id, saved.id), ERR_NOT_FOUND);
    EXPECT_STUDY_ERROR(m_Repo->DeleteAIContent(bob.id, saved.id), ERR_NOT_FOUND);

    EXPECT_EQ(m_Repo->GetTask(Owner(), t.id).status, TASK_PENDING);
    EXPECT_EQ(m_Repo->GetAIContent(Owner(), saved.id).response_text, "Disorder.");
    EXPECT_EQ(m_Repo->FetchChatHistory(Owner()).size(), 1u);
}

// ─────────────────────────────────────
TEST_F(RepositoryTest, StudyLogsNewestFirst) {
    EXPECT_STUDY_ERROR(m_Repo->AddStudyLog(Owner(), "Math", 0, ""), ERR_VALIDATION);
    EXPECT_STUDY_ERROR(m_Repo->AddStudyLog(Owner(), "", 10, ""), ERR_VALIDATION);

    m_Repo->AddStudyLog(Owner(), "Math", 25, "chapter 1");
    const StudyLog second = m_Repo->AddStudyLog(Owner(), "Biology", 50, "");

    auto logs = m_Repo->FetchStudyLogs(Owner());
    ASSERT_EQ(logs.size(), 2u);
    EXPECT_EQ(logs[0].id, second.id);
    EXPECT_EQ(m_Repo->FetchStudyLogs(Owner(), 1).size(), 1u);

    m_Repo->DeleteStudyLog(Owner(), second.id);
    EXPECT_EQ(m_Repo->FetchStudyLogs(Owner()).size(), 1u);
}

// ─────────────────────────────────────
TEST_F(RepositoryTest, QuizScoreMustFitTotal) {
    const QuizResult ok = m_Repo->AddQuizResult(Owner(), "Algebra", 3, 5);
    EXPECT_EQ(ok.score, 3);
    EXPECT_EQ(ok.total_questions, 5);

    EXPECT_STUDY_ERROR(m_Repo->AddQuizResult(Owner(), "Algebra", 6, 5), ERR_VALIDATION);
    EXPECT_STUDY_ERROR(m_Repo->AddQuizResult(Owner(), "Algebra", -1, 5), ERR_VALIDATION);
    EXPECT_STUDY_ERROR(m_Repo->AddQuizResult(Owner(), "Algebra", 0, 0), ERR_VALIDATION);
    EXPECT_STUDY_ERROR(m_Repo->AddQuizResult(Owner(), "Algebra", 1, 2, "{\"not\": \"a list\"}"),
                       ERR_VALIDATION);

    EXPECT_EQ(m_Repo->FetchQuizResults(Owner()).size(), 1u);
}

// ─────────────────────────────────────
TEST_F(RepositoryTest, QuizResultKeepsQuestions) {
    const nlohmann::json questions = nlohmann::json::array(
        {{{"question_text", "2+2?"},
          {"options", {"3", "4", "5", "6"}},
          {"correct_option_index", 1},
          {"explanation", "basic sum"},
          {"user_answer_index", 1}}});
    const QuizResult r = m_Repo->AddQuizResult(Owner(), "Arithmetic", 1, 1, questions.dump());

    const QuizResult loaded = m_Repo->GetQuizResult(Owner(), r.id);
    EXPECT_EQ(nlohmann::json::parse(loaded.questions_json), questions);
    EXPECT_STUDY_ERROR(m_Repo->GetQuizResult(Owner(), r.id + 100), ERR_NOT_FOUND);
}

// ─────────────────────────────────────
TEST_F(RepositoryTest, AIContentFilteredByKind) {
    m_Repo->AddAIContent(Owner(), CONTENT_EXPLANATION, "photosynthesis", "Plants make sugar.");
    const AIContent summary = m_Repo->AddAIContent(Owner(), CONTENT_SUMMARY, "long text", "Short.");

    EXPECT_EQ(m_Repo->FetchAIContent(Owner()).size(), 2u);
    auto summaries = m_Repo->FetchAIContent(Owner(), CONTENT_SUMMARY);
    ASSERT_EQ(summaries.size(), 1u);
    EXPECT_EQ(summaries[0].response_text, "Short.");

    EXPECT_EQ(m_Repo->GetAIContent(Owner(), summary.id).kind, CONTENT_SUMMARY);
    m_Repo->DeleteAIContent(Owner(), summary.id);
    EXPECT_STUDY_ERROR(m_Repo->GetAIContent(Owner(), summary.id), ERR_NOT_FOUND);
    EXPECT_STUDY_ERROR(m_Repo->DeleteAIContent(Owner(), summary.id), ERR_NOT_FOUND);
}

// ─────────────────────────────────────
TEST_F(RepositoryTest, ChatHistoryKeepsMostRecentOldestFirst) {
    for (int i = 0; i < 25; i++) {
        m_Repo->AddChatMessage(Owner(), i % 2 == 0 ? "user" : "model", "msg " + std::to_string(i));
    }
    EXPECT_STUDY_ERROR(m_Repo->AddChatMessage(Owner(), "system", "hi"), ERR_VALIDATION);

    auto history = m_Repo->FetchChatHistory(Owner());
    ASSERT_EQ(history.size(), 20u);
    EXPECT_EQ(history.front().content, "msg 5");
    EXPECT_EQ(history.back().content, "msg 24");

    m_Repo->ClearChatHistory(Owner());
    EXPECT_TRUE(m_Repo->FetchChatHistory(Owner()).empty());
}

// ─────────────────────────────────────
TEST_F(RepositoryTest, SettingsUpsertAndFallback) {
    EXPECT_FALSE(m_Repo->GetSetting(Owner(), kGeminiApiKey).has_value());
    m_Repo->SetSetting(Owner(), kGeminiApiKey, "first");
    m_Repo->SetSetting(Owner(), kGeminiApiKey, "second");
    EXPECT_EQ(m_Repo->GetSetting(Owner(), kGeminiApiKey).value_or(""), "second");
    m_Repo->DeleteSetting(Owner(), kGeminiApiKey);
    EXPECT_FALSE(m_Repo->GetSetting(Owner(), kGeminiApiKey).has_value());

    EXPECT_EQ(m_Repo->GetIntSetting(Owner(), kPomodoroWorkMinutes, 25, 1, 120), 25);
    m_Repo->SetSetting(Owner(), kPomodoroWorkMinutes, "50");
    EXPECT_EQ(m_Repo->GetIntSetting(Owner(), kPomodoroWorkMinutes, 25, 1, 120), 50);
    m_Repo->SetSetting(Owner(), kPomodoroWorkMinutes, "500");
    EXPECT_EQ(m_Repo->GetIntSetting(Owner(), kPomodoroWorkMinutes, 25, 1, 120), 25);
    m_Repo->SetSetting(Owner(), kPomodoroWorkMinutes, "abc");
    EXPECT_EQ(m_Repo->GetIntSetting(Owner(), kPomodoroWorkMinutes, 25, 1, 120), 25);
}
