#include "analytics.hpp"
#include "common.hpp"

#include <chrono>
#include <cstdio>
#include <set>

#include <spdlog/spdlog.h>

namespace {
constexpr const char *kLocalDay = "date(logged_at, 'unixepoch', 'localtime')";

std::optional<std::chrono::sys_days> ParseDay(const std::string &s) {
    if (!IsValidDate(s)) {
        return std::nullopt;
    }
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    std::sscanf(s.c_str(), "%4d-%2u-%2u", &y, &m, &d);
    return std::chrono::sys_days{
        std::chrono::year_month_day{std::chrono::year{y}, std::chrono::month{m},
                                    std::chrono::day{d}}};
}
} // namespace

// ─────────────────────────────────────
Analytics::Analytics(SQLite &db) : m_Db(db) {}

// ─────────────────────────────────────
int Analytics::QueryInt(const char *sql, int64_t owner) {
    auto stmt = m_Db.Prepare(sql);
    stmt.Bind(1, owner);
    return stmt.Step() ? stmt.GetInt(0) : 0;
}

// ─────────────────────────────────────
double Analytics::QueryDouble(const char *sql, int64_t owner) {
    auto stmt = m_Db.Prepare(sql);
    stmt.Bind(1, owner);
    if (!stmt.Step() || stmt.IsNull(0)) {
        return 0.0;
    }
    return stmt.GetDouble(0);
}

// ─────────────────────────────────────
double Analytics::CompletionRate(int64_t owner, const std::optional<std::string> &from,
                                 const std::optional<std::string> &to) {
    if (from.has_value() != to.has_value()) {
        throw StudyError(ERR_VALIDATION, "a date range needs both ends");
    }
    if (from && (!IsValidDate(*from) || !IsValidDate(*to))) {
        throw StudyError(ERR_VALIDATION, "dates must be YYYY-MM-DD");
    }

    std::string sql = "SELECT COUNT(*), COALESCE(SUM(status = 1), 0) FROM tasks WHERE owner_id = ?";
    if (from) {
        sql += " AND date(created_at, 'unixepoch', 'localtime') BETWEEN ? AND ?";
    }
    auto stmt = m_Db.Prepare(sql.c_str());
    stmt.Bind(1, owner);
    if (from) {
        stmt.Bind(2, *from).Bind(3, *to);
    }
    if (!stmt.Step()) {
        return 0.0;
    }
    const int total = stmt.GetInt(0);
    const int completed = stmt.GetInt(1);
    return total == 0 ? 0.0 : static_cast<double>(completed) / total;
}

// ─────────────────────────────────────
int Analytics::TotalTasks(int64_t owner) {
    return QueryInt("SELECT COUNT(*) FROM tasks WHERE owner_id = ?", owner);
}

// ─────────────────────────────────────
int Analytics::CompletedTasks(int64_t owner) {
    return QueryInt("SELECT COUNT(*) FROM tasks WHERE owner_id = ? AND status = 1", owner);
}

// ─────────────────────────────────────
int Analytics::TotalStudyMinutes(int64_t owner) {
    return QueryInt("SELECT COALESCE(SUM(duration_minutes), 0) FROM study_logs WHERE owner_id = ?",
                    owner);
}

// ─────────────────────────────────────
int Analytics::StudySessions(int64_t owner) {
    return QueryInt("SELECT COUNT(*) FROM study_logs WHERE owner_id = ?", owner);
}

// ─────────────────────────────────────
double Analytics::QuizAverage(int64_t owner) {
    return QueryDouble("SELECT AVG(CAST(score AS REAL) / total_questions) FROM quiz_results "
                       "WHERE owner_id = ?",
                       owner);
}

// ─────────────────────────────────────
int Analytics::QuizzesTaken(int64_t owner) {
    return QueryInt("SELECT COUNT(*) FROM quiz_results WHERE owner_id = ?", owner);
}

// ─────────────────────────────────────
int Analytics::CorrectAnswers(int64_t owner) {
    return QueryInt("SELECT COALESCE(SUM(score), 0) FROM quiz_results WHERE owner_id = ?", owner);
}

// ─────────────────────────────────────
int Analytics::ComputeStreak(const std::vector<std::string> &dates, const std::string &today) {
    const auto now = ParseDay(today);
    if (!now) {
        throw StudyError(ERR_VALIDATION, "today must be YYYY-MM-DD");
    }

    std::set<std::chrono::sys_days> days;
    for (const auto &d : dates) {
        if (auto parsed = ParseDay(d)) {
            days.insert(*parsed);
        } else {
            spdlog::warn("skipping malformed study day '{}'", d);
        }
    }

    std::chrono::sys_days cursor = *now;
    if (!days.count(cursor)) {
        cursor -= std::chrono::days{1};
        if (!days.count(cursor)) {
            return 0;
        }
    }

    int streak = 0;
    while (days.count(cursor)) {
        streak++;
        cursor -= std::chrono::days{1};
    }
    return streak;
}

// ─────────────────────────────────────
int Analytics::StudyStreak(int64_t owner) {
    const std::string sql = std::string("SELECT DISTINCT ") + kLocalDay +
                            " FROM study_logs WHERE owner_id = ? ORDER BY 1 DESC";
    auto stmt = m_Db.Prepare(sql.c_str());
    stmt.Bind(1, owner);

    std::vector<std::string> dates;
    while (stmt.Step()) {
        dates.push_back(stmt.GetText(0));
    }
    return ComputeStreak(dates, LocalDateString(NowEpoch()));
}

// ─────────────────────────────────────
int Analytics::StudyDaysSince(int64_t owner, int days) {
    const std::string sql = std::string("SELECT COUNT(DISTINCT ") + kLocalDay +
                            ") FROM study_logs WHERE owner_id = ? AND " + kLocalDay +
                            " >= date('now', 'localtime', ?)";
    auto stmt = m_Db.Prepare(sql.c_str());
    stmt.Bind(1, owner).Bind(2, "-" + std::to_string(days > 0 ? days - 1 : 0) + " days");
    return stmt.Step() ? stmt.GetInt(0) : 0;
}

// ─────────────────────────────────────
std::vector<SubjectMinutes> Analytics::TopSubjects(int64_t owner, int limit) {
    auto stmt = m_Db.Prepare("SELECT subject, SUM(duration_minutes) AS total FROM study_logs "
                             "WHERE owner_id = ? GROUP BY subject "
                             "ORDER BY total DESC, subject ASC LIMIT ?");
    stmt.Bind(1, owner).Bind(2, limit);

    std::vector<SubjectMinutes> out;
    while (stmt.Step()) {
        out.push_back({stmt.GetText(0), stmt.GetInt(1)});
    }
    return out;
}

// ─────────────────────────────────────
int Analytics::ComputeLearningPoints(int completed_tasks, int study_sessions,
                                     int correct_answers) {
    return completed_tasks * kPointsPerCompletedTask + study_sessions * kPointsPerStudySession +
           correct_answers * kPointsPerCorrectAnswer;
}

// ─────────────────────────────────────
int Analytics::LearningPoints(int64_t owner) {
    return ComputeLearningPoints(CompletedTasks(owner), StudySessions(owner),
                                 CorrectAnswers(owner));
}

// ─────────────────────────────────────
AnalyticsSummary Analytics::Summarize(int64_t owner) {
    AnalyticsSummary s;
    s.total_tasks = TotalTasks(owner);
    s.completed_tasks = CompletedTasks(owner);
    s.completion_rate = CompletionRate(owner);
    s.study_minutes = TotalStudyMinutes(owner);
    s.study_sessions = StudySessions(owner);
    s.quizzes_taken = QuizzesTaken(owner);
    s.correct_answers = CorrectAnswers(owner);
    s.quiz_average = QuizAverage(owner);
    s.streak_days = StudyStreak(owner);
    s.days_last_7 = StudyDaysSince(owner, 7);
    s.days_last_30 = StudyDaysSince(owner, 30);
    s.top_subjects = TopSubjects(owner);
    s.learning_points =
        ComputeLearningPoints(s.completed_tasks, s.study_sessions, s.correct_answers);
    spdlog::debug("analytics computed for user {}", owner);
    return s;
}
