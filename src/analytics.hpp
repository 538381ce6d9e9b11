#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "sqlite.hpp"

struct SubjectMinutes {
    std::string subject;
    int minutes = 0;
};

struct AnalyticsSummary {
    int total_tasks = 0;
    int completed_tasks = 0;
    double completion_rate = 0.0; // 0..1
    int study_minutes = 0;
    int study_sessions = 0;
    int quizzes_taken = 0;
    int correct_answers = 0;
    double quiz_average = 0.0; // 0..1
    int streak_days = 0;
    int days_last_7 = 0;
    int days_last_30 = 0;
    std::vector<SubjectMinutes> top_subjects;
    int learning_points = 0;
};

// Read-only aggregates. Calendar days are local days.
class Analytics {
  public:
    static constexpr int kPointsPerCompletedTask = 10;
    static constexpr int kPointsPerStudySession = 5;
    static constexpr int kPointsPerCorrectAnswer = 1;

    explicit Analytics(SQLite &db);

    // Restricts to tasks created between two local dates (inclusive) when both are given.
    double CompletionRate(int64_t owner, const std::optional<std::string> &from = std::nullopt,
                          const std::optional<std::string> &to = std::nullopt);
    int TotalTasks(int64_t owner);
    int CompletedTasks(int64_t owner);
    int TotalStudyMinutes(int64_t owner);
    int StudySessions(int64_t owner);
    double QuizAverage(int64_t owner);
    int QuizzesTaken(int64_t owner);
    int CorrectAnswers(int64_t owner);
    int StudyStreak(int64_t owner);
    int StudyDaysSince(int64_t owner, int days);
    std::vector<SubjectMinutes> TopSubjects(int64_t owner, int limit = 3);
    int LearningPoints(int64_t owner);
    AnalyticsSummary Summarize(int64_t owner);

    // Distinct YYYY-MM-DD days, any order. The run must end today or yesterday.
    static int ComputeStreak(const std::vector<std::string> &dates, const std::string &today);
    static int ComputeLearningPoints(int completed_tasks, int study_sessions, int correct_answers);

  private:
    int QueryInt(const char *sql, int64_t owner);
    double QueryDouble(const char *sql, int64_t owner);

    SQLite &m_Db;
};
