#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

enum LogLevel { LOG_DEBUG, LOG_INFO, LOG_OFF };

enum TaskStatus { TASK_PENDING = 0, TASK_COMPLETED = 1 };

enum DueFilter { DUE_ANY, DUE_TODAY, DUE_UPCOMING, DUE_OVERDUE };

enum AIContentKind {
    CONTENT_EXPLANATION,
    CONTENT_SUMMARY,
    CONTENT_QUESTIONS,
    CONTENT_CHAT_SNAPSHOT,
};

struct User {
    int64_t id = -1;
    std::string username;
    std::string password_hash;
    double created_at = 0.0;
};

struct Category {
    int64_t id = -1;
    int64_t owner_id = -1;
    std::string name;
};

struct Task {
    int64_t id = -1;
    int64_t owner_id = -1;
    std::string title;
    std::optional<int64_t> category_id;
    std::string category_name = "Uncategorized";
    std::optional<std::string> due_date; // YYYY-MM-DD
    TaskStatus status = TASK_PENDING;
    double created_at = 0.0;
    std::optional<double> completed_at;
};

struct TaskFilter {
    bool show_completed = false;
    // nullopt = all categories, 0 = Uncategorized only
    std::optional<int64_t> category_id;
    DueFilter due = DUE_ANY;
    int limit = 0;
};

struct StudyLog {
    int64_t id = -1;
    int64_t owner_id = -1;
    std::string subject;
    int duration_minutes = 0;
    std::string notes;
    double logged_at = 0.0;
};

struct QuizItem {
    std::string question;
    std::vector<std::string> choices; // always 4
    int correct_index = 0;
    std::string explanation;
    std::optional<int> answer_index;
};

struct QuizResult {
    int64_t id = -1;
    int64_t owner_id = -1;
    std::string topic;
    int score = 0;
    int total_questions = 0;
    double taken_at = 0.0;
    std::string questions_json = "[]";
};

struct AIContent {
    int64_t id = -1;
    int64_t owner_id = -1;
    AIContentKind kind = CONTENT_EXPLANATION;
    std::string prompt;
    std::string response_text;
    double created_at = 0.0;
};

struct ChatMessage {
    int64_t id = -1;
    std::string role; // "user" or "model"
    std::string content;
    double created_at = 0.0;
};

// Setting keys
inline constexpr const char *kGeminiApiKey = "gemini_api_key";
inline constexpr const char *kPomodoroWorkMinutes = "pomodoro_work_minutes";
inline constexpr const char *kPomodoroBreakMinutes = "pomodoro_break_minutes";
inline constexpr const char *kPomodoroLongBreakMinutes = "pomodoro_long_break_minutes";

const char *ToString(AIContentKind kind);
std::optional<AIContentKind> AIContentKindFromString(const std::string &s);

double NowEpoch();
std::string FormatLocalTime(double epoch, const char *fmt = "%Y-%m-%d %H:%M");
std::string LocalDateString(double epoch);
std::string Trim(const std::string &s);
bool IsValidDate(const std::string &yyyy_mm_dd);
