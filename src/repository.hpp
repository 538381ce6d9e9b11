#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common.hpp"
#include "sqlite.hpp"

// Owner-scoped access to every table. An id owned by another user behaves exactly like a
// missing id. All writes run inside a single transaction.
class Repository {
  public:
    explicit Repository(SQLite &db);

    // Categories
    Category AddCategory(int64_t owner, const std::string &name);
    void RenameCategory(int64_t owner, int64_t category_id, const std::string &name);
    // Tasks of the category move to Uncategorized in the same transaction.
    void DeleteCategory(int64_t owner, int64_t category_id);
    std::vector<Category> FetchCategories(int64_t owner);
    std::optional<Category> FindCategory(int64_t owner, const std::string &name);
    static const std::vector<std::string> &DefaultCategoryNames();

    // Tasks
    Task CreateTask(int64_t owner, const std::string &title, std::optional<int64_t> category_id,
                    const std::optional<std::string> &due_date);
    Task GetTask(int64_t owner, int64_t task_id);
    std::vector<Task> FetchTasks(int64_t owner, const TaskFilter &filter = {});
    void SetTaskCompleted(int64_t owner, int64_t task_id, bool completed);
    void DeleteTask(int64_t owner, int64_t task_id);
    std::vector<Task> FetchReminders(int64_t owner);

    // Study logs
    StudyLog AddStudyLog(int64_t owner, const std::string &subject, int duration_minutes,
                         const std::string &notes);
    std::vector<StudyLog> FetchStudyLogs(int64_t owner, int limit = 0);
    void DeleteStudyLog(int64_t owner, int64_t log_id);

    // Quiz results
    QuizResult AddQuizResult(int64_t owner, const std::string &topic, int score,
                             int total_questions, const std::string &questions_json = "[]");
    std::vector<QuizResult> FetchQuizResults(int64_t owner, int limit = 0);
    QuizResult GetQuizResult(int64_t owner, int64_t result_id);

    // AI content archive
    AIContent AddAIContent(int64_t owner, AIContentKind kind, const std::string &prompt,
                           const std::string &response_text);
    std::vector<AIContent> FetchAIContent(int64_t owner,
                                          std::optional<AIContentKind> kind = std::nullopt);
    AIContent GetAIContent(int64_t owner, int64_t content_id);
    void DeleteAIContent(int64_t owner, int64_t content_id);

    // Chat history
    ChatMessage AddChatMessage(int64_t owner, const std::string &role,
                               const std::string &content);
    // Most recent `limit` messages, oldest first.
    std::vector<ChatMessage> FetchChatHistory(int64_t owner, int limit = 20);
    void ClearChatHistory(int64_t owner);

    // Settings
    std::optional<std::string> GetSetting(int64_t owner, const std::string &key);
    void SetSetting(int64_t owner, const std::string &key, const std::string &value);
    void DeleteSetting(int64_t owner, const std::string &key);
    // Falls back when the value is missing, not a number or outside [min, max].
    int GetIntSetting(int64_t owner, const std::string &key, int fallback, int min, int max);

  private:
    void RequireUser(int64_t owner);
    void RequireCategory(int64_t owner, int64_t category_id);
    Task ReadTask(const SQLite::Statement &stmt) const;
    StudyLog ReadStudyLog(const SQLite::Statement &stmt) const;
    QuizResult ReadQuizResult(const SQLite::Statement &stmt) const;
    AIContent ReadAIContent(const SQLite::Statement &stmt) const;

    SQLite &m_Db;
};
