#include "repository.hpp"

#include <charconv>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {
constexpr const char *kTaskColumns =
    "SELECT t.id, t.owner_id, t.title, t.category_id, c.name, t.due_date, t.status, "
    "t.created_at, t.completed_at FROM tasks t "
    "LEFT JOIN categories c ON c.id = t.category_id AND c.owner_id = t.owner_id ";

int LimitOrAll(int limit) {
    return limit > 0 ? limit : -1;
}

std::string RequireText(const std::string &value, const char *field) {
    std::string trimmed = Trim(value);
    if (trimmed.empty()) {
        throw StudyError(ERR_VALIDATION, std::string(field) + " must not be empty");
    }
    return trimmed;
}
} // namespace

// ─────────────────────────────────────
Repository::Repository(SQLite &db) : m_Db(db) {}

// ─────────────────────────────────────
void Repository::RequireUser(int64_t owner) {
    auto stmt = m_Db.Prepare("SELECT 1 FROM users WHERE id = ?");
    stmt.Bind(1, owner);
    if (!stmt.Step()) {
        throw StudyError(ERR_NOT_FOUND, "user not found");
    }
}

// ─────────────────────────────────────
void Repository::RequireCategory(int64_t owner, int64_t category_id) {
    auto stmt = m_Db.Prepare("SELECT 1 FROM categories WHERE id = ? AND owner_id = ?");
    stmt.Bind(1, category_id).Bind(2, owner);
    if (!stmt.Step()) {
        throw StudyError(ERR_NOT_FOUND, "category not found");
    }
}

// ╭─────────────────────────────────────╮
// │             Categories              │
// ╰─────────────────────────────────────╯
const std::vector<std::string> &Repository::DefaultCategoryNames() {
    static const std::vector<std::string> names = {"Academic", "Personal", "Project", "Urgent"};
    return names;
}

// ─────────────────────────────────────
Category Repository::AddCategory(int64_t owner, const std::string &name) {
    const std::string clean = RequireText(name, "category name");
    if (clean == "Uncategorized") {
        throw StudyError(ERR_VALIDATION, "'Uncategorized' is reserved");
    }
    if (FindCategory(owner, clean)) {
        throw StudyError(ERR_VALIDATION, "category '" + clean + "' already exists");
    }

    SQLite::Transaction tx(m_Db);
    RequireUser(owner);
    auto stmt = m_Db.Prepare("INSERT INTO categories (owner_id, name) VALUES (?, ?)");
    stmt.Bind(1, owner).Bind(2, clean);
    stmt.Run();

    Category c;
    c.id = m_Db.LastInsertId();
    c.owner_id = owner;
    c.name = clean;
    tx.Commit();

    spdlog::debug("category {} added for user {}", c.id, owner);
    return c;
}

// ─────────────────────────────────────
void Repository::RenameCategory(int64_t owner, int64_t category_id, const std::string &name) {
    const std::string clean = RequireText(name, "category name");
    if (clean == "Uncategorized") {
        throw StudyError(ERR_VALIDATION, "'Uncategorized' is reserved");
    }
    auto existing = FindCategory(owner, clean);
    if (existing && existing->id != category_id) {
        throw StudyError(ERR_VALIDATION, "category '" + clean + "' already exists");
    }

    SQLite::Transaction tx(m_Db);
    RequireCategory(owner, category_id);
    auto stmt = m_Db.Prepare("UPDATE categories SET name = ? WHERE id = ? AND owner_id = ?");
    stmt.Bind(1, clean).Bind(2, category_id).Bind(3, owner);
    stmt.Run();
    tx.Commit();
}

// ─────────────────────────────────────
void Repository::DeleteCategory(int64_t owner, int64_t category_id) {
    SQLite::Transaction tx(m_Db);
    RequireCategory(owner, category_id);

    auto reassign =
        m_Db.Prepare("UPDATE tasks SET category_id = NULL WHERE owner_id = ? AND category_id = ?");
    reassign.Bind(1, owner).Bind(2, category_id);
    reassign.Run();
    const int moved = m_Db.Changes();

    auto del = m_Db.Prepare("DELETE FROM categories WHERE id = ? AND owner_id = ?");
    del.Bind(1, category_id).Bind(2, owner);
    del.Run();
    tx.Commit();

    spdlog::info("category {} deleted, {} task(s) moved to Uncategorized", category_id, moved);
}

// ─────────────────────────────────────
std::vector<Category> Repository::FetchCategories(int64_t owner) {
    auto stmt = m_Db.Prepare(
        "SELECT id, owner_id, name FROM categories WHERE owner_id = ? ORDER BY name COLLATE NOCASE");
    stmt.Bind(1, owner);

    std::vector<Category> out;
    while (stmt.Step()) {
        Category c;
        c.id = stmt.GetInt64(0);
        c.owner_id = stmt.GetInt64(1);
        c.name = stmt.GetText(2);
        out.push_back(c);
    }
    return out;
}

// ─────────────────────────────────────
std::optional<Category> Repository::FindCategory(int64_t owner, const std::string &name) {
    auto stmt =
        m_Db.Prepare("SELECT id, owner_id, name FROM categories WHERE owner_id = ? AND name = ?");
    stmt.Bind(1, owner).Bind(2, Trim(name));
    if (!stmt.Step()) {
        return std::nullopt;
    }
    Category c;
    c.id = stmt.GetInt64(0);
    c.owner_id = stmt.GetInt64(1);
    c.name = stmt.GetText(2);
    return c;
}

// ╭─────────────────────────────────────╮
// │                Tasks                │
// ╰─────────────────────────────────────╯
Task Repository::ReadTask(const SQLite::Statement &stmt) const {
    Task t;
    t.id = stmt.GetInt64(0);
    t.owner_id = stmt.GetInt64(1);
    t.title = stmt.GetText(2);
    if (!stmt.IsNull(3)) {
        t.category_id = stmt.GetInt64(3);
        t.category_name = stmt.GetText(4);
    }
    if (!stmt.IsNull(5)) {
        t.due_date = stmt.GetText(5);
    }
    t.status = stmt.GetInt(6) == TASK_COMPLETED ? TASK_COMPLETED : TASK_PENDING;
    t.created_at = stmt.GetDouble(7);
    if (!stmt.IsNull(8)) {
        t.completed_at = stmt.GetDouble(8);
    }
    return t;
}

// ─────────────────────────────────────
Task Repository::CreateTask(int64_t owner, const std::string &title,
                            std::optional<int64_t> category_id,
                            const std::optional<std::string> &due_date) {
    const std::string clean = RequireText(title, "task title");
    std::optional<std::string> due;
    if (due_date && !Trim(*due_date).empty()) {
        due = Trim(*due_date);
        if (!IsValidDate(*due)) {
            throw StudyError(ERR_VALIDATION, "due date must be YYYY-MM-DD");
        }
    }

    SQLite::Transaction tx(m_Db);
    RequireUser(owner);
    if (category_id) {
        RequireCategory(owner, *category_id);
    }

    auto stmt = m_Db.Prepare("INSERT INTO tasks (owner_id, title, category_id, due_date, status, "
                             "created_at) VALUES (?, ?, ?, ?, 0, ?)");
    stmt.Bind(1, owner).Bind(2, clean).Bind(3, category_id).Bind(4, due).Bind(5, NowEpoch());
    stmt.Run();
    const int64_t id = m_Db.LastInsertId();
    tx.Commit();

    spdlog::debug("task {} created for user {}", id, owner);
    return GetTask(owner, id);
}

// ─────────────────────────────────────
Task Repository::GetTask(int64_t owner, int64_t task_id) {
    const std::string sql = std::string(kTaskColumns) + "WHERE t.id = ? AND t.owner_id = ?";
    auto stmt = m_Db.Prepare(sql.c_str());
    stmt.Bind(1, task_id).Bind(2, owner);
    if (!stmt.Step()) {
        throw StudyError(ERR_NOT_FOUND, "task not found");
    }
    return ReadTask(stmt);
}

// ─────────────────────────────────────
std::vector<Task> Repository::FetchTasks(int64_t owner, const TaskFilter &filter) {
    std::string sql = std::string(kTaskColumns) + "WHERE t.owner_id = ?1";
    if (!filter.show_completed) {
        sql += " AND t.status = 0";
    }
    if (filter.category_id) {
        sql += *filter.category_id == 0 ? " AND t.category_id IS NULL" : " AND t.category_id = ?2";
    }
    switch (filter.due) {
    case DUE_ANY:
        break;
    case DUE_TODAY:
        sql += " AND t.due_date = date('now', 'localtime')";
        break;
    case DUE_UPCOMING:
        sql += " AND t.due_date > date('now', 'localtime')"
               " AND t.due_date <= date('now', 'localtime', '+7 days')";
        break;
    case DUE_OVERDUE:
        sql += " AND t.due_date < date('now', 'localtime') AND t.status = 0";
        break;
    }
    sql += " ORDER BY t.due_date IS NULL, t.due_date ASC, t.created_at DESC, t.id DESC LIMIT ?3";

    auto stmt = m_Db.Prepare(sql.c_str());
    stmt.Bind(1, owner);
    if (filter.category_id && *filter.category_id != 0) {
        stmt.Bind(2, *filter.category_id);
    }
    stmt.Bind(3, LimitOrAll(filter.limit));

    std::vector<Task> out;
    while (stmt.Step()) {
        out.push_back(ReadTask(stmt));
    }
    return out;
}

// ─────────────────────────────────────
void Repository::SetTaskCompleted(int64_t owner, int64_t task_id, bool completed) {
    SQLite::Transaction tx(m_Db);
    auto stmt = m_Db.Prepare(
        "UPDATE tasks SET status = ?, completed_at = ? WHERE id = ? AND owner_id = ?");
    stmt.Bind(1, completed ? static_cast<int>(TASK_COMPLETED) : static_cast<int>(TASK_PENDING));
    if (completed) {
        stmt.Bind(2, NowEpoch());
    } else {
        stmt.BindNull(2);
    }
    stmt.Bind(3, task_id).Bind(4, owner);
    stmt.Run();
    if (m_Db.Changes() == 0) {
        throw StudyError(ERR_NOT_FOUND, "task not found");
    }
    tx.Commit();

    spdlog::debug("task {} marked {}", task_id, completed ? "completed" : "pending");
}

// ─────────────────────────────────────
void Repository::DeleteTask(int64_t owner, int64_t task_id) {
    SQLite::Transaction tx(m_Db);
    auto stmt = m_Db.Prepare("DELETE FROM tasks WHERE id = ? AND owner_id = ?");
    stmt.Bind(1, task_id).Bind(2, owner);
    stmt.Run();
    if (m_Db.Changes() == 0) {
        throw StudyError(ERR_NOT_FOUND, "task not found");
    }
    tx.Commit();
}

// ─────────────────────────────────────
std::vector<Task> Repository::FetchReminders(int64_t owner) {
    const std::string sql = std::string(kTaskColumns) +
                            "WHERE t.owner_id = ? AND t.status = 0 AND t.due_date IS NOT NULL "
                            "AND t.due_date <= date('now', 'localtime') "
                            "ORDER BY t.due_date ASC, t.id ASC";
    auto stmt = m_Db.Prepare(sql.c_str());
    stmt.Bind(1, owner);

    std::vector<Task> out;
    while (stmt.Step()) {
        out.push_back(ReadTask(stmt));
    }
    return out;
}

// ╭─────────────────────────────────────╮
// │             Study logs              │
// ╰─────────────────────────────────────╯
StudyLog Repository::ReadStudyLog(const SQLite::Statement &stmt) const {
    StudyLog l;
    l.id = stmt.GetInt64(0);
    l.owner_id = stmt.GetInt64(1);
    l.subject = stmt.GetText(2);
    l.duration_minutes = stmt.GetInt(3);
    l.notes = stmt.GetText(4);
    l.logged_at = stmt.GetDouble(5);
    return l;
}

// ─────────────────────────────────────
StudyLog Repository::AddStudyLog(int64_t owner, const std::string &subject,
                                 int duration_minutes, const std::string &notes) {
    const std::string clean = RequireText(subject, "subject");
    if (duration_minutes <= 0) {
        throw StudyError(ERR_VALIDATION, "duration must be a positive number of minutes");
    }

    SQLite::Transaction tx(m_Db);
    RequireUser(owner);

    StudyLog l;
    l.owner_id = owner;
    l.subject = clean;
    l.duration_minutes = duration_minutes;
    l.notes = Trim(notes);
    l.logged_at = NowEpoch();

    auto stmt = m_Db.Prepare("INSERT INTO study_logs (owner_id, subject, duration_minutes, notes, "
                             "logged_at) VALUES (?, ?, ?, ?, ?)");
    stmt.Bind(1, owner).Bind(2, l.subject).Bind(3, l.duration_minutes).Bind(4, l.notes);
    stmt.Bind(5, l.logged_at);
    stmt.Run();
    l.id = m_Db.LastInsertId();
    tx.Commit();

    spdlog::debug("study log {} added: {} min", l.id, l.duration_minutes);
    return l;
}

// ─────────────────────────────────────
std::vector<StudyLog> Repository::FetchStudyLogs(int64_t owner, int limit) {
    auto stmt = m_Db.Prepare("SELECT id, owner_id, subject, duration_minutes, notes, logged_at "
                             "FROM study_logs WHERE owner_id = ? "
                             "ORDER BY logged_at DESC, id DESC LIMIT ?");
    stmt.Bind(1, owner).Bind(2, LimitOrAll(limit));

    std::vector<StudyLog> out;
    while (stmt.Step()) {
        out.push_back(ReadStudyLog(stmt));
    }
    return out;
}

// ─────────────────────────────────────
void Repository::DeleteStudyLog(int64_t owner, int64_t log_id) {
    SQLite::Transaction tx(m_Db);
    auto stmt = m_Db.Prepare("DELETE FROM study_logs WHERE id = ? AND owner_id = ?");
    stmt.Bind(1, log_id).Bind(2, owner);
    stmt.Run();
    if (m_Db.Changes() == 0) {
        throw StudyError(ERR_NOT_FOUND, "study log not found");
    }
    tx.Commit();
}

// ╭─────────────────────────────────────╮
// │            Quiz results             │
// ╰─────────────────────────────────────╯
QuizResult Repository::ReadQuizResult(const SQLite::Statement &stmt) const {
    QuizResult r;
    r.id = stmt.GetInt64(0);
    r.owner_id = stmt.GetInt64(1);
    r.topic = stmt.GetText(2);
    r.score = stmt.GetInt(3);
    r.total_questions = stmt.GetInt(4);
    r.taken_at = stmt.GetDouble(5);
    r.questions_json = stmt.GetText(6);
    return r;
}

// ─────────────────────────────────────
QuizResult Repository::AddQuizResult(int64_t owner, const std::string &topic, int score,
                                     int total_questions, const std::string &questions_json) {
    const std::string clean = RequireText(topic, "quiz topic");
    if (total_questions <= 0) {
        throw StudyError(ERR_VALIDATION, "a quiz needs at least one question");
    }
    if (score < 0 || score > total_questions) {
        throw StudyError(ERR_VALIDATION, "score must be between 0 and " +
                                             std::to_string(total_questions));
    }
    const auto parsed = nlohmann::json::parse(questions_json, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) {
        throw StudyError(ERR_VALIDATION, "quiz questions must be a JSON array");
    }

    SQLite::Transaction tx(m_Db);
    RequireUser(owner);

    QuizResult r;
    r.owner_id = owner;
    r.topic = clean;
    r.score = score;
    r.total_questions = total_questions;
    r.taken_at = NowEpoch();
    r.questions_json = questions_json;

    auto stmt = m_Db.Prepare("INSERT INTO quiz_results (owner_id, topic, score, total_questions, "
                             "taken_at, questions_json) VALUES (?, ?, ?, ?, ?, ?)");
    stmt.Bind(1, owner).Bind(2, r.topic).Bind(3, r.score).Bind(4, r.total_questions);
    stmt.Bind(5, r.taken_at).Bind(6, r.questions_json);
    stmt.Run();
    r.id = m_Db.LastInsertId();
    tx.Commit();

    spdlog::info("quiz result saved: {}/{} on '{}'", score, total_questions, r.topic);
    return r;
}

// ─────────────────────────────────────
std::vector<QuizResult> Repository::FetchQuizResults(int64_t owner, int limit) {
    auto stmt = m_Db.Prepare("SELECT id, owner_id, topic, score, total_questions, taken_at, "
                             "questions_json FROM quiz_results WHERE owner_id = ? "
                             "ORDER BY taken_at DESC, id DESC LIMIT ?");
    stmt.Bind(1, owner).Bind(2, LimitOrAll(limit));

    std::vector<QuizResult> out;
    while (stmt.Step()) {
        out.push_back(ReadQuizResult(stmt));
    }
    return out;
}

// ─────────────────────────────────────
QuizResult Repository::GetQuizResult(int64_t owner, int64_t result_id) {
    auto stmt = m_Db.Prepare("SELECT id, owner_id, topic, score, total_questions, taken_at, "
                             "questions_json FROM quiz_results WHERE id = ? AND owner_id = ?");
    stmt.Bind(1, result_id).Bind(2, owner);
    if (!stmt.Step()) {
        throw StudyError(ERR_NOT_FOUND, "quiz result not found");
    }
    return ReadQuizResult(stmt);
}

// ╭─────────────────────────────────────╮
// │             AI content              │
// ╰─────────────────────────────────────╯
AIContent Repository::ReadAIContent(const SQLite::Statement &stmt) const {
    AIContent c;
    c.id = stmt.GetInt64(0);
    c.owner_id = stmt.GetInt64(1);
    c.kind = AIContentKindFromString(stmt.GetText(2)).value_or(CONTENT_EXPLANATION);
    c.prompt = stmt.GetText(3);
    c.response_text = stmt.GetText(4);
    c.created_at = stmt.GetDouble(5);
    return c;
}

// ─────────────────────────────────────
AIContent Repository::AddAIContent(int64_t owner, AIContentKind kind, const std::string &prompt,
                                   const std::string &response_text) {
    const std::string clean = RequireText(prompt, "prompt");
    RequireText(response_text, "response");

    SQLite::Transaction tx(m_Db);
    RequireUser(owner);

    AIContent c;
    c.owner_id = owner;
    c.kind = kind;
    c.prompt = clean;
    c.response_text = response_text;
    c.created_at = NowEpoch();

    auto stmt = m_Db.Prepare("INSERT INTO ai_content (owner_id, kind, prompt, response_text, "
                             "created_at) VALUES (?, ?, ?, ?, ?)");
    stmt.Bind(1, owner).Bind(2, std::string(ToString(kind))).Bind(3, c.prompt);
    stmt.Bind(4, c.response_text).Bind(5, c.created_at);
    stmt.Run();
    c.id = m_Db.LastInsertId();
    tx.Commit();

    spdlog::debug("ai content {} archived as {}", c.id, ToString(kind));
    return c;
}

// ─────────────────────────────────────
std::vector<AIContent> Repository::FetchAIContent(int64_t owner,
                                                  std::optional<AIContentKind> kind) {
    std::string sql = "SELECT id, owner_id, kind, prompt, response_text, created_at "
                      "FROM ai_content WHERE owner_id = ?1";
    if (kind) {
        sql += " AND kind = ?2";
    }
    sql += " ORDER BY created_at DESC, id DESC";

    auto stmt = m_Db.Prepare(sql.c_str());
    stmt.Bind(1, owner);
    if (kind) {
        stmt.Bind(2, std::string(ToString(*kind)));
    }

    std::vector<AIContent> out;
    while (stmt.Step()) {
        out.push_back(ReadAIContent(stmt));
    }
    return out;
}

// ─────────────────────────────────────
AIContent Repository::GetAIContent(int64_t owner, int64_t content_id) {
    auto stmt = m_Db.Prepare("SELECT id, owner_id, kind, prompt, response_text, created_at "
                             "FROM ai_content WHERE id = ? AND owner_id = ?");
    stmt.Bind(1, content_id).Bind(2, owner);
    if (!stmt.Step()) {
        throw StudyError(ERR_NOT_FOUND, "archived content not found");
    }
    return ReadAIContent(stmt);
}

// ─────────────────────────────────────
void Repository::DeleteAIContent(int64_t owner, int64_t content_id) {
    SQLite::Transaction tx(m_Db);
    auto stmt = m_Db.Prepare("DELETE FROM ai_content WHERE id = ? AND owner_id = ?");
    stmt.Bind(1, content_id).Bind(2, owner);
    stmt.Run();
    if (m_Db.Changes() == 0) {
        throw StudyError(ERR_NOT_FOUND, "archived content not found");
    }
    tx.Commit();
}

// ╭─────────────────────────────────────╮
// │            Chat history             │
// ╰─────────────────────────────────────╯
ChatMessage Repository::AddChatMessage(int64_t owner, const std::string &role,
                                       const std::string &content) {
    if (role != "user" && role != "model") {
        throw StudyError(ERR_VALIDATION, "chat role must be 'user' or 'model'");
    }
    RequireText(content, "message");

    SQLite::Transaction tx(m_Db);
    RequireUser(owner);

    ChatMessage m;
    m.role = role;
    m.content = content;
    m.created_at = NowEpoch();

    auto stmt = m_Db.Prepare(
        "INSERT INTO chat_messages (owner_id, role, content, created_at) VALUES (?, ?, ?, ?)");
    stmt.Bind(1, owner).Bind(2, m.role).Bind(3, m.content).Bind(4, m.created_at);
    stmt.Run();
    m.id = m_Db.LastInsertId();
    tx.Commit();
    return m;
}

// ─────────────────────────────────────
std::vector<ChatMessage> Repository::FetchChatHistory(int64_t owner, int limit) {
    auto stmt = m_Db.Prepare("SELECT id, role, content, created_at FROM ("
                             "SELECT id, role, content, created_at FROM chat_messages "
                             "WHERE owner_id = ? ORDER BY created_at DESC, id DESC LIMIT ?"
                             ") ORDER BY created_at ASC, id ASC");
    stmt.Bind(1, owner).Bind(2, LimitOrAll(limit));

    std::vector<ChatMessage> out;
    while (stmt.Step()) {
        ChatMessage m;
        m.id = stmt.GetInt64(0);
        m.role = stmt.GetText(1);
        m.content = stmt.GetText(2);
        m.created_at = stmt.GetDouble(3);
        out.push_back(m);
    }
    return out;
}

// ─────────────────────────────────────
void Repository::ClearChatHistory(int64_t owner) {
    SQLite::Transaction tx(m_Db);
    auto stmt = m_Db.Prepare("DELETE FROM chat_messages WHERE owner_id = ?");
    stmt.Bind(1, owner);
    stmt.Run();
    tx.Commit();
}

// ╭─────────────────────────────────────╮
// │              Settings               │
// ╰─────────────────────────────────────╯
std::optional<std::string> Repository::GetSetting(int64_t owner, const std::string &key) {
    auto stmt = m_Db.Prepare("SELECT value FROM settings WHERE owner_id = ? AND key = ?");
    stmt.Bind(1, owner).Bind(2, key);
    if (!stmt.Step()) {
        return std::nullopt;
    }
    return stmt.GetText(0);
}

// ─────────────────────────────────────
void Repository::SetSetting(int64_t owner, const std::string &key, const std::string &value) {
    RequireText(key, "setting key");

    SQLite::Transaction tx(m_Db);
    RequireUser(owner);
    auto stmt = m_Db.Prepare("INSERT INTO settings (owner_id, key, value) VALUES (?, ?, ?) "
                             "ON CONFLICT(owner_id, key) DO UPDATE SET value = excluded.value");
    stmt.Bind(1, owner).Bind(2, key).Bind(3, value);
    stmt.Run();
    tx.Commit();

    spdlog::debug("setting '{}' updated for user {}", key, owner);
}

// ─────────────────────────────────────
void Repository::DeleteSetting(int64_t owner, const std::string &key) {
    SQLite::Transaction tx(m_Db);
    auto stmt = m_Db.Prepare("DELETE FROM settings WHERE owner_id = ? AND key = ?");
    stmt.Bind(1, owner).Bind(2, key);
    stmt.Run();
    tx.Commit();
}

// ─────────────────────────────────────
int Repository::GetIntSetting(int64_t owner, const std::string &key, int fallback, int min,
                              int max) {
    const auto raw = GetSetting(owner, key);
    if (!raw) {
        return fallback;
    }
    const std::string value = Trim(*raw);
    int parsed = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        spdlog::warn("setting '{}' is not a number, using {}", key, fallback);
        return fallback;
    }
    if (parsed < min || parsed > max) {
        spdlog::warn("setting '{}'={} out of range [{}, {}], using {}", key, parsed, min, max,
                     fallback);
        return fallback;
    }
    return parsed;
}
