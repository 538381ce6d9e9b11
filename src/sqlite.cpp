#include "sqlite.hpp"

#include <cstring>
#include <fstream>
#include <utility>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
SQLite::SQLite(const std::string &db_path) : m_Db(nullptr), m_DbPath(db_path) {
    Open();
}

// ─────────────────────────────────────
SQLite::~SQLite() {
    Close();
}

// ─────────────────────────────────────
void SQLite::Open() {
    if (m_Db) {
        return;
    }

    if (sqlite3_open(m_DbPath.c_str(), &m_Db) != SQLITE_OK) {
        const std::string msg = m_Db ? sqlite3_errmsg(m_Db) : "out of memory";
        spdlog::error("unable to open database: {} ({})", m_DbPath, msg);
        sqlite3_close(m_Db);
        m_Db = nullptr;
        throw StudyError(ERR_STORE, "unable to open database: " + msg);
    }

    spdlog::debug("SQLite database opened: {}", m_DbPath);

    // Keeps small allocations off malloc; must be configured before the first statement.
    sqlite3_db_config(m_Db, SQLITE_DBCONFIG_LOOKASIDE, m_Lookaside.data(), kLookasideSlotSize,
                      kLookasideSlotCount);

    try {
        ApplyPragmas();
        Init();
    } catch (...) {
        Close();
        throw;
    }
}

// ─────────────────────────────────────
void SQLite::Close() {
    if (m_Db) {
        if (sqlite3_close(m_Db) != SQLITE_OK) {
            spdlog::error("sqlite3_close failed: {}", sqlite3_errmsg(m_Db));
            sqlite3_close_v2(m_Db);
        }
        m_Db = nullptr;
        spdlog::debug("SQLite database closed: {}", m_DbPath);
    }
}

// ─────────────────────────────────────
sqlite3 *SQLite::Handle() const {
    if (!m_Db) {
        throw StudyError(ERR_STORE, "database is not open");
    }
    return m_Db;
}

// ─────────────────────────────────────
void SQLite::ApplyPragmas() {
    sqlite3_busy_timeout(m_Db, 2000);

    // Integrity depends on this one, so it must not be ignored.
    Exec("PRAGMA foreign_keys=ON");

    // Rollback journal keeps every committed page in the main file, which is what a byte-copy
    // backup needs.
    ExecIgnoringErrors("PRAGMA journal_mode=DELETE");
    ExecIgnoringErrors("PRAGMA synchronous=FULL");
    ExecIgnoringErrors("PRAGMA temp_store=FILE");
    ExecIgnoringErrors("PRAGMA cache_size = -1000;");
    ExecIgnoringErrors("PRAGMA secure_delete=ON");
}

// ─────────────────────────────────────
void SQLite::Init() {
    spdlog::debug("Initializing SQLite database tables");

    Transaction tx(*this);

    Exec("CREATE TABLE IF NOT EXISTS users ("
         "id INTEGER PRIMARY KEY AUTOINCREMENT,"
         "username TEXT NOT NULL UNIQUE,"
         "password_hash TEXT NOT NULL,"
         "created_at REAL NOT NULL"
         ")");

    // UNIQUE(id, owner_id) is the parent key that keeps task categories same-owner.
    Exec("CREATE TABLE IF NOT EXISTS categories ("
         "id INTEGER PRIMARY KEY AUTOINCREMENT,"
         "owner_id INTEGER NOT NULL REFERENCES users(id) ON DELETE CASCADE,"
         "name TEXT NOT NULL,"
         "UNIQUE(owner_id, name),"
         "UNIQUE(id, owner_id)"
         ")");

    Exec("CREATE TABLE IF NOT EXISTS tasks ("
         "id INTEGER PRIMARY KEY AUTOINCREMENT,"
         "owner_id INTEGER NOT NULL REFERENCES users(id) ON DELETE CASCADE,"
         "title TEXT NOT NULL CHECK (length(trim(title)) > 0),"
         "category_id INTEGER,"
         "due_date TEXT,"
         "status INTEGER NOT NULL DEFAULT 0 CHECK (status IN (0, 1)),"
         "created_at REAL NOT NULL,"
         "completed_at REAL,"
         "FOREIGN KEY (category_id, owner_id) REFERENCES categories(id, owner_id)"
         ")");

    Exec("CREATE TABLE IF NOT EXISTS study_logs ("
         "id INTEGER PRIMARY KEY AUTOINCREMENT,"
         "owner_id INTEGER NOT NULL REFERENCES users(id) ON DELETE CASCADE,"
         "subject TEXT NOT NULL CHECK (length(trim(subject)) > 0),"
         "duration_minutes INTEGER NOT NULL CHECK (duration_minutes > 0),"
         "notes TEXT,"
         "logged_at REAL NOT NULL"
         ")");

    Exec("CREATE TABLE IF NOT EXISTS quiz_results ("
         "id INTEGER PRIMARY KEY AUTOINCREMENT,"
         "owner_id INTEGER NOT NULL REFERENCES users(id) ON DELETE CASCADE,"
         "topic TEXT NOT NULL,"
         "score INTEGER NOT NULL,"
         "total_questions INTEGER NOT NULL,"
         "taken_at REAL NOT NULL,"
         "questions_json TEXT NOT NULL DEFAULT '[]',"
         "CHECK (total_questions > 0 AND score >= 0 AND score <= total_questions)"
         ")");

    Exec("CREATE TABLE IF NOT EXISTS ai_content ("
         "id INTEGER PRIMARY KEY AUTOINCREMENT,"
         "owner_id INTEGER NOT NULL REFERENCES users(id) ON DELETE CASCADE,"
         "kind TEXT NOT NULL "
         "CHECK (kind IN ('explanation', 'summary', 'questions', 'chat_snapshot')),"
         "prompt TEXT NOT NULL,"
         "response_text TEXT NOT NULL,"
         "created_at REAL NOT NULL"
         ")");

    Exec("CREATE TABLE IF NOT EXISTS chat_messages ("
         "id INTEGER PRIMARY KEY AUTOINCREMENT,"
         "owner_id INTEGER NOT NULL REFERENCES users(id) ON DELETE CASCADE,"
         "role TEXT NOT NULL CHECK (role IN ('user', 'model')),"
         "content TEXT NOT NULL,"
         "created_at REAL NOT NULL"
         ")");

    Exec("CREATE TABLE IF NOT EXISTS settings ("
         "owner_id INTEGER NOT NULL REFERENCES users(id) ON DELETE CASCADE,"
         "key TEXT NOT NULL,"
         "value TEXT NOT NULL,"
         "PRIMARY KEY (owner_id, key)"
         ")");

    Exec("CREATE INDEX IF NOT EXISTS idx_tasks_owner ON tasks(owner_id, status)");
    Exec("CREATE INDEX IF NOT EXISTS idx_study_logs_owner ON study_logs(owner_id, logged_at)");
    Exec("CREATE INDEX IF NOT EXISTS idx_quiz_results_owner ON quiz_results(owner_id)");
    Exec("CREATE INDEX IF NOT EXISTS idx_ai_content_owner ON ai_content(owner_id, kind)");
    Exec("CREATE INDEX IF NOT EXISTS idx_chat_owner ON chat_messages(owner_id, created_at)");

    tx.Commit();

    spdlog::debug("SQLite database tables initialized");
}

// ─────────────────────────────────────
const std::vector<std::string> &SQLite::RequiredTables() {
    static const std::vector<std::string> tables = {
        "users", "categories", "tasks", "study_logs", "quiz_results", "ai_content", "settings",
    };
    return tables;
}

// ─────────────────────────────────────
void SQLite::Exec(const std::string &sql) {
    char *err = nullptr;
    if (sqlite3_exec(Handle(), sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        const std::string msg = err ? err : sqlite3_errmsg(m_Db);
        if (err) {
            sqlite3_free(err);
        }
        spdlog::error("db exec failed: {} ({})", msg, sql);
        throw StudyError(ERR_STORE, "db exec failed: " + msg);
    }
}

// ─────────────────────────────────────
void SQLite::ExecIgnoringErrors(const std::string &sql) {
    char *err = nullptr;
    if (sqlite3_exec(m_Db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        spdlog::warn("db exec ignored failure: {} ({})", err ? err : "unknown", sql);
        if (err) {
            sqlite3_free(err);
        }
    }
}

// ─────────────────────────────────────
SQLite::Statement SQLite::Prepare(const char *sql) {
    sqlite3 *db = Handle();
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        spdlog::error("db prepare failed: {}", sqlite3_errmsg(db));
        throw StudyError(ERR_STORE, std::string("db prepare failed: ") + sqlite3_errmsg(db));
    }
    return Statement(db, stmt);
}

// ─────────────────────────────────────
int64_t SQLite::LastInsertId() const {
    return sqlite3_last_insert_rowid(Handle());
}

// ─────────────────────────────────────
int SQLite::Changes() const {
    return sqlite3_changes(Handle());
}

// ─────────────────────────────────────
bool SQLite::CheckDatabaseFile(const std::string &path, std::string &error) {
    error.clear();

    {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            error = "cannot read " + path;
            return false;
        }
        char header[16] = {};
        in.read(header, sizeof(header));
        if (in.gcount() != sizeof(header) || std::memcmp(header, "SQLite format 3", 16) != 0) {
            error = "not a database file";
            return false;
        }
    }

    sqlite3 *db = nullptr;
    if (sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
        error = db ? sqlite3_errmsg(db) : "unable to open file";
        sqlite3_close(db);
        return false;
    }

    bool ok = true;
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db, "PRAGMA integrity_check", -1, &stmt, nullptr) != SQLITE_OK) {
        error = sqlite3_errmsg(db);
        ok = false;
    } else {
        const int rc = sqlite3_step(stmt);
        const char *res = rc == SQLITE_ROW
                              ? reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0))
                              : nullptr;
        if (!res || std::strcmp(res, "ok") != 0) {
            error = std::string("integrity check failed: ") + (res ? res : sqlite3_errmsg(db));
            ok = false;
        }
    }
    sqlite3_finalize(stmt);

    if (ok) {
        for (const auto &table : RequiredTables()) {
            stmt = nullptr;
            const char *sql = "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?";
            if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
                error = sqlite3_errmsg(db);
                ok = false;
                break;
            }
            sqlite3_bind_text(stmt, 1, table.c_str(), -1, SQLITE_TRANSIENT);
            const bool found = sqlite3_step(stmt) == SQLITE_ROW;
            sqlite3_finalize(stmt);
            if (!found) {
                error = "missing table '" + table + "'";
                ok = false;
                break;
            }
        }
    }

    sqlite3_close(db);
    return ok;
}

// ╭─────────────────────────────────────╮
// │              Statement              │
// ╰─────────────────────────────────────╯
SQLite::Statement::~Statement() {
    if (m_Stmt) {
        sqlite3_finalize(m_Stmt);
        m_Stmt = nullptr;
    }
}

// ─────────────────────────────────────
SQLite::Statement::Statement(Statement &&other) noexcept
    : m_Db(other.m_Db), m_Stmt(std::exchange(other.m_Stmt, nullptr)) {}

// ─────────────────────────────────────
SQLite::Statement &SQLite::Statement::Bind(int idx, int value) {
    sqlite3_bind_int(m_Stmt, idx, value);
    return *this;
}

// ─────────────────────────────────────
SQLite::Statement &SQLite::Statement::Bind(int idx, int64_t value) {
    sqlite3_bind_int64(m_Stmt, idx, static_cast<sqlite3_int64>(value));
    return *this;
}

// ─────────────────────────────────────
SQLite::Statement &SQLite::Statement::Bind(int idx, double value) {
    sqlite3_bind_double(m_Stmt, idx, value);
    return *this;
}

// ─────────────────────────────────────
SQLite::Statement &SQLite::Statement::Bind(int idx, const std::string &value) {
    sqlite3_bind_text(m_Stmt, idx, value.c_str(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
    return *this;
}

// ─────────────────────────────────────
SQLite::Statement &SQLite::Statement::Bind(int idx, const std::optional<std::string> &value) {
    return value ? Bind(idx, *value) : BindNull(idx);
}

// ─────────────────────────────────────
SQLite::Statement &SQLite::Statement::Bind(int idx, const std::optional<int64_t> &value) {
    return value ? Bind(idx, *value) : BindNull(idx);
}

// ─────────────────────────────────────
SQLite::Statement &SQLite::Statement::Bind(int idx, const std::optional<double> &value) {
    return value ? Bind(idx, *value) : BindNull(idx);
}

// ─────────────────────────────────────
SQLite::Statement &SQLite::Statement::BindNull(int idx) {
    sqlite3_bind_null(m_Stmt, idx);
    return *this;
}

// ─────────────────────────────────────
bool SQLite::Statement::Step() {
    const int rc = sqlite3_step(m_Stmt);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    const std::string msg = sqlite3_errmsg(m_Db);
    spdlog::error("db step failed ({}): {}", rc, msg);
    throw StudyError(ERR_STORE, "db step failed: " + msg);
}

// ─────────────────────────────────────
void SQLite::Statement::Run() {
    while (Step()) {
    }
}

// ─────────────────────────────────────
bool SQLite::Statement::IsNull(int col) const {
    return sqlite3_column_type(m_Stmt, col) == SQLITE_NULL;
}

// ─────────────────────────────────────
int SQLite::Statement::GetInt(int col) const {
    return sqlite3_column_int(m_Stmt, col);
}

// ─────────────────────────────────────
int64_t SQLite::Statement::GetInt64(int col) const {
    return static_cast<int64_t>(sqlite3_column_int64(m_Stmt, col));
}

// ─────────────────────────────────────
double SQLite::Statement::GetDouble(int col) const {
    return sqlite3_column_double(m_Stmt, col);
}

// ─────────────────────────────────────
std::string SQLite::Statement::GetText(int col) const {
    const char *txt = reinterpret_cast<const char *>(sqlite3_column_text(m_Stmt, col));
    return txt ? txt : "";
}

// ╭─────────────────────────────────────╮
// │             Transaction             │
// ╰─────────────────────────────────────╯
SQLite::Transaction::Transaction(SQLite &db) : m_Db(db) {
    m_Db.Exec("BEGIN IMMEDIATE");
}

// ─────────────────────────────────────
SQLite::Transaction::~Transaction() {
    if (!m_Done && m_Db.IsOpen()) {
        char *err = nullptr;
        if (sqlite3_exec(m_Db.m_Db, "ROLLBACK", nullptr, nullptr, &err) != SQLITE_OK) {
            spdlog::error("rollback failed: {}", err ? err : "unknown");
            sqlite3_free(err);
        } else {
            spdlog::debug("transaction rolled back");
        }
    }
}

// ─────────────────────────────────────
void SQLite::Transaction::Commit() {
    m_Db.Exec("COMMIT");
    m_Done = true;
}
