#include "auth.hpp"
#include "repository.hpp"

#include <sodium.h>
#include <spdlog/spdlog.h>

// ─────────────────────────────────────
AuthService::AuthService(SQLite &db) : m_Db(db) {
    if (sodium_init() < 0) {
        spdlog::error("libsodium initialization failed");
        throw StudyError(ERR_STORE, "libsodium initialization failed");
    }
}

// ─────────────────────────────────────
std::string AuthService::HashPassword(const std::string &password) {
    char out[crypto_pwhash_STRBYTES];
    if (crypto_pwhash_str(out, password.c_str(), static_cast<unsigned long long>(password.size()),
                          crypto_pwhash_OPSLIMIT_INTERACTIVE,
                          crypto_pwhash_MEMLIMIT_INTERACTIVE) != 0) {
        spdlog::error("crypto_pwhash_str failed (likely out of memory)");
        throw StudyError(ERR_STORE, "password hashing failed");
    }
    return std::string(out);
}

// ─────────────────────────────────────
bool AuthService::VerifyPassword(const std::string &password, const std::string &hash) {
    if (hash.empty()) {
        spdlog::warn("password verification against an empty hash");
        return false;
    }
    return crypto_pwhash_str_verify(hash.c_str(), password.c_str(),
                                    static_cast<unsigned long long>(password.size())) == 0;
}

// ─────────────────────────────────────
void AuthService::ValidatePassword(const std::string &password) {
    if (password.size() < kMinPasswordLength) {
        throw StudyError(ERR_VALIDATION, "password must be at least " +
                                             std::to_string(kMinPasswordLength) + " characters");
    }
}

// ─────────────────────────────────────
std::optional<User> AuthService::FindUser(const std::string &username) {
    auto stmt = m_Db.Prepare(
        "SELECT id, username, password_hash, created_at FROM users WHERE username = ?");
    stmt.Bind(1, username);
    if (!stmt.Step()) {
        return std::nullopt;
    }
    User u;
    u.id = stmt.GetInt64(0);
    u.username = stmt.GetText(1);
    u.password_hash = stmt.GetText(2);
    u.created_at = stmt.GetDouble(3);
    return u;
}

// ─────────────────────────────────────
std::optional<User> AuthService::FindUser(int64_t user_id) {
    auto stmt =
        m_Db.Prepare("SELECT id, username, password_hash, created_at FROM users WHERE id = ?");
    stmt.Bind(1, user_id);
    if (!stmt.Step()) {
        return std::nullopt;
    }
    User u;
    u.id = stmt.GetInt64(0);
    u.username = stmt.GetText(1);
    u.password_hash = stmt.GetText(2);
    u.created_at = stmt.GetDouble(3);
    return u;
}

// ─────────────────────────────────────
User AuthService::Register(const std::string &username, const std::string &password) {
    const std::string name = Trim(username);
    if (name.empty()) {
        throw StudyError(ERR_VALIDATION, "username must not be empty");
    }
    ValidatePassword(password);
    if (FindUser(name)) {
        throw StudyError(ERR_DUPLICATE_USERNAME, "username '" + name + "' is already taken");
    }

    User u;
    u.username = name;
    u.password_hash = HashPassword(password);
    u.created_at = NowEpoch();

    SQLite::Transaction tx(m_Db);
    auto insert =
        m_Db.Prepare("INSERT INTO users (username, password_hash, created_at) VALUES (?, ?, ?)");
    insert.Bind(1, u.username).Bind(2, u.password_hash).Bind(3, u.created_at);
    insert.Run();
    u.id = m_Db.LastInsertId();

    for (const auto &category : Repository::DefaultCategoryNames()) {
        auto seed = m_Db.Prepare("INSERT INTO categories (owner_id, name) VALUES (?, ?)");
        seed.Bind(1, u.id).Bind(2, category);
        seed.Run();
    }
    tx.Commit();

    spdlog::info("user '{}' registered (id {})", u.username, u.id);
    return u;
}

// ─────────────────────────────────────
User AuthService::Login(const std::string &username, const std::string &password) {
    auto user = FindUser(Trim(username));
    if (!user || !VerifyPassword(password, user->password_hash)) {
        spdlog::warn("failed login attempt for '{}'", Trim(username));
        throw StudyError(ERR_INVALID_CREDENTIALS, "invalid username or password");
    }
    spdlog::info("user '{}' logged in", user->username);
    return *user;
}

// ─────────────────────────────────────
void AuthService::ChangePassword(int64_t user_id, const std::string &current_password,
                                 const std::string &new_password) {
    auto user = FindUser(user_id);
    if (!user) {
        throw StudyError(ERR_NOT_FOUND, "user not found");
    }
    if (!VerifyPassword(current_password, user->password_hash)) {
        throw StudyError(ERR_INVALID_CREDENTIALS, "current password is incorrect");
    }
    ValidatePassword(new_password);

    const std::string hash = HashPassword(new_password);
    SQLite::Transaction tx(m_Db);
    auto stmt = m_Db.Prepare("UPDATE users SET password_hash = ? WHERE id = ?");
    stmt.Bind(1, hash).Bind(2, user_id);
    stmt.Run();
    tx.Commit();

    spdlog::info("password changed for user {}", user_id);
}

// ─────────────────────────────────────
void AuthService::DeleteAccount(int64_t user_id, const std::string &password) {
    auto user = FindUser(user_id);
    if (!user) {
        throw StudyError(ERR_NOT_FOUND, "user not found");
    }
    if (!VerifyPassword(password, user->password_hash)) {
        throw StudyError(ERR_INVALID_CREDENTIALS, "password is incorrect");
    }

    SQLite::Transaction tx(m_Db);
    // Tasks reference categories, so they go before the cascade reaches categories.
    auto tasks = m_Db.Prepare("DELETE FROM tasks WHERE owner_id = ?");
    tasks.Bind(1, user_id);
    tasks.Run();
    auto stmt = m_Db.Prepare("DELETE FROM users WHERE id = ?");
    stmt.Bind(1, user_id);
    stmt.Run();
    tx.Commit();

    spdlog::info("account '{}' deleted", user->username);
}
