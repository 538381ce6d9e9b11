#pragma once

#include <string>

#include "common.hpp"
#include "sqlite.hpp"

class AuthService {
  public:
    explicit AuthService(SQLite &db);

    // Creates the user and seeds the default categories. Throws ERR_VALIDATION or
    // ERR_DUPLICATE_USERNAME.
    User Register(const std::string &username, const std::string &password);
    // Throws ERR_INVALID_CREDENTIALS for an unknown user or a wrong password alike.
    User Login(const std::string &username, const std::string &password);
    void ChangePassword(int64_t user_id, const std::string &current_password,
                        const std::string &new_password);
    // Removes the user and, through the foreign keys, everything they own.
    void DeleteAccount(int64_t user_id, const std::string &password);

    static constexpr std::size_t kMinPasswordLength = 6;

  private:
    std::string HashPassword(const std::string &password);
    bool VerifyPassword(const std::string &password, const std::string &hash);
    std::optional<User> FindUser(const std::string &username);
    std::optional<User> FindUser(int64_t user_id);
    void ValidatePassword(const std::string &password);

    SQLite &m_Db;
};
