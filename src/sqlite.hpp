#pragma once

#include <sqlite3.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"

class SQLite {
  public:
    explicit SQLite(const std::string &db_path);
    ~SQLite();

    SQLite(const SQLite &) = delete;
    SQLite &operator=(const SQLite &) = delete;

    // Thin RAII wrapper, finalizes on scope exit. Bind indices are 1-based, columns 0-based.
    class Statement {
      public:
        Statement(sqlite3 *db, sqlite3_stmt *stmt) : m_Db(db), m_Stmt(stmt) {}
        ~Statement();

        Statement(const Statement &) = delete;
        Statement &operator=(const Statement &) = delete;
        Statement(Statement &&other) noexcept;

        Statement &Bind(int idx, int value);
        Statement &Bind(int idx, int64_t value);
        Statement &Bind(int idx, double value);
        Statement &Bind(int idx, const std::string &value);
        Statement &Bind(int idx, const std::optional<std::string> &value);
        Statement &Bind(int idx, const std::optional<int64_t> &value);
        Statement &Bind(int idx, const std::optional<double> &value);
        Statement &BindNull(int idx);

        // true while rows remain; throws StudyError(ERR_STORE) on failure
        bool Step();
        void Run();

        bool IsNull(int col) const;
        int GetInt(int col) const;
        int64_t GetInt64(int col) const;
        double GetDouble(int col) const;
        std::string GetText(int col) const;

      private:
        sqlite3 *m_Db = nullptr;
        sqlite3_stmt *m_Stmt = nullptr;
    };

    // Rolls back on destruction unless Commit() was called.
    class Transaction {
      public:
        explicit Transaction(SQLite &db);
        ~Transaction();

        Transaction(const Transaction &) = delete;
        Transaction &operator=(const Transaction &) = delete;

        void Commit();

      private:
        SQLite &m_Db;
        bool m_Done = false;
    };

    Statement Prepare(const char *sql);
    void Exec(const std::string &sql);
    int64_t LastInsertId() const;
    int Changes() const;

    const std::string &Path() const {
        return m_DbPath;
    }
    bool IsOpen() const {
        return m_Db != nullptr;
    }

    void Close();
    void Open();

    // Validates that a file is a readable database carrying the tables this store creates.
    static bool CheckDatabaseFile(const std::string &path, std::string &error);
    static const std::vector<std::string> &RequiredTables();

  private:
    void ApplyPragmas();
    void Init();
    void ExecIgnoringErrors(const std::string &sql);
    sqlite3 *Handle() const;

  private:
    sqlite3 *m_Db = nullptr;
    std::string m_DbPath;

    // Small deterministic lookaside buffer to reduce heap churn.
    static constexpr int kLookasideSlotSize = 128;
    static constexpr int kLookasideSlotCount = 256; // 32 KiB
    std::array<unsigned char, kLookasideSlotSize * kLookasideSlotCount> m_Lookaside{};
};
