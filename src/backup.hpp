#pragma once

#include <string>

#include "sqlite.hpp"

// Byte-copy export and validated restore of the database file.
class Backup {
  public:
    explicit Backup(SQLite &db);

    void Export(const std::string &destination);
    // Throws ERR_STORE, leaving the current database untouched, when the candidate is not a
    // usable database. The store is reopened on the restored file.
    void Restore(const std::string &source);
    static std::string SuggestedFileName();

  private:
    SQLite &m_Db;
};
