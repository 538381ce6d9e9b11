#include "backup.hpp"
#include "common.hpp"

#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

// ─────────────────────────────────────
Backup::Backup(SQLite &db) : m_Db(db) {}

// ─────────────────────────────────────
std::string Backup::SuggestedFileName() {
    return "studydesk_backup_" + FormatLocalTime(NowEpoch(), "%Y%m%d_%H%M%S") + ".sqlite";
}

// ─────────────────────────────────────
void Backup::Export(const std::string &destination) {
    if (Trim(destination).empty()) {
        throw StudyError(ERR_VALIDATION, "no backup destination given");
    }

    fs::path dest(destination);
    std::error_code ec;
    if (fs::is_directory(dest, ec)) {
        dest /= SuggestedFileName();
    }
    if (fs::equivalent(dest, m_Db.Path(), ec)) {
        throw StudyError(ERR_VALIDATION, "backup destination is the live database");
    }

    // Nothing is pending outside a transaction, so the file on disk is complete.
    fs::copy_file(m_Db.Path(), dest, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        spdlog::error("backup to {} failed: {}", dest.string(), ec.message());
        throw StudyError(ERR_STORE, "backup failed: " + ec.message());
    }
    spdlog::info("database backed up to {}", dest.string());
}

// ─────────────────────────────────────
void Backup::Restore(const std::string &source) {
    std::string error;
    if (!SQLite::CheckDatabaseFile(source, error)) {
        spdlog::error("refusing to restore {}: {}", source, error);
        throw StudyError(ERR_STORE, "not a valid StudyDesk backup: " + error);
    }

    const fs::path live(m_Db.Path());
    const fs::path staged = live.string() + ".restore";
    std::error_code ec;

    fs::copy_file(source, staged, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        spdlog::error("restore staging failed: {}", ec.message());
        throw StudyError(ERR_STORE, "restore failed: " + ec.message());
    }

    m_Db.Close();
    fs::rename(staged, live, ec);
    if (ec) {
        spdlog::error("restore of {} failed: {}", source, ec.message());
        std::error_code rm_ec;
        if (!fs::remove(staged, rm_ec) && rm_ec) {
            spdlog::warn("could not remove {}: {}", staged.string(), rm_ec.message());
        }
        m_Db.Open();
        throw StudyError(ERR_STORE, "restore failed: " + ec.message());
    }

    m_Db.Open();
    spdlog::info("database restored from {}", source);
}
