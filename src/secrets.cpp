#include "secrets.hpp"
#include <spdlog/spdlog.h>

namespace {
constexpr const char *kLastUsername = "last_username";
constexpr const char *kApp = "studydesk";
} // namespace

// ─────────────────────────────────────
Secrets::Secrets()
    : m_Schema{"io.studydesk.Secret",
               SECRET_SCHEMA_NONE,
               {{"app", SECRET_SCHEMA_ATTRIBUTE_STRING},
                {"key", SECRET_SCHEMA_ATTRIBUTE_STRING},
                {nullptr, static_cast<SecretSchemaAttributeType>(0)}}} {}

// ─────────────────────────────────────
bool Secrets::Failed(GError *&error, const char *action, const std::string &key) {
    if (!error) {
        return false;
    }
    spdlog::warn("keyring: cannot {} '{}': {}", action, key, error->message);
    g_clear_error(&error);
    return true;
}

// ─────────────────────────────────────
bool Secrets::SaveSecret(const std::string &key, const std::string &value) {
    if (key.empty() || value.empty()) {
        return false;
    }

    GError *error = nullptr;
    const std::string label = "StudyDesk " + key;
    const gboolean stored =
        secret_password_store_sync(&m_Schema, SECRET_COLLECTION_DEFAULT, label.c_str(),
                                   value.c_str(), nullptr, &error, "app", kApp, "key",
                                   key.c_str(), nullptr);
    if (Failed(error, "store", key)) {
        return false;
    }
    return stored;
}

// ─────────────────────────────────────
std::string Secrets::LoadSecret(const std::string &key) {
    if (key.empty()) {
        return "";
    }

    GError *error = nullptr;
    gchar *found = secret_password_lookup_sync(&m_Schema, nullptr, &error, "app", kApp, "key",
                                               key.c_str(), nullptr);
    if (Failed(error, "look up", key) || !found) {
        return "";
    }
    std::string value(found);
    secret_password_free(found);
    return value;
}

// ─────────────────────────────────────
bool Secrets::ClearSecret(const std::string &key) {
    GError *error = nullptr;
    const gboolean removed = secret_password_clear_sync(&m_Schema, nullptr, &error, "app", kApp,
                                                        "key", key.c_str(), nullptr);
    if (Failed(error, "clear", key)) {
        return false;
    }
    return removed;
}

// ─────────────────────────────────────
bool Secrets::RememberUsername(const std::string &username) {
    return SaveSecret(kLastUsername, username);
}

// ─────────────────────────────────────
std::string Secrets::LastUsername() {
    return LoadSecret(kLastUsername);
}

// ─────────────────────────────────────
bool Secrets::ForgetUsername() {
    return ClearSecret(kLastUsername);
}
