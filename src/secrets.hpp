#pragma once

#include <string>
#include <libsecret/secret.h>

// Small values kept in the desktop keyring under the StudyDesk schema. Failures are logged and
// reported as false/empty; the application works without a keyring.
class Secrets {
  public:
    Secrets();

    bool SaveSecret(const std::string &key, const std::string &value);
    std::string LoadSecret(const std::string &key);
    bool ClearSecret(const std::string &key);

    // Pre-fills the login prompt.
    bool RememberUsername(const std::string &username);
    std::string LastUsername();
    bool ForgetUsername();

  private:
    static bool Failed(GError *&error, const char *action, const std::string &key);

    SecretSchema m_Schema;
};
