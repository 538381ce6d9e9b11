#pragma once

#include <optional>
#include <string>

#include "common.hpp"

enum Screen {
    SCREEN_LOGGED_OUT,
    SCREEN_MAIN_MENU,
    SCREEN_TASK_MANAGER,
    SCREEN_STUDY_TRACKER,
    SCREEN_AI_HELPER,
    SCREEN_AI_QUIZ,
    SCREEN_AI_CHAT,
    SCREEN_ANALYTICS,
    SCREEN_REVIEW_HUB,
    SCREEN_SETTINGS,
};

const char *ToString(Screen screen);

struct Session {
    User user;
    std::string api_key;
    double started_at = 0.0;
};

// Owns the logged-in session and the active screen. Every move goes through a fixed table.
class Controller {
  public:
    Screen Current() const {
        return m_Screen;
    }
    bool LoggedIn() const {
        return m_Session.has_value();
    }
    const Session &Active() const;
    Session &Active();

    // LoggedOut -> MainMenu; the user must already be authenticated.
    void Login(const User &user, const std::string &api_key);
    void Logout();
    // Returns false (and logs) when the table forbids the move.
    bool Navigate(Screen target);
    bool Back();

    void SetApiKey(const std::string &api_key);

    static bool IsAllowed(Screen from, Screen to);

  private:
    Screen m_Screen = SCREEN_LOGGED_OUT;
    std::optional<Session> m_Session;
};
