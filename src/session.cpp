#include "session.hpp"
#include "errors.hpp"

#include <array>
#include <utility>

#include <spdlog/spdlog.h>

namespace {
struct Transition {
    Screen from;
    Screen to;
};

// Login and logout are not listed: they only happen through Controller::Login/Logout.
constexpr std::array<Transition, 16> kTransitions = {{
    {SCREEN_MAIN_MENU, SCREEN_TASK_MANAGER},
    {SCREEN_MAIN_MENU, SCREEN_STUDY_TRACKER},
    {SCREEN_MAIN_MENU, SCREEN_AI_HELPER},
    {SCREEN_MAIN_MENU, SCREEN_AI_QUIZ},
    {SCREEN_MAIN_MENU, SCREEN_AI_CHAT},
    {SCREEN_MAIN_MENU, SCREEN_ANALYTICS},
    {SCREEN_MAIN_MENU, SCREEN_REVIEW_HUB},
    {SCREEN_MAIN_MENU, SCREEN_SETTINGS},
    {SCREEN_TASK_MANAGER, SCREEN_MAIN_MENU},
    {SCREEN_STUDY_TRACKER, SCREEN_MAIN_MENU},
    {SCREEN_AI_HELPER, SCREEN_MAIN_MENU},
    {SCREEN_AI_QUIZ, SCREEN_MAIN_MENU},
    {SCREEN_AI_CHAT, SCREEN_MAIN_MENU},
    {SCREEN_ANALYTICS, SCREEN_MAIN_MENU},
    {SCREEN_REVIEW_HUB, SCREEN_MAIN_MENU},
    {SCREEN_SETTINGS, SCREEN_MAIN_MENU},
}};
} // namespace

// ─────────────────────────────────────
const char *ToString(Screen screen) {
    switch (screen) {
    case SCREEN_LOGGED_OUT:
        return "LoggedOut";
    case SCREEN_MAIN_MENU:
        return "MainMenu";
    case SCREEN_TASK_MANAGER:
        return "TaskManager";
    case SCREEN_STUDY_TRACKER:
        return "StudyTracker";
    case SCREEN_AI_HELPER:
        return "AIHelper";
    case SCREEN_AI_QUIZ:
        return "AIQuiz";
    case SCREEN_AI_CHAT:
        return "AIChat";
    case SCREEN_ANALYTICS:
        return "Analytics";
    case SCREEN_REVIEW_HUB:
        return "ReviewHub";
    case SCREEN_SETTINGS:
        return "Settings";
    }
    return "Unknown";
}

// ─────────────────────────────────────
bool Controller::IsAllowed(Screen from, Screen to) {
    for (const auto &t : kTransitions) {
        if (t.from == from && t.to == to) {
            return true;
        }
    }
    return false;
}

// ─────────────────────────────────────
const Session &Controller::Active() const {
    if (!m_Session) {
        throw StudyError(ERR_INVALID_CREDENTIALS, "not logged in");
    }
    return *m_Session;
}

// ─────────────────────────────────────
Session &Controller::Active() {
    if (!m_Session) {
        throw StudyError(ERR_INVALID_CREDENTIALS, "not logged in");
    }
    return *m_Session;
}

// ─────────────────────────────────────
void Controller::Login(const User &user, const std::string &api_key) {
    if (m_Screen != SCREEN_LOGGED_OUT) {
        spdlog::warn("login requested from {}, ignoring", ToString(m_Screen));
        return;
    }
    Session s;
    s.user = user;
    s.user.password_hash.clear();
    s.api_key = api_key;
    s.started_at = NowEpoch();
    m_Session = std::move(s);
    m_Screen = SCREEN_MAIN_MENU;
    spdlog::debug("session started for '{}'", user.username);
}

// ─────────────────────────────────────
void Controller::Logout() {
    if (m_Session) {
        spdlog::debug("session ended for '{}'", m_Session->user.username);
    }
    m_Session.reset();
    m_Screen = SCREEN_LOGGED_OUT;
}

// ─────────────────────────────────────
bool Controller::Navigate(Screen target) {
    if (!m_Session || !IsAllowed(m_Screen, target)) {
        spdlog::warn("illegal transition {} -> {}", ToString(m_Screen), ToString(target));
        return false;
    }
    spdlog::debug("screen {} -> {}", ToString(m_Screen), ToString(target));
    m_Screen = target;
    return true;
}

// ─────────────────────────────────────
bool Controller::Back() {
    if (m_Screen == SCREEN_LOGGED_OUT || m_Screen == SCREEN_MAIN_MENU) {
        return false;
    }
    return Navigate(SCREEN_MAIN_MENU);
}

// ─────────────────────────────────────
void Controller::SetApiKey(const std::string &api_key) {
    Active().api_key = api_key;
}
