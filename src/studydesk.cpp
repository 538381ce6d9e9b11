#include "studydesk.hpp"

#include <cstdlib>
#include <iostream>

#include <spdlog/sinks/basic_file_sink.h>

// ─────────────────────────────────────
StudyDesk::StudyDesk(LogLevel log_level) {
    m_DataDir = GetDataDir();
    InitLogging(log_level);

    const std::filesystem::path dbpath = m_DataDir / "studydesk.sqlite";
    spdlog::info("StudyDesk starting");
    spdlog::info("DataBase path: {}", dbpath.string());

    // SQLite
    m_SQLite = std::make_unique<SQLite>(dbpath.string());
    m_Repository = std::make_unique<Repository>(*m_SQLite);
    m_Analytics = std::make_unique<Analytics>(*m_SQLite);
    m_Backup = std::make_unique<Backup>(*m_SQLite);
    spdlog::info("SQLite database initialized");

    // Auth
    m_Auth = std::make_unique<AuthService>(*m_SQLite);

    // Gemini
    const char *model = std::getenv("STUDYDESK_GEMINI_MODEL");
    m_ModelName = model && *model ? model : Gemini::kDefaultModel;
    m_Gemini = std::make_unique<Gemini>(Gemini::kDefaultBaseUrl, m_ModelName);
    spdlog::info("Gemini client initialized (model {})", m_ModelName);

    // Secrets
    m_Secrets = std::make_unique<Secrets>();
    spdlog::info("Secrets manager initialized");

    // Notifications
    m_Notification = std::make_unique<Notification>();
    spdlog::info("Notification system initialized");
}

// ─────────────────────────────────────
StudyDesk::~StudyDesk() {
    spdlog::info("StudyDesk shutting down");
    spdlog::default_logger()->flush();
}

// ─────────────────────────────────────
LogLevel StudyDesk::LogLevelFromEnv() {
    const char *env = std::getenv("STUDYDESK_LOG_LEVEL");
    const std::string level = env ? env : "";
    if (level == "debug") {
        return LOG_DEBUG;
    }
    if (level == "off") {
        return LOG_OFF;
    }
    return LOG_INFO;
}

// ─────────────────────────────────────
std::filesystem::path StudyDesk::GetDataDir() {
    std::filesystem::path dir;
    const char *custom = std::getenv("STUDYDESK_DATA_DIR");
    const char *xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (custom && *custom) {
        dir = custom;
    } else if (xdgDataHome && *xdgDataHome) {
        dir = std::filesystem::path(xdgDataHome) / "studydesk";
    } else {
        const char *home = std::getenv("HOME");
        if (!home || !*home) {
            throw StudyError(ERR_STORE, "HOME environment variable not set");
        }
        dir = std::filesystem::path(home) / ".local" / "share" / "studydesk";
    }

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw StudyError(ERR_STORE, "cannot create " + dir.string() + ": " + ec.message());
    }
    return dir;
}

// ─────────────────────────────────────
void StudyDesk::InitLogging(LogLevel log_level) {
    // File logger, so log lines never land in the middle of a screen.
    auto file_logger =
        spdlog::basic_logger_mt("studydesk", (m_DataDir / "studydesk.log").string());
    spdlog::set_default_logger(file_logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

    if (log_level == LOG_DEBUG) {
        spdlog::set_level(spdlog::level::debug);
    } else if (log_level == LOG_INFO) {
        spdlog::set_level(spdlog::level::info);
    } else if (log_level == LOG_OFF) {
        spdlog::set_level(spdlog::level::off);
    }
    spdlog::flush_on(spdlog::level::warn);
}

// ─────────────────────────────────────
int StudyDesk::Run() {
    while (!m_Quit && !m_Console.Closed()) {
        try {
            switch (m_Controller.Current()) {
            case SCREEN_LOGGED_OUT:
                LoggedOutScreen();
                break;
            case SCREEN_MAIN_MENU:
                MainMenuScreen();
                break;
            case SCREEN_TASK_MANAGER:
                TaskManagerScreen();
                break;
            case SCREEN_STUDY_TRACKER:
                StudyTrackerScreen();
                break;
            case SCREEN_AI_HELPER:
                AIHelperScreen();
                break;
            case SCREEN_AI_QUIZ:
                AIQuizScreen();
                break;
            case SCREEN_AI_CHAT:
                AIChatScreen();
                break;
            case SCREEN_ANALYTICS:
                AnalyticsScreen();
                break;
            case SCREEN_REVIEW_HUB:
                ReviewHubScreen();
                break;
            case SCREEN_SETTINGS:
                SettingsScreen();
                break;
            }
        } catch (const StudyError &e) {
            ReportError(e);
        } catch (const std::exception &e) {
            spdlog::error("unexpected error on screen {}: {}", static_cast<int>(m_Controller.Current()),
                          e.what());
            m_Console.Error(std::string("Unexpected error: ") + e.what());
            if (m_Controller.LoggedIn() && m_Controller.Current() != SCREEN_MAIN_MENU) {
                m_Controller.Back();
            }
        }
    }
    m_Controller.Logout();
    return 0;
}

// ─────────────────────────────────────
void StudyDesk::ReportError(const StudyError &e) {
    switch (e.Code()) {
    case ERR_VALIDATION:
    case ERR_INVALID_CREDENTIALS:
    case ERR_DUPLICATE_USERNAME:
        spdlog::debug("{}: {}", ErrorCodeName(e.Code()), e.what());
        m_Console.Error(e.what());
        return;
    case ERR_NOT_FOUND:
        spdlog::warn("NotFound: {}", e.what());
        m_Console.Error("That item no longer exists.");
        return;
    case ERR_MISSING_API_KEY:
        spdlog::warn("AI request without an API key");
        m_Console.Error("No Gemini API key set. Add one under Settings > Gemini API key.");
        return;
    case ERR_NETWORK:
    case ERR_AI_SERVICE:
    case ERR_MALFORMED_QUIZ:
        spdlog::error("{}: {}", ErrorCodeName(e.Code()), e.what());
        m_Console.Error(std::string("AI request failed: ") + e.what());
        return;
    case ERR_STORE:
        spdlog::error("StoreError: {}", e.what());
        m_Console.Error(std::string("Database error: ") + e.what());
        if (m_Controller.LoggedIn() && m_Controller.Current() != SCREEN_MAIN_MENU) {
            m_Controller.Back();
        }
        return;
    }
    m_Console.Error(e.what());
}

// ─────────────────────────────────────
void StudyDesk::Login() {
    const std::string remembered = m_Secrets->LastUsername();
    std::string username =
        m_Console.ReadLine(remembered.empty() ? "Username" : "Username [" + remembered + "]");
    if (username.empty()) {
        username = remembered;
    }
    const std::string password = m_Console.ReadPassword("Password");
    if (m_Console.Closed()) {
        return;
    }

    const User user = m_Auth->Login(username, password);
    const std::string api_key = m_Repository->GetSetting(user.id, kGeminiApiKey).value_or("");
    m_Controller.Login(user, api_key);
    SyncApiKey();
    if (!m_Secrets->RememberUsername(user.username)) {
        spdlog::debug("username not remembered, keyring unavailable");
    }
    m_QuoteText.clear();
    m_Quote.reset();

    m_Console.Success("Welcome back, " + user.username + "!");
    ShowReminders();
}

// ─────────────────────────────────────
void StudyDesk::Register() {
    m_Console.Header("Create account");
    const std::string username = m_Console.ReadLine("Choose a username");
    const std::string password = m_Console.ReadPassword("Choose a password (min 6 chars)");
    const std::string confirm = m_Console.ReadPassword("Confirm password");
    if (m_Console.Closed()) {
        return;
    }
    if (password != confirm) {
        m_Console.Error("Passwords do not match.");
        return;
    }
    const User user = m_Auth->Register(username, password);
    m_Console.Success("Account '" + user.username + "' created. You can log in now.");
}

// ─────────────────────────────────────
void StudyDesk::Logout() {
    if (m_Controller.LoggedIn()) {
        spdlog::info("user '{}' logged out", m_Controller.Active().user.username);
    }
    m_Controller.Logout();
    m_Gemini->ClearApiKey();
    m_Quote.reset();
    m_QuoteText.clear();
    m_TaskFilter = TaskFilter{};
    m_Console.Info("Logged out.");
}

// ─────────────────────────────────────
void StudyDesk::SyncApiKey() {
    const std::string &key = m_Controller.Active().api_key;
    if (key.empty()) {
        m_Gemini->ClearApiKey();
    } else {
        m_Gemini->SetApiKey(key);
    }
}

// ─────────────────────────────────────
void StudyDesk::ShowReminders() {
    const auto due = m_Repository->FetchReminders(Owner());
    if (due.empty()) {
        return;
    }

    const std::string today = LocalDateString(NowEpoch());
    int overdue = 0;
    m_Console.Header("Reminders");
    for (const auto &t : due) {
        const bool late = t.due_date && *t.due_date < today;
        overdue += late ? 1 : 0;
        m_Console.Info((late ? "OVERDUE  " : "TODAY    ") + t.title + "  (" + t.category_name +
                       ", due " + t.due_date.value_or("") + ")");
    }

    const int today_count = static_cast<int>(due.size()) - overdue;
    const bool sent = m_Notification->SendNotification(
        "appointment-soon", "StudyDesk reminders",
        std::to_string(today_count) + " task(s) due today, " + std::to_string(overdue) +
            " overdue",
        overdue > 0 ? URGENCY_CRITICAL : URGENCY_NORMAL);
    if (!sent) {
        spdlog::debug("reminder notification not delivered, shown in the terminal only");
    }
}

// ─────────────────────────────────────
PomodoroConfig StudyDesk::LoadPomodoroConfig() {
    PomodoroConfig c;
    c.work_minutes = m_Repository->GetIntSetting(Owner(), kPomodoroWorkMinutes, 25, 1, 120);
    c.break_minutes = m_Repository->GetIntSetting(Owner(), kPomodoroBreakMinutes, 5, 1, 60);
    c.long_break_minutes =
        m_Repository->GetIntSetting(Owner(), kPomodoroLongBreakMinutes, 15, 1, 120);
    return c;
}
