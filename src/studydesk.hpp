#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

// parts
#include "analytics.hpp"
#include "async_request.hpp"
#include "auth.hpp"
#include "backup.hpp"
#include "console.hpp"
#include "gemini.hpp"
#include "notification.hpp"
#include "pomodoro.hpp"
#include "repository.hpp"
#include "secrets.hpp"
#include "session.hpp"
#include "sqlite.hpp"

#include "common.hpp"

class StudyDesk {
  public:
    explicit StudyDesk(LogLevel log_level);
    ~StudyDesk();

    int Run();

    static LogLevel LogLevelFromEnv();
    static std::filesystem::path GetDataDir();

  private:
    void InitLogging(LogLevel log_level);

    // Screens
    void LoggedOutScreen();
    void MainMenuScreen();
    void TaskManagerScreen();
    void StudyTrackerScreen();
    void AIHelperScreen();
    void AIQuizScreen();
    void AIChatScreen();
    void AnalyticsScreen();
    void ReviewHubScreen();
    void SettingsScreen();

    // Helpers
    void Login();
    void Register();
    void Logout();
    void ShowReminders();
    void AddTask();
    void ListTasks(const TaskFilter &filter);
    std::optional<int64_t> PickCategory();
    void ChangeTaskFilter();
    void LogStudySession(const std::string &subject_hint, int minutes_hint);
    void RunPomodoro();
    void TakeQuiz(const std::string &topic, std::vector<QuizItem> &items);
    void ReviewQuiz(const std::string &topic, const std::vector<QuizItem> &items);
    void ManageCategories();
    void PomodoroSettings();
    void BackupRestore();
    void AccountSettings();
    PomodoroConfig LoadPomodoroConfig();
    void SyncApiKey();
    void RefreshQuote();

    // Runs an AI call off the interactive thread with a spinner. Enter abandons the wait.
    template <typename T> std::optional<T> WaitForAI(std::function<T(Gemini &)> job);
    // Store errors also leave the current screen.
    void ReportError(const StudyError &e);

    int64_t Owner() const {
        return m_Controller.Active().user.id;
    }

  private:
    std::filesystem::path m_DataDir;
    std::string m_ModelName;

    std::unique_ptr<SQLite> m_SQLite;
    std::unique_ptr<Repository> m_Repository;
    std::unique_ptr<AuthService> m_Auth;
    std::unique_ptr<Analytics> m_Analytics;
    std::unique_ptr<Backup> m_Backup;
    std::unique_ptr<Gemini> m_Gemini;
    std::unique_ptr<Notification> m_Notification;
    std::unique_ptr<Secrets> m_Secrets;

    Controller m_Controller;
    Console m_Console;
    std::optional<AsyncRequest<std::string>> m_Quote;
    std::string m_QuoteText;
    TaskFilter m_TaskFilter;
    bool m_Quit = false;
};
