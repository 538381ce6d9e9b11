#include "studydesk.hpp"
#include "json.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>

namespace {
std::string Shorten(const std::string &s, std::size_t max) {
    std::string flat = s;
    for (auto &c : flat) {
        if (c == '\n' || c == '\r') {
            c = ' ';
        }
    }
    return flat.size() <= max ? flat : flat.substr(0, max - 3) + "...";
}

std::string Clock(std::chrono::seconds s) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld", static_cast<long long>(s.count() / 60),
                  static_cast<long long>(s.count() % 60));
    return buf;
}

std::string Percent(double fraction) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%.1f%%", fraction * 100.0);
    return buf;
}

AIContentKind KindFor(AIMode mode) {
    switch (mode) {
    case MODE_SUMMARIZE:
        return CONTENT_SUMMARY;
    case MODE_QUESTIONS:
        return CONTENT_QUESTIONS;
    default:
        return CONTENT_EXPLANATION;
    }
}

// Stored quiz attempts carry the items plus the answer that was given.
std::vector<QuizItem> ItemsFromJson(const std::string &questions_json) {
    JsonParse parse;
    std::vector<QuizItem> items = Gemini::ParseQuizItems(questions_json);
    const auto raw = nlohmann::json::parse(questions_json, nullptr, false);
    for (std::size_t i = 0; i < items.size() && raw.is_array() && i < raw.size(); i++) {
        const int answer = parse.GetInt(raw[i], "user_answer_index", -1);
        if (answer >= 0 && answer < 4) {
            items[i].answer_index = answer;
        }
    }
    return items;
}
} // namespace

// ─────────────────────────────────────
template <typename T> std::optional<T> StudyDesk::WaitForAI(std::function<T(Gemini &)> job) {
    AsyncRequest<T> request([gemini = *m_Gemini, job]() mutable { return job(gemini); });

    static const char *kFrames[] = {"|", "/", "-", "\\"};
    int frame = 0;
    while (!request.WaitFor(std::chrono::milliseconds(200))) {
        m_Console.Status(std::string("  ") + kFrames[frame++ % 4] +
                         " Waiting for Gemini... (press Enter to cancel)");
        if (m_Console.WaitForInput(std::chrono::milliseconds(0))) {
            m_Console.ReadRaw();
            m_Console.Status("");
            spdlog::info("AI request abandoned by the user");
            m_Console.Info("Cancelled.");
            return std::nullopt;
        }
    }
    m_Console.Status("");
    return request.Get();
}

// ╭─────────────────────────────────────╮
// │             Logged out              │
// ╰─────────────────────────────────────╯
void StudyDesk::LoggedOutScreen() {
    const int choice = m_Console.Menu("StudyDesk", {"Log in", "Register"}, "Quit");
    switch (choice) {
    case 1:
        Login();
        break;
    case 2:
        Register();
        break;
    default:
        m_Quit = true;
        break;
    }
}

// ╭─────────────────────────────────────╮
// │              Main menu              │
// ╰─────────────────────────────────────╯
void StudyDesk::RefreshQuote() {
    if (!m_Gemini->HasApiKey()) {
        m_QuoteText = "Add a Gemini API key in Settings for a daily dose of motivation.";
        return;
    }
    if (!m_Quote && m_QuoteText.empty()) {
        Gemini gemini = *m_Gemini;
        m_Quote.emplace([gemini]() mutable { return gemini.Ask("", MODE_QUOTE); });
        m_QuoteText = "Fetching inspiration...";
        return;
    }
    if (m_Quote && m_Quote->Ready()) {
        try {
            m_QuoteText = "\"" + m_Quote->Get() + "\"";
        } catch (const StudyError &e) {
            spdlog::warn("quote request failed: {}", e.what());
            m_QuoteText = "Keep going!";
        }
        m_Quote.reset();
    }
}

// ─────────────────────────────────────
void StudyDesk::MainMenuScreen() {
    RefreshQuote();
    m_Console.Header("Welcome, " + m_Controller.Active().user.username);
    m_Console.Info(m_QuoteText);

    const int choice = m_Console.Menu("Main menu", {"Task manager", "Study tracker", "AI helper",
                                                    "AI quiz", "AI chat", "Analytics",
                                                    "Review hub", "Settings", "New quote"},
                                      "Log out");
    switch (choice) {
    case 1:
        m_Controller.Navigate(SCREEN_TASK_MANAGER);
        break;
    case 2:
        m_Controller.Navigate(SCREEN_STUDY_TRACKER);
        break;
    case 3:
        m_Controller.Navigate(SCREEN_AI_HELPER);
        break;
    case 4:
        m_Controller.Navigate(SCREEN_AI_QUIZ);
        break;
    case 5:
        m_Controller.Navigate(SCREEN_AI_CHAT);
        break;
    case 6:
        m_Controller.Navigate(SCREEN_ANALYTICS);
        break;
    case 7:
        m_Controller.Navigate(SCREEN_REVIEW_HUB);
        break;
    case 8:
        m_Controller.Navigate(SCREEN_SETTINGS);
        break;
    case 9:
        m_Quote.reset();
        m_QuoteText.clear();
        break;
    default:
        Logout();
        break;
    }
}

// ╭─────────────────────────────────────╮
// │            Task manager             │
// ╰─────────────────────────────────────╯
void StudyDesk::ListTasks(const TaskFilter &filter) {
    const auto tasks = m_Repository->FetchTasks(Owner(), filter);
    if (tasks.empty()) {
        m_Console.Info("No tasks match the current filter.");
        return;
    }
    for (const auto &t : tasks) {
        char line[512];
        std::snprintf(line, sizeof(line), "[%lld] %s %-40s %-14s %s", static_cast<long long>(t.id),
                      t.status == TASK_COMPLETED ? "[x]" : "[ ]", Shorten(t.title, 40).c_str(),
                      t.category_name.c_str(), t.due_date ? t.due_date->c_str() : "-");
        m_Console.Info(line);
    }
}

// ─────────────────────────────────────
std::optional<int64_t> StudyDesk::PickCategory() {
    const auto categories = m_Repository->FetchCategories(Owner());
    std::vector<std::string> names;
    for (const auto &c : categories) {
        names.push_back(c.name);
    }
    const int choice = m_Console.Menu("Category", names, "Uncategorized");
    if (choice == 0) {
        return std::nullopt;
    }
    return categories[static_cast<std::size_t>(choice - 1)].id;
}

// ─────────────────────────────────────
void StudyDesk::AddTask() {
    const std::string title = m_Console.ReadLine("Task description");
    if (title.empty()) {
        m_Console.Error("Task description cannot be empty.");
        return;
    }
    const auto category = PickCategory();
    const std::string due = m_Console.ReadLine("Due date YYYY-MM-DD (blank for none)");

    const Task t = m_Repository->CreateTask(
        Owner(), title, category, due.empty() ? std::nullopt : std::optional<std::string>(due));
    m_Console.Success("Task added: " + t.title);
}

// ─────────────────────────────────────
void StudyDesk::ChangeTaskFilter() {
    const int due = m_Console.Menu("Due date filter",
                                   {"Any", "Due today", "Upcoming (7 days)", "Overdue"});
    switch (due) {
    case 1:
        m_TaskFilter.due = DUE_ANY;
        break;
    case 2:
        m_TaskFilter.due = DUE_TODAY;
        break;
    case 3:
        m_TaskFilter.due = DUE_UPCOMING;
        break;
    case 4:
        m_TaskFilter.due = DUE_OVERDUE;
        break;
    default:
        return;
    }

    const auto categories = m_Repository->FetchCategories(Owner());
    std::vector<std::string> names = {"All categories", "Uncategorized"};
    for (const auto &c : categories) {
        names.push_back(c.name);
    }
    const int pick = m_Console.Menu("Category filter", names);
    if (pick == 1) {
        m_TaskFilter.category_id.reset();
    } else if (pick == 2) {
        m_TaskFilter.category_id = 0;
    } else if (pick > 2) {
        m_TaskFilter.category_id = categories[static_cast<std::size_t>(pick - 3)].id;
    }
}

// ─────────────────────────────────────
void StudyDesk::TaskManagerScreen() {
    m_Console.Header("Task manager");
    ListTasks(m_TaskFilter);

    const int choice = m_Console.Menu(
        "Tasks", {"Add task", "Toggle completed", "Delete task", "Filter",
                  m_TaskFilter.show_completed ? "Hide completed" : "Show completed", "Reminders"});
    switch (choice) {
    case 1:
        AddTask();
        break;
    case 2: {
        auto id = m_Console.ReadInt("Task id", 1, INT32_MAX);
        if (id) {
            const Task t = m_Repository->GetTask(Owner(), *id);
            m_Repository->SetTaskCompleted(Owner(), t.id, t.status != TASK_COMPLETED);
            m_Console.Success(t.status == TASK_COMPLETED ? "Task reopened." : "Task completed.");
        }
        break;
    }
    case 3: {
        auto id = m_Console.ReadInt("Task id", 1, INT32_MAX);
        if (id && m_Console.Confirm("Delete task " + std::to_string(*id) + "?")) {
            m_Repository->DeleteTask(Owner(), *id);
            m_Console.Success("Task deleted.");
        }
        break;
    }
    case 4:
        ChangeTaskFilter();
        break;
    case 5:
        m_TaskFilter.show_completed = !m_TaskFilter.show_completed;
        break;
    case 6:
        ShowReminders();
        break;
    default:
        m_Controller.Back();
        break;
    }
}

// ╭─────────────────────────────────────╮
// │            Study tracker            │
// ╰─────────────────────────────────────╯
void StudyDesk::LogStudySession(const std::string &subject_hint, int minutes_hint) {
    std::string subject = m_Console.ReadLine(
        subject_hint.empty() ? "Subject" : "Subject [" + subject_hint + "]");
    if (subject.empty()) {
        subject = subject_hint;
    }

    int minutes = minutes_hint;
    if (minutes <= 0) {
        auto entered = m_Console.ReadInt("Duration in minutes", 1, 24 * 60);
        if (!entered) {
            return;
        }
        minutes = *entered;
    }
    const std::string notes = m_Console.ReadLine("Notes (optional)");

    const StudyLog log = m_Repository->AddStudyLog(Owner(), subject, minutes, notes);
    m_Console.Success("Logged " + std::to_string(log.duration_minutes) + " min of " + log.subject);
}

// ─────────────────────────────────────
void StudyDesk::RunPomodoro() {
    PomodoroTimer timer(LoadPomodoroConfig());
    const std::string subject = m_Console.ReadLine("What are you studying?");
    m_Console.Info("Commands: p = pause/resume, s = skip phase, q = stop");
    timer.Start();

    auto last = std::chrono::steady_clock::now();
    while (!m_Console.Closed()) {
        m_Console.Status(std::string("  ") + ToString(timer.Phase()) + "  " +
                         Clock(timer.Remaining()) + (timer.Running() ? "" : "  (paused)") +
                         "  #" + std::to_string(timer.CompletedWorkPhases() + 1) + " > ");

        PomodoroTimer::TickResult r;
        if (m_Console.WaitForInput(std::chrono::seconds(1))) {
            const std::string cmd = m_Console.ReadRaw();
            if (cmd == "q") {
                break;
            }
            if (cmd == "p") {
                timer.Running() ? timer.Pause() : timer.Start();
            } else if (cmd == "s") {
                r = timer.Skip();
            }
        }

        const auto now = std::chrono::steady_clock::now();
        const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - last);
        if (elapsed.count() > 0) {
            last += elapsed;
            if (!r.phase_changed) {
                r = timer.Tick(elapsed);
            }
        }

        if (!r.phase_changed) {
            continue;
        }
        m_Console.Status("");
        m_Console.Print("");
        const std::string msg =
            std::string(ToString(r.finished)) + " finished. " + ToString(r.next) + " is next.";
        m_Console.Success(msg);
        if (!m_Notification->SendNotification("alarm-clock", "Pomodoro", msg)) {
            m_Console.Print("\a");
        }

        if (r.finished == PHASE_WORK && r.finished_minutes > 0 &&
            m_Console.Confirm("Log " + std::to_string(r.finished_minutes) + " minutes?")) {
            LogStudySession(subject, r.finished_minutes);
        }
        last = std::chrono::steady_clock::now();
    }
    m_Console.Status("");
    m_Console.Print("");
    m_Console.Info("Pomodoro stopped after " + std::to_string(timer.CompletedWorkPhases()) +
                   " work phase(s).");
}

// ─────────────────────────────────────
void StudyDesk::StudyTrackerScreen() {
    m_Console.Header("Study tracker");
    const auto logs = m_Repository->FetchStudyLogs(Owner(), 10);
    if (logs.empty()) {
        m_Console.Info("No study sessions yet.");
    }
    for (const auto &l : logs) {
        m_Console.Info("[" + std::to_string(l.id) + "] " + FormatLocalTime(l.logged_at) + "  " +
                       l.subject + "  " + std::to_string(l.duration_minutes) + " min" +
                       (l.notes.empty() ? "" : "  (" + Shorten(l.notes, 40) + ")"));
    }

    const auto cfg = LoadPomodoroConfig();
    const int choice = m_Console.Menu(
        "Study", {"Log a session", "Pomodoro timer (" + std::to_string(cfg.work_minutes) + "/" +
                                       std::to_string(cfg.break_minutes) + ")",
                  "Delete a session"});
    switch (choice) {
    case 1:
        LogStudySession("", 0);
        break;
    case 2:
        RunPomodoro();
        break;
    case 3: {
        auto id = m_Console.ReadInt("Session id", 1, INT32_MAX);
        if (id && m_Console.Confirm("Delete session " + std::to_string(*id) + "?")) {
            m_Repository->DeleteStudyLog(Owner(), *id);
            m_Console.Success("Session deleted.");
        }
        break;
    }
    default:
        m_Controller.Back();
        break;
    }
}

// ╭─────────────────────────────────────╮
// │              AI helper              │
// ╰─────────────────────────────────────╯
void StudyDesk::AIHelperScreen() {
    const int choice = m_Console.Menu(
        "AI helper", {"Explain a concept", "Summarize text", "Practice questions"});
    AIMode mode = MODE_EXPLAIN;
    std::string input;
    switch (choice) {
    case 1:
        input = m_Console.ReadLine("Concept");
        break;
    case 2:
        mode = MODE_SUMMARIZE;
        input = m_Console.ReadBlock("Paste the text to summarize");
        break;
    case 3:
        mode = MODE_QUESTIONS;
        input = m_Console.ReadLine("Topic");
        break;
    default:
        m_Controller.Back();
        return;
    }
    if (input.empty()) {
        m_Console.Error("Please enter some text first.");
        return;
    }

    auto answer =
        WaitForAI<std::string>([input, mode](Gemini &g) { return g.Ask(input, mode); });
    if (!answer) {
        return;
    }
    m_Console.Header("Gemini");
    m_Console.Print(*answer);

    if (m_Console.Confirm("Save to the review hub?")) {
        m_Repository->AddAIContent(Owner(), KindFor(mode), input, *answer);
        m_Console.Success("Saved.");
    }
}

// ╭─────────────────────────────────────╮
// │               AI quiz               │
// ╰─────────────────────────────────────╯
void StudyDesk::TakeQuiz(const std::string &topic, std::vector<QuizItem> &items) {
    int score = 0;
    for (std::size_t i = 0; i < items.size() && !m_Console.Closed(); i++) {
        auto &item = items[i];
        m_Console.Header("Question " + std::to_string(i + 1) + "/" + std::to_string(items.size()));
        m_Console.Print(item.question);
        for (std::size_t c = 0; c < item.choices.size(); c++) {
            m_Console.Info(std::to_string(c + 1) + ") " + item.choices[c]);
        }
        auto answer = m_Console.ReadInt("Your answer (blank to skip)", 1, 4);
        if (answer) {
            item.answer_index = *answer - 1;
        }
        if (item.answer_index && *item.answer_index == item.correct_index) {
            score++;
            m_Console.Success("Correct!");
        } else {
            m_Console.Error("The answer was " + std::to_string(item.correct_index + 1) + ") " +
                            item.choices[static_cast<std::size_t>(item.correct_index)]);
        }
        if (!item.explanation.empty()) {
            m_Console.Info(item.explanation);
        }
    }

    const int total = static_cast<int>(items.size());
    m_Repository->AddQuizResult(Owner(), topic, score, total,
                                Gemini::QuizItemsToJson(items).dump());
    m_Console.Header("Result");
    m_Console.Success("You scored " + std::to_string(score) + "/" + std::to_string(total) + " (" +
                      Percent(static_cast<double>(score) / total) + ")");
}

// ─────────────────────────────────────
void StudyDesk::ReviewQuiz(const std::string &topic, const std::vector<QuizItem> &items) {
    m_Console.Header("Review: " + topic);
    for (std::size_t i = 0; i < items.size(); i++) {
        const auto &item = items[i];
        m_Console.Print(std::to_string(i + 1) + ". " + item.question);
        for (std::size_t c = 0; c < item.choices.size(); c++) {
            std::string mark = "   ";
            if (static_cast<int>(c) == item.correct_index) {
                mark = " ✔ ";
            } else if (item.answer_index && *item.answer_index == static_cast<int>(c)) {
                mark = " ✘ ";
            }
            m_Console.Info(mark + item.choices[c]);
        }
        if (!item.answer_index) {
            m_Console.Info("   (skipped)");
        }
        m_Console.Info("   " + item.explanation);
    }
}

// ─────────────────────────────────────
void StudyDesk::AIQuizScreen() {
    const int choice = m_Console.Menu("AI quiz", {"New quiz", "Past results"});
    if (choice == 1) {
        const std::string topic = m_Console.ReadLine("Quiz topic");
        if (topic.empty()) {
            m_Console.Error("Please enter a quiz topic.");
            return;
        }
        auto count = m_Console.ReadInt("Number of questions (3-10)", Gemini::kMinQuizQuestions,
                                       Gemini::kMaxQuizQuestions);
        if (!count) {
            return;
        }
        const int n = *count;
        auto items = WaitForAI<std::vector<QuizItem>>(
            [topic, n](Gemini &g) { return g.GenerateQuiz(topic, n); });
        if (!items) {
            return;
        }
        TakeQuiz(topic, *items);
        if (m_Console.Confirm("Review your answers?")) {
            ReviewQuiz(topic, *items);
            m_Console.Pause();
        }
    } else if (choice == 2) {
        const auto results = m_Repository->FetchQuizResults(Owner(), 20);
        if (results.empty()) {
            m_Console.Info("No quizzes taken yet.");
            return;
        }
        for (const auto &r : results) {
            m_Console.Info("[" + std::to_string(r.id) + "] " + FormatLocalTime(r.taken_at) + "  " +
                           r.topic + "  " + std::to_string(r.score) + "/" +
                           std::to_string(r.total_questions));
        }
        auto id = m_Console.ReadInt("Review quiz id (blank to skip)", 1, INT32_MAX);
        if (!id) {
            return;
        }
        const QuizResult r = m_Repository->GetQuizResult(Owner(), *id);
        try {
            ReviewQuiz(r.topic, ItemsFromJson(r.questions_json));
        } catch (const StudyError &e) {
            spdlog::warn("quiz {} has no reviewable questions: {}", r.id, e.what());
            m_Console.Error("This attempt has no stored questions to review.");
        }
        m_Console.Pause();
    } else {
        m_Controller.Back();
    }
}

// ╭─────────────────────────────────────╮
// │               AI chat               │
// ╰─────────────────────────────────────╯
void StudyDesk::AIChatScreen() {
    const auto history = m_Repository->FetchChatHistory(Owner(), Gemini::kChatContextMessages);
    m_Console.Header("Chat with Gemini");
    for (const auto &m : history) {
        m_Console.Print((m.role == "user" ? "You: " : "Gemini: ") + m.content);
    }

    const int choice =
        m_Console.Menu("Chat", {"Send messages", "Save conversation to review hub",
                                "Clear history"});
    if (choice == 1) {
        while (!m_Console.Closed()) {
            const std::string message = m_Console.ReadLine("You (blank to stop)");
            if (message.empty()) {
                break;
            }
            const auto context =
                m_Repository->FetchChatHistory(Owner(), Gemini::kChatContextMessages);
            auto reply = WaitForAI<std::string>(
                [context, message](Gemini &g) { return g.Chat(context, message); });
            if (!reply) {
                continue;
            }
            m_Repository->AddChatMessage(Owner(), "user", message);
            m_Repository->AddChatMessage(Owner(), "model", *reply);
            m_Console.Print("Gemini: " + *reply);
        }
    } else if (choice == 2) {
        if (history.empty()) {
            m_Console.Info("Nothing to save yet.");
            return;
        }
        std::string transcript;
        for (const auto &m : history) {
            transcript += (m.role == "user" ? "You: " : "Gemini: ") + m.content + "\n\n";
        }
        m_Repository->AddAIContent(Owner(), CONTENT_CHAT_SNAPSHOT,
                                   "Chat on " + FormatLocalTime(NowEpoch()), transcript);
        m_Console.Success("Conversation saved.");
    } else if (choice == 3) {
        if (m_Console.Confirm("Clear the whole chat history?")) {
            m_Repository->ClearChatHistory(Owner());
            m_Console.Success("History cleared.");
        }
    } else {
        m_Controller.Back();
    }
}

// ╭─────────────────────────────────────╮
// │              Analytics              │
// ╰─────────────────────────────────────╯
void StudyDesk::AnalyticsScreen() {
    const AnalyticsSummary s = m_Analytics->Summarize(Owner());
    m_Console.Header("Analytics");
    m_Console.Info("Tasks completed:     " + std::to_string(s.completed_tasks) + "/" +
                   std::to_string(s.total_tasks) + " (" + Percent(s.completion_rate) + ")");
    m_Console.Info("Study time:          " + std::to_string(s.study_minutes / 60) + " h " +
                   std::to_string(s.study_minutes % 60) + " min in " +
                   std::to_string(s.study_sessions) + " session(s)");
    m_Console.Info("Study streak:        " + std::to_string(s.streak_days) + " day(s)");
    m_Console.Info("Consistency:         " + std::to_string(s.days_last_7) + "/7 days, " +
                   std::to_string(s.days_last_30) + "/30 days");
    m_Console.Info("Quizzes:             " + std::to_string(s.quizzes_taken) + " taken, average " +
                   Percent(s.quiz_average));
    m_Console.Info("Learning points:     " + std::to_string(s.learning_points));
    if (!s.top_subjects.empty()) {
        m_Console.Info("Top subjects:");
        for (const auto &t : s.top_subjects) {
            m_Console.Info("  " + t.subject + "  " + std::to_string(t.minutes) + " min");
        }
    }

    const int choice = m_Console.Menu("Analytics", {"Completion rate for a date range"});
    if (choice == 1) {
        const std::string from = m_Console.ReadLine("From YYYY-MM-DD");
        const std::string to = m_Console.ReadLine("To YYYY-MM-DD");
        const double rate = m_Analytics->CompletionRate(Owner(), from, to);
        m_Console.Success("Completion rate " + from + " to " + to + ": " + Percent(rate));
        m_Console.Pause();
    } else {
        m_Controller.Back();
    }
}

// ╭─────────────────────────────────────╮
// │             Review hub              │
// ╰─────────────────────────────────────╯
void StudyDesk::ReviewHubScreen() {
    const int choice =
        m_Console.Menu("Review hub", {"Saved AI content", "Quiz results", "Study log history"});
    if (choice == 1) {
        const int kind = m_Console.Menu("Show", {"Everything", "Explanations", "Summaries",
                                                 "Practice questions", "Chat snapshots"});
        if (kind == 0) {
            return;
        }
        std::optional<AIContentKind> filter;
        if (kind > 1) {
            filter = static_cast<AIContentKind>(kind - 2);
        }
        const auto items = m_Repository->FetchAIContent(Owner(), filter);
        if (items.empty()) {
            m_Console.Info("Nothing saved yet.");
            return;
        }
        for (const auto &c : items) {
            m_Console.Info("[" + std::to_string(c.id) + "] " + FormatLocalTime(c.created_at) +
                           "  " + ToString(c.kind) + "  " + Shorten(c.prompt, 50));
        }
        auto id = m_Console.ReadInt("Open id (blank to skip)", 1, INT32_MAX);
        if (!id) {
            return;
        }
        const AIContent c = m_Repository->GetAIContent(Owner(), *id);
        m_Console.Header(ToString(c.kind));
        m_Console.Print(c.prompt);
        m_Console.Print("");
        m_Console.Print(c.response_text);
        if (m_Console.Confirm("Delete this entry?")) {
            m_Repository->DeleteAIContent(Owner(), c.id);
            m_Console.Success("Deleted.");
        }
    } else if (choice == 2) {
        for (const auto &r : m_Repository->FetchQuizResults(Owner())) {
            m_Console.Info(FormatLocalTime(r.taken_at) + "  " + r.topic + "  " +
                           std::to_string(r.score) + "/" + std::to_string(r.total_questions));
        }
        m_Console.Pause();
    } else if (choice == 3) {
        for (const auto &l : m_Repository->FetchStudyLogs(Owner())) {
            m_Console.Info(FormatLocalTime(l.logged_at) + "  " + l.subject + "  " +
                           std::to_string(l.duration_minutes) + " min" +
                           (l.notes.empty() ? "" : "  " + l.notes));
        }
        m_Console.Pause();
    } else {
        m_Controller.Back();
    }
}

// ╭─────────────────────────────────────╮
// │              Settings               │
// ╰─────────────────────────────────────╯
void StudyDesk::ManageCategories() {
    const auto categories = m_Repository->FetchCategories(Owner());
    m_Console.Header("Categories");
    for (const auto &c : categories) {
        m_Console.Info("[" + std::to_string(c.id) + "] " + c.name);
    }

    const int choice = m_Console.Menu("Categories", {"Add", "Rename", "Delete"});
    if (choice == 1) {
        const Category c = m_Repository->AddCategory(Owner(), m_Console.ReadLine("Name"));
        m_Console.Success("Category '" + c.name + "' added.");
    } else if (choice == 2) {
        auto id = m_Console.ReadInt("Category id", 1, INT32_MAX);
        if (id) {
            m_Repository->RenameCategory(Owner(), *id, m_Console.ReadLine("New name"));
            m_Console.Success("Category renamed.");
        }
    } else if (choice == 3) {
        auto id = m_Console.ReadInt("Category id", 1, INT32_MAX);
        if (id && m_Console.Confirm("Delete it? Its tasks become Uncategorized")) {
            m_Repository->DeleteCategory(Owner(), *id);
            if (m_TaskFilter.category_id && *m_TaskFilter.category_id == *id) {
                m_TaskFilter.category_id.reset();
            }
            m_Console.Success("Category deleted.");
        }
    }
}

// ─────────────────────────────────────
void StudyDesk::PomodoroSettings() {
    const auto cfg = LoadPomodoroConfig();
    m_Console.Info("Leave blank to keep the current value.");
    auto work = m_Console.ReadInt("Work minutes [" + std::to_string(cfg.work_minutes) + "]", 1, 120);
    auto brk = m_Console.ReadInt("Break minutes [" + std::to_string(cfg.break_minutes) + "]", 1, 60);
    auto lng = m_Console.ReadInt(
        "Long break minutes [" + std::to_string(cfg.long_break_minutes) + "]", 1, 120);
    if (work) {
        m_Repository->SetSetting(Owner(), kPomodoroWorkMinutes, std::to_string(*work));
    }
    if (brk) {
        m_Repository->SetSetting(Owner(), kPomodoroBreakMinutes, std::to_string(*brk));
    }
    if (lng) {
        m_Repository->SetSetting(Owner(), kPomodoroLongBreakMinutes, std::to_string(*lng));
    }
    m_Console.Success("Pomodoro settings saved.");
}

// ─────────────────────────────────────
void StudyDesk::BackupRestore() {
    const int choice = m_Console.Menu("Backup", {"Back up database", "Restore from backup"});
    if (choice == 1) {
        const std::string suggested = (m_DataDir / Backup::SuggestedFileName()).string();
        std::string dest = m_Console.ReadLine("Destination [" + suggested + "]");
        if (dest.empty()) {
            dest = suggested;
        }
        m_Backup->Export(dest);
        m_Console.Success("Backup written to " + dest);
    } else if (choice == 2) {
        const std::string source = m_Console.ReadLine("Backup file");
        if (source.empty()) {
            return;
        }
        if (!m_Console.Confirm("Restoring replaces ALL current data and logs you out. Continue?")) {
            return;
        }
        m_Backup->Restore(source);
        m_Console.Success("Database restored. Please log in again.");
        Logout();
    }
}

// ─────────────────────────────────────
void StudyDesk::AccountSettings() {
    const int choice = m_Console.Menu("Account", {"Change password", "Delete account"});
    if (choice == 1) {
        const std::string current = m_Console.ReadPassword("Current password");
        const std::string next = m_Console.ReadPassword("New password");
        const std::string confirm = m_Console.ReadPassword("Confirm new password");
        if (next != confirm) {
            m_Console.Error("Passwords do not match.");
            return;
        }
        m_Auth->ChangePassword(Owner(), current, next);
        m_Console.Success("Password changed.");
    } else if (choice == 2) {
        if (!m_Console.Confirm("Delete your account and ALL of its data?")) {
            return;
        }
        const std::string password = m_Console.ReadPassword("Password");
        m_Auth->DeleteAccount(Owner(), password);
        if (!m_Secrets->ForgetUsername()) {
            spdlog::debug("no remembered username to forget");
        }
        m_Console.Success("Account deleted.");
        Logout();
    }
}

// ─────────────────────────────────────
void StudyDesk::SettingsScreen() {
    const bool has_key = !m_Controller.Active().api_key.empty();
    const int choice = m_Console.Menu(
        "Settings", {std::string("Gemini API key (") + (has_key ? "set" : "not set") + ")",
                     "Pomodoro durations", "Task categories", "Backup & restore", "Account",
                     "Log out"});
    switch (choice) {
    case 1: {
        const std::string key = m_Console.ReadLine("New key (blank to keep, '-' to remove)");
        if (key.empty()) {
            break;
        }
        if (key == "-") {
            m_Repository->DeleteSetting(Owner(), kGeminiApiKey);
            m_Controller.SetApiKey("");
            m_Console.Success("API key removed.");
        } else {
            m_Repository->SetSetting(Owner(), kGeminiApiKey, key);
            m_Controller.SetApiKey(key);
            m_Console.Success("API key saved.");
        }
        SyncApiKey();
        m_Quote.reset();
        m_QuoteText.clear();
        break;
    }
    case 2:
        PomodoroSettings();
        break;
    case 3:
        ManageCategories();
        break;
    case 4:
        BackupRestore();
        break;
    case 5:
        AccountSettings();
        break;
    case 6:
        Logout();
        break;
    default:
        m_Controller.Back();
        break;
    }
}
