#include "pomodoro.hpp"

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
const char *ToString(PomodoroPhase phase) {
    switch (phase) {
    case PHASE_WORK:
        return "Work";
    case PHASE_SHORT_BREAK:
        return "Short break";
    case PHASE_LONG_BREAK:
        return "Long break";
    }
    return "Work";
}

// ─────────────────────────────────────
PomodoroTimer::PomodoroTimer(const PomodoroConfig &config) : m_Config(config) {
    if (m_Config.long_break_every < 1) {
        m_Config.long_break_every = 4;
    }
    m_Remaining = Length(PHASE_WORK);
}

// ─────────────────────────────────────
std::chrono::seconds PomodoroTimer::Length(PomodoroPhase phase) const {
    switch (phase) {
    case PHASE_WORK:
        return std::chrono::minutes(m_Config.work_minutes);
    case PHASE_SHORT_BREAK:
        return std::chrono::minutes(m_Config.break_minutes);
    case PHASE_LONG_BREAK:
        return std::chrono::minutes(m_Config.long_break_minutes);
    }
    return std::chrono::minutes(m_Config.work_minutes);
}

// ─────────────────────────────────────
void PomodoroTimer::Start() {
    m_Running = true;
}

// ─────────────────────────────────────
void PomodoroTimer::Pause() {
    m_Running = false;
}

// ─────────────────────────────────────
void PomodoroTimer::Reset() {
    m_Running = false;
    m_Phase = PHASE_WORK;
    m_CompletedWork = 0;
    m_Remaining = Length(PHASE_WORK);
}

// ─────────────────────────────────────
PomodoroTimer::TickResult PomodoroTimer::Advance() {
    TickResult r;
    r.phase_changed = true;
    r.finished = m_Phase;
    r.finished_minutes =
        static_cast<int>(std::chrono::duration_cast<std::chrono::minutes>(Length(m_Phase)).count());

    if (m_Phase == PHASE_WORK) {
        m_CompletedWork++;
        m_Phase = m_CompletedWork % m_Config.long_break_every == 0 ? PHASE_LONG_BREAK
                                                                   : PHASE_SHORT_BREAK;
    } else {
        m_Phase = PHASE_WORK;
    }
    m_Remaining = Length(m_Phase);
    r.next = m_Phase;

    spdlog::info("pomodoro: {} finished, {} next", ToString(r.finished), ToString(r.next));
    return r;
}

// ─────────────────────────────────────
PomodoroTimer::TickResult PomodoroTimer::Skip() {
    TickResult r = Advance();
    // Skipped work is not counted as studied time.
    r.finished_minutes = 0;
    return r;
}

// ─────────────────────────────────────
PomodoroTimer::TickResult PomodoroTimer::Tick(std::chrono::seconds elapsed) {
    if (!m_Running || elapsed.count() <= 0) {
        return {};
    }
    if (elapsed < m_Remaining) {
        m_Remaining -= elapsed;
        return {};
    }
    // Overshoot is dropped; the next phase starts full.
    return Advance();
}
