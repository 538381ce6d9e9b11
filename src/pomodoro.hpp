#pragma once

#include <chrono>

enum PomodoroPhase { PHASE_WORK, PHASE_SHORT_BREAK, PHASE_LONG_BREAK };

const char *ToString(PomodoroPhase phase);

struct PomodoroConfig {
    int work_minutes = 25;
    int break_minutes = 5;
    int long_break_minutes = 15;
    int long_break_every = 4;
};

// Countdown driven by the caller. Nothing runs while paused.
class PomodoroTimer {
  public:
    struct TickResult {
        bool phase_changed = false;
        PomodoroPhase finished = PHASE_WORK;
        PomodoroPhase next = PHASE_WORK;
        int finished_minutes = 0;
    };

    explicit PomodoroTimer(const PomodoroConfig &config = {});

    void Start();
    void Pause();
    void Reset();
    // Ends the current phase now, as if its time ran out.
    TickResult Skip();
    TickResult Tick(std::chrono::seconds elapsed);

    bool Running() const {
        return m_Running;
    }
    PomodoroPhase Phase() const {
        return m_Phase;
    }
    std::chrono::seconds Remaining() const {
        return m_Remaining;
    }
    int CompletedWorkPhases() const {
        return m_CompletedWork;
    }

  private:
    std::chrono::seconds Length(PomodoroPhase phase) const;
    TickResult Advance();

    PomodoroConfig m_Config;
    PomodoroPhase m_Phase = PHASE_WORK;
    std::chrono::seconds m_Remaining{0};
    int m_CompletedWork = 0;
    bool m_Running = false;
};
