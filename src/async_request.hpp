#pragma once

#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

// Counts workers still running so the process can wait for them before static teardown.
class AsyncWork {
  public:
    static void Begin() {
        std::lock_guard<std::mutex> lock(s_Mutex);
        s_Running++;
    }

    static void End() {
        std::lock_guard<std::mutex> lock(s_Mutex);
        s_Running--;
        s_Cv.notify_all();
    }

    static int Running() {
        std::lock_guard<std::mutex> lock(s_Mutex);
        return s_Running;
    }

    // True once no worker is left; false if some are still running after the timeout.
    static bool Drain(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(s_Mutex);
        return s_Cv.wait_for(lock, timeout, [] { return s_Running == 0; });
    }

  private:
    static inline std::mutex s_Mutex;
    static inline std::condition_variable s_Cv;
    static inline int s_Running = 0;
};

// ─────────────────────────────────────
// Runs one job on a detached worker. Dropping the request abandons the wait: the job still runs
// to completion and its result is discarded with the shared slot.
template <typename T> class AsyncRequest {
  public:
    explicit AsyncRequest(std::function<T()> job) : m_State(std::make_shared<State>()) {
        AsyncWork::Begin();
        std::thread([state = m_State, job = std::move(job)]() {
            std::optional<T> value;
            std::exception_ptr error;
            try {
                value = job();
            } catch (...) {
                error = std::current_exception();
            }
            std::lock_guard<std::mutex> lock(state->mutex);
            state->value = std::move(value);
            state->error = error;
            state->done = true;
            state->cv.notify_all();
            AsyncWork::End();
        }).detach();
    }

    bool Ready() const {
        std::lock_guard<std::mutex> lock(m_State->mutex);
        return m_State->done;
    }

    bool WaitFor(std::chrono::milliseconds timeout) const {
        std::unique_lock<std::mutex> lock(m_State->mutex);
        return m_State->cv.wait_for(lock, timeout, [this] { return m_State->done; });
    }

    // Blocks until done; rethrows whatever the job threw.
    T Get() {
        std::unique_lock<std::mutex> lock(m_State->mutex);
        m_State->cv.wait(lock, [this] { return m_State->done; });
        if (m_State->error) {
            std::rethrow_exception(m_State->error);
        }
        return std::move(*m_State->value);
    }

  private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
        std::optional<T> value;
        std::exception_ptr error;
    };

    std::shared_ptr<State> m_State;
};
