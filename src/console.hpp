#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

// Line-oriented terminal I/O on stdin/stdout. End of input marks the console closed and every
// further read returns empty.
class Console {
  public:
    void Header(const std::string &title);
    void Print(const std::string &line);
    void Info(const std::string &msg);
    void Success(const std::string &msg);
    void Error(const std::string &msg);
    void Pause();

    std::string ReadLine(const std::string &prompt);
    // Reads lines until an empty one.
    std::string ReadBlock(const std::string &prompt);
    // A line typed while a countdown or spinner is on screen, no prompt.
    std::string ReadRaw();
    std::string ReadPassword(const std::string &prompt);
    std::optional<int> ReadInt(const std::string &prompt, int min, int max);
    bool Confirm(const std::string &prompt);
    // 1-based choice from the list, 0 for back / cancel.
    int Menu(const std::string &title, const std::vector<std::string> &options,
             const std::string &back_label = "Back");

    // True when a line is ready on stdin before the timeout.
    bool WaitForInput(std::chrono::milliseconds timeout);
    // Redraws the current line; used by countdowns and spinners.
    void Status(const std::string &line);

    bool Closed() const {
        return m_Closed;
    }

  private:
    bool m_Closed = false;
};
