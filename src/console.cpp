#include "console.hpp"
#include "common.hpp"

#include <cerrno>
#include <charconv>
#include <cstring>
#include <iostream>

#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
void Console::Header(const std::string &title) {
    std::cout << "\n══════ " << title << " ══════\n";
}

// ─────────────────────────────────────
void Console::Print(const std::string &line) {
    std::cout << line << "\n";
}

// ─────────────────────────────────────
void Console::Info(const std::string &msg) {
    std::cout << "  " << msg << "\n";
}

// ─────────────────────────────────────
void Console::Success(const std::string &msg) {
    std::cout << "  ✔ " << msg << "\n";
}

// ─────────────────────────────────────
void Console::Error(const std::string &msg) {
    std::cout << "  ✘ " << msg << "\n";
}

// ─────────────────────────────────────
void Console::Pause() {
    ReadLine("Press Enter to continue");
}

// ─────────────────────────────────────
std::string Console::ReadLine(const std::string &prompt) {
    if (m_Closed) {
        return "";
    }
    std::cout << prompt << ": " << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) {
        spdlog::debug("stdin closed");
        m_Closed = true;
        std::cout << "\n";
        return "";
    }
    return Trim(line);
}

// ─────────────────────────────────────
std::string Console::ReadBlock(const std::string &prompt) {
    if (m_Closed) {
        return "";
    }
    std::cout << prompt << " (finish with an empty line):\n" << std::flush;
    std::string block;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (Trim(line).empty()) {
            return Trim(block);
        }
        block += line + "\n";
    }
    m_Closed = true;
    return Trim(block);
}

// ─────────────────────────────────────
std::string Console::ReadRaw() {
    std::string line;
    if (m_Closed || !std::getline(std::cin, line)) {
        m_Closed = true;
        return "";
    }
    return Trim(line);
}

// ─────────────────────────────────────
std::string Console::ReadPassword(const std::string &prompt) {
    termios old_tio{};
    const bool tty = isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &old_tio) == 0;
    if (tty) {
        termios no_echo = old_tio;
        no_echo.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        tcsetattr(STDIN_FILENO, TCSANOW, &no_echo);
    }

    std::string line;
    if (!m_Closed) {
        std::cout << prompt << ": " << std::flush;
        if (!std::getline(std::cin, line)) {
            m_Closed = true;
        }
    }

    if (tty) {
        tcsetattr(STDIN_FILENO, TCSANOW, &old_tio);
        std::cout << "\n";
    }
    // Passwords keep inner and outer spaces.
    return line;
}

// ─────────────────────────────────────
std::optional<int> Console::ReadInt(const std::string &prompt, int min, int max) {
    const std::string text = ReadLine(prompt);
    if (text.empty()) {
        return std::nullopt;
    }
    int value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value < min || value > max) {
        Error("Enter a number between " + std::to_string(min) + " and " + std::to_string(max));
        return std::nullopt;
    }
    return value;
}

// ─────────────────────────────────────
bool Console::Confirm(const std::string &prompt) {
    const std::string answer = ReadLine(prompt + " [y/N]");
    return answer == "y" || answer == "Y" || answer == "yes";
}

// ─────────────────────────────────────
int Console::Menu(const std::string &title, const std::vector<std::string> &options,
                  const std::string &back_label) {
    Header(title);
    for (std::size_t i = 0; i < options.size(); i++) {
        std::cout << "  " << (i + 1) << ") " << options[i] << "\n";
    }
    std::cout << "  0) " << back_label << "\n";

    while (!m_Closed) {
        auto choice = ReadInt("Choose", 0, static_cast<int>(options.size()));
        if (choice) {
            return *choice;
        }
    }
    return 0;
}

// ─────────────────────────────────────
bool Console::WaitForInput(std::chrono::milliseconds timeout) {
    if (m_Closed) {
        return false;
    }
    pollfd pfd{};
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    const int rc = poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc < 0) {
        spdlog::warn("poll on stdin failed: {}", std::strerror(errno));
        return false;
    }
    return rc > 0 && (pfd.revents & (POLLIN | POLLHUP));
}

// ─────────────────────────────────────
void Console::Status(const std::string &line) {
    std::cout << "\r\033[K" << line << std::flush;
}
