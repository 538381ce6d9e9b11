#include "common.hpp"
#include "errors.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>

// ─────────────────────────────────────
const char *ToString(AIContentKind kind) {
    switch (kind) {
    case CONTENT_EXPLANATION:
        return "explanation";
    case CONTENT_SUMMARY:
        return "summary";
    case CONTENT_QUESTIONS:
        return "questions";
    case CONTENT_CHAT_SNAPSHOT:
        return "chat_snapshot";
    }
    return "explanation";
}

// ─────────────────────────────────────
std::optional<AIContentKind> AIContentKindFromString(const std::string &s) {
    if (s == "explanation") {
        return CONTENT_EXPLANATION;
    }
    if (s == "summary") {
        return CONTENT_SUMMARY;
    }
    if (s == "questions") {
        return CONTENT_QUESTIONS;
    }
    if (s == "chat_snapshot") {
        return CONTENT_CHAT_SNAPSHOT;
    }
    return std::nullopt;
}

// ─────────────────────────────────────
double NowEpoch() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ─────────────────────────────────────
std::string FormatLocalTime(double epoch, const char *fmt) {
    std::time_t t = static_cast<std::time_t>(epoch);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[64];
    if (std::strftime(buf, sizeof(buf), fmt, &tm) == 0) {
        return "";
    }
    return buf;
}

// ─────────────────────────────────────
std::string LocalDateString(double epoch) {
    return FormatLocalTime(epoch, "%Y-%m-%d");
}

// ─────────────────────────────────────
std::string Trim(const std::string &s) {
    const char *ws = " \t\r\n";
    const auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

// ─────────────────────────────────────
bool IsValidDate(const std::string &yyyy_mm_dd) {
    if (yyyy_mm_dd.size() != 10 || yyyy_mm_dd[4] != '-' || yyyy_mm_dd[7] != '-') {
        return false;
    }
    // Dates are compared as text in SQL, so only plain digits are allowed.
    for (std::size_t i = 0; i < yyyy_mm_dd.size(); i++) {
        if (i != 4 && i != 7 && !std::isdigit(static_cast<unsigned char>(yyyy_mm_dd[i]))) {
            return false;
        }
    }
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    if (std::sscanf(yyyy_mm_dd.c_str(), "%4d-%2u-%2u", &y, &m, &d) != 3) {
        return false;
    }
    const std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{m},
                                          std::chrono::day{d}};
    return ymd.ok();
}

// ─────────────────────────────────────
const char *ErrorCodeName(ErrorCode code) {
    switch (code) {
    case ERR_VALIDATION:
        return "ValidationError";
    case ERR_NOT_FOUND:
        return "NotFound";
    case ERR_INVALID_CREDENTIALS:
        return "InvalidCredentials";
    case ERR_DUPLICATE_USERNAME:
        return "DuplicateUsername";
    case ERR_MISSING_API_KEY:
        return "MissingAPIKey";
    case ERR_NETWORK:
        return "NetworkError";
    case ERR_AI_SERVICE:
        return "AIServiceError";
    case ERR_MALFORMED_QUIZ:
        return "MalformedQuizResponse";
    case ERR_STORE:
        return "StoreError";
    }
    return "Error";
}
