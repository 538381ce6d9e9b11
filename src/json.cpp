#include "json.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

#include <spdlog/spdlog.h>

// ─────────────────────────────────────
int JsonParse::GetInt(const nlohmann::json &j, const std::string &key, int fallback) {
    // null is how an unanswered quiz question is stored
    if (!j.is_object() || !j.contains(key) || j.at(key).is_null()) {
        spdlog::debug("JsonParse: no value for '{}', using {}", key, fallback);
        return fallback;
    }
    const auto &v = j.at(key);
    if (v.is_number_integer()) {
        if (v.is_number_unsigned()) {
            const auto u = v.get<uint64_t>();
            if (u <= static_cast<uint64_t>(std::numeric_limits<int>::max())) {
                return static_cast<int>(u);
            }
        } else {
            const auto i = v.get<int64_t>();
            if (i >= std::numeric_limits<int>::min() && i <= std::numeric_limits<int>::max()) {
                return static_cast<int>(i);
            }
        }
        spdlog::warn("JsonParse: '{}' does not fit an int, using {}", key, fallback);
        return fallback;
    }
    if (v.is_number()) {
        const double d = v.get<double>();
        if (std::isfinite(d) && d >= std::numeric_limits<int>::min() &&
            d <= std::numeric_limits<int>::max()) {
            return static_cast<int>(d);
        }
        spdlog::warn("JsonParse: '{}' does not fit an int, using {}", key, fallback);
        return fallback;
    }
    spdlog::warn("JsonParse: '{}' holds {}, expected a number", key, j.at(key).type_name());
    return fallback;
}

// ─────────────────────────────────────
std::string JsonParse::GetString(const nlohmann::json &j, const std::string &key,
                                 const std::string &fallback) {
    if (!j.is_object() || !j.contains(key) || j.at(key).is_null()) {
        return fallback;
    }
    if (j.at(key).is_string()) {
        return j.at(key).get<std::string>();
    }
    spdlog::warn("JsonParse: '{}' holds {}, expected a string", key, j.at(key).type_name());
    return fallback;
}

// ─────────────────────────────────────
std::optional<nlohmann::json> JsonParse::Find(const nlohmann::json &j,
                                              const std::vector<nlohmann::json> &path) {
    const nlohmann::json *cur = &j;
    for (const auto &step : path) {
        if (step.is_string()) {
            const std::string key = step.get<std::string>();
            if (!cur->is_object() || !cur->contains(key)) {
                return std::nullopt;
            }
            cur = &cur->at(key);
        } else if (step.is_number_unsigned() || step.is_number_integer()) {
            const auto idx = step.get<std::size_t>();
            if (!cur->is_array() || idx >= cur->size()) {
                return std::nullopt;
            }
            cur = &cur->at(idx);
        } else {
            return std::nullopt;
        }
    }
    return *cur;
}
