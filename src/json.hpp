#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Lenient reads with a fallback, for payloads from outside the process.
class JsonParse {
  public:
    int GetInt(const nlohmann::json &j, const std::string &key, int fallback);
    std::string GetString(const nlohmann::json &j, const std::string &key,
                          const std::string &fallback);

    // Walks a path of object keys / array indices; nullopt when any step is missing.
    std::optional<nlohmann::json> Find(const nlohmann::json &j,
                                       const std::vector<nlohmann::json> &path);
};
