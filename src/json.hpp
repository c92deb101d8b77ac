#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

class JsonParse {
  public:
    // Fallback when missing, not a number, or outside [min, max]. The range
    // check runs on the unnarrowed value.
    int GetIntInRange(const nlohmann::json &j, const std::string &key, int fallback, int min,
                      int max);
    std::string GetString(const nlohmann::json &j, const std::string &key,
                          const std::string &fallback);

  private:
    std::optional<std::int64_t> GetWide(const nlohmann::json &j, const std::string &key);
};
