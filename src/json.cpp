#include "json.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <limits>

// ─────────────────────────────────────
// Widest exact reading of a JSON number; nullopt for non-numbers and
// floating values that do not fit an int64.
static std::optional<std::int64_t> ReadWide(const nlohmann::json &v) {
    if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::numeric_limits<std::int64_t>::max();
        }
        return static_cast<std::int64_t>(u);
    }
    if (v.is_number_integer()) {
        return v.get<std::int64_t>();
    }
    if (v.is_number_float()) {
        const double d = v.get<double>();
        // 2^63 is exactly representable; anything at or beyond it does not fit.
        if (!std::isfinite(d) || d >= 9223372036854775808.0 || d < -9223372036854775808.0) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(d);
    }
    return std::nullopt;
}

// ─────────────────────────────────────
std::optional<std::int64_t> JsonParse::GetWide(const nlohmann::json &j, const std::string &key) {
    if (!j.contains(key)) {
        spdlog::debug("JsonParse: Key '{}' not found", key);
        return std::nullopt;
    }
    const auto &v = j.at(key);
    if (!v.is_number()) {
        spdlog::warn("JsonParse: Key '{}' is not a number", key);
        return std::nullopt;
    }
    const auto wide = ReadWide(v);
    if (!wide) {
        spdlog::warn("JsonParse: Key '{}' = {} is not representable", key, v.dump());
        return std::nullopt;
    }
    if (v.is_number_float()) {
        spdlog::debug("JsonParse: Truncated '{}' to {}", key, *wide);
    }
    return wide;
}

// ─────────────────────────────────────
int JsonParse::GetIntInRange(const nlohmann::json &j, const std::string &key, int fallback,
                             int min, int max) {
    const auto val = GetWide(j, key);
    if (!val) {
        return fallback;
    }
    if (*val < min || *val > max) {
        spdlog::warn("JsonParse: Key '{}' = {} outside [{}, {}], using fallback {}", key, *val, min,
                     max, fallback);
        return fallback;
    }
    return static_cast<int>(*val);
}

// ─────────────────────────────────────
std::string JsonParse::GetString(const nlohmann::json &j, const std::string &key,
                                 const std::string &fallback) {
    if (!j.contains(key)) {
        spdlog::debug("JsonParse: Key '{}' not found, using fallback '{}'", key, fallback);
        return fallback;
    }
    if (j.at(key).is_string()) {
        return j.at(key).get<std::string>();
    }
    spdlog::warn("JsonParse: Key '{}' is not a string, using fallback '{}'", key, fallback);
    return fallback;
}
