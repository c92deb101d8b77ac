#include "config.hpp"

#include "json.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <utility>
#include <vector>

// ─────────────────────────────────────
static std::filesystem::path XdgDir(const char *xdg_var, const char *home_fallback) {
    const char *xdg = std::getenv(xdg_var);
    if (xdg && *xdg) {
        return std::filesystem::path(xdg);
    }
    const char *home = std::getenv("HOME");
    if (!home || !*home) {
        return {};
    }
    return std::filesystem::path(home) / home_fallback;
}

// ─────────────────────────────────────
std::filesystem::path DefaultConfigPath() {
    const auto base = XdgDir("XDG_CONFIG_HOME", ".config");
    if (base.empty()) {
        return {};
    }
    return base / "foretime" / "config.json";
}

// ─────────────────────────────────────
std::filesystem::path DefaultDBPath() {
    const auto base = XdgDir("XDG_DATA_HOME", ".local/share");
    if (base.empty()) {
        return {};
    }
    return base / "foretime" / "usage.sqlite";
}

// ─────────────────────────────────────
LogLevel ParseLogLevel(const std::string &name, LogLevel fallback) {
    if (name == "debug") {
        return LOG_DEBUG;
    }
    if (name == "info") {
        return LOG_INFO;
    }
    if (name == "off") {
        return LOG_OFF;
    }
    spdlog::warn("Unknown log level '{}', keeping current level", name);
    return fallback;
}

// ─────────────────────────────────────
void ApplyLogLevel(LogLevel log_level) {
    if (log_level == LOG_DEBUG) {
        spdlog::set_level(spdlog::level::debug);
    } else if (log_level == LOG_INFO) {
        spdlog::set_level(spdlog::level::info);
    } else if (log_level == LOG_OFF) {
        spdlog::set_level(spdlog::level::off);
    }
}

// ─────────────────────────────────────
void ApplyConfigJson(const nlohmann::json &j, Config &config) {
    if (!j.is_object()) {
        spdlog::warn("Config: expected a JSON object, got {}", j.type_name());
        return;
    }

    JsonParse jp;
    config.port = static_cast<unsigned>(
        jp.GetIntInRange(j, "port", static_cast<int>(config.port), 1, 65535));
    config.flush_period = std::chrono::seconds(
        jp.GetIntInRange(j, "flush_seconds", static_cast<int>(config.flush_period.count()), 1,
                         86400));
    config.status_period = std::chrono::seconds(
        jp.GetIntInRange(j, "status_seconds", static_cast<int>(config.status_period.count()), 0,
                         86400));
    config.recent_limit = jp.GetIntInRange(j, "recent_limit", config.recent_limit, 1, 1000);
    config.recent_window = std::chrono::hours(
        jp.GetIntInRange(j, "recent_window_hours", static_cast<int>(config.recent_window.count()),
                         1, 24 * 365));
    config.prune_after_days =
        jp.GetIntInRange(j, "prune_after_days", config.prune_after_days, 0, 3650);

    if (const auto db = jp.GetString(j, "db_path", ""); !db.empty()) {
        config.db_path = db;
    }
    if (const auto root = jp.GetString(j, "web_root", ""); !root.empty()) {
        config.web_root = root;
    }
    if (j.contains("log_level")) {
        config.log_level = ParseLogLevel(jp.GetString(j, "log_level", ""), config.log_level);
    }
}

// ─────────────────────────────────────
bool LoadConfigFile(const std::filesystem::path &path, Config &config, std::string &error) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        spdlog::debug("No config file at '{}', using defaults", path.string());
        return true;
    }

    std::ifstream file(path);
    if (!file) {
        error = "unable to read config file: " + path.string();
        return false;
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error &e) {
        error = "invalid config file " + path.string() + ": " + e.what();
        return false;
    }

    ApplyConfigJson(j, config);
    spdlog::info("Loaded config from {}", path.string());
    return true;
}

// ─────────────────────────────────────
static bool ParseNumber(const std::string &flag, const std::string &value, int &out,
                        std::string &error) {
    try {
        std::size_t pos = 0;
        out = std::stoi(value, &pos);
        if (pos != value.size()) {
            error = "invalid value for " + flag + ": " + value;
            return false;
        }
    } catch (const std::exception &) {
        error = "invalid value for " + flag + ": " + value;
        return false;
    }
    return true;
}

// ─────────────────────────────────────
ArgsResult ParseArgs(int argc, char **argv, nlohmann::json &overrides,
                     std::filesystem::path &config_path, std::string &error) {
    static const std::vector<std::pair<std::string, std::string>> numeric_flags = {
        {"--port", "port"},
        {"--flush-seconds", "flush_seconds"},
        {"--status-seconds", "status_seconds"},
        {"--recent-limit", "recent_limit"},
        {"--prune-days", "prune_after_days"},
    };
    static const std::vector<std::pair<std::string, std::string>> path_flags = {
        {"--db", "db_path"},
        {"--web-root", "web_root"},
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            return ARGS_HELP;
        }
        if (arg == "--debug") {
            overrides["log_level"] = "debug";
            continue;
        }
        if (arg == "--quiet") {
            overrides["log_level"] = "off";
            continue;
        }

        if (i + 1 >= argc) {
            error = "missing value for " + arg;
            return ARGS_ERROR;
        }
        const std::string value = argv[i + 1];

        bool matched = false;
        if (arg == "--config") {
            config_path = value;
            matched = true;
        }
        for (const auto &[flag, key] : numeric_flags) {
            if (arg != flag) {
                continue;
            }
            int number = 0;
            if (!ParseNumber(flag, value, number, error)) {
                return ARGS_ERROR;
            }
            overrides[key] = number;
            matched = true;
        }
        for (const auto &[flag, key] : path_flags) {
            if (arg == flag) {
                overrides[key] = value;
                matched = true;
            }
        }

        if (!matched) {
            error = "unknown option: " + arg;
            return ARGS_ERROR;
        }
        ++i;
    }
    return ARGS_OK;
}

// ─────────────────────────────────────
ArgsResult LoadConfig(int argc, char **argv, Config &config, std::string &error) {
    nlohmann::json overrides = nlohmann::json::object();
    std::filesystem::path explicit_config;

    const ArgsResult result = ParseArgs(argc, argv, overrides, explicit_config, error);
    if (result != ARGS_OK) {
        return result;
    }

    std::error_code ec;
    if (!explicit_config.empty() && !std::filesystem::exists(explicit_config, ec)) {
        error = "config file not found: " + explicit_config.string();
        return ARGS_ERROR;
    }

    config.config_path = explicit_config.empty() ? DefaultConfigPath() : explicit_config;
    if (!LoadConfigFile(config.config_path, config, error)) {
        return ARGS_ERROR;
    }
    ApplyConfigJson(overrides, config);

    if (config.db_path.empty()) {
        config.db_path = DefaultDBPath();
    }
    if (config.db_path.empty()) {
        error = "HOME is not set and no --db path was given";
        return ARGS_ERROR;
    }
    return ARGS_OK;
}

// ─────────────────────────────────────
std::string Usage(const char *argv0) {
    return std::string("Usage: ") + argv0 +
           " [options]\n"
           "  --port N              dashboard port (default 3030)\n"
           "  --db PATH             sqlite database file\n"
           "  --config PATH         JSON config file\n"
           "  --web-root PATH       directory holding index.html and static/\n"
           "  --flush-seconds N     persistence period (default 30)\n"
           "  --status-seconds N    status log period, 0 disables (default 60)\n"
           "  --recent-limit N      rows shown as recent activity (default 50)\n"
           "  --prune-days N        delete history older than N days, 0 keeps all\n"
           "  --debug | --quiet     log level\n"
           "  -h, --help\n";
}
