#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "common.hpp"

struct Config {
    unsigned port = 3030;
    // One tick credits one second; not user-configurable.
    std::chrono::milliseconds tick{1000};
    std::chrono::seconds flush_period{30};
    std::chrono::seconds status_period{60}; // 0 disables the status log
    int recent_limit = 50;
    std::chrono::hours recent_window{24};
    int prune_after_days = 0; // 0 keeps history forever
    std::filesystem::path db_path;
    std::filesystem::path web_root;
    std::filesystem::path config_path;
    LogLevel log_level = LOG_INFO;
};

enum ArgsResult { ARGS_OK, ARGS_HELP, ARGS_ERROR };

// Command line flags are collected as a JSON object with the same keys as the
// config file so both go through ApplyConfigJson.
ArgsResult ParseArgs(int argc, char **argv, nlohmann::json &overrides,
                     std::filesystem::path &config_path, std::string &error);

void ApplyConfigJson(const nlohmann::json &j, Config &config);

// Missing file is not an error. Malformed JSON is.
bool LoadConfigFile(const std::filesystem::path &path, Config &config, std::string &error);

// defaults, then the config file, then the command line.
ArgsResult LoadConfig(int argc, char **argv, Config &config, std::string &error);

std::filesystem::path DefaultConfigPath();
std::filesystem::path DefaultDBPath();
LogLevel ParseLogLevel(const std::string &name, LogLevel fallback);
void ApplyLogLevel(LogLevel log_level);
std::string Usage(const char *argv0);
