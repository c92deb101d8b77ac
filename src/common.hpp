#pragma once

#include <cstdint>
#include <optional>
#include <string>

enum LogLevel { LOG_DEBUG, LOG_INFO, LOG_OFF };

// Raw answer of the compositor about the focused window.
struct FocusedWindow {
    std::optional<std::uint64_t> window_id;
    int pid = -1;
    std::string title;
    std::string app_id;
    bool valid = false;
};

// What the foreground probe reports for one tick.
struct ProbeResult {
    std::string process_name;
    std::string window_title;
    std::optional<std::string> url;
};

struct ActivityTarget {
    std::string identifier;
    std::string app_name;
    std::string window_title;
    std::optional<std::string> url;
};

struct UsageRecord {
    std::string identifier;
    std::string app_name;
    std::string window_title;
    std::optional<std::string> url;
    std::int64_t timestamp = 0; // unix seconds, flush time
    std::int64_t duration = 0;  // seconds accumulated in the interval
};
