#include "browser_url.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>

// ─────────────────────────────────────
static std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// ─────────────────────────────────────
static bool LooksLikeUrl(const std::string &s) {
    return s.rfind("http", 0) == 0 || s.find("://") != std::string::npos;
}

// ─────────────────────────────────────
std::optional<std::string> ChromiumExtractor::Extract(const FocusedWindow &window) const {
    const std::string sep = " - ";
    const auto pos = window.title.rfind(sep);
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    std::string candidate = window.title.substr(pos + sep.size());
    if (LooksLikeUrl(candidate)) {
        return candidate;
    }
    return std::nullopt;
}

// ─────────────────────────────────────
std::optional<std::string> FirefoxExtractor::Extract(const FocusedWindow &window) const {
    static const std::array<std::string, 3> patterns = {
        " - Mozilla Firefox", " | Mozilla Firefox", " — Mozilla Firefox"};

    for (const auto &pattern : patterns) {
        const auto pos = window.title.find(pattern);
        if (pos == std::string::npos) {
            continue;
        }
        std::string prefix = window.title.substr(0, pos);
        if (LooksLikeUrl(prefix)) {
            return prefix;
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────
UrlExtractor MakeUrlExtractor(const std::string &process_name) {
    const std::string name = ToLower(process_name);
    if (name.find("chrome") != std::string::npos || name.find("chromium") != std::string::npos ||
        name.find("msedge") != std::string::npos || name.find("microsoft-edge") != std::string::npos ||
        name.find("brave") != std::string::npos) {
        return ChromiumExtractor{};
    }
    if (name.find("firefox") != std::string::npos) {
        return FirefoxExtractor{};
    }
    return UnknownExtractor{};
}

// ─────────────────────────────────────
std::optional<std::string> ExtractUrl(const UrlExtractor &extractor, const FocusedWindow &window) {
    auto url = std::visit([&window](const auto &e) { return e.Extract(window); }, extractor);
    if (url) {
        spdlog::debug("Extracted URL '{}' from title '{}'", *url, window.title);
    }
    return url;
}

// ─────────────────────────────────────
ActivityTarget MakeTarget(const std::string &app_name, const std::string &window_title,
                          const std::optional<std::string> &url) {
    ActivityTarget target;
    target.app_name = app_name;
    target.window_title = window_title;
    target.url = url;
    target.identifier = app_name + ":" + (url ? *url : window_title);
    return target;
}

// ─────────────────────────────────────
ActivityTarget MakeTarget(const ProbeResult &probe) {
    return MakeTarget(probe.process_name, probe.window_title, probe.url);
}
