#pragma once

#include <optional>
#include <string>
#include <variant>

#include "common.hpp"

// Chrome, Chromium, Edge and Brave: URL is the last " - " segment of the title.
class ChromiumExtractor {
  public:
    std::optional<std::string> Extract(const FocusedWindow &window) const;
};

// Firefox: URL is whatever precedes the "Mozilla Firefox" suffix.
class FirefoxExtractor {
  public:
    std::optional<std::string> Extract(const FocusedWindow &window) const;
};

class UnknownExtractor {
  public:
    std::optional<std::string> Extract(const FocusedWindow &) const {
        return std::nullopt;
    }
};

using UrlExtractor = std::variant<ChromiumExtractor, FirefoxExtractor, UnknownExtractor>;

UrlExtractor MakeUrlExtractor(const std::string &process_name);
std::optional<std::string> ExtractUrl(const UrlExtractor &extractor, const FocusedWindow &window);

// identifier = app ":" (url if present, else title)
ActivityTarget MakeTarget(const std::string &app_name, const std::string &window_title,
                          const std::optional<std::string> &url);
ActivityTarget MakeTarget(const ProbeResult &probe);
