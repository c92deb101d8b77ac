#include "window.hpp"

#include "browser_url.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

// ─────────────────────────────────────
Window::Window() {
    if (m_Niri.IsAvailable()) {
        m_WM = NIRI;
        spdlog::info("Window manager detected: NIRI");
    } else if (m_Hypr.IsAvailable()) {
        m_WM = HYPRLAND;
        spdlog::info("Window manager detected: HYPRLAND");
    } else {
        m_WM = NONE;
    }
}

// ─────────────────────────────────────
bool Window::IsAvailable() const {
    return m_WM != NONE;
}

// ─────────────────────────────────────
FocusedWindow Window::GetFocusedWindow() {
    switch (m_WM) {
    case NIRI: {
        const auto reply = m_Niri.SendEnumRequest("FocusedWindow");
        if (!reply) {
            return {};
        }
        return ParseNiriFocusedWindow(*reply);
    }
    case HYPRLAND: {
        const auto client = m_Hypr.GetActiveWindow();
        if (!client) {
            return {};
        }
        return ParseHyprlandClient(*client);
    }
    case NONE:
        break;
    }
    return {};
}

// ─────────────────────────────────────
std::optional<ProbeResult> Window::Probe() {
    const FocusedWindow fw = GetFocusedWindow();
    if (!fw.valid) {
        return std::nullopt;
    }
    return ToProbeResult(fw, ProcessNameForPid(fw.pid));
}

// ─────────────────────────────────────
std::optional<ProbeResult> Window::ToProbeResult(const FocusedWindow &fw,
                                                 const std::string &process_name) {
    ProbeResult result;
    result.process_name = process_name.empty() ? fw.app_id : process_name;
    if (result.process_name.empty()) {
        spdlog::debug("Focused window {} has neither a process nor an app_id",
                      fw.window_id.value_or(0));
        return std::nullopt;
    }
    result.window_title = fw.title;

    // Browsers often run under a helper name (GeckoMain); the app_id is the better hint then.
    UrlExtractor extractor = MakeUrlExtractor(result.process_name);
    if (std::holds_alternative<UnknownExtractor>(extractor)) {
        extractor = MakeUrlExtractor(fw.app_id);
    }
    result.url = ExtractUrl(extractor, fw);
    return result;
}

// ─────────────────────────────────────
FocusedWindow Window::ParseNiriFocusedWindow(const nlohmann::json &root) {
    FocusedWindow focus;

    if (!root.is_object() || !root.contains("Ok") || !root["Ok"].is_object() ||
        !root["Ok"].contains("FocusedWindow")) {
        spdlog::debug("Unexpected niri IPC response format");
        return focus;
    }

    const auto &fw = root["Ok"]["FocusedWindow"];
    if (fw.is_null()) {
        spdlog::debug("No focused window");
        return focus;
    }
    if (!fw.is_object()) {
        return focus;
    }

    if (fw.contains("id") && fw["id"].is_number_unsigned()) {
        focus.window_id = fw["id"].get<std::uint64_t>();
    }
    if (fw.contains("pid") && fw["pid"].is_number_integer()) {
        focus.pid = fw["pid"].get<int>();
    }
    if (fw.contains("title") && fw["title"].is_string()) {
        focus.title = fw["title"].get<std::string>();
    }
    if (fw.contains("app_id") && fw["app_id"].is_string()) {
        focus.app_id = fw["app_id"].get<std::string>();
    }

    const bool is_focused =
        fw.contains("is_focused") && fw["is_focused"].is_boolean() && fw["is_focused"].get<bool>();

    focus.valid = (focus.window_id.has_value() && is_focused);
    return focus;
}

// ─────────────────────────────────────
FocusedWindow Window::ParseHyprlandClient(const nlohmann::json &client) {
    FocusedWindow focus;
    if (!client.is_object()) {
        return focus;
    }

    if (client.contains("pid") && client["pid"].is_number_integer()) {
        focus.pid = client["pid"].get<int>();
    }
    if (client.contains("class") && client["class"].is_string()) {
        focus.app_id = client["class"].get<std::string>();
    }
    if (client.contains("title") && client["title"].is_string()) {
        focus.title = client["title"].get<std::string>();
    }
    if (client.contains("address") && client["address"].is_string()) {
        // Addresses are 64-bit pointers such as "0x5612a3b4c5d0".
        try {
            focus.window_id = std::stoull(client["address"].get<std::string>(), nullptr, 16);
        } catch (const std::exception &) {
            spdlog::debug("Unparsable Hyprland address {}", client["address"].get<std::string>());
            focus.window_id.reset();
        }
    }

    focus.valid = !focus.app_id.empty() || !focus.title.empty();
    return focus;
}

// ─────────────────────────────────────
std::string Window::ProcessNameForPid(int pid, const std::filesystem::path &proc_root) {
    if (pid <= 0) {
        return {};
    }

    std::ifstream comm(proc_root / std::to_string(pid) / "comm");
    if (!comm) {
        spdlog::debug("Process {} vanished before it could be named", pid);
        return {};
    }

    std::string name;
    std::getline(comm, name);
    while (!name.empty() && (name.back() == '\n' || name.back() == '\r' || name.back() == ' ')) {
        name.pop_back();
    }
    return name;
}
