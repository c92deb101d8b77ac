#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common.hpp"
#include "foreground_probe.hpp"
#include "hyprland.hpp"
#include "niri.hpp"

// Foreground probe backed by the running Wayland compositor.
class Window : public ForegroundProbe {
  public:
    enum WM { NONE, NIRI, HYPRLAND };

    Window();

    std::optional<ProbeResult> Probe() override;
    FocusedWindow GetFocusedWindow();
    bool IsAvailable() const;

    // Expected: { "Ok": { "FocusedWindow": { id, title, app_id, pid, is_focused } | null } }
    static FocusedWindow ParseNiriFocusedWindow(const nlohmann::json &root);
    // Hyprland client object: { address, class, title, pid, ... }
    static FocusedWindow ParseHyprlandClient(const nlohmann::json &client);

    // Reads <proc_root>/<pid>/comm. Empty when the process is gone.
    static std::string ProcessNameForPid(int pid,
                                         const std::filesystem::path &proc_root = "/proc");

    // Resolves the display name and browser URL for a focused window.
    static std::optional<ProbeResult> ToProbeResult(const FocusedWindow &fw,
                                                    const std::string &process_name);

  private:
    WM m_WM = NONE;
    NiriIPC m_Niri;
    HyprlandIPC m_Hypr;
};
