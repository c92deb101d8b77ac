#pragma once

#include <optional>

#include "common.hpp"

// Returns the current foreground target, or std::nullopt when nothing can be
// attributed (no focused window, compositor unreachable, process gone).
class ForegroundProbe {
  public:
    virtual ~ForegroundProbe() = default;
    virtual std::optional<ProbeResult> Probe() = 0;
};
