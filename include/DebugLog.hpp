#pragma once

#include <string>

namespace BYC {

    // Process-wide append-only debug log, disabled by default.
    void setDebugMode(bool enabled);
    bool debugMode();

    void setDebugLogPath(const std::string& path);
    std::string debugLogPath();

    void logDebugLine(const std::string& message);
}
