#include "DebugLog.hpp"

#include <fstream>
#include <mutex>

namespace BYC
{

    namespace
    {
        std::mutex logMutex;
        bool debugEnabled = false;
        std::string logPath = "bond_calculator_debug.log";
    }

    void setDebugMode(bool enabled)
    {
        std::lock_guard<std::mutex> lock(logMutex);
        debugEnabled = enabled;
    }

    bool debugMode()
    {
        std::lock_guard<std::mutex> lock(logMutex);
        return debugEnabled;
    }

    void setDebugLogPath(const std::string &path)
    {
        if (path.empty())
        {
            return;
        }

        std::lock_guard<std::mutex> lock(logMutex);
        logPath = path;
    }

    std::string debugLogPath()
    {
        std::lock_guard<std::mutex> lock(logMutex);
        return logPath;
    }

    void logDebugLine(const std::string &message)
    {
        std::lock_guard<std::mutex> lock(logMutex);
        if (!debugEnabled)
        {
            return;
        }

        std::ofstream out(logPath, std::ios::out | std::ios::app);
        if (out)
        {
            out << message << "\n";
        }
    }
}
