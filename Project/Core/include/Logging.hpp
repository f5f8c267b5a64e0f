#pragma once

#include <string>
#include <memory>
#include <functional>
#include <deque>
#include <vector>
#include <mutex>
#include <chrono>
#include <sstream>
#include <utility>

// Cross-platform API export/import macros
#ifdef _WIN32
#ifdef WORKERHOST_EXPORTS
#define WORKERHOST_API __declspec(dllexport)
#else
#define WORKERHOST_API __declspec(dllimport)
#endif
#else
    // Linux/GCC
#ifdef WORKERHOST_EXPORTS
#define WORKERHOST_API __attribute__((visibility("default")))
#else
#define WORKERHOST_API
#endif
#endif

struct HostSettingsData;

namespace HostLogging {

    // Log levels matching spdlog levels
    enum class LogLevel {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5
    };

    // Structure for retained log messages
    struct LogMessage {
        std::string text;
        LogLevel level;
        double timestamp;

        LogMessage(const std::string& message, LogLevel lvl)
            : text(message), level(lvl), timestamp(std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count()) {}
    };

    // Thread-safe ring of the most recent log messages (launcher summary, tests)
    class LogHistory {
    public:
        void Push(const LogMessage& message);
        std::vector<LogMessage> Snapshot() const;
        bool Contains(const std::string& fragment) const;
        void Clear();
        size_t Size() const;

    private:
        mutable std::mutex mutex;
        std::deque<LogMessage> messages;
        static constexpr size_t MAX_HISTORY_SIZE = 1000;
    };

    // Initialize the logging system. Without settings, logs go to "logs/" at trace level.
    bool WORKERHOST_API Initialize();
    bool WORKERHOST_API Initialize(const HostSettingsData& settings);

    // Shutdown the logging system
    void WORKERHOST_API Shutdown();

    // Recent messages retained in memory
    WORKERHOST_API LogHistory& GetLogHistory();

    // Logging functions
    void WORKERHOST_API LogTrace(const std::string& message);
    void WORKERHOST_API LogDebug(const std::string& message);
    void WORKERHOST_API LogInfo(const std::string& message);
    void WORKERHOST_API LogWarn(const std::string& message);
    void WORKERHOST_API LogError(const std::string& message);
    void WORKERHOST_API LogCritical(const std::string& message);

    // Parse "trace" / "debug" / "info" / "warn" / "error" / "critical" (defaults to Info).
    LogLevel WORKERHOST_API ParseLogLevel(const std::string& name);

    void WORKERHOST_API PrintOutput(const std::string& message, LogLevel logType = LogLevel::Info, bool toConsoleOnly = false);

    // Variadic form: PrintOutput(LogLevel::Warn, "pid ", pid, " not found")
    template <typename... Args>
    void PrintOutput(LogLevel logType, Args&&... parts)
    {
        std::ostringstream oss;
        (oss << ... << std::forward<Args>(parts));
        PrintOutput(oss.str(), logType, false);
    }

}

// Convenience macros for host logging
#define HOST_LOG_TRACE(msg)    HostLogging::LogTrace(msg)
#define HOST_LOG_DEBUG(msg)    HostLogging::LogDebug(msg)
#define HOST_LOG_INFO(msg)     HostLogging::LogInfo(msg)
#define HOST_LOG_WARN(msg)     HostLogging::LogWarn(msg)
#define HOST_LOG_ERROR(msg)    HostLogging::LogError(msg)
#define HOST_LOG_CRITICAL(msg) HostLogging::LogCritical(msg)

/**
 * @brief Prints a message through the host logger.
 *
 * Two forms are accepted:
 *  - HOST_PRINT("text", LogLevel::Warn)           message first, optional level
 *  - HOST_PRINT(LogLevel::Warn, "pid ", pid, ...) level first, parts are streamed together
 *
 * HOST_PRINT(HostLogging::LogLevel::Error, "Script ", name, " crashed");
 */
#define HOST_PRINT(...) HostLogging::PrintOutput(__VA_ARGS__)
