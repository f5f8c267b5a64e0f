#include "Logging.hpp"
#include "Settings/HostSettings.hpp"

#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/base_sink.h"
#include "spdlog/pattern_formatter.h"

#include <filesystem>
#include <iostream>

namespace HostLogging {

    // Sink that retains recent messages in the in-memory history
    class HistorySink : public spdlog::sinks::base_sink<std::mutex> {
    public:
        explicit HistorySink(LogHistory& history) : logHistory(history) {}

    protected:
        void sink_it_(const spdlog::details::log_msg& msg) override {
            // Convert spdlog level to our LogLevel enum
            LogLevel level;
            switch (msg.level) {
                case spdlog::level::trace:    level = LogLevel::Trace; break;
                case spdlog::level::debug:    level = LogLevel::Debug; break;
                case spdlog::level::info:     level = LogLevel::Info; break;
                case spdlog::level::warn:     level = LogLevel::Warn; break;
                case spdlog::level::err:      level = LogLevel::Error; break;
                case spdlog::level::critical: level = LogLevel::Critical; break;
                default:                      level = LogLevel::Info; break;
            }

            std::string message = fmt::to_string(msg.payload);
            if (message.empty()) return;

            logHistory.Push(LogMessage(message, level));
        }

        void flush_() override {
        }

    private:
        LogHistory& logHistory;
    };

    // Static instances
    static std::shared_ptr<spdlog::logger> logger;

    static LogHistory logHistory;
    static bool initialized = false;

    static spdlog::level::level_enum ToSpdlogLevel(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:    return spdlog::level::trace;
            case LogLevel::Debug:    return spdlog::level::debug;
            case LogLevel::Info:     return spdlog::level::info;
            case LogLevel::Warn:     return spdlog::level::warn;
            case LogLevel::Error:    return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
        }
        return spdlog::level::info;
    }

    // LogHistory implementation
    void LogHistory::Push(const LogMessage& message) {
        std::lock_guard<std::mutex> lock(mutex);

        // Drop the oldest messages once the history is full
        while (messages.size() >= MAX_HISTORY_SIZE) {
            messages.pop_front();
        }

        messages.push_back(message);
    }

    std::vector<LogMessage> LogHistory::Snapshot() const {
        std::lock_guard<std::mutex> lock(mutex);
        return std::vector<LogMessage>(messages.begin(), messages.end());
    }

    bool LogHistory::Contains(const std::string& fragment) const {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& m : messages) {
            if (m.text.find(fragment) != std::string::npos) return true;
        }
        return false;
    }

    void LogHistory::Clear() {
        std::lock_guard<std::mutex> lock(mutex);
        messages.clear();
    }

    size_t LogHistory::Size() const {
        std::lock_guard<std::mutex> lock(mutex);
        return messages.size();
    }

    // Logging system functions
    static bool InitializeWith(const std::string& logDirectory, spdlog::level::level_enum level) {
        if (initialized) {
            return true;
        }

        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_level(level);
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            sinks.push_back(console_sink);

            if (!logDirectory.empty()) {
                std::filesystem::create_directories(logDirectory);
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                    (std::filesystem::path(logDirectory) / "workerhost.log").string(), true);
                file_sink->set_level(spdlog::level::trace);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
                sinks.push_back(file_sink);
            }

            // History sink keeps everything so tests can inspect debug output
            auto history_sink = std::make_shared<HistorySink>(logHistory);
            history_sink->set_level(spdlog::level::trace);
            history_sink->set_pattern("%v");
            sinks.push_back(history_sink);

            logger = std::make_shared<spdlog::logger>("workerhost", sinks.begin(), sinks.end());

            logger->set_level(spdlog::level::trace);
            logger->flush_on(spdlog::level::warn);

            // Register as default logger
            spdlog::set_default_logger(logger);

            initialized = true;

            LogInfo("WorkerHost logging system initialized");

            return true;
        }
        catch (const std::exception& ex) {
            std::cerr << "Failed to initialize logging system: " << ex.what() << std::endl;
            initialized = true; // Set to true anyway to avoid repeated attempts
            return false;
        }
    }

    bool Initialize() {
        return InitializeWith("logs", spdlog::level::trace);
    }

    bool Initialize(const HostSettingsData& settings) {
        return InitializeWith(settings.logDirectory, ToSpdlogLevel(ParseLogLevel(settings.logLevel)));
    }

    void Shutdown() {
        if (!initialized) {
            return;
        }

        LogInfo("Shutting down logging system");

        if (logger) {
            logger->flush();
            logger.reset();
        }

        spdlog::shutdown();
        logHistory.Clear();
        initialized = false;
    }

    LogHistory& GetLogHistory() {
        return logHistory;
    }

    LogLevel ParseLogLevel(const std::string& name) {
        if (name == "trace") return LogLevel::Trace;
        if (name == "debug") return LogLevel::Debug;
        if (name == "warn" || name == "warning") return LogLevel::Warn;
        if (name == "error") return LogLevel::Error;
        if (name == "critical") return LogLevel::Critical;
        return LogLevel::Info;
    }

    // Internal helper for logging
    void LogInternal(LogLevel level, const std::string& message) {
        if (message.empty()) return;

        if (!initialized || !logger) {
            // Logger not initialized or already destroyed; still retain the message
            logHistory.Push(LogMessage(message, level));
            return;
        }

        switch (level) {
            case LogLevel::Trace:    logger->trace(message); break;
            case LogLevel::Debug:    logger->debug(message); break;
            case LogLevel::Info:     logger->info(message); break;
            case LogLevel::Warn:     logger->warn(message); break;
            case LogLevel::Error:    logger->error(message); break;
            case LogLevel::Critical: logger->critical(message); break;
        }
    }

    void PrintOutput(const std::string& message, LogLevel logType, bool toConsoleOnly)
    {
        if (toConsoleOnly)
            std::cout << message << std::endl;
        else
            LogInternal(logType, message);
    }

    // Public logging functions
    void LogTrace(const std::string& message) {
        LogInternal(LogLevel::Trace, message);
    }

    void LogDebug(const std::string& message) {
        LogInternal(LogLevel::Debug, message);
    }

    void LogInfo(const std::string& message) {
        LogInternal(LogLevel::Info, message);
    }

    void LogWarn(const std::string& message) {
        LogInternal(LogLevel::Warn, message);
    }

    void LogError(const std::string& message) {
        LogInternal(LogLevel::Error, message);
    }

    void LogCritical(const std::string& message) {
        LogInternal(LogLevel::Critical, message);
    }

}
