#pragma once

#include <functional>
#include <mutex>
#include <ostream>
#include <string>

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

// Each instance logs under its own name: "[demo] INFO Serving ...".
class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    explicit Logger(std::string name, LogLevel level = LogLevel::WARN);

    void SetLevel(LogLevel level);
    LogLevel Level() const;
    bool Enabled(LogLevel level) const;

    // Replaces the default std::cerr output. Sinks receive the formatted line.
    void SetSink(Sink sink);
    void SetStream(std::ostream& stream);

    void Log(LogLevel level, const std::string& message);
    void Debug(const std::string& message) { Log(LogLevel::DEBUG, message); }
    void Info(const std::string& message) { Log(LogLevel::INFO, message); }
    void Warn(const std::string& message) { Log(LogLevel::WARN, message); }
    void Error(const std::string& message) { Log(LogLevel::ERROR, message); }

    const std::string& Name() const { return name_; }

    static const char* LevelName(LogLevel level);

private:
    std::string name_;
    LogLevel level_;
    Sink sink_;
    mutable std::mutex mutex_;
};
