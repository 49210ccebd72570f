#include "Logger.hpp"

#include <iostream>
#include <utility>

Logger::Logger(std::string name, LogLevel level)
    : name_(std::move(name)),
      level_(level) {}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::Level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool Logger::Enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) >= static_cast<int>(level_);
}

void Logger::SetSink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::SetStream(std::ostream& stream) {
    SetSink([&stream](LogLevel, const std::string& line) {
        stream << line << std::endl;
    });
}

void Logger::Log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) < static_cast<int>(level_)) {
        return;
    }

    const std::string line = "[" + name_ + "] " + LevelName(level) + " " + message;
    if (sink_) {
        sink_(level, line);
        return;
    }

    std::cerr << line << std::endl;
}

const char* Logger::LevelName(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARN:
        return "WARN";
    case LogLevel::ERROR:
        return "ERROR";
    }
    return "INFO";
}
