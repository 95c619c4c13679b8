#include "fairos/utils/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace fairos {
namespace utils {

namespace {

std::string timeString() {
    auto now = std::chrono::system_clock::now();
    auto nowTime = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm;
    localtime_r(&nowTime, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << millis.count();
    return ss.str();
}

} // namespace

LogLevel ParseLogLevel(const std::string& level) {
    if (level == "debug" || level == "DEBUG") return LogLevel::Debug;
    if (level == "info" || level == "INFO") return LogLevel::Info;
    if (level == "warn" || level == "WARN" || level == "warning" || level == "WARNING") return LogLevel::Warn;
    if (level == "error" || level == "ERROR") return LogLevel::Error;
    if (level == "fatal" || level == "FATAL") return LogLevel::Fatal;
    if (level == "panic" || level == "PANIC") return LogLevel::Panic;
    return LogLevel::Warn;
}

std::string LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Panic: return "PANIC";
    }
    return "UNKNOWN";
}

std::string JSONFormatter::Format(const LogEntry& entry) {
    nlohmann::json j = {
        {"level", LogLevelToString(entry.level)},
        {"time", entry.time},
        {"msg", entry.message}
    };
    for (const auto& field : entry.fields) {
        j[field.first] = field.second;
    }
    return j.dump();
}

std::string TextFormatter::Format(const LogEntry& entry) {
    std::stringstream ss;
    ss << "[" << entry.time << "] "
       << "[" << LogLevelToString(entry.level) << "] "
       << entry.message;

    if (!entry.fields.empty()) {
        ss << " {";
        bool first = true;
        for (const auto& field : entry.fields) {
            if (!first) ss << ", ";
            ss << field.first << "=" << field.second;
            first = false;
        }
        ss << "}";
    }
    return ss.str();
}

void ConsoleOutput::Write(const std::string& line) {
    std::cerr << line << std::endl;
}

FileOutput::FileOutput(const std::string& filename) {
    file_.open(filename, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "无法打开日志文件: " << filename << std::endl;
    }
}

void FileOutput::Write(const std::string& line) {
    if (file_.is_open()) {
        file_ << line << std::endl;
    }
}

void MemoryOutput::Write(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(line);
}

std::vector<std::string> MemoryOutput::Lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
}

void MemoryOutput::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
}

void LogContext::WithField(const std::string& key, const std::string& value) {
    fields_[key] = value;
}

LogContext LogContext::With(const std::string& key, const std::string& value) const {
    LogContext ctx = *this;
    ctx.WithField(key, value);
    return ctx;
}

Logger::Logger() {
    outputs_.push_back(std::make_shared<ConsoleOutput>());
    formatter_ = std::make_unique<TextFormatter>();
}

Logger& Logger::GetInstance() {
    static Logger instance;
    return instance;
}

void Logger::Initialize(const LoggingConfig& config) {
    SetLevel(ParseLogLevel(config.level));

    if (config.format == "json") {
        SetFormatter(std::make_unique<JSONFormatter>());
    } else {
        SetFormatter(std::make_unique<TextFormatter>());
    }

    if (config.output == "file") {
        SetOutput(std::make_shared<FileOutput>(config.file));
    } else {
        SetOutput(std::make_shared<ConsoleOutput>());
    }
}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::GetLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::SetOutput(std::shared_ptr<LogOutput> output) {
    std::lock_guard<std::mutex> lock(mutex_);
    outputs_.clear();
    outputs_.push_back(std::move(output));
}

void Logger::SetFormatter(std::unique_ptr<LogFormatter> formatter) {
    std::lock_guard<std::mutex> lock(mutex_);
    formatter_ = std::move(formatter);
}

bool Logger::Enabled(LogLevel level) const {
    return static_cast<int>(level) <= static_cast<int>(GetLevel());
}

void Logger::Log(LogLevel level, const std::string& message, const LogContext& ctx) {
    if (!Enabled(level)) return;

    LogEntry entry;
    entry.level = level;
    entry.message = message;
    entry.time = timeString();
    entry.fields = ctx.Fields();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!formatter_) return;
    std::string line = formatter_->Format(entry);
    for (auto& output : outputs_) {
        output->Write(line);
    }
}

void Logger::Debug(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Debug, message, ctx);
}

void Logger::Info(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Info, message, ctx);
}

void Logger::Warn(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Warn, message, ctx);
}

void Logger::Error(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Error, message, ctx);
}

void Logger::Fatal(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Fatal, message, ctx);
}

void Logger::Panic(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Panic, message, ctx);
}

} // namespace utils
} // namespace fairos
