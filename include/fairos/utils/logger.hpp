#pragma once

#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace fairos {
namespace utils {

// 日志级别，数值越大越详细
enum class LogLevel : int {
    Panic = 0,
    Fatal = 1,
    Error = 2,
    Warn  = 3,
    Info  = 4,
    Debug = 5
};

LogLevel ParseLogLevel(const std::string& level);
std::string LogLevelToString(LogLevel level);

// 日志配置
struct LoggingConfig {
    std::string level = "warn";       // debug, info, warn, error, fatal, panic
    std::string format = "text";      // json, text
    std::string output = "console";   // console, file
    std::string file = "fairos-client.log";
};

struct LogEntry {
    LogLevel level;
    std::string message;
    std::string time;
    std::map<std::string, std::string> fields;
};

class LogFormatter {
public:
    virtual ~LogFormatter() = default;
    virtual std::string Format(const LogEntry& entry) = 0;
};

class JSONFormatter : public LogFormatter {
public:
    std::string Format(const LogEntry& entry) override;
};

class TextFormatter : public LogFormatter {
public:
    std::string Format(const LogEntry& entry) override;
};

class LogOutput {
public:
    virtual ~LogOutput() = default;
    virtual void Write(const std::string& line) = 0;
};

// 输出到stderr，避免污染调用方的stdout
class ConsoleOutput : public LogOutput {
public:
    void Write(const std::string& line) override;
};

class FileOutput : public LogOutput {
public:
    explicit FileOutput(const std::string& filename);
    void Write(const std::string& line) override;

private:
    std::ofstream file_;
};

// 保存在内存中，供测试检查
class MemoryOutput : public LogOutput {
public:
    void Write(const std::string& line) override;
    std::vector<std::string> Lines() const;
    void Clear();

private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

// 日志上下文字段
class LogContext {
public:
    LogContext() = default;

    const std::map<std::string, std::string>& Fields() const { return fields_; }
    void WithField(const std::string& key, const std::string& value);
    LogContext With(const std::string& key, const std::string& value) const;

private:
    std::map<std::string, std::string> fields_;
};

class Logger {
public:
    static Logger& GetInstance();

    void Initialize(const LoggingConfig& config);

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const;

    // 替换全部输出
    void SetOutput(std::shared_ptr<LogOutput> output);
    void SetFormatter(std::unique_ptr<LogFormatter> formatter);

    void Log(LogLevel level, const std::string& message, const LogContext& ctx = LogContext());

    void Debug(const std::string& message, const LogContext& ctx = LogContext());
    void Info(const std::string& message, const LogContext& ctx = LogContext());
    void Warn(const std::string& message, const LogContext& ctx = LogContext());
    void Error(const std::string& message, const LogContext& ctx = LogContext());
    void Fatal(const std::string& message, const LogContext& ctx = LogContext());
    // 库内不终止进程，仅以最高级别记录
    void Panic(const std::string& message, const LogContext& ctx = LogContext());

    bool Enabled(LogLevel level) const;

private:
    Logger();
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LogLevel level_ = LogLevel::Warn;
    std::vector<std::shared_ptr<LogOutput>> outputs_;
    std::unique_ptr<LogFormatter> formatter_;
    mutable std::mutex mutex_;
};

inline Logger& GetLogger() {
    return Logger::GetInstance();
}

} // namespace utils
} // namespace fairos
