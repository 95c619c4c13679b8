#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace fairos {

// 服务端默认地址与会话cookie名称
const std::string DEFAULT_SERVER_URL = "http://localhost:9090/v1";
const std::string SESSION_COOKIE_NAME = "fairOS-dfs";
const std::string COMPRESSION_HEADER = "fairOS-dfs-Compression";

// 连接池参数
const long DEFAULT_IDLE_TIMEOUT = 6000;      // 秒
const long DEFAULT_MAX_IDLE_CONNECTIONS = 20;
const long DEFAULT_CONNECT_TIMEOUT = 30;     // 秒

// 错误码
enum class ErrorCode : int {
    None = 0,
    TransportUnreachable,   // 无法连接/解析服务器
    RemoteRejected,         // 非2xx响应，带有服务端的message/code
    DecodeFailed,           // 响应体与期望的结构不符
    Cancelled,
    UnsupportedExpression,
    InvalidArgument,
    NoSession,              // 该用户没有会话token
    Io,

    // 用户相关
    UserError,
    UsernameAlreadyExists,
    InvalidUsername,
    InvalidPassword,

    // 其他领域的通用错误
    PodError,
    FileSystemError,
    KeyValueError,
    DocumentError
};

std::string ErrorCodeToString(ErrorCode code);

// 错误类型
class Error {
public:
    Error() : code_(ErrorCode::None), remoteCode_(0) {}
    Error(ErrorCode code, const std::string& message, uint32_t remoteCode = 0)
        : code_(code), message_(message), remoteCode_(remoteCode) {}

    const std::string& what() const { return message_; }
    bool ok() const { return code_ == ErrorCode::None; }
    bool hasError() const { return code_ != ErrorCode::None; }

    ErrorCode Code() const { return code_; }
    // 服务端错误信封中的code字段，仅RemoteRejected及其映射出的领域错误有意义
    uint32_t RemoteCode() const { return remoteCode_; }

    // 保留原始message与remote code，仅替换错误码
    Error WithCode(ErrorCode code) const { return Error(code, message_, remoteCode_); }

private:
    ErrorCode code_;
    std::string message_;
    uint32_t remoteCode_;
};

// 结果类型
template<typename T>
class Result {
public:
    Result() : hasError_(true) {}
    Result(const T& value) : value_(value), hasError_(false) {}
    Result(T&& value) : value_(std::move(value)), hasError_(false) {}
    Result(const Error& error) : error_(error), hasError_(true) {}

    bool ok() const { return !hasError_; }
    const T& value() const & { return value_; }
    T&& value() && { return std::move(value_); }
    const Error& error() const { return error_; }

private:
    T value_;
    Error error_;
    bool hasError_;
};

using Bytes = std::vector<uint8_t>;

} // namespace fairos
