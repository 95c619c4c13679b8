#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "fairos/types.hpp"
#include "fairos/transport/multipart.hpp"
#include "fairos/utils/logger.hpp"

namespace fairos {
namespace transport {

using json = nlohmann::json;

enum class Method {
    Get,
    Post,
    Delete
};

std::string MethodToString(Method method);

// 有序的查询参数
using QueryParams = std::vector<std::pair<std::string, std::string>>;

// 协作式取消：置位后正在进行的传输会被中止
class CancellationToken {
public:
    void Cancel() { cancelled_.store(true); }
    bool IsCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// 传输层配置
struct TransportConfig {
    std::string baseURL = DEFAULT_SERVER_URL;
    std::string cookieName = SESSION_COOKIE_NAME;
    long idleTimeout = DEFAULT_IDLE_TIMEOUT;             // 空闲连接保留时间（秒）
    // 单个easy句柄的连接缓存上限(CURLOPT_MAXCONNECTS)。
    // 连接经CURLSH共享，共享缓存的大小由libcurl决定，不受此值约束
    long maxIdleConnections = DEFAULT_MAX_IDLE_CONNECTIONS;
    long connectTimeout = DEFAULT_CONNECT_TIMEOUT;       // 秒
    bool verifyPeer = true;
};

// 一次HTTP请求，构建后不再修改
struct Request {
    Method method = Method::Get;
    std::string path;
    QueryParams query;
    std::string body;
    std::string contentType;
    std::optional<std::string> token;                    // 会话token，未登录的调用为空
    std::map<std::string, std::string> headers;          // 附加请求头
    std::shared_ptr<CancellationToken> cancel;
};

// 2xx响应
struct Response {
    long status = 0;
    std::string body;
    std::optional<std::string> sessionToken;             // 仅POST响应会刷新
};

// JSON响应体以及可能刷新的会话token
struct JsonReply {
    json body;
    std::optional<std::string> sessionToken;
};

// 连接池化的HTTP执行器。
// 所有连接经由同一个libcurl共享句柄复用；对象本身可被多个线程同时使用。
class HttpTransport {
public:
    explicit HttpTransport(const TransportConfig& config = TransportConfig());
    ~HttpTransport();

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    // 执行请求并分类结果：
    //   无法连接 -> TransportUnreachable
    //   非2xx    -> RemoteRejected(message, code)，错误体不是{message, code}时为DecodeFailed
    //   取消     -> Cancelled
    Result<Response> Execute(const Request& request) const;

    Result<json> GetJson(const std::string& path,
                         const QueryParams& query,
                         const std::optional<std::string>& token,
                         std::shared_ptr<CancellationToken> cancel = nullptr) const;

    Result<JsonReply> PostJson(const std::string& path,
                               const json& body,
                               const std::optional<std::string>& token) const;

    Result<json> DeleteJson(const std::string& path,
                            const json& body,
                            const std::optional<std::string>& token) const;

    // multipart上传，响应按JSON解码
    Result<JsonReply> PostMultipart(const std::string& path,
                                    const MultipartBody& multipart,
                                    const std::optional<std::string>& token,
                                    const std::map<std::string, std::string>& headers = {}) const;

    // multipart请求，响应体为原始二进制，不做JSON解码
    Result<Bytes> DownloadMultipart(const std::string& path,
                                    const MultipartBody& multipart,
                                    const std::optional<std::string>& token) const;

    // baseURL + path + "?k=v&k2=v2"。
    // 不做百分号编码：调用方负责按服务端约定预编码参数值，这里再编码会破坏线上格式。
    std::string BuildURL(const std::string& path, const QueryParams& query) const;

    const TransportConfig& Config() const { return config_; }

    // 从Set-Cookie头中取出指定cookie的值，名称不符时返回空
    static std::optional<std::string> ParseSessionCookie(const std::string& header,
                                                         const std::string& cookieName);

    static bool IsStatusOk(long status) { return status >= 200 && status < 300; }

    // 将非2xx响应体{message, code}转换为RemoteRejected
    static Error ClassifyFailure(long status, const std::string& body);

    static Result<json> DecodeJson(const std::string& body, const std::string& what);

private:
    struct SharedPool;

    Result<json> decodeSuccess(const Request& request, const Response& response) const;

    TransportConfig config_;
    std::unique_ptr<SharedPool> pool_;
};

// 将JSON转换为强类型结构，失败视为与服务端的契约错误
template<typename T>
Result<T> DecodeAs(const json& j, const std::string& what) {
    try {
        return j.get<T>();
    } catch (const json::exception& e) {
        utils::GetLogger().Error("响应结构与预期不符",
            utils::LogContext().With("response", what).With("error", e.what()));
        return Error(ErrorCode::DecodeFailed, "unexpected " + what + " response: " + e.what());
    }
}

} // namespace transport
} // namespace fairos
