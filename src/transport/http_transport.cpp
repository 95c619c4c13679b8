#include "fairos/transport/http_transport.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <mutex>
#include <curl/curl.h>

namespace fairos {
namespace transport {

namespace {

std::once_flag curlInitFlag;

// libcurl写入回调函数
size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

// 收集响应头
size_t headerCallback(char* buffer, size_t size, size_t nitems, std::vector<std::string>* headers) {
    size_t length = size * nitems;
    std::string line(buffer, length);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
    if (!line.empty()) {
        headers->push_back(line);
    }
    return length;
}

// 返回非0时libcurl中止传输
int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* cancel = static_cast<CancellationToken*>(clientp);
    return (cancel && cancel->IsCancelled()) ? 1 : 0;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

// RAII封装curl_slist
class HeaderList {
public:
    HeaderList() = default;
    ~HeaderList() {
        if (list_) {
            curl_slist_free_all(list_);
        }
    }
    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    void Append(const std::string& header) {
        list_ = curl_slist_append(list_, header.c_str());
    }
    curl_slist* Get() const { return list_; }

private:
    curl_slist* list_ = nullptr;
};

} // namespace

// 连接缓存与DNS缓存在所有请求间共享
struct HttpTransport::SharedPool {
    CURLSH* share = nullptr;
    std::mutex locks[CURL_LOCK_DATA_LAST];

    static void lock(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        static_cast<SharedPool*>(userptr)->locks[data].lock();
    }

    static void unlock(CURL*, curl_lock_data data, void* userptr) {
        static_cast<SharedPool*>(userptr)->locks[data].unlock();
    }
};

std::string MethodToString(Method method) {
    switch (method) {
        case Method::Get: return "GET";
        case Method::Post: return "POST";
        case Method::Delete: return "DELETE";
    }
    return "GET";
}

HttpTransport::HttpTransport(const TransportConfig& config)
    : config_(config), pool_(std::make_unique<SharedPool>()) {
    std::call_once(curlInitFlag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });

    pool_->share = curl_share_init();
    if (pool_->share) {
        curl_share_setopt(pool_->share, CURLSHOPT_LOCKFUNC, &SharedPool::lock);
        curl_share_setopt(pool_->share, CURLSHOPT_UNLOCKFUNC, &SharedPool::unlock);
        curl_share_setopt(pool_->share, CURLSHOPT_USERDATA, pool_.get());
        curl_share_setopt(pool_->share, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
        curl_share_setopt(pool_->share, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    } else {
        // 没有共享句柄时每个请求各自建立连接，功能不受影响
        utils::GetLogger().Warn("无法创建libcurl共享句柄，连接不会被复用");
    }
}

HttpTransport::~HttpTransport() {
    if (pool_ && pool_->share) {
        curl_share_cleanup(pool_->share);
    }
}

std::string HttpTransport::BuildURL(const std::string& path, const QueryParams& query) const {
    std::string url = config_.baseURL + path;
    if (!query.empty()) {
        url += "?";
        bool first = true;
        for (const auto& [key, value] : query) {
            if (!first) url += "&";
            url += key + "=" + value;
            first = false;
        }
    }
    return url;
}

std::optional<std::string> HttpTransport::ParseSessionCookie(const std::string& header,
                                                             const std::string& cookieName) {
    // 形如 "fairOS-dfs=<token>; Path=/; HttpOnly"，只看第一个属性
    std::string pair = header.substr(0, header.find(';'));
    size_t eq = pair.find('=');
    if (eq == std::string::npos) {
        return std::nullopt;
    }
    std::string name = trim(pair.substr(0, eq));
    if (name != cookieName) {
        return std::nullopt;
    }
    return trim(pair.substr(eq + 1));
}

Result<json> HttpTransport::DecodeJson(const std::string& body, const std::string& what) {
    try {
        return json::parse(body);
    } catch (const json::exception& e) {
        utils::GetLogger().Error("响应体不是合法的JSON",
            utils::LogContext().With("response", what).With("error", e.what()));
        return Error(ErrorCode::DecodeFailed, "failed to parse " + what + " response: " + e.what());
    }
}

Error HttpTransport::ClassifyFailure(long status, const std::string& body) {
    json envelope = json::parse(body, nullptr, false);
    if (envelope.is_discarded() || !envelope.is_object() ||
        !envelope.contains("message") || !envelope["message"].is_string()) {
        utils::GetLogger().Error("无法解析错误响应",
            utils::LogContext().With("status", std::to_string(status)));
        return Error(ErrorCode::DecodeFailed,
                     "unexpected error response with status " + std::to_string(status));
    }

    // 缺少code或超出uint32范围时以HTTP状态码代替
    uint32_t code = static_cast<uint32_t>(status);
    if (envelope.contains("code") && envelope["code"].is_number_unsigned()) {
        uint64_t raw = envelope["code"].get<uint64_t>();
        if (raw <= std::numeric_limits<uint32_t>::max()) {
            code = static_cast<uint32_t>(raw);
        }
    }
    return Error(ErrorCode::RemoteRejected, envelope["message"].get<std::string>(), code);
}

Result<Response> HttpTransport::Execute(const Request& request) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return Error(ErrorCode::TransportUnreachable, "Failed to initialize CURL");
    }

    std::string url = BuildURL(request.path, request.query);
    std::string method = MethodToString(request.method);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, config_.verifyPeer ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, config_.verifyPeer ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, config_.connectTimeout);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // 连接复用
    if (pool_->share) {
        curl_easy_setopt(curl, CURLOPT_SHARE, pool_->share);
    }
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXCONNECTS, config_.maxIdleConnections);
    curl_easy_setopt(curl, CURLOPT_MAXAGE_CONN, config_.idleTimeout);

    switch (request.method) {
        case Method::Get:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case Method::Post:
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
            break;
        case Method::Delete:
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
            if (!request.body.empty()) {
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
            }
            break;
    }

    HeaderList headers;
    if (!request.contentType.empty()) {
        headers.Append("Content-Type: " + request.contentType);
    }
    if (request.token) {
        headers.Append("Cookie: " + config_.cookieName + "=" + *request.token);
    }
    for (const auto& [name, value] : request.headers) {
        headers.Append(name + ": " + value);
    }
    // 禁用100-continue，避免大文件上传多一次往返
    headers.Append("Expect:");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.Get());

    std::string responseBuffer;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseBuffer);

    std::vector<std::string> responseHeaders;
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &responseHeaders);

    if (request.cancel) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, request.cancel.get());
    }

    CURLcode res = curl_easy_perform(curl);

    long httpCode = 0;
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
    }
    curl_easy_cleanup(curl);

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        utils::GetLogger().Debug("请求已取消",
            utils::LogContext().With("method", method).With("url", url));
        return Error(ErrorCode::Cancelled, "request cancelled: " + method + " " + request.path);
    }
    if (res != CURLE_OK) {
        std::string errorMsg = curl_easy_strerror(res);
        utils::GetLogger().Warn("无法连接服务器",
            utils::LogContext()
                .With("method", method)
                .With("url", url)
                .With("error", errorMsg));
        return Error(ErrorCode::TransportUnreachable, "CURL request failed: " + errorMsg);
    }

    utils::GetLogger().Debug("HTTP请求完成",
        utils::LogContext()
            .With("method", method)
            .With("url", url)
            .With("status", std::to_string(httpCode)));

    if (!IsStatusOk(httpCode)) {
        return ClassifyFailure(httpCode, responseBuffer);
    }

    Response response;
    response.status = httpCode;
    response.body = std::move(responseBuffer);

    // 只有POST会刷新会话
    if (request.method == Method::Post) {
        const std::string prefix = "set-cookie:";
        for (const auto& line : responseHeaders) {
            if (toLower(line.substr(0, prefix.size())) != prefix) {
                continue;
            }
            auto token = ParseSessionCookie(line.substr(prefix.size()), config_.cookieName);
            if (token) {
                response.sessionToken = token;
            }
        }
    }
    return response;
}

Result<json> HttpTransport::decodeSuccess(const Request& request, const Response& response) const {
    return DecodeJson(response.body, MethodToString(request.method) + " " + request.path);
}

Result<json> HttpTransport::GetJson(const std::string& path,
                                    const QueryParams& query,
                                    const std::optional<std::string>& token,
                                    std::shared_ptr<CancellationToken> cancel) const {
    Request request;
    request.method = Method::Get;
    request.path = path;
    request.query = query;
    request.token = token;
    request.cancel = std::move(cancel);

    auto response = Execute(request);
    if (!response.ok()) {
        return response.error();
    }
    return decodeSuccess(request, response.value());
}

Result<JsonReply> HttpTransport::PostJson(const std::string& path,
                                          const json& body,
                                          const std::optional<std::string>& token) const {
    Request request;
    request.method = Method::Post;
    request.path = path;
    request.body = body.dump();
    request.contentType = "application/json";
    request.token = token;

    auto response = Execute(request);
    if (!response.ok()) {
        return response.error();
    }
    auto decoded = decodeSuccess(request, response.value());
    if (!decoded.ok()) {
        return decoded.error();
    }
    return JsonReply{std::move(decoded).value(), response.value().sessionToken};
}

Result<json> HttpTransport::DeleteJson(const std::string& path,
                                       const json& body,
                                       const std::optional<std::string>& token) const {
    Request request;
    request.method = Method::Delete;
    request.path = path;
    request.body = body.dump();
    request.contentType = "application/json";
    request.token = token;

    auto response = Execute(request);
    if (!response.ok()) {
        return response.error();
    }
    return decodeSuccess(request, response.value());
}

Result<JsonReply> HttpTransport::PostMultipart(const std::string& path,
                                               const MultipartBody& multipart,
                                               const std::optional<std::string>& token,
                                               const std::map<std::string, std::string>& headers) const {
    Request request;
    request.method = Method::Post;
    request.path = path;
    request.body = multipart.body;
    request.contentType = multipart.ContentType();
    request.token = token;
    request.headers = headers;

    auto response = Execute(request);
    if (!response.ok()) {
        return response.error();
    }
    auto decoded = decodeSuccess(request, response.value());
    if (!decoded.ok()) {
        return decoded.error();
    }
    return JsonReply{std::move(decoded).value(), response.value().sessionToken};
}

Result<Bytes> HttpTransport::DownloadMultipart(const std::string& path,
                                               const MultipartBody& multipart,
                                               const std::optional<std::string>& token) const {
    Request request;
    request.method = Method::Post;
    request.path = path;
    request.body = multipart.body;
    request.contentType = multipart.ContentType();
    request.token = token;

    auto response = Execute(request);
    if (!response.ok()) {
        return response.error();
    }
    const std::string& body = response.value().body;
    return Bytes(body.begin(), body.end());
}

} // namespace transport
} // namespace fairos
