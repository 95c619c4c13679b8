#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "fairos/types.hpp"
#include "fairos/errors.hpp"
#include "fairos/block_size.hpp"
#include "fairos/expression.hpp"
#include "fairos/client/session_store.hpp"
#include "fairos/client/seek_stream.hpp"
#include "fairos/transport/http_transport.hpp"
#include "fairos/utils/logger.hpp"

namespace fairos {
namespace client {

using json = nlohmann::json;

// 客户端配置
struct ClientConfig {
    std::string baseURL = DEFAULT_SERVER_URL;
    std::string cookieName = SESSION_COOKIE_NAME;
    long idleTimeout = DEFAULT_IDLE_TIMEOUT;
    long maxIdleConnections = DEFAULT_MAX_IDLE_CONNECTIONS;   // 见TransportConfig::maxIdleConnections
    long connectTimeout = DEFAULT_CONNECT_TIMEOUT;
    bool verifyPeer = true;
    // 设置后在构造时初始化全局日志
    std::optional<utils::LoggingConfig> logging;

    transport::TransportConfig Transport() const;
};

// 键值表的索引类型
enum class IndexType {
    Str,
    Number
};

// 文档库字段类型
enum class FieldType {
    Str,
    Number,
    Map
};

enum class Compression {
    Gzip,
    Snappy
};

struct SignupResult {
    std::string address;
    std::optional<std::string> mnemonic;
};

// 解析/file/upload的响应，按提交顺序返回文件名
Result<std::vector<std::string>> ParseUploadResponse(const json& body);

// FairOS客户端。
// 会话token保存在注入的SessionStore中；登录、注销等会修改会话的调用需要调用方串行化，
// 其余调用只读取会话，可以并发。
class Client {
public:
    explicit Client(const ClientConfig& config = ClientConfig(),
                    std::shared_ptr<SessionStore> sessions = nullptr);

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    SessionStore& Sessions() { return *sessions_; }
    const SessionStore& Sessions() const { return *sessions_; }
    const transport::HttpTransport& Transport() const { return *transport_; }

    // 用户
    Result<SignupResult> Signup(const std::string& username,
                                const std::string& password,
                                const std::optional<std::string>& mnemonic = std::nullopt);
    Error Login(const std::string& username, const std::string& password);
    Error Logout(const std::string& username);
    Error DeleteUser(const std::string& username, const std::string& password);
    Result<bool> UserExists(const std::string& username) const;
    Result<bool> IsLoggedIn(const std::string& username) const;

    // Pod
    Error CreatePod(const std::string& username, const std::string& pod, const std::string& password) const;
    Error OpenPod(const std::string& username, const std::string& pod, const std::string& password) const;
    Error ClosePod(const std::string& username, const std::string& pod) const;
    Error DeletePod(const std::string& username, const std::string& pod, const std::string& password) const;
    Result<bool> PodExists(const std::string& username, const std::string& pod) const;

    // 文件系统
    Error Mkdir(const std::string& username, const std::string& pod, const std::string& path) const;
    Error Rm(const std::string& username, const std::string& pod, const std::string& path) const;
    Result<std::string> UploadBuffer(const std::string& username,
                                     const std::string& pod,
                                     const std::string& dir,
                                     const std::string& fileName,
                                     const Bytes& data,
                                     const std::string& contentType,
                                     const BlockSize& blockSize,
                                     const std::optional<Compression>& compression = std::nullopt) const;
    Result<std::string> UploadFile(const std::string& username,
                                   const std::string& pod,
                                   const std::string& dir,
                                   const std::string& localPath,
                                   const BlockSize& blockSize,
                                   const std::optional<Compression>& compression = std::nullopt) const;
    Result<Bytes> DownloadBuffer(const std::string& username,
                                 const std::string& pod,
                                 const std::string& path) const;
    Error DownloadFile(const std::string& username,
                       const std::string& pod,
                       const std::string& path,
                       const std::string& localPath) const;

    // 键值存储
    Error CreateKvStore(const std::string& username, const std::string& pod,
                        const std::string& store, IndexType indexType) const;
    Error OpenKvStore(const std::string& username, const std::string& pod, const std::string& store) const;
    Error DeleteKvStore(const std::string& username, const std::string& pod, const std::string& store) const;
    Error PutKvPair(const std::string& username, const std::string& pod, const std::string& store,
                    const std::string& key, const json& value) const;
    Result<json> GetKvPair(const std::string& username, const std::string& pod,
                           const std::string& store, const std::string& key) const;
    Error DeleteKvPair(const std::string& username, const std::string& pod,
                       const std::string& store, const std::string& key) const;
    Result<uint32_t> CountKvPairs(const std::string& username, const std::string& pod,
                                  const std::string& store) const;
    Result<bool> KvPairExists(const std::string& username, const std::string& pod,
                              const std::string& store, const std::string& key) const;
    Error LoadCsvBuffer(const std::string& username, const std::string& pod,
                        const std::string& store, const std::string& csv, bool memory) const;

    // 建立服务端游标并返回惰性序列；序列与本客户端共享传输层和会话存储
    Result<std::unique_ptr<KeyValueSeek>> KvSeek(const std::string& username,
                                                 const std::string& pod,
                                                 const std::string& store,
                                                 const std::string& startKey,
                                                 const std::optional<std::string>& endKey = std::nullopt,
                                                 const std::optional<uint32_t>& limit = std::nullopt) const;

    // 文档库
    Error CreateDocDatabase(const std::string& username, const std::string& pod,
                            const std::string& database,
                            const std::vector<std::pair<std::string, FieldType>>& fields,
                            bool mutableDb) const;
    Error OpenDocDatabase(const std::string& username, const std::string& pod,
                          const std::string& database) const;
    Error DeleteDocDatabase(const std::string& username, const std::string& pod,
                            const std::string& database) const;
    // 写入文档，自动附加随机id并返回
    Result<std::string> PutDocument(const std::string& username, const std::string& pod,
                                    const std::string& database, const json& doc) const;
    Result<json> GetDocument(const std::string& username, const std::string& pod,
                             const std::string& database, const std::string& id) const;
    Result<std::vector<json>> FindDocuments(const std::string& username, const std::string& pod,
                                            const std::string& database, const Expr& expr,
                                            const std::optional<uint32_t>& limit = std::nullopt) const;
    Result<uint32_t> CountDocuments(const std::string& username, const std::string& pod,
                                    const std::string& database, const Expr& expr) const;
    Error DeleteDocument(const std::string& username, const std::string& pod,
                         const std::string& database, const std::string& id) const;
    Error LoadJsonBuffer(const std::string& username, const std::string& pod,
                         const std::string& database, const std::string& data) const;

private:
    // 取出会话token，没有时返回NoSession
    Result<std::string> sessionToken(const std::string& username) const;

    // 对需要会话的POST/GET/DELETE的通用封装，错误映射到给定领域
    Result<json> post(ErrorDomain domain, const std::string& username,
                      const std::string& path, const json& body) const;
    Result<json> get(ErrorDomain domain, const std::string& username,
                     const std::string& path, const transport::QueryParams& query) const;
    Result<json> del(ErrorDomain domain, const std::string& username,
                     const std::string& path, const json& body) const;
    Result<json> upload(ErrorDomain domain, const std::string& username, const std::string& path,
                        const transport::MultipartBuilder& builder,
                        const std::map<std::string, std::string>& headers = {}) const;

    // 注册/登录后保存新的会话
    Error storeSession(const std::string& username, const std::optional<std::string>& token);

    std::shared_ptr<transport::HttpTransport> transport_;
    std::shared_ptr<SessionStore> sessions_;
};

} // namespace client
} // namespace fairos
