#include "fairos/client/client.hpp"

namespace fairos {
namespace client {

using transport::HttpTransport;
using transport::JsonReply;
using transport::MultipartBuilder;
using transport::QueryParams;

transport::TransportConfig ClientConfig::Transport() const {
    transport::TransportConfig config;
    config.baseURL = baseURL;
    config.cookieName = cookieName;
    config.idleTimeout = idleTimeout;
    config.maxIdleConnections = maxIdleConnections;
    config.connectTimeout = connectTimeout;
    config.verifyPeer = verifyPeer;
    return config;
}

Client::Client(const ClientConfig& config, std::shared_ptr<SessionStore> sessions)
    : transport_(std::make_shared<HttpTransport>(config.Transport()))
    , sessions_(std::move(sessions)) {
    if (config.logging) {
        utils::GetLogger().Initialize(*config.logging);
    }
    if (!sessions_) {
        sessions_ = std::make_shared<MemorySessionStore>();
    }
    utils::GetLogger().Debug("FairOS客户端已创建",
        utils::LogContext().With("baseURL", config.baseURL));
}

Result<std::string> Client::sessionToken(const std::string& username) const {
    auto token = sessions_->Cookie(username);
    if (!token) {
        utils::GetLogger().Debug("用户没有会话",
            utils::LogContext().With("username", username));
        return Error(ErrorCode::NoSession, "no session for user " + username);
    }
    return *token;
}

Error Client::storeSession(const std::string& username, const std::optional<std::string>& token) {
    if (!token) {
        utils::GetLogger().Error("响应中缺少会话cookie",
            utils::LogContext().With("username", username));
        return Error(ErrorCode::DecodeFailed, "response did not carry a session cookie");
    }
    sessions_->SetCookie(username, *token);
    return Error();
}

Result<json> Client::post(ErrorDomain domain, const std::string& username,
                          const std::string& path, const json& body) const {
    auto token = sessionToken(username);
    if (!token.ok()) {
        return token.error();
    }
    auto reply = transport_->PostJson(path, body, token.value());
    if (!reply.ok()) {
        return MapDomainError(domain, reply.error());
    }
    return reply.value().body;
}

Result<json> Client::get(ErrorDomain domain, const std::string& username,
                         const std::string& path, const QueryParams& query) const {
    auto token = sessionToken(username);
    if (!token.ok()) {
        return token.error();
    }
    auto reply = transport_->GetJson(path, query, token.value());
    if (!reply.ok()) {
        return MapDomainError(domain, reply.error());
    }
    return reply.value();
}

Result<json> Client::del(ErrorDomain domain, const std::string& username,
                         const std::string& path, const json& body) const {
    auto token = sessionToken(username);
    if (!token.ok()) {
        return token.error();
    }
    auto reply = transport_->DeleteJson(path, body, token.value());
    if (!reply.ok()) {
        return MapDomainError(domain, reply.error());
    }
    return reply.value();
}

Result<json> Client::upload(ErrorDomain domain, const std::string& username, const std::string& path,
                            const MultipartBuilder& builder,
                            const std::map<std::string, std::string>& headers) const {
    auto token = sessionToken(username);
    if (!token.ok()) {
        return token.error();
    }
    auto multipart = builder.Build();
    if (!multipart.ok()) {
        return multipart.error();
    }
    auto reply = transport_->PostMultipart(path, multipart.value(), token.value(), headers);
    if (!reply.ok()) {
        return MapDomainError(domain, reply.error());
    }
    return reply.value().body;
}

} // namespace client
} // namespace fairos
