#include "fairos/client/client.hpp"

namespace fairos {
namespace client {

namespace {

struct SignupResponse {
    std::string address;
    std::optional<std::string> mnemonic;
};

void from_json(const json& j, SignupResponse& r) {
    j.at("address").get_to(r.address);
    // 使用调用方提供的助记词时服务端不回传
    if (j.contains("mnemonic") && j.at("mnemonic").is_string()) {
        r.mnemonic = j.at("mnemonic").get<std::string>();
    }
}

Result<bool> boolField(const json& body, const std::string& field, const std::string& what) {
    if (!body.is_object() || !body.contains(field) || !body.at(field).is_boolean()) {
        return Error(ErrorCode::DecodeFailed, "unexpected " + what + " response");
    }
    return body.at(field).get<bool>();
}

} // namespace

Result<SignupResult> Client::Signup(const std::string& username,
                                    const std::string& password,
                                    const std::optional<std::string>& mnemonic) {
    json data = {
        {"user_name", username},
        {"password", password},
        {"mnemonic", nullptr}
    };
    if (mnemonic) {
        data["mnemonic"] = *mnemonic;
    }

    auto reply = transport_->PostJson("/user/signup", data, std::nullopt);
    if (!reply.ok()) {
        utils::GetLogger().Info("注册失败",
            utils::LogContext().With("username", username).With("error", reply.error().what()));
        return MapDomainError(ErrorDomain::User, reply.error());
    }

    auto decoded = transport::DecodeAs<SignupResponse>(reply.value().body, "user signup");
    if (!decoded.ok()) {
        return decoded.error();
    }
    auto err = storeSession(username, reply.value().sessionToken);
    if (err.hasError()) {
        return err;
    }

    SignupResult result;
    result.address = decoded.value().address;
    result.mnemonic = decoded.value().mnemonic;
    utils::GetLogger().Info("用户注册成功",
        utils::LogContext().With("username", username).With("address", result.address));
    return result;
}

Error Client::Login(const std::string& username, const std::string& password) {
    json data = {
        {"user_name", username},
        {"password", password}
    };
    auto reply = transport_->PostJson("/user/login", data, std::nullopt);
    if (!reply.ok()) {
        return MapDomainError(ErrorDomain::User, reply.error());
    }
    auto err = storeSession(username, reply.value().sessionToken);
    if (err.hasError()) {
        return err;
    }
    utils::GetLogger().Info("用户登录成功", utils::LogContext().With("username", username));
    return Error();
}

Error Client::Logout(const std::string& username) {
    auto reply = post(ErrorDomain::User, username, "/user/logout", json::object());
    if (!reply.ok()) {
        return reply.error();
    }
    sessions_->RemoveCookie(username);
    return Error();
}

Error Client::DeleteUser(const std::string& username, const std::string& password) {
    auto reply = del(ErrorDomain::User, username, "/user/delete", {{"password", password}});
    if (!reply.ok()) {
        return reply.error();
    }
    sessions_->RemoveCookie(username);
    utils::GetLogger().Info("用户已删除", utils::LogContext().With("username", username));
    return Error();
}

Result<bool> Client::UserExists(const std::string& username) const {
    auto reply = transport_->GetJson("/user/present", {{"user_name", username}}, std::nullopt);
    if (!reply.ok()) {
        return MapDomainError(ErrorDomain::User, reply.error());
    }
    return boolField(reply.value(), "present", "user present");
}

Result<bool> Client::IsLoggedIn(const std::string& username) const {
    auto reply = transport_->GetJson("/user/isloggedin", {{"user_name", username}}, std::nullopt);
    if (!reply.ok()) {
        return MapDomainError(ErrorDomain::User, reply.error());
    }
    return boolField(reply.value(), "loggedin", "user isloggedin");
}

} // namespace client
} // namespace fairos
