#include "fairos/client/client.hpp"

namespace fairos {
namespace client {

Error Client::CreatePod(const std::string& username, const std::string& pod, const std::string& password) const {
    json data = {
        {"pod_name", pod},
        {"password", password}
    };
    auto reply = post(ErrorDomain::Pod, username, "/pod/new", data);
    if (!reply.ok()) {
        return reply.error();
    }
    utils::GetLogger().Info("Pod已创建",
        utils::LogContext().With("username", username).With("pod", pod));
    return Error();
}

Error Client::OpenPod(const std::string& username, const std::string& pod, const std::string& password) const {
    json data = {
        {"pod_name", pod},
        {"password", password}
    };
    auto reply = post(ErrorDomain::Pod, username, "/pod/open", data);
    return reply.ok() ? Error() : reply.error();
}

Error Client::ClosePod(const std::string& username, const std::string& pod) const {
    auto reply = post(ErrorDomain::Pod, username, "/pod/close", {{"pod_name", pod}});
    return reply.ok() ? Error() : reply.error();
}

Error Client::DeletePod(const std::string& username, const std::string& pod, const std::string& password) const {
    json data = {
        {"pod_name", pod},
        {"password", password}
    };
    auto reply = del(ErrorDomain::Pod, username, "/pod/delete", data);
    return reply.ok() ? Error() : reply.error();
}

Result<bool> Client::PodExists(const std::string& username, const std::string& pod) const {
    auto reply = get(ErrorDomain::Pod, username, "/pod/present", {{"pod_name", pod}});
    if (!reply.ok()) {
        return reply.error();
    }
    const auto& body = reply.value();
    if (!body.is_object() || !body.contains("present") || !body.at("present").is_boolean()) {
        return Error(ErrorCode::DecodeFailed, "unexpected pod present response");
    }
    return body.at("present").get<bool>();
}

} // namespace client
} // namespace fairos
