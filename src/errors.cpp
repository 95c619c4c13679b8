#include "fairos/errors.hpp"

#include <utility>
#include <vector>

namespace fairos {

namespace {

struct MessageRule {
    std::string fragment;
    ErrorCode code;
};

const std::vector<MessageRule>& userRules() {
    static const std::vector<MessageRule> rules = {
        {MSG_USERNAME_ALREADY_PRESENT, ErrorCode::UsernameAlreadyExists},
        {MSG_INVALID_USERNAME, ErrorCode::InvalidUsername},
        {MSG_INVALID_PASSWORD, ErrorCode::InvalidPassword},
    };
    return rules;
}

ErrorCode genericCode(ErrorDomain domain) {
    switch (domain) {
        case ErrorDomain::User: return ErrorCode::UserError;
        case ErrorDomain::Pod: return ErrorCode::PodError;
        case ErrorDomain::FileSystem: return ErrorCode::FileSystemError;
        case ErrorDomain::KeyValue: return ErrorCode::KeyValueError;
        case ErrorDomain::Document: return ErrorCode::DocumentError;
    }
    return ErrorCode::UserError;
}

} // namespace

Error MapDomainError(ErrorDomain domain, const Error& err) {
    if (err.Code() != ErrorCode::RemoteRejected) {
        return err;
    }

    if (domain == ErrorDomain::User) {
        for (const auto& rule : userRules()) {
            if (err.what().find(rule.fragment) != std::string::npos) {
                return err.WithCode(rule.code);
            }
        }
    }
    return err.WithCode(genericCode(domain));
}

} // namespace fairos
