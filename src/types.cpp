#include "fairos/types.hpp"

namespace fairos {

std::string ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::TransportUnreachable: return "transport unreachable";
        case ErrorCode::RemoteRejected: return "remote rejected";
        case ErrorCode::DecodeFailed: return "decode failed";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::UnsupportedExpression: return "unsupported expression";
        case ErrorCode::InvalidArgument: return "invalid argument";
        case ErrorCode::NoSession: return "no session";
        case ErrorCode::Io: return "io";
        case ErrorCode::UserError: return "user error";
        case ErrorCode::UsernameAlreadyExists: return "username already exists";
        case ErrorCode::InvalidUsername: return "invalid username";
        case ErrorCode::InvalidPassword: return "invalid password";
        case ErrorCode::PodError: return "pod error";
        case ErrorCode::FileSystemError: return "filesystem error";
        case ErrorCode::KeyValueError: return "key-value error";
        case ErrorCode::DocumentError: return "document error";
    }
    return "unknown";
}

} // namespace fairos
