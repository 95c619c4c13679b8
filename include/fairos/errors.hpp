#pragma once

#include <string>
#include "fairos/types.hpp"

namespace fairos {

// 错误所属的领域
enum class ErrorDomain {
    User,
    Pod,
    FileSystem,
    KeyValue,
    Document
};

// 将传输层错误映射为领域错误。
// TransportUnreachable/DecodeFailed/Cancelled/NoSession原样返回，
// RemoteRejected按已知message子串映射，未匹配的归为该领域的通用错误。
// 注意：依赖服务端的英文错误文本，服务端改动措辞会使映射退化为通用错误。
Error MapDomainError(ErrorDomain domain, const Error& err);

// 已知的服务端错误文本
const std::string MSG_USERNAME_ALREADY_PRESENT = "user signup: user name already present";
const std::string MSG_INVALID_USERNAME = "user login: invalid user name";
const std::string MSG_INVALID_PASSWORD = "user login: invalid password";

// seek游标耗尽时服务端返回的错误文本
const std::string MSG_NO_NEXT_ELEMENT = "no next element";

} // namespace fairos
