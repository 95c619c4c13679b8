#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fairos {
namespace client {

// 按用户名保存会话token。
// 写操作（登录、注销等）由调用方串行化，实现本身不加锁。
class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual std::optional<std::string> Cookie(const std::string& username) const = 0;

    // 重复设置会覆盖旧token
    virtual void SetCookie(const std::string& username, const std::string& token) = 0;

    virtual void RemoveCookie(const std::string& username) = 0;

    virtual std::vector<std::string> Usernames() const = 0;
};

// 内存实现
class MemorySessionStore : public SessionStore {
public:
    MemorySessionStore() = default;

    std::optional<std::string> Cookie(const std::string& username) const override;
    void SetCookie(const std::string& username, const std::string& token) override;
    void RemoveCookie(const std::string& username) override;
    std::vector<std::string> Usernames() const override;

private:
    std::map<std::string, std::string> cookies_;
};

} // namespace client
} // namespace fairos
