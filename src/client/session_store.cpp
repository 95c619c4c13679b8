#include "fairos/client/session_store.hpp"

namespace fairos {
namespace client {

std::optional<std::string> MemorySessionStore::Cookie(const std::string& username) const {
    auto it = cookies_.find(username);
    if (it == cookies_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemorySessionStore::SetCookie(const std::string& username, const std::string& token) {
    cookies_[username] = token;
}

void MemorySessionStore::RemoveCookie(const std::string& username) {
    cookies_.erase(username);
}

std::vector<std::string> MemorySessionStore::Usernames() const {
    std::vector<std::string> names;
    for (const auto& pair : cookies_) {
        names.push_back(pair.first);
    }
    return names;
}

} // namespace client
} // namespace fairos
