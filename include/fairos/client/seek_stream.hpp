#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include "fairos/types.hpp"
#include "fairos/client/session_store.hpp"
#include "fairos/transport/http_transport.hpp"

namespace fairos {
namespace client {

using KvPair = std::pair<std::string, std::string>;

// 服务端游标上的惰性、单遍、可取消的键值序列。
// 游标状态全部保存在服务端，每次Next()发起一次/kv/seek/next。
// 同一实例不能被多个线程同时拉取；Cancel()可以从其他线程调用。
// 与创建它的Client共享传输层和会话存储，可以比Client活得更久。
class KeyValueSeek {
public:
    KeyValueSeek(std::shared_ptr<const transport::HttpTransport> transport,
                 std::shared_ptr<const SessionStore> sessions,
                 std::string username,
                 std::string pod,
                 std::string store,
                 std::optional<uint32_t> limit);

    KeyValueSeek(const KeyValueSeek&) = delete;
    KeyValueSeek& operator=(const KeyValueSeek&) = delete;

    // 下一个键值对；序列结束返回nullopt。
    // 无法连接、被取消、没有会话或响应无法解码时返回错误，之后序列视为结束。
    Result<std::optional<KvPair>> Next();

    // (下界, 上界)，未指定limit时上界为空
    std::pair<size_t, std::optional<size_t>> SizeHint() const;

    // 停止序列并中止正在进行的请求
    void Cancel();

    bool Done() const { return done_; }
    size_t Yielded() const { return yielded_; }

    // 服务端以非"no next element"的错误结束序列时保存该错误，正常结束时为ok
    const Error& TerminalError() const { return terminalError_; }

private:
    Result<std::optional<KvPair>> finish(const Error& err);

    std::shared_ptr<const transport::HttpTransport> transport_;
    std::shared_ptr<const SessionStore> sessions_;
    std::string username_;
    std::string pod_;
    std::string store_;
    std::optional<uint32_t> limit_;

    std::shared_ptr<transport::CancellationToken> cancel_;
    size_t yielded_ = 0;
    bool done_ = false;
    Error terminalError_;
};

} // namespace client
} // namespace fairos
