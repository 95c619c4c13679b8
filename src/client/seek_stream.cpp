#include "fairos/client/seek_stream.hpp"

#include "fairos/errors.hpp"
#include "fairos/utils/logger.hpp"

namespace fairos {
namespace client {

namespace {

// /kv/seek/next 的响应
struct KvEntryResponse {
    std::vector<std::string> keys;
    std::string values;
};

void from_json(const transport::json& j, KvEntryResponse& r) {
    j.at("keys").get_to(r.keys);
    j.at("values").get_to(r.values);
}

} // namespace

KeyValueSeek::KeyValueSeek(std::shared_ptr<const transport::HttpTransport> transport,
                           std::shared_ptr<const SessionStore> sessions,
                           std::string username,
                           std::string pod,
                           std::string store,
                           std::optional<uint32_t> limit)
    : transport_(std::move(transport))
    , sessions_(std::move(sessions))
    , username_(std::move(username))
    , pod_(std::move(pod))
    , store_(std::move(store))
    , limit_(limit)
    , cancel_(std::make_shared<transport::CancellationToken>()) {}

Result<std::optional<KvPair>> KeyValueSeek::finish(const Error& err) {
    done_ = true;
    if (err.hasError()) {
        return err;
    }
    return std::optional<KvPair>();
}

Result<std::optional<KvPair>> KeyValueSeek::Next() {
    if (done_) {
        return std::optional<KvPair>();
    }
    if (cancel_->IsCancelled()) {
        return finish(Error(ErrorCode::Cancelled, "seek cancelled"));
    }
    if (limit_ && yielded_ >= *limit_) {
        return finish(Error());
    }

    auto token = sessions_->Cookie(username_);
    if (!token) {
        return finish(Error(ErrorCode::NoSession, "no session for user " + username_));
    }

    transport::QueryParams query = {
        {"pod_name", pod_},
        {"table_name", store_},
    };
    auto res = transport_->GetJson("/kv/seek/next", query, token, cancel_);
    if (!res.ok()) {
        const Error& err = res.error();
        if (err.Code() != ErrorCode::RemoteRejected) {
            return finish(err);
        }
        // 服务端拒绝即视为序列结束；非约定的结束信号保存下来供调用方区分
        if (err.what().find(MSG_NO_NEXT_ELEMENT) == std::string::npos) {
            utils::GetLogger().Warn("seek序列因服务端错误结束",
                utils::LogContext()
                    .With("store", store_)
                    .With("message", err.what()));
            terminalError_ = MapDomainError(ErrorDomain::KeyValue, err);
        }
        return finish(Error());
    }

    auto entry = transport::DecodeAs<KvEntryResponse>(res.value(), "kv seek next");
    if (!entry.ok()) {
        return finish(entry.error());
    }
    if (entry.value().keys.empty()) {
        return finish(Error());
    }

    ++yielded_;
    return std::optional<KvPair>(KvPair(entry.value().keys.front(), entry.value().values));
}

std::pair<size_t, std::optional<size_t>> KeyValueSeek::SizeHint() const {
    if (limit_) {
        return {0, static_cast<size_t>(*limit_)};
    }
    return {0, std::nullopt};
}

void KeyValueSeek::Cancel() {
    cancel_->Cancel();
}

} // namespace client
} // namespace fairos
