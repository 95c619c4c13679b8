#include "fairos/client/client.hpp"

#include "fairos/utils/tools.hpp"

namespace fairos {
namespace client {

namespace {

struct KvGetResponse {
    std::vector<std::string> keys;
    std::string values;
};

void from_json(const json& j, KvGetResponse& r) {
    j.at("keys").get_to(r.keys);
    j.at("values").get_to(r.values);
}

std::string indexTypeName(IndexType type) {
    return type == IndexType::Number ? "number" : "string";
}

json tableBody(const std::string& pod, const std::string& store) {
    return {
        {"pod_name", pod},
        {"table_name", store}
    };
}

} // namespace

Error Client::CreateKvStore(const std::string& username, const std::string& pod,
                            const std::string& store, IndexType indexType) const {
    json data = tableBody(pod, store);
    data["indexType"] = indexTypeName(indexType);
    auto reply = post(ErrorDomain::KeyValue, username, "/kv/new", data);
    return reply.ok() ? Error() : reply.error();
}

Error Client::OpenKvStore(const std::string& username, const std::string& pod, const std::string& store) const {
    auto reply = post(ErrorDomain::KeyValue, username, "/kv/open", tableBody(pod, store));
    return reply.ok() ? Error() : reply.error();
}

Error Client::DeleteKvStore(const std::string& username, const std::string& pod, const std::string& store) const {
    auto reply = del(ErrorDomain::KeyValue, username, "/kv/delete", tableBody(pod, store));
    return reply.ok() ? Error() : reply.error();
}

Error Client::PutKvPair(const std::string& username, const std::string& pod, const std::string& store,
                        const std::string& key, const json& value) const {
    json data = tableBody(pod, store);
    data["key"] = key;
    // 值以JSON文本写入
    data["value"] = value.dump();
    auto reply = post(ErrorDomain::KeyValue, username, "/kv/entry/put", data);
    return reply.ok() ? Error() : reply.error();
}

Result<json> Client::GetKvPair(const std::string& username, const std::string& pod,
                               const std::string& store, const std::string& key) const {
    transport::QueryParams query = {
        {"pod_name", pod},
        {"table_name", store},
        {"key", key},
        {"format", "byte-string"}
    };
    auto reply = get(ErrorDomain::KeyValue, username, "/kv/entry/get", query);
    if (!reply.ok()) {
        return reply.error();
    }
    auto entry = transport::DecodeAs<KvGetResponse>(reply.value(), "kv entry get");
    if (!entry.ok()) {
        return entry.error();
    }
    auto raw = utils::Base64Decode(entry.value().values);
    if (!raw.ok()) {
        return Error(ErrorCode::DecodeFailed, "kv value is not valid base64: " + raw.error().what());
    }
    const auto& bytes = raw.value();
    return transport::HttpTransport::DecodeJson(std::string(bytes.begin(), bytes.end()), "kv value");
}

Error Client::DeleteKvPair(const std::string& username, const std::string& pod,
                           const std::string& store, const std::string& key) const {
    json data = tableBody(pod, store);
    data["key"] = key;
    auto reply = del(ErrorDomain::KeyValue, username, "/kv/entry/del", data);
    return reply.ok() ? Error() : reply.error();
}

Result<uint32_t> Client::CountKvPairs(const std::string& username, const std::string& pod,
                                      const std::string& store) const {
    auto reply = post(ErrorDomain::KeyValue, username, "/kv/count", tableBody(pod, store));
    if (!reply.ok()) {
        return reply.error();
    }
    const auto& body = reply.value();
    if (!body.is_object() || !body.contains("count") || !body.at("count").is_number_unsigned()) {
        return Error(ErrorCode::DecodeFailed, "unexpected kv count response");
    }
    return body.at("count").get<uint32_t>();
}

Result<bool> Client::KvPairExists(const std::string& username, const std::string& pod,
                                  const std::string& store, const std::string& key) const {
    transport::QueryParams query = {
        {"pod_name", pod},
        {"table_name", store},
        {"key", key}
    };
    auto reply = get(ErrorDomain::KeyValue, username, "/kv/present", query);
    if (!reply.ok()) {
        return reply.error();
    }
    const auto& body = reply.value();
    if (!body.is_object() || !body.contains("present") || !body.at("present").is_boolean()) {
        return Error(ErrorCode::DecodeFailed, "unexpected kv present response");
    }
    return body.at("present").get<bool>();
}

Error Client::LoadCsvBuffer(const std::string& username, const std::string& pod,
                            const std::string& store, const std::string& csv, bool memory) const {
    transport::MultipartBuilder builder;
    builder.AddText("pod_name", pod).AddText("table_name", store);
    if (memory) {
        builder.AddText("memory", store);
    }
    builder.AddStream("csv", csv, std::string("data.csv"), std::string("text/csv"));
    auto reply = upload(ErrorDomain::KeyValue, username, "/kv/loadcsv", builder);
    return reply.ok() ? Error() : reply.error();
}

Result<std::unique_ptr<KeyValueSeek>> Client::KvSeek(const std::string& username,
                                                     const std::string& pod,
                                                     const std::string& store,
                                                     const std::string& startKey,
                                                     const std::optional<std::string>& endKey,
                                                     const std::optional<uint32_t>& limit) const {
    json data = tableBody(pod, store);
    data["start_prefix"] = startKey;
    data["end_prefix"] = endKey ? json(*endKey) : json(nullptr);
    data["limit"] = limit ? json(*limit) : json(nullptr);

    auto reply = post(ErrorDomain::KeyValue, username, "/kv/seek", data);
    if (!reply.ok()) {
        return reply.error();
    }
    utils::GetLogger().Debug("seek游标已建立",
        utils::LogContext().With("pod", pod).With("store", store).With("start", startKey));
    auto seek = std::make_unique<KeyValueSeek>(transport_, sessions_, username, pod, store, limit);
    return Result<std::unique_ptr<KeyValueSeek>>(std::move(seek));
}

} // namespace client
} // namespace fairos
