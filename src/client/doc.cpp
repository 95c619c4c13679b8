#include "fairos/client/client.hpp"

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include "fairos/utils/tools.hpp"

namespace fairos {
namespace client {

namespace {

std::string fieldTypeName(FieldType type) {
    switch (type) {
        case FieldType::Str: return "string";
        case FieldType::Number: return "number";
        case FieldType::Map: return "map";
    }
    return "string";
}

// 索引描述 "name=string,age=number"
std::string indexSpec(const std::vector<std::pair<std::string, FieldType>>& fields) {
    std::ostringstream ss;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            ss << ",";
        }
        ss << fields[i].first << "=" << fieldTypeName(fields[i].second);
    }
    return ss.str();
}

json tableBody(const std::string& pod, const std::string& database) {
    return {
        {"pod_name", pod},
        {"table_name", database}
    };
}

// 服务端以base64返回文档的JSON文本
Result<json> decodeDocument(const std::string& encoded) {
    auto raw = utils::Base64Decode(encoded);
    if (!raw.ok()) {
        return Error(ErrorCode::DecodeFailed, "document is not valid base64: " + raw.error().what());
    }
    const auto& bytes = raw.value();
    return transport::HttpTransport::DecodeJson(std::string(bytes.begin(), bytes.end()), "document");
}

} // namespace

Error Client::CreateDocDatabase(const std::string& username, const std::string& pod,
                                const std::string& database,
                                const std::vector<std::pair<std::string, FieldType>>& fields,
                                bool mutableDb) const {
    json data = tableBody(pod, database);
    data["si"] = indexSpec(fields);
    data["mutable"] = mutableDb;
    auto reply = post(ErrorDomain::Document, username, "/doc/new", data);
    return reply.ok() ? Error() : reply.error();
}

Error Client::OpenDocDatabase(const std::string& username, const std::string& pod,
                              const std::string& database) const {
    auto reply = post(ErrorDomain::Document, username, "/doc/open", tableBody(pod, database));
    return reply.ok() ? Error() : reply.error();
}

Error Client::DeleteDocDatabase(const std::string& username, const std::string& pod,
                                const std::string& database) const {
    auto reply = del(ErrorDomain::Document, username, "/doc/delete", tableBody(pod, database));
    return reply.ok() ? Error() : reply.error();
}

Result<std::string> Client::PutDocument(const std::string& username, const std::string& pod,
                                        const std::string& database, const json& doc) const {
    if (!doc.is_object()) {
        return Error(ErrorCode::InvalidArgument, "document must be a JSON object");
    }
    std::string id = utils::GenerateUUID();
    json withId = doc;
    withId["id"] = id;

    json data = tableBody(pod, database);
    data["doc"] = withId.dump();
    auto reply = post(ErrorDomain::Document, username, "/doc/entry/put", data);
    if (!reply.ok()) {
        return reply.error();
    }
    return id;
}

Result<json> Client::GetDocument(const std::string& username, const std::string& pod,
                                 const std::string& database, const std::string& id) const {
    transport::QueryParams query = {
        {"pod_name", pod},
        {"table_name", database},
        {"id", id}
    };
    auto reply = get(ErrorDomain::Document, username, "/doc/entry/get", query);
    if (!reply.ok()) {
        return reply.error();
    }
    const auto& body = reply.value();
    if (!body.is_object() || !body.contains("doc") || !body.at("doc").is_string()) {
        return Error(ErrorCode::DecodeFailed, "unexpected doc entry get response");
    }
    return decodeDocument(body.at("doc").get<std::string>());
}

Result<std::vector<json>> Client::FindDocuments(const std::string& username, const std::string& pod,
                                                const std::string& database, const Expr& expr,
                                                const std::optional<uint32_t>& limit) const {
    auto compiled = CompileExpr(expr);
    if (!compiled.ok()) {
        return compiled.error();
    }
    transport::QueryParams query = {
        {"pod_name", pod},
        {"table_name", database},
        {"expr", compiled.value()}
    };
    if (limit) {
        query.emplace_back("limit", std::to_string(*limit));
    }

    auto reply = get(ErrorDomain::Document, username, "/doc/find", query);
    if (!reply.ok()) {
        return reply.error();
    }
    auto encoded = transport::DecodeAs<std::vector<std::string>>(
        reply.value().is_object() && reply.value().contains("docs") ? reply.value().at("docs") : json(),
        "doc find");
    if (!encoded.ok()) {
        return encoded.error();
    }

    std::vector<json> docs;
    for (const auto& item : encoded.value()) {
        auto doc = decodeDocument(item);
        if (!doc.ok()) {
            return doc.error();
        }
        docs.push_back(doc.value());
    }
    utils::GetLogger().Debug("文档查询完成",
        utils::LogContext().With("table", database).With("expr", compiled.value())
                           .With("count", std::to_string(docs.size())));
    return docs;
}

Result<uint32_t> Client::CountDocuments(const std::string& username, const std::string& pod,
                                        const std::string& database, const Expr& expr) const {
    auto compiled = CompileExpr(expr);
    if (!compiled.ok()) {
        return compiled.error();
    }
    json data = tableBody(pod, database);
    data["expr"] = compiled.value();
    auto reply = post(ErrorDomain::Document, username, "/doc/count", data);
    if (!reply.ok()) {
        return reply.error();
    }

    // 数量放在message字段中
    const auto& body = reply.value();
    if (!body.is_object() || !body.contains("message") || !body.at("message").is_string()) {
        return Error(ErrorCode::DecodeFailed, "unexpected doc count response");
    }
    const std::string text = body.at("message").get<std::string>();
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return Error(ErrorCode::DecodeFailed, "doc count is not a number: " + text);
    }
    try {
        unsigned long long count = std::stoull(text);
        if (count > UINT32_MAX) {
            return Error(ErrorCode::DecodeFailed, "doc count out of range: " + text);
        }
        return static_cast<uint32_t>(count);
    } catch (const std::out_of_range&) {
        return Error(ErrorCode::DecodeFailed, "doc count out of range: " + text);
    }
}

Error Client::DeleteDocument(const std::string& username, const std::string& pod,
                             const std::string& database, const std::string& id) const {
    json data = tableBody(pod, database);
    data["id"] = id;
    auto reply = del(ErrorDomain::Document, username, "/doc/entry/del", data);
    return reply.ok() ? Error() : reply.error();
}

Error Client::LoadJsonBuffer(const std::string& username, const std::string& pod,
                             const std::string& database, const std::string& data) const {
    transport::MultipartBuilder builder;
    builder.AddText("pod_name", pod)
           .AddText("table_name", database)
           .AddStream("json", data, std::string("data.json"), std::string("application/json"));
    auto reply = upload(ErrorDomain::Document, username, "/doc/loadjson", builder);
    return reply.ok() ? Error() : reply.error();
}

} // namespace client
} // namespace fairos
