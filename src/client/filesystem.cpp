#include "fairos/client/client.hpp"

#include "fairos/utils/tools.hpp"

namespace fairos {
namespace client {

using transport::MultipartBuilder;

namespace {

std::string compressionName(Compression compression) {
    switch (compression) {
        case Compression::Gzip: return "gzip";
        case Compression::Snappy: return "snappy";
    }
    return "gzip";
}

std::map<std::string, std::string> compressionHeaders(const std::optional<Compression>& compression) {
    std::map<std::string, std::string> headers;
    if (compression) {
        headers[COMPRESSION_HEADER] = compressionName(*compression);
    }
    return headers;
}

// 下载请求：pod_name + file_path
MultipartBuilder downloadForm(const std::string& pod, const std::string& path) {
    MultipartBuilder builder;
    builder.AddText("pod_name", pod).AddText("file_path", path);
    return builder;
}

} // namespace

Result<std::vector<std::string>> ParseUploadResponse(const json& body) {
    if (!body.is_object() || !body.contains("Responses") || !body.at("Responses").is_array()) {
        return Error(ErrorCode::DecodeFailed, "unexpected file upload response");
    }
    std::vector<std::string> names;
    for (const auto& entry : body.at("Responses")) {
        if (!entry.is_object() || !entry.contains("file_name") || !entry.at("file_name").is_string()) {
            return Error(ErrorCode::DecodeFailed, "unexpected file upload response entry");
        }
        names.push_back(entry.at("file_name").get<std::string>());
    }
    return names;
}

Error Client::Mkdir(const std::string& username, const std::string& pod, const std::string& path) const {
    json data = {
        {"pod_name", pod},
        {"dir_path", path}
    };
    auto reply = post(ErrorDomain::FileSystem, username, "/dir/mkdir", data);
    return reply.ok() ? Error() : reply.error();
}

Error Client::Rm(const std::string& username, const std::string& pod, const std::string& path) const {
    json data = {
        {"pod_name", pod},
        {"file_path", path}
    };
    auto reply = del(ErrorDomain::FileSystem, username, "/file/delete", data);
    return reply.ok() ? Error() : reply.error();
}

Result<std::string> Client::UploadBuffer(const std::string& username,
                                         const std::string& pod,
                                         const std::string& dir,
                                         const std::string& fileName,
                                         const Bytes& data,
                                         const std::string& contentType,
                                         const BlockSize& blockSize,
                                         const std::optional<Compression>& compression) const {
    MultipartBuilder builder;
    builder.AddText("pod_name", pod)
           .AddText("dir_path", dir)
           .AddText("block_size", blockSize.ToString())
           .AddStream("files", data, fileName, contentType);

    auto reply = upload(ErrorDomain::FileSystem, username, "/file/upload", builder,
                        compressionHeaders(compression));
    if (!reply.ok()) {
        return reply.error();
    }
    auto names = ParseUploadResponse(reply.value());
    if (!names.ok()) {
        return names.error();
    }
    if (names.value().empty()) {
        return Error(ErrorCode::DecodeFailed, "file upload response carries no file");
    }
    utils::GetLogger().Info("文件上传成功",
        utils::LogContext().With("pod", pod).With("dir", dir).With("file", names.value().front()));
    return names.value().front();
}

Result<std::string> Client::UploadFile(const std::string& username,
                                       const std::string& pod,
                                       const std::string& dir,
                                       const std::string& localPath,
                                       const BlockSize& blockSize,
                                       const std::optional<Compression>& compression) const {
    MultipartBuilder builder;
    builder.AddText("pod_name", pod)
           .AddText("dir_path", dir)
           .AddText("block_size", blockSize.ToString())
           .AddFile("files", localPath);

    auto reply = upload(ErrorDomain::FileSystem, username, "/file/upload", builder,
                        compressionHeaders(compression));
    if (!reply.ok()) {
        return reply.error();
    }
    auto names = ParseUploadResponse(reply.value());
    if (!names.ok()) {
        return names.error();
    }
    if (names.value().empty()) {
        return Error(ErrorCode::DecodeFailed, "file upload response carries no file");
    }
    return names.value().front();
}

Result<Bytes> Client::DownloadBuffer(const std::string& username,
                                     const std::string& pod,
                                     const std::string& path) const {
    auto token = sessionToken(username);
    if (!token.ok()) {
        return token.error();
    }
    auto multipart = downloadForm(pod, path).Build();
    if (!multipart.ok()) {
        return multipart.error();
    }
    auto data = transport_->DownloadMultipart("/file/download", multipart.value(), token.value());
    if (!data.ok()) {
        return MapDomainError(ErrorDomain::FileSystem, data.error());
    }
    return data;
}

Error Client::DownloadFile(const std::string& username,
                           const std::string& pod,
                           const std::string& path,
                           const std::string& localPath) const {
    auto data = DownloadBuffer(username, pod, path);
    if (!data.ok()) {
        return data.error();
    }
    return utils::WriteFileBytes(localPath, data.value());
}

} // namespace client
} // namespace fairos
