#include "fairos/transport/multipart.hpp"

#include <filesystem>
#include "fairos/utils/logger.hpp"
#include "fairos/utils/tools.hpp"

namespace fairos {
namespace transport {

namespace fs = std::filesystem;

namespace {
const char* const CRLF = "\r\n";
const char* const DEFAULT_STREAM_TYPE = "application/octet-stream";

// Content-Disposition中的name与filename按HTML5表单规则转义
std::string escapeDispositionValue(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '"':  out += "%22"; break;
            case '\r': out += "%0D"; break;
            case '\n': out += "%0A"; break;
            default:   out += c; break;
        }
    }
    return out;
}
}

std::string MultipartBody::ContentType() const {
    return "multipart/form-data; boundary=" + boundary;
}

Result<std::string> GenerateBoundary() {
    auto random = utils::RandomHex(16);
    if (!random.ok()) {
        return random.error();
    }
    return "------------------------" + random.value();
}

MultipartBuilder& MultipartBuilder::AddText(const std::string& name, const std::string& value) {
    parts_.push_back({Source::Text, name, value, std::nullopt, std::nullopt});
    return *this;
}

MultipartBuilder& MultipartBuilder::AddStream(const std::string& name,
                                              const Bytes& data,
                                              const std::optional<std::string>& filename,
                                              const std::optional<std::string>& contentType) {
    return AddStream(name, std::string(data.begin(), data.end()), filename, contentType);
}

MultipartBuilder& MultipartBuilder::AddStream(const std::string& name,
                                              const std::string& data,
                                              const std::optional<std::string>& filename,
                                              const std::optional<std::string>& contentType) {
    parts_.push_back({Source::Memory, name, data, filename, contentType});
    return *this;
}

MultipartBuilder& MultipartBuilder::AddFile(const std::string& name,
                                            const std::string& path,
                                            const std::optional<std::string>& filename,
                                            const std::optional<std::string>& contentType) {
    Part part{Source::File, name, path, filename, contentType};
    if (!part.filename) {
        part.filename = fs::path(path).filename().string();
    }
    if (!part.contentType) {
        part.contentType = utils::GuessContentType(path);
    }
    parts_.push_back(std::move(part));
    return *this;
}

Result<MultipartBody> MultipartBuilder::Build() const {
    auto boundary = GenerateBoundary();
    if (!boundary.ok()) {
        return boundary.error();
    }
    return Build(boundary.value());
}

void MultipartBuilder::appendPart(std::string& out, const std::string& boundary,
                                  const Part& part, const std::string& content) {
    out += "--" + boundary + CRLF;
    out += "Content-Disposition: form-data; name=\"" + escapeDispositionValue(part.name) + "\"";
    if (part.filename) {
        out += "; filename=\"" + escapeDispositionValue(*part.filename) + "\"";
    }
    out += CRLF;

    // 文本字段不带Content-Type，流至少带默认类型
    if (part.source != Source::Text) {
        out += "Content-Type: ";
        out += part.contentType ? *part.contentType : DEFAULT_STREAM_TYPE;
        out += CRLF;
    }
    out += CRLF;
    out += content;
    out += CRLF;
}

Result<MultipartBody> MultipartBuilder::Build(const std::string& boundary) const {
    if (boundary.empty()) {
        return Error(ErrorCode::InvalidArgument, "multipart boundary must not be empty");
    }

    MultipartBody result;
    result.boundary = boundary;

    for (const auto& part : parts_) {
        if (part.source == Source::File) {
            auto content = utils::ReadFileBytes(part.data);
            if (!content.ok()) {
                utils::GetLogger().Warn("读取multipart文件失败",
                    utils::LogContext().With("path", part.data).With("field", part.name));
                return content.error();
            }
            const Bytes& bytes = content.value();
            appendPart(result.body, boundary, part, std::string(bytes.begin(), bytes.end()));
        } else {
            appendPart(result.body, boundary, part, part.data);
        }
    }
    result.body += "--" + boundary + "--" + CRLF;
    return result;
}

} // namespace transport
} // namespace fairos
