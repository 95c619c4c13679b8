#pragma once

#include <optional>
#include <string>
#include <vector>
#include "fairos/types.hpp"

namespace fairos {
namespace transport {

// 编码后的multipart请求体
struct MultipartBody {
    std::string boundary;
    std::string body;

    // multipart/form-data; boundary=<boundary>
    std::string ContentType() const;
};

// multipart/form-data构建器，保持各部分的添加顺序
class MultipartBuilder {
public:
    MultipartBuilder() = default;

    // 文本字段
    MultipartBuilder& AddText(const std::string& name, const std::string& value);

    // 内存中的字节流
    MultipartBuilder& AddStream(const std::string& name,
                                const Bytes& data,
                                const std::optional<std::string>& filename = std::nullopt,
                                const std::optional<std::string>& contentType = std::nullopt);
    MultipartBuilder& AddStream(const std::string& name,
                                const std::string& data,
                                const std::optional<std::string>& filename = std::nullopt,
                                const std::optional<std::string>& contentType = std::nullopt);

    // 文件流，在Build时读取。
    // filename默认取路径的最后一段，contentType默认按扩展名推断
    MultipartBuilder& AddFile(const std::string& name,
                              const std::string& path,
                              const std::optional<std::string>& filename = std::nullopt,
                              const std::optional<std::string>& contentType = std::nullopt);

    // 使用随机boundary编码
    Result<MultipartBody> Build() const;

    // 使用指定boundary编码，相同输入产生逐字节相同的输出
    Result<MultipartBody> Build(const std::string& boundary) const;

    size_t PartCount() const { return parts_.size(); }

private:
    enum class Source {
        Text,
        Memory,
        File
    };

    struct Part {
        Source source;
        std::string name;
        std::string data;   // Text/Memory为内容，File为路径
        std::optional<std::string> filename;
        std::optional<std::string> contentType;
    };

    static void appendPart(std::string& out, const std::string& boundary,
                           const Part& part, const std::string& content);

    std::vector<Part> parts_;
};

// 生成随机boundary
Result<std::string> GenerateBoundary();

} // namespace transport
} // namespace fairos
