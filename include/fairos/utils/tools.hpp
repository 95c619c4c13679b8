#pragma once

#include <string>
#include <vector>
#include "fairos/types.hpp"

namespace fairos {
namespace utils {

// Base64编码/解码（OpenSSL BIO，不换行）
std::string Base64Encode(const Bytes& data);
std::string Base64Encode(const std::string& data);
Result<Bytes> Base64Decode(const std::string& base64);

// 加密安全的随机字节，以十六进制字符串返回
Result<std::string> RandomHex(size_t numBytes);

// 随机UUID（v4）
std::string GenerateUUID();

// 根据文件扩展名推断Content-Type，未知时为application/octet-stream
std::string GuessContentType(const std::string& path);

// 读取整个文件
Result<Bytes> ReadFileBytes(const std::string& path);
Error WriteFileBytes(const std::string& path, const Bytes& data);

std::string HexEncode(const Bytes& data);

} // namespace utils
} // namespace fairos
