#include "fairos/utils/tools.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <sstream>
#include <iomanip>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <uuid/uuid.h>

namespace fairos {
namespace utils {

namespace fs = std::filesystem;

std::string Base64Encode(const Bytes& data) {
    BIO* bio;
    BIO* b64;
    BUF_MEM* bufferPtr;

    b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_new(BIO_s_mem());
    bio = BIO_push(b64, bio);

    BIO_write(bio, data.data(), static_cast<int>(data.size()));
    BIO_flush(bio);
    BIO_get_mem_ptr(bio, &bufferPtr);

    std::string result(bufferPtr->data, bufferPtr->length);
    BIO_free_all(bio);
    return result;
}

std::string Base64Encode(const std::string& data) {
    return Base64Encode(Bytes(data.begin(), data.end()));
}

Result<Bytes> Base64Decode(const std::string& base64) {
    if (base64.empty()) {
        return Bytes();
    }

    // BIO在无换行模式下要求输入不含空白
    std::string input;
    input.reserve(base64.size());
    for (char c : base64) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            input.push_back(c);
        }
    }
    if (input.size() % 4 != 0) {
        return Error(ErrorCode::DecodeFailed, "invalid base64 length");
    }

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    BIO* bio = BIO_new_mem_buf(input.data(), static_cast<int>(input.size()));
    bio = BIO_push(b64, bio);

    Bytes decoded(input.size());
    int decodedLen = BIO_read(bio, decoded.data(), static_cast<int>(decoded.size()));
    BIO_free_all(bio);

    if (decodedLen < 0) {
        return Error(ErrorCode::DecodeFailed, "base64 decode failed");
    }
    // 非空输入却解不出任何字节，说明内容不是合法的base64
    if (decodedLen == 0) {
        return Error(ErrorCode::DecodeFailed, "invalid base64 data");
    }
    decoded.resize(static_cast<size_t>(decodedLen));
    return decoded;
}

Result<std::string> RandomHex(size_t numBytes) {
    Bytes bytes(numBytes);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        return Error(ErrorCode::Io, "failed to generate random bytes");
    }
    return HexEncode(bytes);
}

std::string GenerateUUID() {
    uuid_t uuid;
    uuid_generate_random(uuid);
    char uuidStr[37];
    uuid_unparse_lower(uuid, uuidStr);
    return std::string(uuidStr);
}

std::string GuessContentType(const std::string& path) {
    static const std::map<std::string, std::string> types = {
        {".txt", "text/plain"},
        {".csv", "text/csv"},
        {".json", "application/json"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".xml", "text/xml"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
    };

    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = types.find(ext);
    if (it == types.end()) {
        return "application/octet-stream";
    }
    return it->second;
}

Result<Bytes> ReadFileBytes(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Error(ErrorCode::Io, "failed to open file: " + path);
    }
    Bytes data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Error(ErrorCode::Io, "failed to read file: " + path);
    }
    return data;
}

Error WriteFileBytes(const std::string& path, const Bytes& data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return Error(ErrorCode::Io, "failed to create file: " + path);
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
        return Error(ErrorCode::Io, "failed to write file: " + path);
    }
    return Error();
}

std::string HexEncode(const Bytes& data) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (uint8_t byte : data) {
        ss << std::setw(2) << static_cast<int>(byte);
    }
    return ss.str();
}

} // namespace utils
} // namespace fairos
