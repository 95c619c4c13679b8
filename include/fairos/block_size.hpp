#pragma once

#include <cstdint>
#include <string>
#include "fairos/types.hpp"

namespace fairos {

// 块大小单位，按十进制SI换算（1K = 1000B）
enum class BlockUnit {
    Bytes,
    Kilobytes,
    Megabytes,
    Gigabytes,
    Terabytes
};

// 带单位的块大小。单位换算向下截断，因此往返换算不保证精确：
// BlockSize::Bytes(1500).ToKilobytes() == BlockSize::Kilobytes(1)
class BlockSize {
public:
    BlockSize() : unit_(BlockUnit::Bytes), magnitude_(0) {}
    BlockSize(BlockUnit unit, uint32_t magnitude) : unit_(unit), magnitude_(magnitude) {}

    static BlockSize Bytes(uint32_t n) { return BlockSize(BlockUnit::Bytes, n); }
    static BlockSize Kilobytes(uint32_t n) { return BlockSize(BlockUnit::Kilobytes, n); }
    static BlockSize Megabytes(uint32_t n) { return BlockSize(BlockUnit::Megabytes, n); }
    static BlockSize Gigabytes(uint32_t n) { return BlockSize(BlockUnit::Gigabytes, n); }
    static BlockSize Terabytes(uint32_t n) { return BlockSize(BlockUnit::Terabytes, n); }

    // 选择不超过字节数的最大单位，例如 1500000 -> 1M
    static BlockSize FromBytes(uint64_t bytes);

    // 解析 "<数字><B|K|M|G|T>" 格式，例如 "64K"
    static Result<BlockSize> Parse(const std::string& text);

    BlockUnit Unit() const { return unit_; }
    uint32_t Magnitude() const { return magnitude_; }

    BlockSize ToBytes() const;
    BlockSize ToKilobytes() const;
    BlockSize ToMegabytes() const;
    BlockSize ToGigabytes() const;
    BlockSize ToTerabytes() const;
    BlockSize To(BlockUnit unit) const;

    std::string ToString() const;

    bool operator==(const BlockSize& other) const {
        return unit_ == other.unit_ && magnitude_ == other.magnitude_;
    }
    bool operator!=(const BlockSize& other) const { return !(*this == other); }

private:
    BlockUnit unit_;
    uint32_t magnitude_;
};

} // namespace fairos
