#include "fairos/block_size.hpp"

#include <cctype>
#include <limits>

namespace fairos {

namespace {

uint64_t unitFactor(BlockUnit unit) {
    switch (unit) {
        case BlockUnit::Bytes: return 1ULL;
        case BlockUnit::Kilobytes: return 1000ULL;
        case BlockUnit::Megabytes: return 1000000ULL;
        case BlockUnit::Gigabytes: return 1000000000ULL;
        case BlockUnit::Terabytes: return 1000000000000ULL;
    }
    return 1ULL;
}

char unitSuffix(BlockUnit unit) {
    switch (unit) {
        case BlockUnit::Bytes: return 'B';
        case BlockUnit::Kilobytes: return 'K';
        case BlockUnit::Megabytes: return 'M';
        case BlockUnit::Gigabytes: return 'G';
        case BlockUnit::Terabytes: return 'T';
    }
    return 'B';
}

const uint64_t MAX_MAGNITUDE = std::numeric_limits<uint32_t>::max();

} // namespace

BlockSize BlockSize::FromBytes(uint64_t bytes) {
    const BlockUnit units[] = {
        BlockUnit::Terabytes, BlockUnit::Gigabytes, BlockUnit::Megabytes, BlockUnit::Kilobytes
    };
    for (BlockUnit unit : units) {
        uint64_t factor = unitFactor(unit);
        if (bytes >= factor) {
            uint64_t n = bytes / factor;
            return BlockSize(unit, static_cast<uint32_t>(n > MAX_MAGNITUDE ? MAX_MAGNITUDE : n));
        }
    }
    return BlockSize(BlockUnit::Bytes, static_cast<uint32_t>(bytes));
}

Result<BlockSize> BlockSize::Parse(const std::string& text) {
    if (text.size() < 2) {
        return Error(ErrorCode::InvalidArgument, "invalid block size: '" + text + "'");
    }

    BlockUnit unit;
    switch (text.back()) {
        case 'B': unit = BlockUnit::Bytes; break;
        case 'K': unit = BlockUnit::Kilobytes; break;
        case 'M': unit = BlockUnit::Megabytes; break;
        case 'G': unit = BlockUnit::Gigabytes; break;
        case 'T': unit = BlockUnit::Terabytes; break;
        default:
            return Error(ErrorCode::InvalidArgument, "invalid block size unit: '" + text + "'");
    }

    // 只接受纯十进制数字，避免stoul接受前导空白或符号
    uint64_t magnitude = 0;
    for (size_t i = 0; i + 1 < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(c)) {
            return Error(ErrorCode::InvalidArgument, "invalid block size number: '" + text + "'");
        }
        magnitude = magnitude * 10 + static_cast<uint64_t>(c - '0');
        if (magnitude > MAX_MAGNITUDE) {
            return Error(ErrorCode::InvalidArgument, "block size out of range: '" + text + "'");
        }
    }
    return BlockSize(unit, static_cast<uint32_t>(magnitude));
}

BlockSize BlockSize::To(BlockUnit unit) const {
    uint64_t from = unitFactor(unit_);
    uint64_t to = unitFactor(unit);

    if (from <= to) {
        // 向较大单位换算：截断
        uint64_t ratio = to / from;
        return BlockSize(unit, static_cast<uint32_t>(magnitude_ / ratio));
    }

    // 向较小单位换算：超出u32时饱和
    uint64_t ratio = from / to;
    uint64_t n = magnitude_;
    if (n > MAX_MAGNITUDE / ratio) {
        return BlockSize(unit, static_cast<uint32_t>(MAX_MAGNITUDE));
    }
    return BlockSize(unit, static_cast<uint32_t>(n * ratio));
}

BlockSize BlockSize::ToBytes() const { return To(BlockUnit::Bytes); }
BlockSize BlockSize::ToKilobytes() const { return To(BlockUnit::Kilobytes); }
BlockSize BlockSize::ToMegabytes() const { return To(BlockUnit::Megabytes); }
BlockSize BlockSize::ToGigabytes() const { return To(BlockUnit::Gigabytes); }
BlockSize BlockSize::ToTerabytes() const { return To(BlockUnit::Terabytes); }

std::string BlockSize::ToString() const {
    return std::to_string(magnitude_) + unitSuffix(unit_);
}

} // namespace fairos
