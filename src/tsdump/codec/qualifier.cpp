#include "tsdump/codec/qualifier.h"
#include "tsdump/core/error.h"

#include <cstring>
#include <limits>
#include <string>

namespace tsdump {
namespace codec {

namespace {

uint64_t read_be(const core::Bytes& bytes, size_t pos, size_t width) {
    uint64_t v = 0;
    for (size_t i = 0; i < width; ++i) {
        v = (v << 8) | bytes[pos + i];
    }
    return v;
}

void write_be(core::Bytes& out, uint64_t v, size_t width) {
    for (size_t i = width; i > 0; --i) {
        out.push_back(static_cast<uint8_t>(v >> (8 * (i - 1))));
    }
}

} // namespace

uint32_t offset_from_qualifier(const core::Bytes& qualifier, size_t pos) {
    if (in_milliseconds(qualifier, pos)) {
        uint32_t q = static_cast<uint32_t>(read_be(qualifier, pos, 4));
        return (q & 0x0FFFFFC0) >> kMsFlagBits;
    }
    uint32_t seconds = static_cast<uint32_t>(read_be(qualifier, pos, 2)) >> kFlagBits;
    return seconds * 1000;
}

uint8_t flags_from_qualifier(const core::Bytes& qualifier, size_t pos) {
    size_t last = pos + qualifier_width(qualifier, pos) - 1;
    return qualifier[last] & kFlagsMask;
}

core::Bytes build_qualifier(uint32_t offset_ms, uint8_t flags, bool ms) {
    core::Bytes out;
    if (ms) {
        if (offset_ms > kMsOffsetMask) {
            throw core::InvalidArgumentError("Millisecond offset out of range: " + std::to_string(offset_ms));
        }
        uint32_t q = 0xF0000000u | (offset_ms << kMsFlagBits) | (flags & kFlagsMask);
        write_be(out, q, 4);
    } else {
        uint32_t seconds = offset_ms / 1000;
        if (seconds > kMaxSecondOffset) {
            throw core::InvalidArgumentError("Second offset out of range: " + std::to_string(seconds));
        }
        write_be(out, (seconds << kFlagBits) | (flags & kFlagsMask), 2);
    }
    return out;
}

core::Bytes build_annotation_qualifier(uint32_t offset_ms, bool ms) {
    core::Bytes out{kAnnotationPrefix};
    core::Bytes offset = build_qualifier(offset_ms, 0, ms);
    out.insert(out.end(), offset.begin(), offset.end());
    return out;
}

core::Bytes encode_integer(int64_t value, uint8_t& flags) {
    size_t width;
    if (value >= std::numeric_limits<int8_t>::min() && value <= std::numeric_limits<int8_t>::max()) {
        width = 1;
    } else if (value >= std::numeric_limits<int16_t>::min() && value <= std::numeric_limits<int16_t>::max()) {
        width = 2;
    } else if (value >= std::numeric_limits<int32_t>::min() && value <= std::numeric_limits<int32_t>::max()) {
        width = 4;
    } else {
        width = 8;
    }
    flags = static_cast<uint8_t>(width - 1);
    core::Bytes out;
    write_be(out, static_cast<uint64_t>(value), width);
    return out;
}

core::Bytes encode_float(double value, uint8_t& flags) {
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    flags = kFlagFloat | 0x7;
    core::Bytes out;
    write_be(out, bits, 8);
    return out;
}

core::Bytes encode_float32(float value, uint8_t& flags) {
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    flags = kFlagFloat | 0x3;
    core::Bytes out;
    write_be(out, bits, 4);
    return out;
}

int64_t decode_integer(const core::Bytes& value) {
    switch (value.size()) {
        case 1:
            return static_cast<int8_t>(value[0]);
        case 2:
            return static_cast<int16_t>(read_be(value, 0, 2));
        case 4:
            return static_cast<int32_t>(read_be(value, 0, 4));
        case 8:
            return static_cast<int64_t>(read_be(value, 0, 8));
        default:
            throw core::IllegalDataError("Integer value of invalid length " + std::to_string(value.size()) +
                                         ": " + core::bytes_to_string(value));
    }
}

double decode_float(const core::Bytes& value) {
    if (value.size() == 4) {
        uint32_t bits = static_cast<uint32_t>(read_be(value, 0, 4));
        float f;
        std::memcpy(&f, &bits, sizeof(f));
        return f;
    }
    if (value.size() == 8) {
        uint64_t bits = read_be(value, 0, 8);
        double d;
        std::memcpy(&d, &bits, sizeof(d));
        return d;
    }
    throw core::IllegalDataError("Floating point value of invalid length " + std::to_string(value.size()) +
                                 ": " + core::bytes_to_string(value));
}

} // namespace codec
} // namespace tsdump
