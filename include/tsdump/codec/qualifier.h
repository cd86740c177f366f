#pragma once

#include <cstddef>
#include <cstdint>

#include "tsdump/codec/const.h"
#include "tsdump/core/types.h"

namespace tsdump {
namespace codec {

/**
 * @brief True when the qualifier at pos starts a millisecond point
 */
inline bool in_milliseconds(const core::Bytes& qualifier, size_t pos = 0) {
    return pos < qualifier.size() && (qualifier[pos] & kMsByteFlag) == kMsByteFlag;
}

/**
 * @brief True when the timestamp carries the millisecond resolution bits
 */
inline bool in_milliseconds(core::Timestamp timestamp) {
    return (static_cast<uint64_t>(timestamp) & kSecondMask) != 0;
}

/**
 * @brief Width of the (sub-)qualifier starting at pos: 4 for milliseconds, 2 otherwise
 */
inline size_t qualifier_width(const core::Bytes& qualifier, size_t pos = 0) {
    return in_milliseconds(qualifier, pos) ? 4 : 2;
}

/**
 * @brief Offset from the row base time in milliseconds.
 *
 * Seconds qualifiers are scaled to milliseconds, so the result is always
 * in the same unit. The caller guarantees qualifier_width() bytes at pos.
 */
uint32_t offset_from_qualifier(const core::Bytes& qualifier, size_t pos = 0);

/**
 * @brief Low four flag bits (float flag and value length) of the qualifier at pos
 */
uint8_t flags_from_qualifier(const core::Bytes& qualifier, size_t pos = 0);

inline size_t value_length_from_flags(uint8_t flags) {
    return static_cast<size_t>(flags & kLengthMask) + 1;
}

inline bool is_float(uint8_t flags) {
    return (flags & kFlagFloat) != 0;
}

/**
 * @brief Builds a point qualifier.
 * @param offset_ms offset in milliseconds; truncated to whole seconds unless ms is set
 * @throws InvalidArgumentError if the offset does not fit the qualifier
 */
core::Bytes build_qualifier(uint32_t offset_ms, uint8_t flags, bool ms);

/**
 * @brief Builds an annotation qualifier (prefix byte plus 2 or 4 offset bytes)
 */
core::Bytes build_annotation_qualifier(uint32_t offset_ms, bool ms);

/**
 * @brief Encodes an integer on the fewest of 1, 2, 4 or 8 bytes.
 * @param flags receives the matching value flags
 */
core::Bytes encode_integer(int64_t value, uint8_t& flags);

/**
 * @brief Encodes a double on 8 bytes
 */
core::Bytes encode_float(double value, uint8_t& flags);

/**
 * @brief Encodes a float on 4 bytes
 */
core::Bytes encode_float32(float value, uint8_t& flags);

/**
 * @brief Sign-extended big-endian integer of 1, 2, 4 or 8 bytes
 * @throws IllegalDataError on any other length
 */
int64_t decode_integer(const core::Bytes& value);

/**
 * @brief IEEE-754 value of 4 or 8 bytes
 * @throws IllegalDataError on any other length
 */
double decode_float(const core::Bytes& value);

} // namespace codec
} // namespace tsdump
