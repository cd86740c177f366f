#pragma once

#include <cstddef>
#include <cstdint>

namespace tsdump {
namespace codec {

// Row key layout
constexpr size_t kMetricWidth = 3;
constexpr size_t kTagkWidth = 3;
constexpr size_t kTagvWidth = 3;
constexpr size_t kTimestampBytes = 4;
constexpr size_t kRowKeyPrefixWidth = kMetricWidth + kTimestampBytes;

/** Seconds of data held by one row. */
constexpr int64_t kMaxTimespan = 3600;

/** Any of these bits set means the timestamp is in milliseconds. */
constexpr uint64_t kSecondMask = 0xFFFFFFFF00000000ULL;

// Qualifier flags
constexpr unsigned kFlagBits = 4;
constexpr unsigned kMsFlagBits = 6;
constexpr uint8_t kFlagFloat = 0x08;
constexpr uint8_t kLengthMask = 0x07;
constexpr uint8_t kFlagsMask = kFlagFloat | kLengthMask;
constexpr uint8_t kMsByteFlag = 0xF0;
constexpr uint32_t kMsOffsetMask = 0x003FFFFF;
constexpr uint32_t kMaxSecondOffset = 0x0FFF;

/** First qualifier byte of an annotation column. */
constexpr uint8_t kAnnotationPrefix = 0x01;

// Trailing meta byte of a compacted value
constexpr uint8_t kCompactMetaDefault = 0x00;
constexpr uint8_t kCompactMetaMixed = 0x01;

} // namespace codec
} // namespace tsdump
