#include "tsdump/codec/row_key.h"
#include "tsdump/codec/const.h"
#include "tsdump/core/error.h"

namespace tsdump {
namespace codec {

namespace {

constexpr size_t kTagWidth = kTagkWidth + kTagvWidth;

core::Bytes slice(const core::Bytes& key, size_t pos, size_t width) {
    return core::Bytes(key.begin() + pos, key.begin() + pos + width);
}

} // namespace

void validate_row_key(const core::Bytes& key) {
    if (key.size() < kRowKeyPrefixWidth || (key.size() - kRowKeyPrefixWidth) % kTagWidth != 0) {
        throw core::MalformedRowKeyError("Invalid row key length " + std::to_string(key.size()) +
                                         ": " + core::bytes_to_string(key));
    }
}

core::Bytes metric_uid(const core::Bytes& key) {
    validate_row_key(key);
    return slice(key, 0, kMetricWidth);
}

core::Timestamp base_time(const core::Bytes& key) {
    validate_row_key(key);
    uint32_t t = 0;
    for (size_t i = 0; i < kTimestampBytes; ++i) {
        t = (t << 8) | key[kMetricWidth + i];
    }
    return static_cast<core::Timestamp>(t);
}

TagUids tag_uids(const core::Bytes& key) {
    validate_row_key(key);
    TagUids tags;
    for (size_t pos = kRowKeyPrefixWidth; pos < key.size(); pos += kTagWidth) {
        tags.emplace_back(slice(key, pos, kTagkWidth), slice(key, pos + kTagkWidth, kTagvWidth));
    }
    return tags;
}

std::string metric_name(const core::Bytes& key, const store::UidResolver& resolver) {
    return resolver.metric_name(metric_uid(key));
}

core::Tags resolve_tags(const core::Bytes& key, const store::UidResolver& resolver) {
    core::Tags tags;
    for (const auto& uids : tag_uids(key)) {
        tags.push_back(resolver.tag_pair(uids.first, uids.second));
    }
    return tags;
}

RowKeyInfo decode_row_key(const core::Bytes& key, const store::UidResolver& resolver) {
    RowKeyInfo info;
    info.metric = metric_name(key, resolver);
    info.base_time = base_time(key);
    info.tags = resolve_tags(key, resolver);
    return info;
}

core::Bytes build_row_key(const core::Bytes& metric, core::Timestamp base_time, const TagUids& tags) {
    if (metric.size() != kMetricWidth) {
        throw core::InvalidArgumentError("Metric uid must be " + std::to_string(kMetricWidth) + " bytes");
    }
    if (base_time < 0 || base_time > 0xFFFFFFFFLL) {
        throw core::InvalidArgumentError("Base time out of range: " + std::to_string(base_time));
    }
    core::Bytes key(metric);
    uint32_t t = static_cast<uint32_t>(base_time);
    for (size_t i = kTimestampBytes; i > 0; --i) {
        key.push_back(static_cast<uint8_t>(t >> (8 * (i - 1))));
    }
    for (const auto& tag : tags) {
        if (tag.first.size() != kTagkWidth || tag.second.size() != kTagvWidth) {
            throw core::InvalidArgumentError("Tag uids must be " + std::to_string(kTagkWidth) + " bytes");
        }
        key.insert(key.end(), tag.first.begin(), tag.first.end());
        key.insert(key.end(), tag.second.begin(), tag.second.end());
    }
    return key;
}

} // namespace codec
} // namespace tsdump
