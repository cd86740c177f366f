#pragma once

#include <string>
#include <utility>
#include <vector>

#include "tsdump/core/types.h"
#include "tsdump/store/uid_resolver.h"

namespace tsdump {
namespace codec {

/**
 * @brief Decoded row key: metric name, base time (seconds) and tags
 */
struct RowKeyInfo {
    std::string metric;
    core::Timestamp base_time = 0;
    core::Tags tags;
};

using TagUids = std::vector<std::pair<core::Bytes, core::Bytes>>;

/**
 * @throws MalformedRowKeyError unless the key is a metric, a timestamp and whole tag pairs
 */
void validate_row_key(const core::Bytes& key);

core::Bytes metric_uid(const core::Bytes& key);
core::Timestamp base_time(const core::Bytes& key);
TagUids tag_uids(const core::Bytes& key);

std::string metric_name(const core::Bytes& key, const store::UidResolver& resolver);
core::Tags resolve_tags(const core::Bytes& key, const store::UidResolver& resolver);

/**
 * @brief Decodes and resolves the whole key.
 * @throws MalformedRowKeyError on a bad layout
 * @throws ResolutionError when any uid is unknown
 */
RowKeyInfo decode_row_key(const core::Bytes& key, const store::UidResolver& resolver);

/**
 * @brief Inverse of decode_row_key on uids; tag pairs are written in the given order
 */
core::Bytes build_row_key(const core::Bytes& metric, core::Timestamp base_time, const TagUids& tags);

} // namespace codec
} // namespace tsdump
