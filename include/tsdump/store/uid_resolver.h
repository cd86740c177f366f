#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "tsdump/core/types.h"

namespace tsdump {
namespace store {

/**
 * @brief Bidirectional mapping between uids and metric/tag names.
 *
 * Every lookup is total: an unknown uid or name raises
 * core::ResolutionError, never a default. Implementations must be safe
 * for concurrent use.
 */
class UidResolver {
public:
    virtual ~UidResolver() = default;

    virtual std::string metric_name(const core::Bytes& uid) const = 0;
    virtual std::string tagk_name(const core::Bytes& uid) const = 0;
    virtual std::string tagv_name(const core::Bytes& uid) const = 0;

    virtual core::Bytes metric_uid(const std::string& name) const = 0;
    virtual core::Bytes tagk_uid(const std::string& name) const = 0;
    virtual core::Bytes tagv_uid(const std::string& name) const = 0;

    /**
     * @brief Metric names starting with prefix, sorted, at most max_results
     */
    virtual std::vector<std::string> suggest_metrics(const std::string& prefix, size_t max_results) const = 0;

    std::pair<std::string, std::string> tag_pair(const core::Bytes& tagk, const core::Bytes& tagv) const {
        return {tagk_name(tagk), tagv_name(tagv)};
    }
};

} // namespace store
} // namespace tsdump
