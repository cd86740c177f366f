#include "tsdump/query/query.h"
#include "tsdump/codec/qualifier.h"

#include <sstream>

namespace tsdump {
namespace query {

int64_t Query::start_seconds() const {
    return codec::in_milliseconds(start) ? start / 1000 : start;
}

int64_t Query::end_seconds() const {
    return codec::in_milliseconds(end) ? end / 1000 : end;
}

std::string Query::to_string() const {
    std::ostringstream oss;
    oss << aggregator;
    if (rate) {
        oss << ":rate";
    }
    if (downsample) {
        oss << ":" << downsample->interval_ms << "ms-" << downsample->aggregator;
    }
    oss << ":" << metric << "{";
    for (size_t i = 0; i < filters.size(); ++i) {
        if (i > 0) {
            oss << ",";
        }
        oss << filters[i].tagk << "=";
        if (filters[i].matches_any()) {
            oss << "*";
        } else {
            for (size_t j = 0; j < filters[i].values.size(); ++j) {
                if (j > 0) {
                    oss << "|";
                }
                oss << filters[i].values[j];
            }
        }
    }
    oss << "} [" << start << ", " << end << "]";
    return oss.str();
}

Query make_delete_query(const std::string& metric, core::Timestamp end) {
    Query q;
    q.metric = metric;
    q.start = 0;
    q.end = end;
    q.aggregator = "sum";
    return q;
}

} // namespace query
} // namespace tsdump
