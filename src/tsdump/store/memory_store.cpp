#include "tsdump/store/memory_store.h"
#include "tsdump/codec/const.h"
#include "tsdump/codec/row_key.h"
#include "tsdump/common/logger.h"
#include "tsdump/core/error.h"

#include <algorithm>
#include <mutex>

namespace tsdump {
namespace store {

namespace {

struct ScanFilter {
    core::Bytes tagk;
    std::vector<core::Bytes> tagvs;   // Empty means any value
};

bool has_prefix(const core::Bytes& key, const core::Bytes& prefix) {
    return key.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), key.begin());
}

bool matches_filters(const core::Bytes& key, const std::vector<ScanFilter>& filters) {
    constexpr size_t kTagWidth = codec::kTagkWidth + codec::kTagvWidth;
    for (const auto& filter : filters) {
        bool found = false;
        for (size_t pos = codec::kRowKeyPrefixWidth; pos + kTagWidth <= key.size(); pos += kTagWidth) {
            if (!std::equal(filter.tagk.begin(), filter.tagk.end(), key.begin() + pos)) {
                continue;
            }
            if (filter.tagvs.empty()) {
                found = true;
            } else {
                auto tagv_begin = key.begin() + pos + codec::kTagkWidth;
                found = std::any_of(filter.tagvs.begin(), filter.tagvs.end(), [&](const core::Bytes& v) {
                    return std::equal(v.begin(), v.end(), tagv_begin);
                });
            }
            break;
        }
        if (!found) {
            return false;
        }
    }
    return true;
}

uint32_t uid_value(const core::Bytes& uid) {
    uint32_t v = 0;
    for (uint8_t b : uid) {
        v = (v << 8) | b;
    }
    return v;
}

} // namespace

class MemoryStore::MemoryCursor : public Cursor {
public:
    MemoryCursor(const MemoryStore& store, std::vector<core::Bytes> keys)
        : store_(store), keys_(std::move(keys)) {}

    std::optional<std::vector<core::Row>> next_page() override {
        std::vector<core::Row> page;
        std::shared_lock<std::shared_mutex> lock(store_.mutex_);
        while (next_ < keys_.size() && page.size() < store_.page_size_) {
            const auto& key = keys_[next_++];
            auto it = store_.rows_.find(key);
            if (it == store_.rows_.end()) {
                continue;   // Deleted since the scan was opened
            }
            page.push_back(core::Row{it->first, it->second});
        }
        if (page.empty()) {
            return std::nullopt;
        }
        return page;
    }

private:
    const MemoryStore& store_;
    std::vector<core::Bytes> keys_;
    size_t next_ = 0;
};

MemoryStore::MemoryStore(std::string table, size_t page_size)
    : table_(std::move(table)), page_size_(page_size == 0 ? 1 : page_size) {
}

std::unique_ptr<Cursor> MemoryStore::scan(const query::Query& query) {
    core::Bytes metric = metric_uid(query.metric);

    std::vector<ScanFilter> filters;
    for (const auto& tag_filter : query.filters) {
        ScanFilter filter;
        filter.tagk = tagk_uid(tag_filter.tagk);
        for (const auto& value : tag_filter.values) {
            filter.tagvs.push_back(tagv_uid(value));
        }
        filters.push_back(std::move(filter));
    }

    int64_t start = std::max<int64_t>(0, query.start_seconds());
    int64_t start_base = std::min<int64_t>(start - start % codec::kMaxTimespan, 0xFFFFFFFFLL);
    int64_t end = query.end_seconds();
    core::Bytes start_key = codec::build_row_key(metric, start_base, {});

    std::vector<core::Bytes> keys;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (auto it = rows_.lower_bound(start_key); it != rows_.end(); ++it) {
            const auto& key = it->first;
            if (!has_prefix(key, metric)) {
                break;
            }
            if (key.size() < codec::kRowKeyPrefixWidth) {
                continue;
            }
            if (codec::base_time(core::Bytes(key.begin(), key.begin() + codec::kRowKeyPrefixWidth)) > end) {
                break;
            }
            if (matches_filters(key, filters)) {
                keys.push_back(key);
            }
        }
    }
    TSDUMP_DEBUG("Scan {} on table {}: {} rows", query.to_string(), table_, keys.size());
    return std::make_unique<MemoryCursor>(*this, std::move(keys));
}

core::Result<void> MemoryStore::delete_row(const core::Bytes& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (rows_.erase(key) > 0) {
        ++deletes_;
    }
    return core::Result<void>();
}

std::string MemoryStore::lookup_name(const UidTable& table, const core::Bytes& uid, const char* kind) {
    auto it = table.names.find(uid);
    if (it == table.names.end()) {
        throw core::ResolutionError(std::string("No such ") + kind + " uid: " + core::bytes_to_string(uid));
    }
    return it->second;
}

core::Bytes MemoryStore::lookup_uid(const UidTable& table, const std::string& name, const char* kind) {
    auto it = table.uids.find(name);
    if (it == table.uids.end()) {
        throw core::ResolutionError(std::string("No such ") + kind + " name: " + name);
    }
    return it->second;
}

void MemoryStore::add_uid(UidTable& table, const std::string& name, const core::Bytes& uid, const char* kind) {
    if (uid.size() != codec::kMetricWidth) {
        throw core::InvalidArgumentError(std::string("Invalid ") + kind + " uid width for " + name);
    }
    auto by_name = table.uids.find(name);
    auto by_uid = table.names.find(uid);
    if (by_name != table.uids.end() && by_uid != table.names.end() && by_name->second == uid) {
        return;
    }
    if (by_name != table.uids.end() || by_uid != table.names.end()) {
        throw core::InvalidArgumentError(std::string("Conflicting ") + kind + " uid for " + name);
    }
    table.uids.emplace(name, uid);
    table.names.emplace(uid, name);
}

core::Bytes MemoryStore::assign_uid(UidTable& table, const std::string& name) {
    auto it = table.uids.find(name);
    if (it != table.uids.end()) {
        return it->second;
    }
    uint32_t next = table.names.empty() ? 1 : uid_value(table.names.rbegin()->first) + 1;
    if (next > 0xFFFFFF) {
        throw core::InternalError("Uid space exhausted");
    }
    core::Bytes uid{static_cast<uint8_t>(next >> 16), static_cast<uint8_t>(next >> 8), static_cast<uint8_t>(next)};
    table.uids.emplace(name, uid);
    table.names.emplace(uid, name);
    return uid;
}

std::string MemoryStore::metric_name(const core::Bytes& uid) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return lookup_name(metrics_, uid, "metric");
}

std::string MemoryStore::tagk_name(const core::Bytes& uid) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return lookup_name(tagks_, uid, "tagk");
}

std::string MemoryStore::tagv_name(const core::Bytes& uid) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return lookup_name(tagvs_, uid, "tagv");
}

core::Bytes MemoryStore::metric_uid(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return lookup_uid(metrics_, name, "metric");
}

core::Bytes MemoryStore::tagk_uid(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return lookup_uid(tagks_, name, "tagk");
}

core::Bytes MemoryStore::tagv_uid(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return lookup_uid(tagvs_, name, "tagv");
}

std::vector<std::string> MemoryStore::suggest_metrics(const std::string& prefix, size_t max_results) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> out;
    for (auto it = metrics_.uids.lower_bound(prefix);
         it != metrics_.uids.end() && out.size() < max_results; ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        out.push_back(it->first);
    }
    return out;
}

void MemoryStore::add_metric(const std::string& name, const core::Bytes& uid) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    add_uid(metrics_, name, uid, "metric");
}

void MemoryStore::add_tagk(const std::string& name, const core::Bytes& uid) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    add_uid(tagks_, name, uid, "tagk");
}

void MemoryStore::add_tagv(const std::string& name, const core::Bytes& uid) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    add_uid(tagvs_, name, uid, "tagv");
}

core::Bytes MemoryStore::assign_metric(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return assign_uid(metrics_, name);
}

core::Bytes MemoryStore::assign_tagk(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return assign_uid(tagks_, name);
}

core::Bytes MemoryStore::assign_tagv(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return assign_uid(tagvs_, name);
}

void MemoryStore::put(const core::Bytes& key, const core::Column& column) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    rows_[key].push_back(column);
}

core::Bytes MemoryStore::put(const std::string& metric, core::Timestamp base_time,
                             const core::Tags& tags, const core::Column& column) {
    codec::TagUids tag_uids;
    for (const auto& tag : tags) {
        tag_uids.emplace_back(assign_tagk(tag.first), assign_tagv(tag.second));
    }
    std::sort(tag_uids.begin(), tag_uids.end());
    core::Bytes key = codec::build_row_key(assign_metric(metric), base_time, tag_uids);
    put(key, column);
    return key;
}

std::optional<core::Row> MemoryStore::get_row(const core::Bytes& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = rows_.find(key);
    if (it == rows_.end()) {
        return std::nullopt;
    }
    return core::Row{it->first, it->second};
}

std::vector<core::Row> MemoryStore::rows() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<core::Row> out;
    out.reserve(rows_.size());
    for (const auto& entry : rows_) {
        out.push_back(core::Row{entry.first, entry.second});
    }
    return out;
}

size_t MemoryStore::row_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return rows_.size();
}

uint64_t MemoryStore::deletes() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return deletes_;
}

UidTable MemoryStore::metric_table() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return metrics_;
}

UidTable MemoryStore::tagk_table() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tagks_;
}

UidTable MemoryStore::tagv_table() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tagvs_;
}

} // namespace store
} // namespace tsdump
