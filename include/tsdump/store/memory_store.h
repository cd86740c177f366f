#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "tsdump/store/store.h"
#include "tsdump/store/uid_resolver.h"

namespace tsdump {
namespace store {

/**
 * @brief Uid table of one kind (metrics, tag keys or tag values)
 */
struct UidTable {
    std::map<core::Bytes, std::string> names;   // uid -> name
    std::map<std::string, core::Bytes> uids;    // name -> uid
};

/**
 * @brief Ordered in-process row store with its uid tables.
 *
 * Rows are kept sorted by key like a region of the remote table. Scans
 * snapshot the matching keys when opened and read the rows page by page,
 * so rows deleted mid-scan are skipped. All methods are thread-safe.
 */
class MemoryStore : public StoreClient, public UidResolver {
public:
    explicit MemoryStore(std::string table, size_t page_size = 128);

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    // StoreClient
    std::unique_ptr<Cursor> scan(const query::Query& query) override;
    core::Result<void> delete_row(const core::Bytes& key) override;
    const std::string& table() const override { return table_; }

    // UidResolver
    std::string metric_name(const core::Bytes& uid) const override;
    std::string tagk_name(const core::Bytes& uid) const override;
    std::string tagv_name(const core::Bytes& uid) const override;
    core::Bytes metric_uid(const std::string& name) const override;
    core::Bytes tagk_uid(const std::string& name) const override;
    core::Bytes tagv_uid(const std::string& name) const override;
    std::vector<std::string> suggest_metrics(const std::string& prefix, size_t max_results) const override;

    /**
     * @brief Registers a name under an explicit uid
     * @throws InvalidArgumentError if the uid width is wrong or either side is taken
     */
    void add_metric(const std::string& name, const core::Bytes& uid);
    void add_tagk(const std::string& name, const core::Bytes& uid);
    void add_tagv(const std::string& name, const core::Bytes& uid);

    /**
     * @brief Returns the uid of name, assigning the next free one if needed
     */
    core::Bytes assign_metric(const std::string& name);
    core::Bytes assign_tagk(const std::string& name);
    core::Bytes assign_tagv(const std::string& name);

    /**
     * @brief Appends a column to a row, creating the row if needed
     */
    void put(const core::Bytes& key, const core::Column& column);

    /**
     * @brief Builds the key from names (assigning uids) and appends the column
     * @return the row key
     */
    core::Bytes put(const std::string& metric, core::Timestamp base_time,
                    const core::Tags& tags, const core::Column& column);

    std::optional<core::Row> get_row(const core::Bytes& key) const;
    std::vector<core::Row> rows() const;
    size_t row_count() const;
    uint64_t deletes() const;

    UidTable metric_table() const;
    UidTable tagk_table() const;
    UidTable tagv_table() const;

    size_t page_size() const { return page_size_; }

private:
    class MemoryCursor;

    static std::string lookup_name(const UidTable& table, const core::Bytes& uid, const char* kind);
    static core::Bytes lookup_uid(const UidTable& table, const std::string& name, const char* kind);
    static void add_uid(UidTable& table, const std::string& name, const core::Bytes& uid, const char* kind);
    static core::Bytes assign_uid(UidTable& table, const std::string& name);

    std::string table_;
    size_t page_size_;

    mutable std::shared_mutex mutex_;
    UidTable metrics_;
    UidTable tagks_;
    UidTable tagvs_;
    std::map<core::Bytes, std::vector<core::Column>> rows_;
    uint64_t deletes_ = 0;
};

} // namespace store
} // namespace tsdump
