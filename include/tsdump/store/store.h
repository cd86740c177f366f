#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tsdump/core/result.h"
#include "tsdump/core/types.h"
#include "tsdump/query/query.h"

namespace tsdump {
namespace store {

/**
 * @brief Paged view over the rows matching a query
 */
class Cursor {
public:
    virtual ~Cursor() = default;

    /**
     * @brief Next batch of rows in key order.
     * @return std::nullopt once the scan is exhausted
     * @throws StoreError if the page cannot be fetched
     */
    virtual std::optional<std::vector<core::Row>> next_page() = 0;
};

/**
 * @brief Client of the remote row store.
 *
 * One client is shared by every batch worker, so scan and delete_row may
 * be called concurrently.
 */
class StoreClient {
public:
    virtual ~StoreClient() = default;

    /**
     * @throws ResolutionError if the query names an unknown metric or tag
     */
    virtual std::unique_ptr<Cursor> scan(const query::Query& query) = 0;

    virtual core::Result<void> delete_row(const core::Bytes& key) = 0;

    /** Table the client reads and deletes from. */
    virtual const std::string& table() const = 0;
};

} // namespace store
} // namespace tsdump
