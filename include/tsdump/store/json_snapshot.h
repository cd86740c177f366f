#pragma once

#include <string>

#include "tsdump/core/result.h"
#include "tsdump/store/memory_store.h"

namespace tsdump {
namespace store {

/**
 * @brief Reads and writes a MemoryStore as a JSON document.
 *
 * Layout:
 * ```
 * {
 *   "uids": {
 *     "metrics": {"000001": "sys.cpu.user"},
 *     "tagk":    {"000001": "host"},
 *     "tagv":    {"000001": "web01"}
 *   },
 *   "rows": [
 *     {"key": "00000150e22700000001000001",
 *      "columns": [{"qualifier": "0000", "value": "2a"}]}
 *   ]
 * }
 * ```
 * Uids, keys, qualifiers and values are hex.
 */
class JsonSnapshot {
public:
    /**
     * @brief Loads the document into store
     * @return number of rows loaded
     */
    static core::Result<size_t> load(const std::string& path, MemoryStore& store);
    static core::Result<size_t> load_from_string(const std::string& text, MemoryStore& store);

    static core::Result<void> save(const std::string& path, const MemoryStore& store);
    static std::string dump(const MemoryStore& store);
};

} // namespace store
} // namespace tsdump
