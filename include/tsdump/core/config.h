#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "tsdump/core/result.h"

namespace tsdump {
namespace core {

/**
 * @brief Process-wide settings of the dump tool
 */
struct ToolConfig {
    std::string data_table;                 // Table holding the data rows
    std::string store_path;                 // JSON snapshot backing the store
    uint32_t page_size;                     // Rows per cursor page
    uint32_t batch_workers;                 // Worker threads for batch delete
    std::chrono::milliseconds progress_interval;  // Between delete progress lines
    std::string log_level;

    // Default constructor
    ToolConfig() : page_size(0), batch_workers(0), progress_interval(0) {}

    static ToolConfig Default() {
        ToolConfig config;
        config.data_table = "tsdb";
        config.store_path = "";
        config.page_size = 128;
        config.batch_workers = 16;
        config.progress_interval = std::chrono::milliseconds(60'000);  // 1 minute
        config.log_level = "info";
        return config;
    }
};

/**
 * @brief Loads a JSON config file over the defaults.
 *
 * Recognized keys: "data_table", "store_path", "page_size",
 * "batch_workers", "progress_interval_ms", "log_level". Unknown keys are
 * ignored with a warning.
 */
Result<ToolConfig> load_config(const std::string& path);

/**
 * @brief Same as load_config, for an in-memory document
 */
Result<ToolConfig> parse_config(const std::string& json_text, const ToolConfig& base = ToolConfig::Default());

} // namespace core
} // namespace tsdump
