#include "tsdump/core/config.h"
#include "tsdump/common/logger.h"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace tsdump {
namespace core {

namespace {

// Counts are read signed so a negative value is rejected instead of wrapping.
bool in_count_range(int64_t value) {
    return value > 0 && value <= static_cast<int64_t>(std::numeric_limits<uint32_t>::max());
}

} // namespace

Result<ToolConfig> parse_config(const std::string& json_text, const ToolConfig& base) {
    ToolConfig config = base;
    try {
        auto j = json::parse(json_text);
        if (!j.is_object()) {
            return Result<ToolConfig>::error("Config root must be a JSON object");
        }
        for (auto it = j.begin(); it != j.end(); ++it) {
            const std::string& key = it.key();
            if (key == "data_table") {
                config.data_table = it.value().get<std::string>();
            } else if (key == "store_path") {
                config.store_path = it.value().get<std::string>();
            } else if (key == "page_size") {
                int64_t page_size = it.value().get<int64_t>();
                if (!in_count_range(page_size)) {
                    return Result<ToolConfig>::error("Config: page_size out of range: " + std::to_string(page_size));
                }
                config.page_size = static_cast<uint32_t>(page_size);
            } else if (key == "batch_workers") {
                int64_t workers = it.value().get<int64_t>();
                if (!in_count_range(workers)) {
                    return Result<ToolConfig>::error("Config: batch_workers out of range: " + std::to_string(workers));
                }
                config.batch_workers = static_cast<uint32_t>(workers);
            } else if (key == "progress_interval_ms") {
                int64_t interval = it.value().get<int64_t>();
                if (interval < 0) {
                    return Result<ToolConfig>::error("Config: progress_interval_ms must not be negative");
                }
                config.progress_interval = std::chrono::milliseconds(interval);
            } else if (key == "log_level") {
                config.log_level = it.value().get<std::string>();
            } else {
                TSDUMP_WARN("Ignoring unknown config key: {}", key);
            }
        }
    } catch (const json::exception& e) {
        return Result<ToolConfig>::error(std::string("Invalid config: ") + e.what());
    }

    if (config.data_table.empty()) {
        return Result<ToolConfig>::error("Config: data_table must not be empty");
    }
    if (config.page_size == 0) {
        return Result<ToolConfig>::error("Config: page_size must be positive");
    }
    if (config.batch_workers == 0) {
        return Result<ToolConfig>::error("Config: batch_workers must be positive");
    }
    return Result<ToolConfig>(std::move(config));
}

Result<ToolConfig> load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<ToolConfig>::error("Cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse_config(buffer.str());
}

} // namespace core
} // namespace tsdump
