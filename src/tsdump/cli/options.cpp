#include "tsdump/cli/options.h"
#include "tsdump/common/logger.h"

#include <sstream>

namespace tsdump {
namespace cli {

namespace {

uint32_t parse_positive(const std::string& flag, const std::string& value) {
    try {
        size_t used = 0;
        long long v = std::stoll(value, &used);
        if (used == value.size() && v > 0 && v <= 0xFFFFFFFFLL) {
            return static_cast<uint32_t>(v);
        }
    } catch (const std::exception&) {
        // Reported below
    }
    throw UsageError("Invalid value for " + flag + ": " + value, 2);
}

} // namespace

std::string usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [--delete|--import] START-DATE [END-DATE] query [queries...]\n"
        << "       " << program << " --batch-delete-older END-DATE metric-prefix\n"
        << "A query is: AGG [rate] [downsample INTERVAL AGG] METRIC [tagk=tagv ...]\n"
        << "The --import flag prints rows in the format of the 'import' command instead of\n"
        << "the default format, which shows how the data is laid out in storage.\n"
        << "The --delete flag deletes every row matched by the query. It implies --import.\n"
        << "Options:\n"
        << "  --import               Print rows in import format\n"
        << "  --delete               Delete rows as they are scanned\n"
        << "  --batch-delete-older   Delete all metrics matching a prefix, up to END-DATE\n"
        << "  --config FILE          JSON config file\n"
        << "  --store FILE           JSON snapshot backing the store\n"
        << "  --table NAME           Data table (default: tsdb)\n"
        << "  --page-size N          Rows per scan page (default: 128)\n"
        << "  --workers N            Batch delete workers (default: 16)\n"
        << "  --log-level LEVEL      Log level (trace, debug, info, warn, error, off)\n"
        << "  --help, -h             Show this help message\n";
    return oss.str();
}

Options parse_options(int argc, const char* const argv[]) {
    Options options;
    bool import_format = false;
    bool delete_rows = false;
    bool batch = false;
    std::string config_path;
    std::vector<std::pair<std::string, std::string>> overrides;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--import") {
            import_format = true;
        } else if (arg == "--delete") {
            delete_rows = true;
        } else if (arg == "--batch-delete-older") {
            batch = true;
        } else if (arg == "--help" || arg == "-h") {
            options.help = true;
            return options;
        } else if (arg == "--config" || arg == "--store" || arg == "--table" ||
                   arg == "--page-size" || arg == "--workers" || arg == "--log-level") {
            if (i + 1 >= argc) {
                throw UsageError("Missing value for " + arg, 2);
            }
            std::string value = argv[++i];
            if (arg == "--config") {
                config_path = value;
            } else {
                overrides.emplace_back(arg, value);
            }
        } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            throw UsageError("Unknown option: " + arg, 2);
        } else {
            options.args.push_back(arg);
        }
    }

    if (!config_path.empty()) {
        auto loaded = core::load_config(config_path);
        if (!loaded.ok()) {
            throw UsageError(loaded.error(), 2);
        }
        options.config = loaded.take_value();
    }
    for (const auto& o : overrides) {
        if (o.first == "--store") {
            options.config.store_path = o.second;
        } else if (o.first == "--table") {
            options.config.data_table = o.second;
        } else if (o.first == "--page-size") {
            options.config.page_size = parse_positive(o.first, o.second);
        } else if (o.first == "--workers") {
            options.config.batch_workers = parse_positive(o.first, o.second);
        } else if (o.first == "--log-level") {
            if (!common::Logger::ParseLevel(o.second)) {
                throw UsageError("Unknown log level: " + o.second, 2);
            }
            options.config.log_level = o.second;
        }
    }

    if (batch) {
        options.mode = Mode::BATCH_DELETE_OLDER;
    } else if (delete_rows) {
        options.mode = Mode::DELETE;
    } else if (import_format) {
        options.mode = Mode::IMPORT;
    }

    if (options.args.empty()) {
        throw UsageError("Invalid usage.", 1);
    }
    if (options.mode == Mode::BATCH_DELETE_OLDER) {
        if (options.args.size() != 2) {
            throw UsageError("Wrong number of arguments with option --batch-delete-older.", 2);
        }
    } else if (options.args.size() < 3) {
        throw UsageError("Not enough arguments.", 2);
    }
    return options;
}

} // namespace cli
} // namespace tsdump
