#pragma once

#include <string>
#include <vector>

#include "tsdump/core/config.h"
#include "tsdump/core/error.h"

namespace tsdump {
namespace cli {

enum class Mode {
    SCAN,               // Debug dump
    IMPORT,             // Import-format dump
    DELETE,             // Import-format dump and delete
    BATCH_DELETE_OLDER  // Parallel delete of a metric prefix
};

/**
 * @brief Parsed command line
 */
struct Options {
    Mode mode = Mode::SCAN;
    core::ToolConfig config = core::ToolConfig::Default();
    std::vector<std::string> args;   // Positional arguments
    bool help = false;
};

/**
 * @brief Bad invocation; carries the process exit code to use
 */
class UsageError : public core::InvalidArgumentError {
public:
    UsageError(const std::string& message, int exit_code)
        : core::InvalidArgumentError(message), exit_code_(exit_code) {}

    int exit_code() const { return exit_code_; }
    const char* name() const noexcept override { return "UsageError"; }

private:
    int exit_code_;
};

/**
 * @brief Parses argv.
 *
 * Settings are layered: defaults, then the --config file, then the
 * individual flags.
 *
 * @throws UsageError with exit code 1 when no positional argument is
 *         given, 2 when the count is wrong for the mode or a flag is bad
 */
Options parse_options(int argc, const char* const argv[]);

std::string usage(const std::string& program);

} // namespace cli
} // namespace tsdump
