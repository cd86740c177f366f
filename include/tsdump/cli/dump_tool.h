#pragma once

#include <ostream>

#include "tsdump/cli/options.h"
#include "tsdump/store/memory_store.h"

namespace tsdump {
namespace cli {

/**
 * @brief Process exit codes of the tool
 */
enum ExitCode : int {
    EXIT_OK = 0,
    EXIT_INVALID_USAGE = 1,
    EXIT_BAD_ARGUMENTS = 2,
    EXIT_DATA_ERROR = 3,
    EXIT_STORE_ERROR = 4,
    EXIT_BATCH_FAILURES = 5
};

/**
 * @brief Runs one invocation of the dump tool
 */
class DumpTool {
public:
    DumpTool(Options options, std::ostream& out);

    /**
     * @brief Opens the configured store snapshot, runs, and saves it back
     * if rows were deleted
     */
    int run();

    /**
     * @brief Runs against an already opened store
     */
    int run_with_store(store::MemoryStore& store);

private:
    int run_scan(store::MemoryStore& store);
    int run_batch(store::MemoryStore& store);

    Options options_;
    std::ostream& out_;
};

} // namespace cli
} // namespace tsdump
