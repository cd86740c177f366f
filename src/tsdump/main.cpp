#include <iostream>
#include <utility>

#include "tsdump/cli/dump_tool.h"
#include "tsdump/cli/options.h"
#include "tsdump/common/logger.h"

int main(int argc, char* argv[]) {
    tsdump::common::Logger::Init();

    tsdump::cli::Options options;
    try {
        options = tsdump::cli::parse_options(argc, argv);
    } catch (const tsdump::cli::UsageError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << tsdump::cli::usage(argv[0]);
        return e.exit_code();
    }

    if (options.help) {
        std::cout << tsdump::cli::usage(argv[0]);
        return 0;
    }

    if (auto level = tsdump::common::Logger::ParseLevel(options.config.log_level)) {
        tsdump::common::Logger::SetLevel(*level);
    } else {
        std::cerr << "Unknown log level: " << options.config.log_level << ". Using default (info)." << std::endl;
    }

    tsdump::cli::DumpTool tool(std::move(options), std::cout);
    return tool.run();
}
