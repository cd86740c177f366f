#include <gtest/gtest.h>
#include "tsdump/cli/options.h"
#include "test_util/temp_dir.h"

#include <vector>

namespace tsdump {
namespace cli {
namespace {

Options Parse(std::vector<const char*> args) {
    args.insert(args.begin(), "tsdump");
    return parse_options(static_cast<int>(args.size()), args.data());
}

int ExitCodeOf(std::vector<const char*> args) {
    try {
        Parse(std::move(args));
    } catch (const UsageError& e) {
        return e.exit_code();
    }
    return 0;
}

TEST(OptionsTest, DefaultModeIsDebugScan) {
    auto options = Parse({"1356998400", "sum", "sys.cpu.user"});
    EXPECT_EQ(options.mode, Mode::SCAN);
    EXPECT_EQ(options.args, (std::vector<std::string>{"1356998400", "sum", "sys.cpu.user"}));
    EXPECT_EQ(options.config.data_table, "tsdb");
    EXPECT_EQ(options.config.batch_workers, 16u);
}

TEST(OptionsTest, ModeFlags) {
    EXPECT_EQ(Parse({"--import", "1h-ago", "sum", "m"}).mode, Mode::IMPORT);
    EXPECT_EQ(Parse({"--delete", "1h-ago", "sum", "m"}).mode, Mode::DELETE);
    // --delete implies the import format, so it wins over --import.
    EXPECT_EQ(Parse({"--import", "--delete", "1h-ago", "sum", "m"}).mode, Mode::DELETE);
    EXPECT_EQ(Parse({"--batch-delete-older", "1d-ago", "sys."}).mode, Mode::BATCH_DELETE_OLDER);
}

TEST(OptionsTest, ExitCodes) {
    EXPECT_EQ(ExitCodeOf({}), 1);
    EXPECT_EQ(ExitCodeOf({"--import"}), 1);
    EXPECT_EQ(ExitCodeOf({"1h-ago", "sum"}), 2);
    EXPECT_EQ(ExitCodeOf({"--batch-delete-older", "1d-ago"}), 2);
    EXPECT_EQ(ExitCodeOf({"--batch-delete-older", "1d-ago", "a", "b"}), 2);
    EXPECT_EQ(ExitCodeOf({"--bogus", "1h-ago", "sum", "m"}), 2);
    EXPECT_EQ(ExitCodeOf({"1h-ago", "sum", "m", "--table"}), 2);
    EXPECT_EQ(ExitCodeOf({"--workers", "0", "1h-ago", "sum", "m"}), 2);
    EXPECT_EQ(ExitCodeOf({"--page-size", "ten", "1h-ago", "sum", "m"}), 2);
    EXPECT_EQ(ExitCodeOf({"--log-level", "loud", "1h-ago", "sum", "m"}), 2);
    EXPECT_EQ(ExitCodeOf({"1h-ago", "sum", "m"}), 0);
}

TEST(OptionsTest, Help) {
    EXPECT_TRUE(Parse({"--help"}).help);
    EXPECT_TRUE(Parse({"-h"}).help);
    EXPECT_NE(usage("tsdump").find("--batch-delete-older"), std::string::npos);
}

TEST(OptionsTest, FlagsOverrideConfigFile) {
    testutil::TempDir dir("tsdump_options");
    std::string path = dir.write_file("tool.json",
        R"({"data_table": "tsdb-test", "store_path": "/data/a.json", "batch_workers": 4, "page_size": 10})");

    auto options = Parse({"--config", path.c_str(), "--workers", "8", "--store", "/data/b.json",
                          "1h-ago", "sum", "m"});
    EXPECT_EQ(options.config.data_table, "tsdb-test");
    EXPECT_EQ(options.config.page_size, 10u);
    EXPECT_EQ(options.config.batch_workers, 8u);
    EXPECT_EQ(options.config.store_path, "/data/b.json");

    // Flag order does not matter: the file is applied first.
    options = Parse({"--table", "t2", "--config", path.c_str(), "1h-ago", "sum", "m"});
    EXPECT_EQ(options.config.data_table, "t2");
}

TEST(OptionsTest, BadConfigFile) {
    testutil::TempDir dir("tsdump_options");
    std::string path = dir.write_file("bad.json", R"({"page_size": 0})");
    EXPECT_EQ(ExitCodeOf({"--config", path.c_str(), "1h-ago", "sum", "m"}), 2);
    EXPECT_EQ(ExitCodeOf({"--config", "/nonexistent/tool.json", "1h-ago", "sum", "m"}), 2);
}

} // namespace
} // namespace cli
} // namespace tsdump
