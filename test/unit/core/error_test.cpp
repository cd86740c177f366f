#include <gtest/gtest.h>
#include "tsdump/core/error.h"
#include <string>

namespace tsdump {
namespace core {
namespace {

TEST(ErrorTest, Construction) {
    Error error("Invalid input", Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(error.code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(error.what(), std::string("Invalid input"));
    EXPECT_STREQ(error.name(), "Error");
}

TEST(ErrorTest, SpecificErrorTypes) {
    InvalidArgumentError invalid_arg("Invalid argument");
    EXPECT_EQ(invalid_arg.code(), Error::Code::INVALID_ARGUMENT);

    ResolutionError resolution("No such metric uid: [0, 0, 9]");
    EXPECT_EQ(resolution.code(), Error::Code::NOT_FOUND);
    EXPECT_STREQ(resolution.name(), "ResolutionError");

    IllegalDataError illegal("Unable to parse row");
    EXPECT_EQ(illegal.code(), Error::Code::DATA_CORRUPTION);

    StoreError store("delete failed");
    EXPECT_EQ(store.code(), Error::Code::UNAVAILABLE);

    InternalError internal("Internal error");
    EXPECT_EQ(internal.code(), Error::Code::INTERNAL);
}

TEST(ErrorTest, MalformedErrorsAreIllegalData) {
    try {
        throw MalformedColumnError("2 trailing value bytes");
    } catch (const IllegalDataError& e) {
        EXPECT_EQ(e.code(), Error::Code::DATA_CORRUPTION);
        EXPECT_STREQ(e.name(), "MalformedColumnError");
    }

    try {
        throw MalformedRowKeyError("Invalid row key length 5");
    } catch (const Error& e) {
        EXPECT_STREQ(e.name(), "MalformedRowKeyError");
        EXPECT_EQ(e.what(), std::string("Invalid row key length 5"));
    }
}

TEST(ErrorTest, ResolutionIsNotIllegalData) {
    ResolutionError error("No such tagk uid");
    const Error& base = error;
    EXPECT_EQ(dynamic_cast<const IllegalDataError*>(&base), nullptr);
}

} // namespace
} // namespace core
} // namespace tsdump
