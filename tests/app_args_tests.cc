#include <gtest/gtest.h>

#include <optional>
#include <vector>

#include "app/app_args.h"

namespace {

std::optional<bimview::app::AppArgs> Parse(const std::vector<const char*>& args) {
    return bimview::app::parseAppArgs(args);
}

} // namespace

TEST(AppArgsTest, NoArgumentsKeepDefaults) {
    const std::optional<bimview::app::AppArgs> args = Parse({});
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(args->frames, 300u);
    EXPECT_EQ(args->floors, 4u);
    EXPECT_EQ(args->grid, 8u);
    EXPECT_FALSE(args->help);
}

TEST(AppArgsTest, ParsesCounts) {
    const std::optional<bimview::app::AppArgs> args = Parse({"--frames", "0", "--floors", "12", "--grid", "32"});
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(args->frames, 0u);
    EXPECT_EQ(args->floors, 12u);
    EXPECT_EQ(args->grid, 32u);
}

TEST(AppArgsTest, HelpFlag) {
    EXPECT_TRUE(Parse({"--help"})->help);
    EXPECT_TRUE(Parse({"-h"})->help);
}

TEST(AppArgsTest, RejectsUnknownMissingAndOutOfRange) {
    EXPECT_FALSE(Parse({"--fast"}).has_value());
    EXPECT_FALSE(Parse({"--frames"}).has_value());
    EXPECT_FALSE(Parse({"--frames", "ten"}).has_value());
    EXPECT_FALSE(Parse({"--frames", "-3"}).has_value());
    EXPECT_FALSE(Parse({"--floors", "0"}).has_value());
    EXPECT_FALSE(Parse({"--floors", "201"}).has_value());
    EXPECT_FALSE(Parse({"--grid", "257"}).has_value());
    EXPECT_FALSE(Parse({"--grid", "8x"}).has_value());
}
