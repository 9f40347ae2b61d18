#include <gtest/gtest.h>
#include <util/string_utils.hpp>

TEST(StringUtils, SplitKeepsEmptyFields) {
    auto parts = StringUtils::split("a::b", ':');
    EXPECT_EQ(parts, (std::vector<std::string>{"a", "", "b"}));
}

TEST(StringUtils, SplitArgsOnWhitespace) {
    auto args = StringUtils::split_args("  put   local.txt\t/srv/remote.txt ");
    EXPECT_EQ(args, (std::vector<std::string>{"put", "local.txt", "/srv/remote.txt"}));
}

TEST(StringUtils, SplitArgsHonoursQuotes) {
    auto args = StringUtils::split_args("mv \"my file.txt\" \"\" dest");
    EXPECT_EQ(args, (std::vector<std::string>{"mv", "my file.txt", "", "dest"}));
}

TEST(StringUtils, SplitArgsEmpty) {
    EXPECT_TRUE(StringUtils::split_args("   ").empty());
}

TEST(StringUtils, Trim) {
    EXPECT_EQ(StringUtils::trim("  /tmp \n"), "/tmp");
    EXPECT_EQ(StringUtils::trim(""), "");
    EXPECT_EQ(StringUtils::trim(" \t "), "");
}
