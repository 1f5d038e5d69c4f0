//
// Created by gregorian-rayne on 02/09/26.
//

#include "covscope/utils/string_utils.hpp"

#include <gtest/gtest.h>

namespace covscope::string_utils
{
    TEST(StringUtilsTest, Trim) {
        EXPECT_EQ(trim("  com.x.Foo \t\n"), "com.x.Foo");
        EXPECT_EQ(trim_left("  a "), "a ");
        EXPECT_EQ(trim_right("  a "), "  a");
        EXPECT_EQ(trim("   "), "");
        EXPECT_EQ(trim(""), "");
    }

    TEST(StringUtilsTest, Split) {
        const auto parts = split("a,b,,c", ',');

        ASSERT_EQ(parts.size(), 4u);
        EXPECT_EQ(parts[0], "a");
        EXPECT_EQ(parts[2], "");
        EXPECT_EQ(parts[3], "c");
    }

    TEST(StringUtilsTest, SplitListTrimsAndDropsEmpty) {
        const auto parts = split_list(" UserService , ,AuthController,");

        EXPECT_EQ(parts, (std::vector<std::string>{"UserService", "AuthController"}));
        EXPECT_TRUE(split_list("").empty());
        EXPECT_TRUE(split_list(" , ").empty());
    }

    TEST(StringUtilsTest, Join) {
        const std::vector<std::string> parts = {"core", "api", "web"};

        EXPECT_EQ(join(parts, ", "), "core, api, web");
        EXPECT_EQ(join(std::vector<std::string>{}, ","), "");
    }

    TEST(StringUtilsTest, PrefixSuffixContains) {
        EXPECT_TRUE(starts_with("com.x.Foo", "com.x"));
        EXPECT_FALSE(starts_with("com", "com.x"));
        EXPECT_TRUE(ends_with("com.x.Foo", ".Foo"));
        EXPECT_FALSE(ends_with("Foo", "x.Foo"));
        EXPECT_TRUE(contains("com.x.dto.Foo", ".dto."));
    }

    TEST(StringUtilsTest, ToLower) {
        EXPECT_EQ(to_lower("JaCoCo Report"), "jacoco report");
    }

    TEST(StringUtilsTest, ReplaceChar) {
        EXPECT_EQ(replace_char("com/example/service/UserService", '/', '.'), "com.example.service.UserService");
        EXPECT_EQ(replace_char("Foo$Inner", '/', '.'), "Foo$Inner");
    }

    TEST(StringUtilsTest, Unquote) {
        EXPECT_EQ(unquote("`reports/a.xml`"), "reports/a.xml");
        EXPECT_EQ(unquote("\"reports/a.xml\""), "reports/a.xml");
        EXPECT_EQ(unquote("'x'"), "x");
        EXPECT_EQ(unquote("`mismatched\""), "`mismatched\"");
        EXPECT_EQ(unquote("`"), "`");
    }

    TEST(StringUtilsTest, FormatRatio) {
        EXPECT_EQ(format_ratio(0.8), "80.00%");
        EXPECT_EQ(format_ratio(0.0), "0.00%");
        EXPECT_EQ(format_ratio(1.0), "100.00%");
        EXPECT_EQ(format_ratio(0.125), "12.50%");
    }

}  // namespace covscope::string_utils
