/**
 * @file test_case.cpp
 * @brief Identifier case conversion tests
 */

#include "tsgen/common.hpp"

#include <gtest/gtest.h>

using namespace tsgen::common;

TEST(IdentifierCase, SplitWords)
{
    EXPECT_EQ(split_words("get_user"), (std::vector<std::string>{"get", "user"}));
    EXPECT_EQ(split_words("getHTTPStatus_code"),
              (std::vector<std::string>{"get", "HTTP", "Status", "code"}));
    EXPECT_EQ(split_words("window-event"), (std::vector<std::string>{"window", "event"}));
    EXPECT_TRUE(split_words("__").empty());
}

TEST(IdentifierCase, Pascal)
{
    EXPECT_EQ(to_pascal_case("user"), "User");
    EXPECT_EQ(to_pascal_case("user_settings"), "UserSettings");
    EXPECT_EQ(to_pascal_case("main_event"), "MainEvent");
    EXPECT_EQ(to_pascal_case("window-event"), "WindowEvent");
    EXPECT_EQ(to_pascal_case("settings-v2"), "SettingsV2");
}

TEST(IdentifierCase, Camel)
{
    EXPECT_EQ(to_camel_case("get_user"), "getUser");
    EXPECT_EQ(to_camel_case("get_user_by_id"), "getUserById");
    EXPECT_EQ(to_camel_case("greet"), "greet");
    EXPECT_EQ(to_camel_case("_private_arg"), "privateArg");
}

TEST(IdentifierCase, Snake)
{
    EXPECT_EQ(to_snake_case("getUser"), "get_user");
    EXPECT_EQ(to_snake_case("UserSettings"), "user_settings");
    EXPECT_EQ(to_snake_case("already_snake"), "already_snake");
}
