#include <cctype>
#include <set>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace runbox;

TEST(UtilsTest, ShellQuote) {
    EXPECT_EQ(shell_quote("main.py"), "'main.py'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_quote(""), "''");
    EXPECT_EQ(shell_quote("$(rm -rf /)"), "'$(rm -rf /)'");
}

TEST(UtilsTest, Base64Encode) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("print('Hello, World!')"), "cHJpbnQoJ0hlbGxvLCBXb3JsZCEnKQ==");
    EXPECT_EQ(base64_encode("EOF\n'\"\\"), "RU9GCiciXA==");
}

TEST(UtilsTest, RandomSuffix) {
    set<string> seen;
    for (int i = 0; i < 100; ++i) {
        string suffix = random_suffix(9);
        ASSERT_EQ(suffix.size(), 9);
        for (char c : suffix)
            EXPECT_TRUE(isdigit(c) || (c >= 'a' && c <= 'z')) << suffix;
        seen.insert(suffix);
    }
    EXPECT_EQ(seen.size(), 100);
}

TEST(UtilsTest, SafePath) {
    EXPECT_EQ(assert_safe_path("main.py"), "main.py");
    EXPECT_EQ(assert_safe_path("src/utils/helper.js"), "src/utils/helper.js");
    EXPECT_THROW(assert_safe_path(""), validation_error);
    EXPECT_THROW(assert_safe_path("/etc/passwd"), validation_error);
    EXPECT_THROW(assert_safe_path("../main.py"), validation_error);
    EXPECT_THROW(assert_safe_path("src/../../main.py"), validation_error);
    EXPECT_THROW(assert_safe_path("src/.."), validation_error);
    EXPECT_THROW(assert_safe_path("main.py; rm -rf /"), validation_error);
    EXPECT_THROW(assert_safe_path("$(whoami).py"), validation_error);
}

TEST(UtilsTest, DeferRunsOnException) {
    int counter = 0;
    try {
        defer { ++counter; };
        throw internal_error("failure");
    } catch (internal_error &) {
    }
    EXPECT_EQ(counter, 1);
}

TEST(UtilsTest, DeferDismiss) {
    int counter = 0;
    {
        scoped_guard guard([&] { ++counter; });
        guard.dismiss();
    }
    EXPECT_EQ(counter, 0);
}

TEST(UtilsTest, ExceptionMessage) {
    unsupported_language ex("ruby");
    EXPECT_STREQ(ex.what(), "Unsupported language: ruby");
    EXPECT_EQ(ex.language, "ruby");

    engine_error not_found(404, "No such container");
    EXPECT_TRUE(not_found.is_not_found());
    EXPECT_FALSE(engine_error(500, "server error").is_not_found());
}
