/// @file test_error.cpp
/// @brief Tests for the error category, error codes and exception types.

#include <ordmap/ordmap.hpp>

#include <gtest/gtest.h>

#include <string>
#include <system_error>
#include <vector>

using namespace ordmap;

// ═══════════════════════════════════════════════════════════════════════════════
// Error codes
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ErrorCode, CategoryName) {
    EXPECT_STREQ(ordmap_category().name(), "ordmap");
}

TEST(ErrorCode, MakeErrorCode) {
    auto ec = make_error_code(errc::concurrent_modification);
    EXPECT_TRUE(static_cast<bool>(ec));
    EXPECT_EQ(ec.category().name(), std::string("ordmap"));
    EXPECT_NE(ec.message().find("changed"), std::string::npos);
}

TEST(ErrorCode, SuccessIsNoError) {
    auto ec = make_error_code(errc::ok);
    EXPECT_FALSE(static_cast<bool>(ec));
    EXPECT_EQ(ec.message(), "success");
}

TEST(ErrorCode, ImplicitConversionFromEnum) {
    std::error_code ec = errc::key_not_found;
    EXPECT_EQ(ec, make_error_code(errc::key_not_found));
    EXPECT_EQ(ec.value(), 80);
}

TEST(ErrorCode, UnknownValue) {
    std::error_code ec(12345, ordmap_category());
    EXPECT_EQ(ec.message(), "unknown ordmap error");
}

TEST(ErrorCode, DistinctFromGenericCategory) {
    EXPECT_NE(make_error_code(errc::odd_literal_count),
              std::make_error_code(std::errc::invalid_argument));
}

TEST(ErrorCode, ResultType) {
    result<int> ok{42, {}};
    EXPECT_TRUE(ok.has_value());
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_EQ(ok.value, 42);

    result<int> bad{0, make_error_code(errc::key_not_found)};
    EXPECT_FALSE(bad.has_value());
    EXPECT_FALSE(static_cast<bool>(bad));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Exceptions
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ErrorCode, ConstructionErrorIsSystemError) {
    try {
        static_cast<void>(OrderedMap<int>::from_literals("x", 1, "y"));
        FAIL() << "expected exception";
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code(), make_error_code(errc::odd_literal_count));
        EXPECT_NE(std::string(e.what()).find("got 3 literals"), std::string::npos);
    }
}

TEST(ErrorCode, FromFlatReportsLength) {
    const std::vector<std::string> flat = {"a", "1", "b"};
    try {
        static_cast<void>(OrderedMap<std::string>::from_flat(flat.begin(), flat.end()));
        FAIL() << "expected exception";
    } catch (const ConstructionError& e) {
        EXPECT_EQ(e.literal_count(), 3u);
    }
}

TEST(ErrorCode, ConcurrentModificationIsSystemError) {
    OrderedMap<int> m = {{"a", 1}};
    auto it = m.key_iterator();
    m.set("b", 2);
    try {
        static_cast<void>(it.next());
        FAIL() << "expected exception";
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code(), make_error_code(errc::concurrent_modification));
    }
}

TEST(ErrorCode, OutOfRangeNamesTheKey) {
    OrderedMap<int> m;
    try {
        static_cast<void>(m.at(42));
        FAIL() << "expected exception";
    } catch (const OutOfRangeError& e) {
        EXPECT_EQ(e.code(), make_error_code(errc::key_not_found));
        EXPECT_NE(std::string(e.what()).find("\"42\""), std::string::npos);
    }
}
