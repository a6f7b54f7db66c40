/// @file test_key.cpp
/// @brief Tests for key canonicalization: to_key(), DefaultKeyPolicy,
///        user overloads and custom key policies.

#include <ordmap/ordmap.hpp>

#include <gtest/gtest.h>

#include <cctype>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

using namespace ordmap;

namespace geo {

struct Cell {
    int x;
    int y;
};

inline void to_key(std::string& k, const Cell& c) {
    k = std::to_string(c.x) + ":" + std::to_string(c.y);
}

} // namespace geo

namespace {

enum class Slot : std::uint8_t { first = 1, second = 2 };

/// ASCII case-insensitive keys.
struct FoldCase {
    template <typename T>
    std::string operator()(const T& key) const {
        std::string out = DefaultKeyPolicy{}(key);
        for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return out;
    }
};

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Canonical forms
// ═══════════════════════════════════════════════════════════════════════════════

TEST(CanonicalKey, Strings) {
    EXPECT_EQ(canonical_key(std::string("abc")), "abc");
    EXPECT_EQ(canonical_key(std::string_view("view")), "view");
    EXPECT_EQ(canonical_key("literal"), "literal");
    EXPECT_EQ(canonical_key(std::string()), "");
    EXPECT_EQ(canonical_key(static_cast<const char*>(nullptr)), "null");
}

TEST(CanonicalKey, CharAndBool) {
    EXPECT_EQ(canonical_key('x'), "x");
    EXPECT_EQ(canonical_key(true), "true");
    EXPECT_EQ(canonical_key(false), "false");
    EXPECT_EQ(canonical_key(nullptr), "null");
}

TEST(CanonicalKey, Integers) {
    EXPECT_EQ(canonical_key(0), "0");
    EXPECT_EQ(canonical_key(7), "7");
    EXPECT_EQ(canonical_key(-42), "-42");
    EXPECT_EQ(canonical_key(1234567890123LL), "1234567890123");
    EXPECT_EQ(canonical_key(std::numeric_limits<int64_t>::min()), "-9223372036854775808");
    EXPECT_EQ(canonical_key(std::numeric_limits<uint64_t>::max()), "18446744073709551615");
    EXPECT_EQ(canonical_key(static_cast<short>(-3)), "-3");
    EXPECT_EQ(canonical_key(static_cast<unsigned char>(200)), "200");
}

TEST(CanonicalKey, IntegralFloatsHaveNoFraction) {
    EXPECT_EQ(canonical_key(1.0), "1");
    EXPECT_EQ(canonical_key(-2.0), "-2");
    EXPECT_EQ(canonical_key(0.0), "0");
    EXPECT_EQ(canonical_key(-0.0), "0");
    EXPECT_EQ(canonical_key(3.0f), "3");
}

TEST(CanonicalKey, FractionalFloatsAreShortest) {
    EXPECT_EQ(canonical_key(0.1), "0.1");
    EXPECT_EQ(canonical_key(-1.5), "-1.5");
    EXPECT_EQ(canonical_key(0.1f), "0.1");
    EXPECT_EQ(canonical_key(1e-7), "1e-7");
    EXPECT_EQ(canonical_key(1e21), "1e+21");
    EXPECT_EQ(canonical_key(123456.789), "123456.789");
}

TEST(CanonicalKey, PositionalNotation) {
    EXPECT_EQ(canonical_key(1e16), "10000000000000000");
    EXPECT_EQ(canonical_key(1e20), "100000000000000000000");
    EXPECT_EQ(canonical_key(-1e18), "-1000000000000000000");
    EXPECT_EQ(canonical_key(0.000001), "0.000001");
    EXPECT_EQ(canonical_key(0.0000015), "0.0000015");
}

TEST(CanonicalKey, ExponentialNotation) {
    EXPECT_EQ(canonical_key(1.5e-7), "1.5e-7");
    EXPECT_EQ(canonical_key(2.5e25), "2.5e+25");
    EXPECT_EQ(canonical_key(-1e300), "-1e+300");
    EXPECT_EQ(canonical_key(5e-324), "5e-324");
}

TEST(CanonicalKey, LongDouble) {
    EXPECT_EQ(canonical_key(2.0L), "2");
    EXPECT_EQ(canonical_key(1.5L), "1.5");
    EXPECT_EQ(canonical_key(-0.0L), "0");
}

TEST(CanonicalKey, NonFiniteFloats) {
    EXPECT_EQ(canonical_key(std::numeric_limits<double>::quiet_NaN()), "NaN");
    EXPECT_EQ(canonical_key(std::numeric_limits<double>::infinity()), "Infinity");
    EXPECT_EQ(canonical_key(-std::numeric_limits<double>::infinity()), "-Infinity");
}

TEST(CanonicalKey, OptionalAndEnum) {
    EXPECT_EQ(canonical_key(std::optional<int>(5)), "5");
    EXPECT_EQ(canonical_key(std::optional<int>()), "null");
    EXPECT_EQ(canonical_key(Slot::second), "2");
}

TEST(CanonicalKey, UserTypeThroughAdl) {
    EXPECT_EQ(canonical_key(geo::Cell{3, 4}), "3:4");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Canonicalization inside the map
// ═══════════════════════════════════════════════════════════════════════════════

TEST(KeyCollision, NumberStringAndFloatAreOneKey) {
    OrderedMap<std::string> m;
    m.set(1, "int");
    m.set("1", "string");
    m.set(1.0, "double");
    EXPECT_EQ(m.size(), 1u);
    EXPECT_EQ(m.at(1), "double");
    EXPECT_EQ(m.keys(), (std::vector<std::string>{"1"}));
}

TEST(KeyCollision, LargeIntegralDoubleMatchesInteger) {
    OrderedMap<int> m;
    m.set(10000000000000000LL, 1);
    EXPECT_TRUE(m.has(1e16));
    m.set(1e16, 2);
    EXPECT_EQ(m.size(), 1u);
    EXPECT_EQ(m.at(10000000000000000LL), 2);
}

TEST(KeyCollision, LongDoubleKey) {
    OrderedMap<int> m;
    m.set(3.0L, 1);
    EXPECT_TRUE(m.has(3));
    EXPECT_TRUE(m.erase(3.0));
}

TEST(KeyCollision, HighBitShortKeysStayDistinct) {
    const std::string a("\xff");
    const std::string b("\xfe\x01");
    const std::string c("\x80\x80\x80");
    detail::StringHash hash;
    EXPECT_EQ(hash(a), hash(std::string_view(a)));
    EXPECT_EQ(hash(c), hash(c.c_str()));

    OrderedMap<int> m;
    m.set(a, 1);
    m.set(b, 2);
    m.set(c, 3);
    EXPECT_EQ(m.size(), 3u);
    EXPECT_EQ(m.at(a), 1);
    EXPECT_EQ(m.at(b), 2);
    EXPECT_EQ(m.at(c), 3);
}

TEST(KeyCollision, BoolAndItsName) {
    OrderedMap<int> m;
    m.set(true, 1);
    EXPECT_TRUE(m.has("true"));
    m.set("true", 2);
    EXPECT_EQ(m.size(), 1u);
    EXPECT_EQ(m.at(true), 2);
}

TEST(KeyCollision, NullLikeKeys) {
    OrderedMap<int> m;
    m.set(nullptr, 1);
    m.set(std::optional<double>(), 2);
    m.set("null", 3);
    EXPECT_EQ(m.size(), 1u);
    EXPECT_EQ(m.at(nullptr), 3);
}

TEST(KeyCollision, EraseByAnyForm) {
    OrderedMap<int> m;
    m.set(10, 1);
    EXPECT_TRUE(m.erase(10.0));
    EXPECT_TRUE(m.empty());
}

TEST(KeyCollision, UserTypeKey) {
    OrderedMap<double> heat;
    heat.set(geo::Cell{3, 4}, 0.5);
    EXPECT_TRUE(heat.has("3:4"));
    EXPECT_EQ(heat.get_or(geo::Cell{3, 4}, 0.0), 0.5);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Custom key policy
// ═══════════════════════════════════════════════════════════════════════════════

TEST(KeyPolicy, CaseFolding) {
    OrderedMap<int, FoldCase> m;
    m.set("Alpha", 1);
    m.set("ALPHA", 2);
    m.set("beta", 3);
    EXPECT_EQ(m.size(), 2u);
    EXPECT_EQ(m.at("alpha"), 2);
    EXPECT_EQ(m.keys(), (std::vector<std::string>{"alpha", "beta"}));
    EXPECT_TRUE(m.erase("BETA"));
}

TEST(KeyPolicy, AddAllAcrossPolicies) {
    auto plain = OrderedMap<int>::from_literals("One", 1, "TWO", 2);
    OrderedMap<int, FoldCase> folded;
    folded.add_all(plain);
    EXPECT_EQ(folded.keys(), (std::vector<std::string>{"one", "two"}));
}

TEST(KeyPolicy, TransposeUsesPolicy) {
    OrderedMap<std::string, FoldCase> m;
    m.set("k", "VALUE");
    auto t = m.transpose();
    EXPECT_TRUE(t.has("value"));
    EXPECT_EQ(t.at("Value"), "k");
}
