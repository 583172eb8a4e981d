/**
 * @file test_ordered_map.cpp
 * @brief Unit tests for OrderedMap (GoogleTest)
 */

#include <gtest/gtest.h>

#include "stratum/OrderedMap.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace stratum;

namespace {

std::vector<std::string> keys_of(const OrderedMap<std::string, int>& map) {
    std::vector<std::string> out;
    for (const auto& key : map.ordered_keys()) {
        out.push_back(key);
    }
    return out;
}

} // namespace

// ============================================================================
// Insertion order
// ============================================================================

TEST(OrderedMapOrder, AppendsNewKeys) {
    OrderedMap<std::string, int> m;
    EXPECT_TRUE(m.set("a", 1));
    EXPECT_TRUE(m.set("b", 2));
    EXPECT_TRUE(m.set("c", 3));
    EXPECT_EQ(keys_of(m), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(OrderedMapOrder, UpdateKeepsPosition) {
    OrderedMap<std::string, int> m;
    m.set("a", 1);
    m.set("b", 2);
    EXPECT_FALSE(m.set("a", 3));
    EXPECT_EQ(keys_of(m), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(m.at("a"), 3);
}

TEST(OrderedMapOrder, RemoveThenSetMovesToEnd) {
    OrderedMap<std::string, int> m;
    m.set("a", 1);
    m.set("b", 2);
    EXPECT_EQ(keys_of(m), (std::vector<std::string>{"a", "b"}));

    EXPECT_TRUE(m.remove("a"));
    m.set("a", 1);
    EXPECT_EQ(keys_of(m), (std::vector<std::string>{"b", "a"}));
}

TEST(OrderedMapOrder, InsertRefusesExistingKey) {
    OrderedMap<std::string, int> m{{"a", 1}};
    EXPECT_FALSE(m.insert("a", 5));
    EXPECT_EQ(m.at("a"), 1);
    EXPECT_TRUE(m.insert("b", 2));
    EXPECT_EQ(m.size(), 2u);
}

// ============================================================================
// move_entry
// ============================================================================

TEST(OrderedMapMove, MovesToFront) {
    OrderedMap<std::string, int> m{{"a", 1}, {"b", 2}, {"c", 3}};
    m.move_entry("c", 0);
    EXPECT_EQ(keys_of(m), (std::vector<std::string>{"c", "a", "b"}));
}

TEST(OrderedMapMove, MovesToBack) {
    OrderedMap<std::string, int> m{{"a", 1}, {"b", 2}, {"c", 3}};
    m.move_entry("a", 2);
    EXPECT_EQ(keys_of(m), (std::vector<std::string>{"b", "c", "a"}));
}

TEST(OrderedMapMove, MovesIntoMiddle) {
    OrderedMap<std::string, int> m{{"a", 1}, {"b", 2}, {"c", 3}, {"d", 4}};
    m.move_entry("a", 2);
    EXPECT_EQ(keys_of(m), (std::vector<std::string>{"b", "c", "a", "d"}));
    EXPECT_EQ(m.index_of("a"), 2u);

    m.move_entry("d", 1);
    EXPECT_EQ(keys_of(m), (std::vector<std::string>{"b", "d", "c", "a"}));
}

TEST(OrderedMapMove, SameIndexIsNoOp) {
    OrderedMap<std::string, int> m{{"a", 1}, {"b", 2}};
    m.move_entry("b", 1);
    EXPECT_EQ(keys_of(m), (std::vector<std::string>{"a", "b"}));
}

TEST(OrderedMapMove, RejectsBadArguments) {
    OrderedMap<std::string, int> m{{"a", 1}, {"b", 2}};
    EXPECT_THROW(m.move_entry("a", 2), std::out_of_range);
    EXPECT_THROW(m.move_entry("zz", 0), std::out_of_range);
    EXPECT_EQ(keys_of(m), (std::vector<std::string>{"a", "b"}));
}

// ============================================================================
// Lookup and views
// ============================================================================

TEST(OrderedMapLookup, FindGetAt) {
    OrderedMap<std::string, int> m{{"x", 7}};
    ASSERT_NE(m.find("x"), nullptr);
    EXPECT_EQ(*m.find("x"), 7);
    EXPECT_EQ(m.find("y"), nullptr);
    EXPECT_EQ(m.get("x"), 7);
    EXPECT_FALSE(m.get("y").has_value());
    EXPECT_THROW(m.at("y"), std::out_of_range);
}

TEST(OrderedMapLookup, PositionalAccess) {
    OrderedMap<std::string, int> m{{"a", 1}, {"b", 2}};
    EXPECT_EQ(m.key_at(1), "b");
    EXPECT_EQ(m.value_at(0), 1);
    m.value_at(0) = 10;
    EXPECT_EQ(m.at("a"), 10);
    EXPECT_THROW(m.key_at(2), std::out_of_range);
    EXPECT_FALSE(m.index_of("missing").has_value());
}

TEST(OrderedMapLookup, ValueViewFollowsOrderAndRestarts) {
    OrderedMap<std::string, int> m{{"a", 1}, {"b", 2}, {"c", 3}};
    auto values = m.ordered_values();
    std::vector<int> first(values.begin(), values.end());
    std::vector<int> second(values.begin(), values.end());
    EXPECT_EQ(first, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(first, second);
    EXPECT_EQ(values.size(), 3u);
}

TEST(OrderedMapLookup, CopyIsIndependent) {
    OrderedMap<std::string, int> m{{"a", 1}, {"b", 2}};
    OrderedMap<std::string, int> copy = m;
    copy.set("a", 100);
    copy.remove("b");
    EXPECT_EQ(m.at("a"), 1);
    EXPECT_TRUE(m.contains_key("b"));
    EXPECT_EQ(copy.at("a"), 100);
    EXPECT_FALSE(copy.contains_key("b"));
}

TEST(OrderedMapLookup, CopyAssignReplacesContentsAndIndex) {
    OrderedMap<std::string, int> source{{"x", 1}, {"y", 2}};
    OrderedMap<std::string, int> target{{"a", 9}, {"b", 8}, {"c", 7}};
    target = source;
    EXPECT_EQ(keys_of(target), (std::vector<std::string>{"x", "y"}));
    EXPECT_FALSE(target.contains_key("a"));
    EXPECT_EQ(target.at("y"), 2);

    // The index must point at target's own nodes
    target.set("x", 10);
    target.remove("y");
    EXPECT_EQ(source.at("x"), 1);
    EXPECT_TRUE(source.contains_key("y"));
    EXPECT_EQ(keys_of(target), (std::vector<std::string>{"x"}));

    const auto& self = target;
    target = self;
    EXPECT_EQ(target.at("x"), 10);
}

TEST(OrderedMapLookup, EqualityIsOrderSensitive) {
    OrderedMap<std::string, int> ab{{"a", 1}, {"b", 2}};
    OrderedMap<std::string, int> ba{{"b", 2}, {"a", 1}};
    OrderedMap<std::string, int> ab2{{"a", 1}, {"b", 2}};
    EXPECT_EQ(ab, ab2);
    EXPECT_NE(ab, ba);
}

TEST(OrderedMapLookup, ClearEmpties) {
    OrderedMap<std::string, int> m{{"a", 1}};
    m.clear();
    EXPECT_TRUE(m.empty());
    EXPECT_FALSE(m.contains_key("a"));
    m.set("a", 2);
    EXPECT_EQ(m.size(), 1u);
}
