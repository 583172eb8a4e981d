/**
 * @file test_container.cpp
 * @brief Unit tests for Container access, paths, copy and equality (GoogleTest)
 */

#include <gtest/gtest.h>

#include "stratum/Container.hpp"
#include "stratum/Errors.hpp"
#include "TestSupport.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using namespace stratum;
using stratum_test::LogCapture;

// ============================================================================
// Direct access
// ============================================================================

TEST(ContainerAccess, SetGetAndOrder) {
    Container c;
    c.set("b", 2);
    c.set("a", 1);
    c.set("b", 3);
    EXPECT_EQ(c.keys(), (std::vector<std::string>{"b", "a"}));
    EXPECT_EQ(c.get<std::int32_t>("b"), 3);
    EXPECT_EQ(c.value_type("a"), "int");
    EXPECT_FALSE(c.value_type("zz").has_value());
}

TEST(ContainerAccess, TypedReadMismatchReturnsFallback) {
    LogCapture logs;
    Container c;
    c.set("name", "Knight");
    EXPECT_EQ(c.get<std::int32_t>("name", 5), 5);
    EXPECT_TRUE(logs.contains("warning", "is 'string', not 'int'"));
    EXPECT_FALSE(c.try_get<std::int32_t>("name").has_value());
    EXPECT_EQ(c.try_get<std::string>("name"), "Knight");
}

TEST(ContainerAccess, MissingKeyReturnsFallbackSilently) {
    LogCapture logs;
    Container c;
    EXPECT_EQ(c.get<std::string>("missing", "dflt"), "dflt");
    EXPECT_TRUE(logs.lines().empty());
}

TEST(ContainerAccess, EmptyKeyIsRejected) {
    Container c;
    EXPECT_THROW(c.set("", 1), InvalidArgumentError);
    EXPECT_THROW(c.get<std::int32_t>(""), InvalidArgumentError);
    EXPECT_THROW(c.contains(""), InvalidArgumentError);
    EXPECT_THROW(c.remove(""), InvalidArgumentError);
}

TEST(ContainerAccess, RemoveAndMoveEntry) {
    Container c;
    c.set("a", 1);
    c.set("b", 2);
    c.set("c", 3);
    EXPECT_TRUE(c.remove("b"));
    EXPECT_FALSE(c.remove("b"));
    c.move_entry("c", 0);
    EXPECT_EQ(c.keys(), (std::vector<std::string>{"c", "a"}));
}

TEST(ContainerAccess, GetOrCreateReplacesMistypedValue) {
    Container c;
    c.set("stats", 5);
    ContainerPtr stats = c.get_or_create_container("stats");
    ASSERT_NE(stats, nullptr);
    EXPECT_EQ(c.value_type("stats"), "container");
    EXPECT_EQ(c.get_or_create_container("stats"), stats);

    ContainerList& items = c.get_or_create_list("items");
    items.push_back(std::make_shared<Container>());
    EXPECT_EQ(c.get_or_create_list("items").size(), 1u);

    ContainerMap& dict = c.get_or_create_map("dict");
    dict.set("k", std::make_shared<Container>());
    EXPECT_TRUE(c.get_or_create_map("dict").contains_key("k"));
}

// ============================================================================
// Path access
// ============================================================================

TEST(ContainerPath, SetCreatesIntermediates) {
    Container c;
    c.path_set("stats.combat.hp", 100);
    EXPECT_EQ(c.path_get<std::int32_t>("stats.combat.hp"), 100);
    EXPECT_EQ(c.value_type("stats"), "container");
    EXPECT_TRUE(c.path_contains("stats.combat"));
    EXPECT_FALSE(c.path_contains("stats.magic"));
}

TEST(ContainerPath, ListIndexAutoGrows) {
    Container c;
    c.path_set("list[5].name", "last");
    const auto list = c.try_get<ContainerList>("list");
    ASSERT_TRUE(list.has_value());
    EXPECT_EQ(list->size(), 6u);
    for (std::size_t i = 0; i < 5; ++i) {
        ASSERT_NE((*list)[i], nullptr);
        EXPECT_TRUE((*list)[i]->empty());
    }
    EXPECT_EQ(c.path_get<std::string>("list[5].name"), "last");
}

TEST(ContainerPath, MapKeysAreQuoted) {
    Container c;
    c.path_set("dict[\"k 1\"].items[2].name", "deep");
    EXPECT_EQ(c.path_get<std::string>("dict[\"k 1\"].items[2].name"), "deep");
    const auto dict = c.try_get<ContainerMap>("dict");
    ASSERT_TRUE(dict.has_value());
    EXPECT_TRUE(dict->contains_key("k 1"));
}

TEST(ContainerPath, WritingBackReadValueChangesNothing) {
    Container c;
    c.path_set("stats.hp", 10);
    c.path_set("items[1].name", "shield");
    c.path_set("dict[\"k\"].v", true);
    ContainerPtr before = c.deep_copy();

    for (const std::string path : {"stats.hp", "stats", "items[1]", "items[1].name", "dict[\"k\"]"}) {
        c.path_set(path, c.path_value(path));
    }
    EXPECT_TRUE(c.equals(*before));
    EXPECT_EQ(c.try_get<ContainerList>("items")->size(), 2u);
}

TEST(ContainerPath, ListGrowthIsCapped) {
    Container c;
    c.path_set("list[0].x", 1);
    const std::string too_far = "list[" + std::to_string(kMaxListAutoGrowIndex + 1) + "].x";
    EXPECT_THROW(c.path_set(too_far, 2), PathNavigationError);
    EXPECT_THROW(c.path_set("fresh[4000000000].x", 2), PathNavigationError);
    EXPECT_EQ(c.try_get<ContainerList>("list")->size(), 1u);
    EXPECT_FALSE(c.contains("fresh"));
}

TEST(ContainerPath, CollectionTerminalRequiresContainer) {
    Container c;
    EXPECT_THROW(c.path_set("items[0]", 5), PathTypeError);
    EXPECT_THROW(c.path_set("dict[\"k\"]", "text"), PathTypeError);
    EXPECT_THROW(c.path_set("items[0]", ContainerPtr()), InvalidArgumentError);

    auto element = std::make_shared<Container>();
    element->set("v", 1);
    c.path_set("items[0]", element);
    EXPECT_EQ(c.path_get<std::int32_t>("items[0].v"), 1);
    EXPECT_EQ(c.path_get<ContainerPtr>("items[0]"), element);
}

TEST(ContainerPath, RelativeAndEmptyPathsAreRejected) {
    Container c;
    EXPECT_THROW(c.path_set("", 1), InvalidArgumentError);
    EXPECT_THROW(c.path_set("[0].x", 1), InvalidArgumentError);
    EXPECT_THROW(c.path_find("[\"k\"]"), InvalidArgumentError);
    EXPECT_THROW(c.path_set("a..b", 1), PathSyntaxError);
}

TEST(ContainerPath, StrictLookupNamesFailingSegment) {
    Container c;
    c.path_set("stats.hp", 10);
    try {
        c.path_value("stats.mp");
        FAIL() << "expected PathNavigationError";
    } catch (const PathNavigationError& e) {
        EXPECT_EQ(e.path(), "stats.mp");
        EXPECT_EQ(e.segment(), "mp");
    }
    EXPECT_THROW(c.path_value("items[3]"), PathNavigationError);
}

TEST(ContainerPath, LookupThroughScalarFails) {
    Container c;
    c.set("hp", 10);
    EXPECT_FALSE(c.path_find("hp.max").has_value());
    EXPECT_EQ(c.path_get<std::int32_t>("hp.max", -1), -1);
}

TEST(ContainerPath, RemoveEntriesAndElements) {
    Container c;
    c.path_set("a.b", 1);
    c.path_set("items[2].x", 1);
    c.path_set("dict[\"k\"].x", 1);

    EXPECT_TRUE(c.path_remove("a.b"));
    EXPECT_FALSE(c.path_remove("a.b"));
    EXPECT_TRUE(c.path_contains("a"));

    EXPECT_TRUE(c.path_remove("items[0]"));
    EXPECT_EQ(c.try_get<ContainerList>("items")->size(), 2u);
    EXPECT_FALSE(c.path_remove("items[5]"));

    EXPECT_TRUE(c.path_remove("dict[\"k\"]"));
    EXPECT_TRUE(c.try_get<ContainerMap>("dict")->empty());
    EXPECT_FALSE(c.path_remove("missing.x"));
}

// ============================================================================
// Copy and equality
// ============================================================================

TEST(ContainerCopy, DeepCopyIsIndependent) {
    Container c;
    c.path_set("stats.hp", 10);
    c.path_set("items[0].name", "sword");

    ContainerPtr copy = c.deep_copy();
    EXPECT_TRUE(copy->equals(c));

    copy->path_set("stats.hp", 99);
    copy->path_set("items[0].name", "axe");
    EXPECT_EQ(c.path_get<std::int32_t>("stats.hp"), 10);
    EXPECT_EQ(c.path_get<std::string>("items[0].name"), "sword");
    EXPECT_FALSE(copy->equals(c));
}

TEST(ContainerCopy, CycleBackEdgeIsDropped) {
    auto root = std::make_shared<Container>();
    auto child = std::make_shared<Container>();
    root->set("child", child);
    child->set("v", 1);
    child->set("up", root);

    ContainerPtr copy = root->deep_copy();
    EXPECT_EQ(copy->path_get<std::int32_t>("child.v"), 1);
    EXPECT_FALSE(copy->path_contains("child.up"));

    child->remove("up");
}

TEST(ContainerEquality, IgnoresKeyOrder) {
    Container a;
    a.set("x", 1);
    a.set("y", "two");
    Container b;
    b.set("y", "two");
    b.set("x", 1);
    EXPECT_TRUE(a.equals(b));

    b.set("x", std::int64_t{1});
    EXPECT_FALSE(a.equals(b));
}

TEST(ContainerEquality, MapsCompareByKeySet) {
    Container a;
    a.path_set("m[\"p\"].v", 1);
    a.path_set("m[\"q\"].v", 2);
    Container b;
    b.path_set("m[\"q\"].v", 2);
    b.path_set("m[\"p\"].v", 1);
    EXPECT_TRUE(a.equals(b));
    b.path_set("m[\"q\"].v", 3);
    EXPECT_FALSE(a.equals(b));
}

TEST(ContainerEquality, ListsCompareInOrder) {
    Container a;
    a.path_set("l[0].v", 1);
    a.path_set("l[1].v", 2);
    Container b;
    b.path_set("l[0].v", 2);
    b.path_set("l[1].v", 1);
    EXPECT_FALSE(a.equals(b));
}

// ============================================================================
// Observers
// ============================================================================

TEST(ContainerObservers, NotifiedOnTopLevelChanges) {
    Container c;
    std::vector<std::string> seen;
    const auto id = c.add_observer([&seen](const std::string& key, const Value& old_value,
                                           const Value& new_value) {
        seen.push_back(key + ":" + type_id(old_value) + "->" + type_id(new_value));
    });

    c.set("a", 1);
    c.set("a", "s");
    c.remove("a");
    EXPECT_EQ(seen, (std::vector<std::string>{"a:null->int", "a:int->string", "a:string->null"}));

    EXPECT_TRUE(c.remove_observer(id));
    EXPECT_FALSE(c.remove_observer(id));
    c.set("b", 2);
    EXPECT_EQ(seen.size(), 3u);
}

TEST(ContainerObservers, NotifiedWhenTopLevelCollectionChangesInPlace) {
    Container c;
    c.path_set("list[0].x", 1);
    c.path_set("dict[\"a\"].x", 1);

    std::vector<std::string> seen;
    c.add_observer([&seen](const std::string& key, const Value& old_value, const Value& new_value) {
        std::size_t before = 0;
        std::size_t after = 0;
        if (const auto* list = std::get_if<ContainerList>(&old_value)) before = list->size();
        if (const auto* list = std::get_if<ContainerList>(&new_value)) after = list->size();
        if (const auto* map = std::get_if<ContainerMap>(&old_value)) before = map->size();
        if (const auto* map = std::get_if<ContainerMap>(&new_value)) after = map->size();
        seen.push_back(key + ":" + std::to_string(before) + "->" + std::to_string(after));
    });

    c.path_set("list[3].y", 5);
    c.path_remove("list[0]");
    c.path_set("dict[\"b\"].x", 2);
    c.path_remove("dict[\"a\"]");
    EXPECT_EQ(seen, (std::vector<std::string>{"list:1->4", "list:4->3", "dict:1->2", "dict:2->1"}));
    EXPECT_EQ(c.path_get<std::int32_t>("list[2].y"), 5);
    EXPECT_EQ(c.path_get<std::int32_t>("dict[\"b\"].x"), 2);

    // Writes inside an existing element and no-op removals leave the collection alone
    c.path_set("list[2].y", 6);
    EXPECT_FALSE(c.path_remove("list[9]"));
    EXPECT_FALSE(c.path_remove("dict[\"zz\"]"));
    EXPECT_EQ(seen.size(), 4u);
}

TEST(ContainerObservers, ReplacingCollectionElementNotifies) {
    Container c;
    c.path_set("items[0].x", 1);
    int calls = 0;
    c.add_observer([&calls](const std::string&, const Value&, const Value&) { ++calls; });

    const ContainerPtr same = c.path_get<ContainerPtr>("items[0]");
    c.path_set("items[0]", same);
    EXPECT_EQ(calls, 0);

    c.path_set("items[0]", std::make_shared<Container>());
    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(c.path_contains("items[0].x"));
}

TEST(ContainerValue, CollectionValuesAreCopyAssignable) {
    ContainerMap map;
    map.set("a", std::make_shared<Container>());
    Value target = ContainerList{std::make_shared<Container>()};
    const Value source = map;
    target = source;
    ASSERT_TRUE(std::holds_alternative<ContainerMap>(target));
    EXPECT_TRUE(std::get<ContainerMap>(target).contains_key("a"));

    std::get<ContainerMap>(target).remove("a");
    EXPECT_TRUE(std::get<ContainerMap>(source).contains_key("a"));
}

TEST(ContainerObservers, ObserverMayUnsubscribeDuringDispatch) {
    Container c;
    int calls = 0;
    Container::ObserverId id = 0;
    id = c.add_observer([&](const std::string&, const Value&, const Value&) {
        ++calls;
        c.remove_observer(id);
    });
    c.set("a", 1);
    c.set("a", 2);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(c.observer_count(), 0u);
}
