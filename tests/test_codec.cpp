/**
 * @file test_codec.cpp
 * @brief Unit tests for the value codec and wire format (GoogleTest)
 */

#include <gtest/gtest.h>

#include "stratum/Codec.hpp"
#include "stratum/Container.hpp"
#include "TestSupport.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <memory>
#include <string>

using namespace stratum;
using stratum_test::LogCapture;
using nlohmann::json;

// ============================================================================
// Scalar payloads
// ============================================================================

TEST(CodecScalar, PayloadText) {
    EXPECT_EQ(serialize_value(Value(true)), "true");
    EXPECT_EQ(serialize_value(Value(std::int32_t{-42})), "-42");
    EXPECT_EQ(serialize_value(Value(std::int64_t{9000000000})), "9000000000");
    EXPECT_EQ(serialize_value(Value(std::string("hello world"))), "hello world");
    EXPECT_EQ(serialize_value(Value()), "");
}

TEST(CodecScalar, FloatingPointRoundTripsExactly) {
    const double d = 0.1 + 0.2;
    const Value decoded = deserialize_value(serialize_value(Value(d)), "double");
    ASSERT_TRUE(std::holds_alternative<double>(decoded));
    EXPECT_EQ(std::get<double>(decoded), d);

    const float f = 3.14159f;
    const Value decoded_f = deserialize_value(serialize_value(Value(f)), "float");
    ASSERT_TRUE(std::holds_alternative<float>(decoded_f));
    EXPECT_EQ(std::get<float>(decoded_f), f);
}

TEST(CodecScalar, BoolIsCaseInsensitive) {
    EXPECT_EQ(std::get<bool>(deserialize_value("TRUE", "bool")), true);
    EXPECT_EQ(std::get<bool>(deserialize_value("False", "bool")), false);
}

TEST(CodecScalar, DecodeFailureYieldsDefault) {
    LogCapture logs;
    const Value v = deserialize_value("not-a-number", "int");
    ASSERT_TRUE(std::holds_alternative<std::int32_t>(v));
    EXPECT_EQ(std::get<std::int32_t>(v), 0);
    EXPECT_TRUE(logs.contains("warning", "cannot decode"));
}

TEST(CodecScalar, IntOutOfRangeYieldsDefault) {
    LogCapture logs;
    const Value v = deserialize_value("9000000000", "int");
    EXPECT_EQ(std::get<std::int32_t>(v), 0);
    const Value l = deserialize_value("9000000000", "long");
    EXPECT_EQ(std::get<std::int64_t>(l), 9000000000);
}

TEST(CodecScalar, GeometryUsesFieldLayout) {
    const std::string payload = serialize_value(Value(Vector3{1.0f, 2.0f, 3.0f}));
    const json doc = json::parse(payload);
    EXPECT_EQ(doc["x"].get<float>(), 1.0f);
    EXPECT_EQ(doc["z"].get<float>(), 3.0f);

    const Value back = deserialize_value(payload, "vector3");
    EXPECT_EQ(std::get<Vector3>(back), (Vector3{1.0f, 2.0f, 3.0f}));

    const Bounds b{{1.0f, 2.0f, 3.0f}, {4.0f, 5.0f, 6.0f}};
    const json bounds_doc = json::parse(serialize_value(Value(b)));
    EXPECT_EQ(bounds_doc["centerY"].get<float>(), 2.0f);
    EXPECT_EQ(bounds_doc["sizeZ"].get<float>(), 6.0f);
    EXPECT_EQ(std::get<Bounds>(deserialize_value(bounds_doc.dump(), "bounds")), b);
}

TEST(CodecScalar, AssetReferenceRoundTrip) {
    const AssetReference ref{AssetStorage::Addressable, "ui/icons/sword", "Sprite"};
    const std::string payload = serialize_value(Value(ref));
    const json doc = json::parse(payload);
    EXPECT_EQ(doc["storageType"], "Addressable");
    EXPECT_EQ(doc["typeName"], "Sprite");
    EXPECT_EQ(std::get<AssetReference>(deserialize_value(payload, "asset_ref")), ref);
}

TEST(CodecScalar, UnknownStorageKindYieldsEmptyReference) {
    LogCapture logs;
    const Value v = deserialize_value(R"({"storageType":"Cloud","key":"k"})", "asset_ref");
    ASSERT_TRUE(std::holds_alternative<AssetReference>(v));
    EXPECT_TRUE(std::get<AssetReference>(v).empty());
}

TEST(CodecScalar, UnknownTypeIdBecomesBlob) {
    const Value v = deserialize_value(R"([1,2,3])", "int_list");
    ASSERT_TRUE(std::holds_alternative<Blob>(v));
    EXPECT_EQ(type_id(v), "int_list");
    EXPECT_EQ(std::get<Blob>(v).payload, json::array({1, 2, 3}));
    EXPECT_EQ(serialize_value(v), "[1,2,3]");

    const Value text = deserialize_value("plain words", "custom");
    EXPECT_EQ(std::get<Blob>(text).payload, json("plain words"));
}

// ============================================================================
// Wire documents
// ============================================================================

TEST(CodecWire, DocumentShape) {
    Container c;
    c.set("hp", 100);
    c.set("name", "Knight");
    const json doc = json::parse(c.to_wire_format());
    EXPECT_EQ(doc["data"]["hp"], "100");
    EXPECT_EQ(doc["typeInfo"]["hp"], "int");
    EXPECT_EQ(doc["data"]["name"], "Knight");
    EXPECT_EQ(doc["typeInfo"]["name"], "string");
}

TEST(CodecWire, RoundTripFourLevelsDeep) {
    Container root;
    root.path_set("a.b.c.d", 42);
    root.path_set("a.b.label", "inner");
    root.path_set("a.pos", Vector2{1.5f, -2.0f});
    root.path_set("a.items[1].tag", "second");
    root.path_set("a.lookup[\"key one\"].weight", 0.25);
    root.set("flag", true);
    root.set("big", std::int64_t{1} << 40);

    const ContainerPtr back = Container::from_wire_format(root.to_wire_format());
    EXPECT_TRUE(back->equals(root));
    EXPECT_EQ(back->path_get<std::int32_t>("a.b.c.d"), 42);
    EXPECT_EQ(back->path_get<std::string>("a.items[1].tag"), "second");
    EXPECT_EQ(back->path_get<double>("a.lookup[\"key one\"].weight"), 0.25);
    EXPECT_EQ(back->keys(), root.keys());
}

TEST(CodecWire, CollectionPayloadShape) {
    Container c;
    c.path_set("items[0].x", 1);
    c.path_set("dict[\"k\"].y", 2);
    const json doc = json::parse(c.to_wire_format());

    EXPECT_EQ(doc["typeInfo"]["items"], "container_list");
    const json list = json::parse(doc["data"]["items"].get<std::string>());
    EXPECT_EQ(list["type"], "container_list");
    EXPECT_EQ(list["elementType"], "container");
    ASSERT_EQ(list["items"].size(), 1u);
    EXPECT_TRUE(list["items"][0].is_string());

    const json map = json::parse(doc["data"]["dict"].get<std::string>());
    EXPECT_EQ(map["type"], "container_map");
    EXPECT_EQ(map["keys"], json::array({"k"}));
    EXPECT_EQ(map["values"].size(), 1u);
}

TEST(CodecWire, NullListElementsSurvive) {
    Container c;
    c.set("items", ContainerList{std::make_shared<Container>(), nullptr});
    const ContainerPtr back = Container::from_wire_format(c.to_wire_format());
    const auto list = back->try_get<ContainerList>("items");
    ASSERT_TRUE(list.has_value());
    ASSERT_EQ(list->size(), 2u);
    EXPECT_NE((*list)[0], nullptr);
    EXPECT_EQ((*list)[1], nullptr);
}

TEST(CodecWire, NullContainerPropertyKeepsItsType) {
    Container c;
    c.set("slot", ContainerPtr());
    const json doc = json::parse(c.to_wire_format());
    EXPECT_TRUE(doc["data"]["slot"].is_null());
    EXPECT_EQ(doc["typeInfo"]["slot"], "container");

    const ContainerPtr back = Container::from_wire_format(doc.dump());
    EXPECT_EQ(back->value_type("slot"), "container");
    EXPECT_EQ(back->get<ContainerPtr>("slot", std::make_shared<Container>()), nullptr);
    EXPECT_TRUE(back->equals(c));
}

TEST(CodecWire, EmptyAndMalformedDocuments) {
    LogCapture logs;
    EXPECT_TRUE(Container::from_wire_format("")->empty());
    EXPECT_TRUE(Container::from_wire_format("{}")->empty());
    EXPECT_TRUE(Container::from_wire_format("{not json")->empty());
    EXPECT_TRUE(logs.contains("warning", "malformed container document"));
}

TEST(CodecWire, KeyWithoutTypeInfoIsSkipped) {
    LogCapture logs;
    const std::string text = R"({"data":{"a":"1","b":"2"},"typeInfo":{"a":"int"}})";
    const ContainerPtr c = Container::from_wire_format(text);
    EXPECT_EQ(c->get<std::int32_t>("a"), 1);
    EXPECT_FALSE(c->contains("b"));
    EXPECT_TRUE(logs.contains("warning", "no type info for key 'b'"));
}

TEST(CodecWire, CycleIsWrittenAsNull) {
    LogCapture logs;
    auto root = std::make_shared<Container>();
    auto child = std::make_shared<Container>();
    child->set("value", 7);
    root->set("child", child);
    child->set("parent", root);

    const json doc = json::parse(root->to_wire_format());
    EXPECT_TRUE(logs.contains("warning", "cycle"));

    const ContainerPtr back = Container::from_wire_format(doc.dump());
    EXPECT_EQ(back->path_get<std::int32_t>("child.value"), 7);
    const auto parent = back->path_find("child.parent");
    ASSERT_TRUE(parent.has_value());
    EXPECT_TRUE(std::holds_alternative<std::monostate>(*parent));

    // Break the cycle so both containers are released
    child->remove("parent");
}

// ============================================================================
// Plain export
// ============================================================================

TEST(CodecPlain, ReadableExport) {
    Container c;
    c.set("hp", 10);
    c.set("tint", Color{1.0f, 0.5f, 0.0f, 1.0f});
    c.path_set("items[0].name", "sword");
    c.path_set("dict[\"k\"].v", true);

    const auto plain = c.to_plain_json();
    EXPECT_EQ(plain["hp"], 10);
    EXPECT_EQ(plain["tint"]["g"], 0.5f);
    EXPECT_EQ(plain["items"][0]["name"], "sword");
    EXPECT_EQ(plain["dict"]["k"]["v"], true);
    EXPECT_EQ(plain.begin().key(), "hp");
}

TEST(CodecPlain, DepthLimitStopsExport) {
    LogCapture logs;
    std::string path = "n";
    for (std::size_t i = 0; i < kMaxNestingDepth + 4; ++i) {
        path += ".n";
    }
    Container deep;
    deep.path_set(path, 1);

    const auto plain = deep.to_plain_json();
    EXPECT_TRUE(plain.contains("n"));
    EXPECT_TRUE(logs.contains("warning", "too deep"));
}
