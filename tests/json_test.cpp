#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "rid/json/json.hpp"

using namespace rid::core;
using nlohmann::json;

namespace {

struct Account {
    ResourceId id;
    std::string name;
};

void to_json(json& j, const Account& a) {
    j = json{{"id", a.id}, {"name", a.name}};
}

void from_json(const json& j, Account& a) {
    j.at("id").get_to(a.id);
    j.at("name").get_to(a.name);
}

} // namespace

TEST(Json, SerializesAsBareString) {
    ResourceId id;
    ASSERT_TRUE(is_ok(resource_id_parse("USER01ARZ3NDEKTSV4RRFFQ69G5FAV", &id)));
    const json j = id;
    ASSERT_TRUE(j.is_string());
    EXPECT_EQ(j.dump(), "\"USER01ARZ3NDEKTSV4RRFFQ69G5FAV\"");
}

TEST(Json, RoundTrip) {
    ResourceId id;
    ASSERT_TRUE(is_ok(resource_id_new("ACCT", &id)));

    const std::string text = json(id).dump();
    const ResourceId back = json::parse(text).get<ResourceId>();
    EXPECT_EQ(back, id);
}

TEST(Json, RoundTripInsideStruct) {
    Account a;
    ASSERT_TRUE(is_ok(resource_id_new("ACCT", &a.id)));
    a.name = "primary";

    const json j = a;
    EXPECT_TRUE(j.at("id").is_string());

    const Account back = json::parse(j.dump()).get<Account>();
    EXPECT_EQ(back.id, a.id);
    EXPECT_EQ(back.name, "primary");
}

TEST(Json, RoundTripContainers) {
    std::vector<ResourceId> ids(3);
    for (auto& id : ids) {
        ASSERT_TRUE(is_ok(resource_id_new("ITEM", &id)));
    }
    const json j = ids;
    ASSERT_TRUE(j.is_array());
    EXPECT_EQ(j.get<std::vector<ResourceId>>(), ids);
}

TEST(Json, LowercaseInputIsCanonicalised) {
    const ResourceId id = json("user01arz3ndektsv4rrffq69g5fav").get<ResourceId>();
    EXPECT_EQ(json(id).get<std::string>(), "USER01ARZ3NDEKTSV4RRFFQ69G5FAV");
}

TEST(Json, DecodeErrorCarriesMessageAndStatus) {
    try {
        (void)json("USER1234").get<ResourceId>();
        FAIL() << "expected DecodeError";
    } catch (const rid::json::DecodeError& e) {
        EXPECT_STREQ(e.what(), "Invalid ID length: USER1234 (expected 30)");
        EXPECT_EQ(e.status().domain, StatusDomain::ResourceId);
        EXPECT_EQ(e.status().code, StatusCode::InvalidLength);
    }
}

TEST(Json, DecodeErrorForBadSuffix) {
    try {
        (void)json("USER01ARZ3NDEKTSV4RRFFQ69G5FAU").get<ResourceId>();
        FAIL() << "expected DecodeError";
    } catch (const rid::json::DecodeError& e) {
        EXPECT_STREQ(e.what(), "Unable to decode internal Ulid: invalid character");
        EXPECT_EQ(e.status().code, StatusCode::UnableToDecodeUlid);
    }
}

TEST(Json, NonStringIsTypeError) {
    EXPECT_THROW((void)json(42).get<ResourceId>(), json::type_error);
    EXPECT_THROW((void)json::object().get<ResourceId>(), json::type_error);
    EXPECT_THROW((void)json(nullptr).get<Ulid>(), json::type_error);
}

TEST(Json, UlidAsBareString) {
    Ulid u{};
    ASSERT_TRUE(is_ok(ulid_parse("01ARZ3NDEKTSV4RRFFQ69G5FAV", &u)));
    const json j = u;
    EXPECT_EQ(j.get<std::string>(), "01ARZ3NDEKTSV4RRFFQ69G5FAV");
    EXPECT_EQ(j.get<Ulid>(), u);

    EXPECT_THROW((void)json("01ARZ3NDEKTSV4RRFFQ69G5FA").get<Ulid>(), rid::json::DecodeError);
}

TEST(JsonSchema, ResourceId) {
    const json s = rid::json::schema_for<ResourceId>();
    const json expected = {
        {"type", "string"},
        {"format", "ResourceID"},
        {"title", "ResourceID"},
        {"description", "A unique resource identifier"},
    };
    EXPECT_EQ(s, expected);
}

TEST(JsonSchema, UlidOmitsNullFields) {
    const json s = rid::json::schema_for<Ulid>();
    EXPECT_EQ(s, (json{{"type", "string"}, {"format", "ulid"}}));
    EXPECT_FALSE(s.contains("title"));
}

TEST(JsonSchema, Definitions) {
    const json doc = rid::json::schema_definitions<ResourceId, Ulid>();
    ASSERT_TRUE(doc.contains("$defs"));
    EXPECT_EQ(doc["$defs"].size(), 2u);
    EXPECT_EQ(doc["$defs"]["ResourceID"]["format"], "ResourceID");
    EXPECT_EQ(doc["$defs"]["Ulid"]["format"], "ulid");
}
