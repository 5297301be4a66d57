// ==============================================================================
// test_schema_gtest.cpp - Unit тесты для структурных схем harvest::model::Schema
// ==============================================================================
//
// infer / join: объединение типов, обязательные поля, nullable, конфликты,
// выбор примера, JSON Schema и внутреннее представление.
//
// ==============================================================================

#include <harvest/schema.hpp>

#include <gtest/gtest.h>

#include <stdexcept>

namespace model = harvest::model;
using harvest::Diagnostics;
using harvest::ErrorKind;
using harvest::Value;

namespace {

Value json(const char* text) {
    auto v = Value::parse_json(text);
    EXPECT_TRUE(v.has_value()) << text;
    return v.value_or(Value());
}

model::Schema infer(const char* text, const std::string& ts = "2024-01-01T00:00:00Z",
                    std::uint64_t ordinal = 0) {
    return model::infer(json(text), ts, ordinal);
}

}  // namespace

// ============================================================================
// Имена типов
// ============================================================================

TEST(SchemaTypes, TypeNames_RoundTrip) {
    const std::uint32_t types = model::TYPE_NULL | model::TYPE_STRING | model::TYPE_OBJECT;

    EXPECT_EQ(model::type_names(types), "null|string|object");
    EXPECT_EQ(model::parse_type_names("null|string|object"), types);
    EXPECT_EQ(model::parse_type_names(""), model::TYPE_NONE);
}

TEST(SchemaTypes, ParseTypeNames_Unknown) {
    EXPECT_THROW(model::parse_type_names("integer|date"), std::invalid_argument);
}

// ============================================================================
// infer
// ============================================================================

TEST(SchemaInfer, Scalars) {
    EXPECT_EQ(infer("1").types, model::TYPE_INTEGER);
    EXPECT_EQ(infer("1.5").types, model::TYPE_NUMBER);
    EXPECT_EQ(infer("true").types, model::TYPE_BOOLEAN);
    EXPECT_EQ(infer("null").types, model::TYPE_NULL);
    EXPECT_EQ(infer("\"x\"").types, model::TYPE_STRING);
}

TEST(SchemaInfer, Object_FieldsAndExamples) {
    auto s = infer(R"({"id": 1, "name": "Ann", "tags": ["a", "b"]})", "t1", 4);

    EXPECT_EQ(s.types, model::TYPE_OBJECT);
    EXPECT_EQ(s.observed, 1u);
    ASSERT_EQ(s.fields.size(), 3u);
    EXPECT_TRUE(s.required("id"));
    EXPECT_TRUE(s.required("name"));

    const auto& id = *s.fields.at("id").schema;
    ASSERT_TRUE(id.example.has_value());
    EXPECT_EQ(id.example->value, Value(static_cast<std::uint64_t>(1)));
    EXPECT_EQ(id.example->ordinal, 4u);

    const auto& tags = *s.fields.at("tags").schema;
    EXPECT_EQ(tags.types, model::TYPE_ARRAY);
    ASSERT_NE(tags.items, nullptr);
    EXPECT_EQ(tags.items->types, model::TYPE_STRING);
    // вложенные контейнеры без примера, корень с примером
    EXPECT_FALSE(tags.example.has_value());
    ASSERT_TRUE(s.example.has_value());
    EXPECT_EQ(s.example->timestamp, "t1");
}

TEST(SchemaInfer, EmptyArray_NoItems) {
    auto s = infer("[]");

    EXPECT_EQ(s.types, model::TYPE_ARRAY);
    EXPECT_EQ(s.items, nullptr);
}

TEST(SchemaInfer, Opaque) {
    auto s = model::opaque(std::string("body{margin:0}"), "t", 2);

    EXPECT_EQ(s.types, model::TYPE_OPAQUE);
    EXPECT_EQ(s.type_name(), "opaque");
    ASSERT_TRUE(s.example.has_value());
    EXPECT_EQ(s.example->value, Value("body{margin:0}"));
    EXPECT_TRUE(model::opaque().example->value.is_null());
}

// ============================================================================
// join
// ============================================================================

TEST(SchemaJoin, IntegerAndNumber_NoConflict) {
    Diagnostics diags;

    auto s = model::join(infer("1"), infer("2.5"), &diags, "count");

    EXPECT_TRUE(diags.empty());
    EXPECT_FALSE(s.is_union());
    EXPECT_EQ(s.type_name(), "number");
}

TEST(SchemaJoin, NullMeansNullable) {
    Diagnostics diags;

    auto s = model::join(infer("\"ann@example.com\""), infer("null"), &diags);

    EXPECT_TRUE(diags.empty());
    EXPECT_FALSE(s.is_union());
    EXPECT_EQ(s.type_name(), "null|string");
}

TEST(SchemaJoin, IncompatibleTypes_UnionWithConflict) {
    Diagnostics diags;

    auto s = model::join(infer("1"), infer("\"one\""), &diags, "body.id");

    EXPECT_TRUE(s.is_union());
    EXPECT_EQ(s.type_name(), "integer|string");
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].kind, ErrorKind::SchemaConflict);
    EXPECT_EQ(diags[0].location, "body.id");
}

TEST(SchemaJoin, NestedConflictLocation) {
    Diagnostics diags;

    model::join(infer(R"({"user": {"id": 1}})"), infer(R"({"user": {"id": "x"}})"), &diags,
                "response");

    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].location, "response.user.id");
}

TEST(SchemaJoin, RequiredOnlyWhenAlwaysPresent) {
    auto s = model::join(infer(R"({"id": 1, "email": "a"})"), infer(R"({"id": 2})"));

    EXPECT_EQ(s.observed, 2u);
    EXPECT_TRUE(s.required("id"));
    EXPECT_FALSE(s.required("email"));
    EXPECT_EQ(s.fields.at("email").present, 1u);
    EXPECT_FALSE(s.required("missing"));
}

TEST(SchemaJoin, ArrayItemsJoined) {
    auto s = infer(R"([{"a": 1}, {"a": 2, "b": true}])");

    ASSERT_NE(s.items, nullptr);
    EXPECT_EQ(s.items->observed, 2u);
    EXPECT_TRUE(s.items->required("a"));
    EXPECT_FALSE(s.items->required("b"));
}

TEST(SchemaJoin, EmptyIsIdentity) {
    auto a = infer(R"({"id": 1})");

    EXPECT_EQ(model::join(model::Schema{}, a), a);
    EXPECT_EQ(model::join(a, model::Schema{}), a);
}

TEST(SchemaJoin, Commutative) {
    auto a = infer(R"({"id": 1, "name": "Ann"})", "t1", 0);
    auto b = infer(R"({"id": 2.5, "email": null})", "t2", 1);

    EXPECT_EQ(model::join(a, b), model::join(b, a));
}

TEST(SchemaJoin, Associative) {
    auto a = infer(R"({"id": 1, "tags": []})", "t1", 0);
    auto b = infer(R"({"id": 2, "tags": ["x"]})", "t2", 1);
    auto c = infer(R"({"name": "c", "tags": ["y", "z"]})", "t3", 2);

    EXPECT_EQ(model::join(model::join(a, b), c), model::join(a, model::join(b, c)));
}

TEST(SchemaJoin, NewestExampleWins) {
    auto older = infer("\"old\"", "2024-01-01T00:00:00Z", 9);
    auto newer = infer("\"new\"", "2024-01-02T00:00:00Z", 1);

    auto s = model::join(newer, older);

    ASSERT_TRUE(s.example.has_value());
    EXPECT_EQ(s.example->value, Value("new"));
}

TEST(SchemaJoin, SameTimestamp_OrdinalBreaksTie) {
    auto first = infer("\"first\"", "t", 1);
    auto second = infer("\"second\"", "t", 2);

    EXPECT_EQ(model::join(first, second).example->value, Value("second"));
    EXPECT_EQ(model::join(second, first).example->value, Value("second"));
}

TEST(SchemaExample, FractionalSecondsComparedAsTime) {
    model::Example whole{Value("a"), "2024-05-02T10:00:00Z", 1};
    model::Example later{Value("b"), "2024-05-02T10:00:00.100Z", 0};

    EXPECT_TRUE(later.newer_than(whole));
    EXPECT_FALSE(whole.newer_than(later));
}

TEST(SchemaExample, OffsetsComparedAsTime) {
    // 11:30+02:00 == 09:30Z, раньше чем 10:00Z
    model::Example shifted{Value("a"), "2024-05-02T11:30:00+02:00", 5};
    model::Example utc{Value("b"), "2024-05-02T10:00:00.000Z", 0};

    EXPECT_TRUE(utc.newer_than(shifted));
    EXPECT_FALSE(shifted.newer_than(utc));
}

TEST(SchemaExample, SameInstant_OrdinalBreaksTie) {
    model::Example a{Value("a"), "2024-05-02T10:00:00Z", 1};
    model::Example b{Value("b"), "2024-05-02T12:00:00.000+02:00", 2};

    EXPECT_TRUE(b.newer_than(a));
    EXPECT_FALSE(a.newer_than(b));
}

// ============================================================================
// JSON Schema
// ============================================================================

TEST(SchemaJsonSchema, ObjectWithRequired) {
    auto s = model::join(infer(R"({"id": 1, "email": "a"})"), infer(R"({"id": 2, "email": null})"));

    Value js = model::to_json_schema(s);

    EXPECT_EQ(js.get_string_field("type"), "object");
    const Value* id = js.find("properties.id");
    ASSERT_NE(id, nullptr);
    EXPECT_EQ(id->get_string_field("type"), "integer");
    ASSERT_NE(id->get("examples"), nullptr);

    const Value* email_type = js.find("properties.email.type");
    ASSERT_NE(email_type, nullptr);
    ASSERT_TRUE(email_type->is_array());
    EXPECT_EQ(email_type->array_size(), 2u);

    const Value* required = js.get("required");
    ASSERT_NE(required, nullptr);
    EXPECT_EQ(required->array_size(), 2u);
}

TEST(SchemaJsonSchema, OpenApiDialect_Nullable) {
    auto s = model::join(infer("\"a\""), infer("null"));

    Value js = model::to_json_schema(s, model::SchemaDialect::OpenApi);

    EXPECT_EQ(js.get_string_field("type"), "string");
    ASSERT_NE(js.get("nullable"), nullptr);
    EXPECT_TRUE(js.get("nullable")->as_bool());
    EXPECT_NE(js.get("example"), nullptr);
}

TEST(SchemaJsonSchema, OpenApiDialect_UnionAsOneOf) {
    auto s = model::join(infer("1"), infer("\"x\""));

    Value js = model::to_json_schema(s, model::SchemaDialect::OpenApi);

    ASSERT_NE(js.get("oneOf"), nullptr);
    EXPECT_EQ(js.get("oneOf")->array_size(), 2u);
}

TEST(SchemaJsonSchema, Opaque_BinaryString) {
    Value js = model::to_json_schema(model::opaque());

    EXPECT_EQ(js.get_string_field("type"), "string");
    EXPECT_EQ(js.get_string_field("format"), "binary");
}

TEST(SchemaJsonSchema, Empty_AcceptsAnything) {
    EXPECT_EQ(model::to_json_schema(model::Schema{}).object_size(), 0u);
}

// ============================================================================
// Внутреннее представление
// ============================================================================

TEST(SchemaValue, LosslessRoundTrip) {
    auto s = model::join(infer(R"({"id": 1, "items": [{"sku": "a"}], "note": null})", "t1", 0),
                         infer(R"({"id": 2.5, "items": []})", "t2", 1));

    auto back = model::schema_from_value(model::to_value(s));

    ASSERT_TRUE(back) << back.error;
    EXPECT_EQ(back.schema, s);
}

TEST(SchemaValue, UnknownType_Error) {
    auto back = model::schema_from_value(json(R"({"types": "integer|date"})"));

    EXPECT_FALSE(back);
    EXPECT_FALSE(back.error.empty());
}

TEST(SchemaValue, NotObject_Error) {
    EXPECT_FALSE(model::schema_from_value(json("[1]")));
}
