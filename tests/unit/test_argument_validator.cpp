#include <gtest/gtest.h>
#include "loom/engine/argument_validator.hpp"
#include "loom/engine/tool_registry.hpp"
#include "fixtures/tool_definitions.hpp"

using namespace loom;
using namespace loom::engine;
using namespace loom::testing::tools;
using json = nlohmann::json;

class ArgumentValidatorTest : public ::testing::Test {
protected:
    ToolRegistry registry;

    void SetUp() override {
        registry.register_tool("add", "Add two integers", {"a", "b"}, add);
        registry.register_tool("greet", "Greet someone", {"name"}, greet);
        registry.register_tool("multiply", "Multiply doubles", {"a", "b"}, multiply);
        registry.register_tool("is_positive", "Check if positive", {"n"}, is_positive);
    }

    std::string validate(const std::string& tool, const json& args) {
        auto schema = registry.get_parameters_schema(tool);
        EXPECT_TRUE(schema.has_value());
        return ArgumentValidator::validate(args, schema.value_or(json::object()));
    }
};

// ============================================================================
// AV-001: Valid arguments -> validation passes
// ============================================================================

TEST_F(ArgumentValidatorTest, ValidArgsPass) {
    EXPECT_TRUE(validate("add", {{"a", 3}, {"b", 4}}).empty());
    EXPECT_TRUE(validate("greet", {{"name", "Alice"}}).empty());
}

TEST_F(ArgumentValidatorTest, IntegerAcceptedForNumber) {
    EXPECT_TRUE(validate("multiply", {{"a", 2}, {"b", 2.5}}).empty());
}

// ============================================================================
// AV-002: Missing required argument -> validation fails
// ============================================================================

TEST_F(ArgumentValidatorTest, MissingRequiredArg) {
    EXPECT_EQ(validate("add", {{"a", 3}}), "Missing required argument: b");
}

// ============================================================================
// AV-003: Wrong argument type -> validation fails
// ============================================================================

TEST_F(ArgumentValidatorTest, WrongArgType) {
    EXPECT_EQ(validate("add", {{"a", "not_a_number"}, {"b", 4}}),
              "Argument 'a' has wrong type: expected integer, got string");
}

TEST_F(ArgumentValidatorTest, FloatRejectedForInteger) {
    EXPECT_EQ(validate("add", {{"a", 1.5}, {"b", 4}}),
              "Argument 'a' has wrong type: expected integer, got number");
}

TEST_F(ArgumentValidatorTest, WrongBoolType) {
    EXPECT_FALSE(validate("is_positive", {{"n", true}}).empty());
}

// ============================================================================
// AV-004: Non-object arguments
// ============================================================================

TEST_F(ArgumentValidatorTest, ArgumentsMustBeObject) {
    EXPECT_EQ(validate("add", json::array({1, 2})), "Arguments must be a JSON object, got array");
    EXPECT_EQ(validate("add", json("3, 4")), "Arguments must be a JSON object, got string");
}

// ============================================================================
// Schema edge cases
// ============================================================================

TEST_F(ArgumentValidatorTest, ExtraArgumentsAllowed) {
    EXPECT_TRUE(validate("add", {{"a", 1}, {"b", 2}, {"c", "extra"}}).empty());
}

TEST_F(ArgumentValidatorTest, EmptySchemaAcceptsAnyObject) {
    EXPECT_TRUE(ArgumentValidator::validate({{"anything", 1}}, json::object()).empty());
}

TEST_F(ArgumentValidatorTest, UnknownTypeNameMatches) {
    json schema = {{"properties", {{"x", {{"type", "custom"}}}}}};
    EXPECT_TRUE(ArgumentValidator::validate({{"x", 1}}, schema).empty());
}

TEST_F(ArgumentValidatorTest, OptionalFieldTypeStillChecked) {
    json schema = {
        {"type", "object"},
        {"properties", {{"tags", {{"type", "array"}}}}}
    };
    EXPECT_TRUE(ArgumentValidator::validate(json::object(), schema).empty());
    EXPECT_EQ(ArgumentValidator::validate({{"tags", "a,b"}}, schema),
              "Argument 'tags' has wrong type: expected array, got string");
}

TEST_F(ArgumentValidatorTest, TypeMatches) {
    EXPECT_TRUE(ArgumentValidator::type_matches(json(3), "integer"));
    EXPECT_TRUE(ArgumentValidator::type_matches(json(3), "number"));
    EXPECT_FALSE(ArgumentValidator::type_matches(json(3.5), "integer"));
    EXPECT_TRUE(ArgumentValidator::type_matches(json(nullptr), "null"));
    EXPECT_TRUE(ArgumentValidator::type_matches(json::object(), "object"));
    EXPECT_FALSE(ArgumentValidator::type_matches(json::object(), "array"));
}
