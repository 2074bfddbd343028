#include <gtest/gtest.h>
#include <toolgov/toolgov.hpp>

#include <optional>
#include <regex>
#include <string>
#include <vector>

using namespace toolgov;

// ===========================================================================
// Fixture: a schema with one rule of each kind
// ===========================================================================

class ValidatorTest : public ::testing::Test {
protected:
    ErrorCatalog catalog;
    ParameterSchema schema;

    void SetUp() override {
        schema.required("path", ValueType::String)
              .range("limit", 1, 100)
              .length("label", 0, 5)
              .pattern("id", "[a-z]+-[0-9]+");
    }

    ValidationReport check(const nlohmann::json& params) {
        return Validator::validate(params, schema, catalog);
    }
};

TEST_F(ValidatorTest, ValidParametersPass) {
    auto report = check({{"path", "/tmp"}, {"limit", 10}, {"label", "abc"}, {"id", "ab-12"}});
    EXPECT_TRUE(report.is_valid());
    EXPECT_NO_THROW(report.throw_if_invalid());
}

TEST_F(ValidatorTest, OptionalFieldsMayBeAbsent) {
    EXPECT_TRUE(check({{"path", "/tmp"}}).is_valid());
}

TEST_F(ValidatorTest, MissingRequiredFieldIsParameterRequired) {
    auto report = check(nlohmann::json::object());
    ASSERT_FALSE(report.is_valid());
    EXPECT_EQ(report.code(), error_codes::ParameterRequired);
    EXPECT_EQ(report.message(), "Parameter validation failed: Parameter 'path' is required");
}

TEST_F(ValidatorTest, NullParamsReportMissingRequiredFields) {
    auto report = check(nlohmann::json());
    ASSERT_EQ(report.violations().size(), 1u);
    EXPECT_TRUE(report.violations()[0].missing_required);
    EXPECT_EQ(report.code(), error_codes::ParameterRequired);
}

TEST_F(ValidatorTest, BlankRequiredStringCountsAsMissing) {
    auto report = check({{"path", "   "}});
    ASSERT_FALSE(report.is_valid());
    EXPECT_EQ(report.code(), error_codes::ParameterRequired);
}

TEST_F(ValidatorTest, AggregatesAllViolations) {
    auto report = check({{"limit", 500}, {"label", "too long"}, {"id", "XYZ"}});
    ASSERT_EQ(report.violations().size(), 4u);
    EXPECT_EQ(report.code(), error_codes::ValidationError);

    const std::string msg = report.message();
    EXPECT_NE(msg.find("Parameter 'path' is required"), std::string::npos);
    EXPECT_NE(msg.find("Parameter 'limit' must be between 1 and 100"), std::string::npos);
    EXPECT_NE(msg.find("Parameter 'label' validation failed: must not exceed 5 characters"),
              std::string::npos);
    EXPECT_NE(msg.find("Parameter 'id' validation failed: must match pattern"),
              std::string::npos);
}

TEST_F(ValidatorTest, TypeMismatchSkipsFurtherChecks) {
    auto report = check({{"path", "/tmp"}, {"limit", "ten"}});
    ASSERT_EQ(report.violations().size(), 1u);
    EXPECT_EQ(report.violations()[0].parameter, "limit");
    EXPECT_NE(report.violations()[0].message.find("expected number but got string"),
              std::string::npos);
}

TEST_F(ValidatorTest, NonObjectParamsAreRejected) {
    auto report = check(nlohmann::json::array({1, 2}));
    ASSERT_EQ(report.violations().size(), 1u);
    EXPECT_EQ(report.code(), error_codes::ValidationError);
}

TEST_F(ValidatorTest, ThrowIfInvalidCarriesCode) {
    try {
        check(nlohmann::json::object()).throw_if_invalid();
        FAIL() << "expected ValidationException";
    } catch (const ValidationException& e) {
        EXPECT_EQ(e.code(), error_codes::ParameterRequired);
    }
}

TEST(ParameterSchemaTest, OneSidedBounds) {
    ParameterRule rule;
    rule.name = "n";
    rule.type = ValueType::Integer;
    rule.minimum = 3;
    ParameterSchema schema;
    schema.add(rule);

    ErrorCatalog catalog;
    auto report = Validator::validate({{"n", 1}}, schema, catalog);
    ASSERT_EQ(report.violations().size(), 1u);
    EXPECT_EQ(report.violations()[0].message, "Parameter 'n' validation failed: must be at least 3");

    auto wrong_type = Validator::validate({{"n", 1.5}}, schema, catalog);
    ASSERT_EQ(wrong_type.violations().size(), 1u);
    EXPECT_NE(wrong_type.violations()[0].message.find("expected integer"), std::string::npos);
}

TEST(ParameterSchemaTest, InvalidPatternFailsAtDeclaration) {
    ParameterSchema schema;
    EXPECT_THROW(schema.pattern("id", "[unclosed"), std::regex_error);
}

TEST(ParameterSchemaTest, OversizedValueIsRejectedWithoutMatching) {
    ParameterSchema schema;
    schema.pattern("name", "[a-z]+", true);
    ErrorCatalog catalog;

    const std::string huge(200000, 'a');
    auto report = Validator::validate({{"name", huge}}, schema, catalog);
    ASSERT_EQ(report.violations().size(), 1u);
    EXPECT_EQ(report.code(), error_codes::ValidationError);
    EXPECT_NE(report.violations()[0].message.find("too long to match pattern"),
              std::string::npos);

    const std::string at_limit(ParameterSchema::kMaxPatternInputLength, 'a');
    EXPECT_TRUE(Validator::validate({{"name", at_limit}}, schema, catalog).is_valid());
}

TEST(ParameterSchemaTest, LengthFailureSkipsPatternCheck) {
    ParameterRule rule;
    rule.name = "code";
    rule.type = ValueType::String;
    rule.max_length = 4;
    rule.pattern = "[0-9]+";
    ParameterSchema schema;
    schema.add(rule);

    ErrorCatalog catalog;
    auto report = Validator::validate({{"code", "abcdefgh"}}, schema, catalog);
    ASSERT_EQ(report.violations().size(), 1u);
    EXPECT_NE(report.violations()[0].message.find("must not exceed 4 characters"),
              std::string::npos);

    auto mismatch = Validator::validate({{"code", "ab"}}, schema, catalog);
    ASSERT_EQ(mismatch.violations().size(), 1u);
    EXPECT_NE(mismatch.violations()[0].message.find("must match pattern"), std::string::npos);
}

TEST(ParameterSchemaTest, Introspection) {
    ParameterSchema schema;
    EXPECT_TRUE(schema.empty());
    EXPECT_FALSE(schema.has_required_fields());
    schema.optional("x").required("y");
    EXPECT_EQ(schema.rules().size(), 2u);
    EXPECT_TRUE(schema.has_required_fields());
}

// ===========================================================================
// Single-value helpers
// ===========================================================================

TEST(ValidationHelpersTest, RequireNonEmpty) {
    EXPECT_EQ(require_non_empty(std::string("x"), "name"), "x");

    try {
        require_non_empty(std::string("  "), "name");
        FAIL();
    } catch (const ValidationException& e) {
        EXPECT_EQ(e.code(), error_codes::ParameterRequired);
        EXPECT_STREQ(e.what(), "Parameter 'name' is required");
    }

    EXPECT_THROW(require_non_empty(nlohmann::json(), "value"), ValidationException);
    EXPECT_NO_THROW(require_non_empty(nlohmann::json(0), "value"));

    std::optional<int> missing;
    EXPECT_THROW(require_non_empty(missing, "count"), ValidationException);
    std::optional<std::string> blank = std::string("");
    EXPECT_THROW(require_non_empty(blank, "label"), ValidationException);
}

TEST(ValidationHelpersTest, RequirePositive) {
    EXPECT_EQ(require_positive(5, "n"), 5);
    try {
        require_positive(0, "n");
        FAIL();
    } catch (const ValidationException& e) {
        EXPECT_EQ(e.code(), error_codes::ValidationError);
        EXPECT_STREQ(e.what(), "Parameter 'n' must be positive");
    }
    EXPECT_THROW(require_positive(-0.5, "x"), ValidationException);
}

TEST(ValidationHelpersTest, RequireInRange) {
    EXPECT_EQ(require_in_range(5, 1, 10, "n"), 5);
    EXPECT_EQ(require_in_range(1, 1, 10, "n"), 1);
    try {
        require_in_range(11, 1, 10, "n");
        FAIL();
    } catch (const ValidationException& e) {
        EXPECT_STREQ(e.what(), "Parameter 'n' must be between 1 and 10");
    }
}

TEST(ValidationHelpersTest, RequireNonEmptyCollection) {
    std::vector<int> items{1};
    EXPECT_EQ(require_non_empty_collection(items, "items").size(), 1u);
    try {
        require_non_empty_collection(std::vector<int>{}, "items");
        FAIL();
    } catch (const ValidationException& e) {
        EXPECT_STREQ(e.what(), "Parameter 'items' cannot be empty");
    }
}
