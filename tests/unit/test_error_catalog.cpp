#include <gtest/gtest.h>
#include <toolgov/toolgov.hpp>

#include <stdexcept>

using namespace toolgov;

// ===========================================================================
// Message builders
// ===========================================================================

TEST(ErrorCatalogTest, MessageTemplates) {
    ErrorCatalog catalog;
    EXPECT_EQ(catalog.parameter_required("path"), "Parameter 'path' is required");
    EXPECT_EQ(catalog.validation_failed("n", "must be odd"),
              "Parameter 'n' validation failed: must be odd");
    EXPECT_EQ(catalog.tool_execution_failed("divide", "boom"),
              "Tool 'divide' execution failed: boom");
    EXPECT_EQ(catalog.range_validation_failed("n", 1, 10),
              "Parameter 'n' must be between 1 and 10");
    EXPECT_EQ(catalog.range_validation_failed("x", 0.5, 2.5),
              "Parameter 'x' must be between 0.5 and 2.5");
    EXPECT_EQ(catalog.must_be_positive("n"), "Parameter 'n' must be positive");
    EXPECT_EQ(catalog.cannot_be_empty("items"), "Parameter 'items' cannot be empty");
    EXPECT_EQ(catalog.budget_exceeded("big", 1500, 1000),
              "Tool 'big' estimated tokens (1500) exceeds budget (1000)");
}

// ===========================================================================
// Recovery
// ===========================================================================

TEST(ErrorCatalogTest, EveryCodeHasAtLeastOneStep) {
    ErrorCatalog catalog;
    for (const char* code : {error_codes::ValidationError, error_codes::ParameterRequired,
                             error_codes::ToolError, error_codes::Timeout,
                             error_codes::ResourceLimitExceeded, error_codes::ToolReleased,
                             error_codes::ToolNotFound, "SOMETHING_ELSE"}) {
        auto record = catalog.lookup(code, "msg", "tool");
        EXPECT_EQ(record.code, code);
        EXPECT_EQ(record.message, "msg");
        EXPECT_FALSE(record.recovery.steps.empty()) << code;
        EXPECT_TRUE(record.recovery.suggested_actions.empty()) << code;
    }
}

TEST(ErrorCatalogTest, BudgetStepsMentionRequestSize) {
    ErrorCatalog catalog;
    auto info = catalog.recovery_info(error_codes::ResourceLimitExceeded);
    ASSERT_FALSE(info.steps.empty());
    EXPECT_EQ(info.steps.front(), "Reduce the size of the request");
}

TEST(ErrorCatalogTest, RegisteredDomainCodeOverridesSteps) {
    ErrorCatalog catalog;
    EXPECT_FALSE(catalog.has_code("QUOTA_EXHAUSTED"));
    catalog.register_code("QUOTA_EXHAUSTED", {"Wait for the quota window to reset"});
    EXPECT_TRUE(catalog.has_code("QUOTA_EXHAUSTED"));

    auto record = catalog.lookup("QUOTA_EXHAUSTED", "quota exhausted");
    ASSERT_EQ(record.recovery.steps.size(), 1u);
    EXPECT_EQ(record.recovery.steps[0], "Wait for the quota window to reset");
}

TEST(ErrorCatalogTest, BaseClassifiesEverythingAsToolError) {
    ErrorCatalog catalog;
    EXPECT_EQ(catalog.classify_failure("file not found: a.txt"), error_codes::ToolError);
}

TEST(ErrorCatalogTest, RecordSerializesToJson) {
    ErrorCatalog catalog;
    auto j = catalog.lookup(error_codes::Timeout, "took too long").to_json();
    EXPECT_EQ(j["code"], "TIMEOUT");
    EXPECT_EQ(j["message"], "took too long");
    ASSERT_TRUE(j["recovery"]["steps"].is_array());
    EXPECT_FALSE(j["recovery"]["steps"].empty());
    EXPECT_TRUE(j["recovery"]["suggestedActions"].is_array());
}

// ===========================================================================
// AlternativeToolCatalog
// ===========================================================================

TEST(AlternativeToolCatalogTest, EmptyRegistryDegradesToBase) {
    ErrorCatalog base;
    AlternativeToolCatalog catalog([] { return std::vector<std::string>{}; });

    auto record = catalog.lookup(error_codes::FileNotFound, "missing", "reader");
    EXPECT_EQ(record.recovery.steps, base.recovery_info(error_codes::FileNotFound).steps);
    EXPECT_TRUE(record.recovery.suggested_actions.empty());
}

TEST(AlternativeToolCatalogTest, AbsentProviderDegradesToBase) {
    AlternativeToolCatalog catalog(nullptr);
    auto record = catalog.lookup(error_codes::TypeVerification, "unverified", "checker");
    EXPECT_FALSE(record.recovery.steps.empty());
    EXPECT_TRUE(record.recovery.suggested_actions.empty());
}

TEST(AlternativeToolCatalogTest, SuggestsAvailableFileTools) {
    AlternativeToolCatalog catalog([] {
        return std::vector<std::string>{"reader", "file_search", "directory_search", "calc"};
    });

    auto record = catalog.lookup(error_codes::FileNotFound, "missing", "reader");
    ASSERT_EQ(record.recovery.steps.size(), 2u);
    EXPECT_EQ(record.recovery.steps[0], "Use file_search to locate files by name or pattern");

    ASSERT_EQ(record.recovery.suggested_actions.size(), 2u);
    EXPECT_EQ(record.recovery.suggested_actions[0].tool, "file_search");
    EXPECT_EQ(record.recovery.suggested_actions[0].parameters["tool_name"], "file_search");
    EXPECT_NE(record.recovery.suggested_actions[0].description.find("Try using file_search"),
              std::string::npos);
    EXPECT_EQ(record.recovery.suggested_actions[1].tool, "directory_search");
}

TEST(AlternativeToolCatalogTest, NeverSuggestsTheFailingTool) {
    AlternativeToolCatalog catalog([] { return std::vector<std::string>{"index_workspace"}; });
    auto record = catalog.lookup(error_codes::WorkspaceNotIndexed, "not indexed",
                                 "index_workspace");
    EXPECT_TRUE(record.recovery.suggested_actions.empty());
}

TEST(AlternativeToolCatalogTest, OptionsDisableGuidance) {
    ErrorRecoveryOptions options;
    options.enable_recovery_guidance = false;
    options.suggest_alternative_tools = false;
    AlternativeToolCatalog catalog([] { return std::vector<std::string>{"file_search"}; },
                                   options);

    ErrorCatalog base;
    auto record = catalog.lookup(error_codes::FileNotFound, "missing", "reader");
    EXPECT_EQ(record.recovery.steps, base.recovery_info(error_codes::FileNotFound).steps);
    EXPECT_TRUE(record.recovery.suggested_actions.empty());
}

TEST(AlternativeToolCatalogTest, FailingProviderIsLoggedAndIgnored) {
    struct Recorder : Monitor {
        int failures = 0;
        void on_event(const MonitorEvent& e) override {
            if (e.type == EventType::ErrorCatalogFailure) ++failures;
        }
    };
    auto recorder = std::make_shared<Recorder>();

    AlternativeToolCatalog catalog(
        []() -> std::vector<std::string> { throw std::runtime_error("registry offline"); },
        ErrorRecoveryOptions{}, recorder);

    auto record = catalog.lookup(error_codes::FileNotFound, "missing", "reader");
    EXPECT_FALSE(record.recovery.steps.empty());
    EXPECT_TRUE(record.recovery.suggested_actions.empty());
    EXPECT_GE(recorder->failures, 1);
}

TEST(AlternativeToolCatalogTest, ClassifiesFailureText) {
    AlternativeToolCatalog catalog(nullptr);
    EXPECT_EQ(catalog.classify_failure("File not found: a.txt"), error_codes::FileNotFound);
    EXPECT_EQ(catalog.classify_failure("Access is denied"), error_codes::AccessDenied);
    EXPECT_EQ(catalog.classify_failure("request timed out"), error_codes::Timeout);
    EXPECT_EQ(catalog.classify_failure("workspace not indexed"), error_codes::WorkspaceNotIndexed);
    EXPECT_EQ(catalog.classify_failure("division by zero"), error_codes::ToolError);
}

TEST(AlternativeToolCatalogTest, DomainMessageHelpers) {
    AlternativeToolCatalog catalog(nullptr);
    EXPECT_EQ(catalog.file_not_found_error("/tmp/x"), "File not found: /tmp/x");
    EXPECT_NE(catalog.type_verification_error("Foo", "goto_definition").find("Foo"),
              std::string::npos);
    EXPECT_NE(catalog.workspace_not_indexed_error().find("index_workspace"), std::string::npos);
}
