#include <gtest/gtest.h>
#include <toolgov/toolgov.hpp>

#include <string>
#include <vector>

using namespace toolgov;

// ===========================================================================
// Text analysis
// ===========================================================================

TEST(CostEstimatorTest, EmptyTextCostsNothing) {
    EXPECT_EQ(CostEstimator::estimate_text(""), 0);
    EXPECT_EQ(CostEstimator::estimate_value(nlohmann::json()), 0);
}

TEST(CostEstimatorTest, AnalyzeFreeText) {
    auto a = CostEstimator::analyze_text("abc 123 def 45");
    EXPECT_EQ(a.characters, 14u);
    EXPECT_EQ(a.words, 4u);
    EXPECT_EQ(a.numeric_runs, 2u);
    EXPECT_EQ(a.structural_chars, 0u);
    EXPECT_FALSE(a.structured);
}

TEST(CostEstimatorTest, AnalyzeJsonText) {
    auto a = CostEstimator::analyze_text("{\"a\":1}");
    EXPECT_EQ(a.characters, 7u);
    EXPECT_EQ(a.words, 1u);
    EXPECT_EQ(a.structural_chars, 5u);
    EXPECT_EQ(a.numeric_runs, 1u);
    EXPECT_TRUE(a.structured);
}

TEST(CostEstimatorTest, LeadingBracketMarksStructuredText) {
    EXPECT_TRUE(CostEstimator::analyze_text("   [ plain words here").structured);
    EXPECT_FALSE(CostEstimator::analyze_text("plain words here").structured);
}

TEST(CostEstimatorTest, PunctuationRatioMarksStructuredText) {
    // 4 structural out of 10 characters
    EXPECT_TRUE(CostEstimator::analyze_text("a:b,c:d,ef").structured);
}

TEST(CostEstimatorTest, FreeTextUsesCharacterRate) {
    // 11 chars / 3.8 = 2.89 beats 2 words / 0.75 = 2.67; x1.05 -> 3.04
    EXPECT_EQ(CostEstimator::estimate_text("hello world"), 4);
}

TEST(CostEstimatorTest, WordRateWinsForShortWords) {
    // 15 chars / 3.8 = 3.95, 8 words / 0.75 = 10.67; x1.05 -> 11.2
    EXPECT_EQ(CostEstimator::estimate_text("a b c d e f g h"), 12);
}

TEST(CostEstimatorTest, StructuredTextCarriesSurchargeAndNumbers) {
    // 7/3.2 = 2.19, +0.8*5 = 6.19, +1 numeric run = 7.19; x1.05 -> 7.55
    EXPECT_EQ(CostEstimator::estimate_text("{\"a\":1}"), 8);
}

TEST(CostEstimatorTest, EstimateValueUsesSerializedForm) {
    nlohmann::json v = {{"a", 1}};
    EXPECT_EQ(CostEstimator::estimate_value(v), CostEstimator::estimate_text(v.dump()));
}

TEST(CostEstimatorTest, SameInputSameOutput) {
    std::string text = "The quick brown fox jumps over 13 lazy dogs, twice.";
    EXPECT_EQ(CostEstimator::estimate_text(text), CostEstimator::estimate_text(text));
}

// ===========================================================================
// Monotonicity under appended structural punctuation
// ===========================================================================

TEST(CostEstimatorTest, AppendingPunctuationNeverLowersEstimate_Json) {
    std::string text = "{\"items\": [1, 2, 3], \"name\": \"abc\"";
    const std::string padding = "}]:,\"{[";

    TokenCount previous = CostEstimator::estimate_text(text);
    for (int round = 0; round < 20; ++round) {
        for (char c : padding) {
            text.push_back(c);
            TokenCount current = CostEstimator::estimate_text(text);
            EXPECT_GE(current, previous) << "after appending to: " << text;
            previous = current;
        }
    }
}

TEST(CostEstimatorTest, AppendingPunctuationNeverLowersEstimate_FreeText) {
    // Crosses the 15% ratio and switches to the structured rates
    std::string text = "a b c d e f g h i j k l m n o p";
    TokenCount previous = CostEstimator::estimate_text(text);
    for (int i = 0; i < 40; ++i) {
        text.push_back(i % 2 == 0 ? ',' : ']');
        TokenCount current = CostEstimator::estimate_text(text);
        EXPECT_GE(current, previous) << "at length " << text.size();
        previous = current;
    }
}

TEST(CostEstimatorTest, CombinedEstimateIsMonotoneInParamText) {
    auto shape = ShapeDescriptor::text();
    nlohmann::json a = {{"query", "find widgets"}};
    nlohmann::json b = {{"query", "find widgets,,,::]]"}};
    EXPECT_GE(CostEstimator::estimate(b, shape, ToolCategory::Query, 1.2),
              CostEstimator::estimate(a, shape, ToolCategory::Query, 1.2));
}

// ===========================================================================
// Category defaults
// ===========================================================================

TEST(CostEstimatorTest, BaseEstimateByCategory) {
    EXPECT_EQ(CostEstimator::base_estimate(ToolCategory::Query), 2000);
    EXPECT_EQ(CostEstimator::base_estimate(ToolCategory::Analysis), 1500);
    EXPECT_EQ(CostEstimator::base_estimate(ToolCategory::Resources), 800);
    EXPECT_EQ(CostEstimator::base_estimate(ToolCategory::Utility), 500);
    EXPECT_EQ(CostEstimator::base_estimate(ToolCategory::Integration), 1200);
    EXPECT_EQ(CostEstimator::base_estimate(ToolCategory::Monitoring), 1000);
    EXPECT_EQ(CostEstimator::base_estimate(ToolCategory::General), 1000);
    EXPECT_EQ(CostEstimator::base_estimate(ToolCategory::Security), 1000);
}

TEST(CostEstimatorTest, ExpectedItemCountByCategory) {
    EXPECT_EQ(CostEstimator::expected_item_count(ToolCategory::Query), 25u);
    EXPECT_EQ(CostEstimator::expected_item_count(ToolCategory::Analysis), 15u);
    EXPECT_EQ(CostEstimator::expected_item_count(ToolCategory::Resources), 50u);
    EXPECT_EQ(CostEstimator::expected_item_count(ToolCategory::Utility), 5u);
    EXPECT_EQ(CostEstimator::expected_item_count(ToolCategory::Testing), 20u);
}

// ===========================================================================
// Shapes
// ===========================================================================

TEST(CostEstimatorTest, FlatShapes) {
    auto cat = ToolCategory::General;
    EXPECT_EQ(CostEstimator::estimate_shape(ShapeDescriptor::primitive(), cat), 30);
    EXPECT_EQ(CostEstimator::estimate_shape(ShapeDescriptor::date(), cat), 40);
    EXPECT_EQ(CostEstimator::estimate_shape(ShapeDescriptor::text(), cat), 50);
    EXPECT_EQ(CostEstimator::estimate_shape(ShapeDescriptor::opaque(), cat), 400);
}

TEST(CostEstimatorTest, CollectionScalesWithCategoryItemCount) {
    auto list_of_text = ShapeDescriptor::collection_of(ShapeDescriptor::text());
    // 50 * 25 + 2 * 25
    EXPECT_EQ(CostEstimator::estimate_shape(list_of_text, ToolCategory::Query), 1300);

    auto list_of_numbers = ShapeDescriptor::collection_of(ShapeDescriptor::primitive());
    // 30 * 5 + 2 * 5
    EXPECT_EQ(CostEstimator::estimate_shape(list_of_numbers, ToolCategory::Utility), 160);
}

TEST(CostEstimatorTest, ObjectFormula) {
    auto widget = ShapeDescriptor::object("Widget", 4, 2);
    EXPECT_EQ(CostEstimator::estimate_shape(widget, ToolCategory::General), 230);
}

TEST(CostEstimatorTest, ResponseNamedObjectGetsEnvelopeAndFloor) {
    auto result = ShapeDescriptor::object("SearchResult", 2);
    EXPECT_TRUE(result.looks_like_response());
    // 200 + max(500, 150)
    EXPECT_EQ(CostEstimator::estimate_shape(result, ToolCategory::General), 700);

    auto opaque = ShapeDescriptor::opaque("FooResponse");
    EXPECT_EQ(CostEstimator::estimate_shape(opaque, ToolCategory::General), 700);
}

TEST(CostEstimatorTest, ResponseWrappingCollection) {
    auto shape = ShapeDescriptor::response(
        "Envelope", ShapeDescriptor::collection_of(ShapeDescriptor::text()));
    // 200 + (50 * 15 + 30)
    EXPECT_EQ(CostEstimator::estimate_shape(shape, ToolCategory::Analysis), 980);
}

TEST(CostEstimatorTest, ShapeTraitsDeriveDescriptors) {
    EXPECT_EQ(shape_of<int>().kind, ShapeDescriptor::Kind::Primitive);
    EXPECT_EQ(shape_of<double>().kind, ShapeDescriptor::Kind::Primitive);
    EXPECT_EQ(shape_of<std::string>().kind, ShapeDescriptor::Kind::Text);

    auto list = shape_of<std::vector<std::string>>();
    EXPECT_EQ(list.kind, ShapeDescriptor::Kind::Collection);
    ASSERT_NE(list.item, nullptr);
    EXPECT_EQ(list.item->kind, ShapeDescriptor::Kind::Text);

    struct Unknown {};
    EXPECT_EQ(shape_of<Unknown>().kind, ShapeDescriptor::Kind::Opaque);
}

// ===========================================================================
// Combined estimate and accuracy
// ===========================================================================

TEST(CostEstimatorTest, BreakdownSumsThenMultiplies) {
    auto b = CostEstimator::estimate_breakdown(nlohmann::json(), ShapeDescriptor::primitive(),
                                               ToolCategory::Utility, 1.2);
    EXPECT_EQ(b.base, 500);
    EXPECT_EQ(b.text, 0);
    EXPECT_EQ(b.shape, 30);
    EXPECT_DOUBLE_EQ(b.multiplier, 1.2);
    EXPECT_EQ(b.total, 636);
}

TEST(CostEstimatorTest, EstimateIncludesParamText) {
    nlohmann::json params = {{"text", "hi"}};
    auto b = CostEstimator::estimate_breakdown(params, ShapeDescriptor::text(),
                                               ToolCategory::General, 1.0);
    EXPECT_EQ(b.text, CostEstimator::estimate_value(params));
    EXPECT_EQ(b.total, b.base + b.text + b.shape);
}

TEST(CostEstimatorTest, Accuracy) {
    EXPECT_DOUBLE_EQ(CostEstimator::accuracy(100, 80), 0.2);
    EXPECT_DOUBLE_EQ(CostEstimator::accuracy(80, 100), 0.2);
    EXPECT_DOUBLE_EQ(CostEstimator::accuracy(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(CostEstimator::accuracy(50, 50), 0.0);
}
