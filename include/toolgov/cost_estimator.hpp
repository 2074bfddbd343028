#pragma once

#include "toolgov/shape.hpp"
#include "toolgov/types.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string_view>

namespace toolgov {

// Structural statistics of a text blob
struct TextAnalysis {
    std::size_t characters{0};
    std::size_t words{0};
    std::size_t structural_chars{0};  // any of {}[]:,"
    std::size_t numeric_runs{0};
    bool structured{false};
};

struct EstimateBreakdown {
    TokenCount base{0};
    TokenCount text{0};
    TokenCount shape{0};
    double multiplier{1.0};
    TokenCount total{0};
};

// Heuristic token estimation. Not a tokenizer: cheap, deterministic,
// deliberately biased towards over-estimating.
class CostEstimator {
public:
    static constexpr double kStructuredCharsPerToken = 3.2;
    static constexpr double kFreeTextCharsPerToken = 3.8;
    static constexpr double kStructuredWordsPerToken = 0.9;
    static constexpr double kFreeTextWordsPerToken = 0.75;
    static constexpr double kStructuralSurchargePerChar = 0.8;
    static constexpr double kStructuralRatioThreshold = 0.15;
    static constexpr double kUncertaintyBuffer = 1.05;

    static constexpr TokenCount kPrimitiveShapeTokens = 30;
    static constexpr TokenCount kDateShapeTokens = 40;
    static constexpr TokenCount kTextShapeTokens = 50;
    static constexpr TokenCount kOpaqueShapeTokens = 400;
    static constexpr TokenCount kResponseEnvelopeTokens = 200;
    static constexpr TokenCount kResponseMinimumPayload = 500;

    static TextAnalysis analyze_text(std::string_view text);

    // Token estimate for a raw text blob
    static TokenCount estimate_text(std::string_view text);

    // Token estimate for the serialized form of a structured value
    static TokenCount estimate_value(const nlohmann::json& value);

    // Category floor used when no richer signal is available
    static TokenCount base_estimate(ToolCategory category);

    // Items a collection result of this category typically holds
    static std::size_t expected_item_count(ToolCategory category);

    static TokenCount estimate_shape(const ShapeDescriptor& shape, ToolCategory category);

    // base + text(params) + shape(result), padded by `multiplier`
    static EstimateBreakdown estimate_breakdown(const nlohmann::json& params,
                                                const ShapeDescriptor& result_shape,
                                                ToolCategory category,
                                                double multiplier = 1.0);

    static TokenCount estimate(const nlohmann::json& params,
                               const ShapeDescriptor& result_shape,
                               ToolCategory category,
                               double multiplier = 1.0);

    // |estimate - actual| / max(estimate, actual); 0 when both are 0
    static double accuracy(TokenCount estimate, TokenCount actual);
};

} // namespace toolgov
