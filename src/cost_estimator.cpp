#include "toolgov/cost_estimator.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace toolgov {

namespace {

bool is_structural(char c) {
    switch (c) {
        case '{': case '}': case '[': case ']':
        case ':': case ',': case '"':
            return true;
        default:
            return false;
    }
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

TokenCount object_formula(const ShapeDescriptor& shape) {
    return static_cast<TokenCount>(25 * shape.property_count + 15 * shape.method_count + 100);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Text heuristics
// ---------------------------------------------------------------------------

TextAnalysis CostEstimator::analyze_text(std::string_view text) {
    TextAnalysis a;
    a.characters = text.size();

    bool in_word = false;
    bool in_number = false;
    char first_non_space = '\0';

    for (char c : text) {
        if (first_non_space == '\0' && !is_space(c)) {
            first_non_space = c;
        }

        if (is_space(c)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            a.words++;
        }

        if (is_digit(c)) {
            if (!in_number) {
                in_number = true;
                a.numeric_runs++;
            }
        } else {
            in_number = false;
        }

        if (is_structural(c)) {
            a.structural_chars++;
        }
    }

    // Opening bracket marks a JSON object/array envelope even when the
    // closer is missing (truncated payloads tokenize the same way).
    bool opens_bracket = first_non_space == '{' || first_non_space == '[';
    double ratio = a.characters > 0
        ? static_cast<double>(a.structural_chars) / static_cast<double>(a.characters)
        : 0.0;
    a.structured = opens_bracket || ratio > kStructuralRatioThreshold;
    return a;
}

TokenCount CostEstimator::estimate_text(std::string_view text) {
    if (text.empty()) {
        return 0;
    }

    const TextAnalysis a = analyze_text(text);

    const double chars_per_token = a.structured ? kStructuredCharsPerToken
                                                : kFreeTextCharsPerToken;
    const double words_per_token = a.structured ? kStructuredWordsPerToken
                                                : kFreeTextWordsPerToken;

    const double char_based = static_cast<double>(a.characters) / chars_per_token;
    const double word_based = static_cast<double>(a.words) / words_per_token;

    double tokens = std::max(char_based, word_based);
    if (a.structured) {
        tokens += kStructuralSurchargePerChar * static_cast<double>(a.structural_chars);
    }
    tokens += static_cast<double>(a.numeric_runs);

    // Round once, after the buffer, so appending characters never lowers
    // the estimate through intermediate rounding.
    return static_cast<TokenCount>(std::ceil(tokens * kUncertaintyBuffer));
}

TokenCount CostEstimator::estimate_value(const nlohmann::json& value) {
    if (value.is_null()) {
        return 0;
    }
    return estimate_text(value.dump());
}

// ---------------------------------------------------------------------------
// Category defaults
// ---------------------------------------------------------------------------

TokenCount CostEstimator::base_estimate(ToolCategory category) {
    switch (category) {
        case ToolCategory::Query:       return 2000;
        case ToolCategory::Analysis:    return 1500;
        case ToolCategory::Resources:   return 800;
        case ToolCategory::Utility:     return 500;
        case ToolCategory::Integration: return 1200;
        case ToolCategory::Monitoring:  return 1000;
        default:                        return 1000;
    }
}

std::size_t CostEstimator::expected_item_count(ToolCategory category) {
    switch (category) {
        case ToolCategory::Query:     return 25;
        case ToolCategory::Analysis:  return 15;
        case ToolCategory::Resources: return 50;
        case ToolCategory::Utility:   return 5;
        default:                      return 20;
    }
}

// ---------------------------------------------------------------------------
// Shape heuristics
// ---------------------------------------------------------------------------

TokenCount CostEstimator::estimate_shape(const ShapeDescriptor& shape, ToolCategory category) {
    using Kind = ShapeDescriptor::Kind;

    switch (shape.kind) {
        case Kind::Primitive:
            return kPrimitiveShapeTokens;
        case Kind::Date:
            return kDateShapeTokens;
        case Kind::Text:
            return kTextShapeTokens;
        case Kind::Collection: {
            const auto items = static_cast<TokenCount>(expected_item_count(category));
            const TokenCount per_item = shape.item
                ? estimate_shape(*shape.item, category)
                : kOpaqueShapeTokens;
            return per_item * items + 2 * items;
        }
        case Kind::Response:
        case Kind::Object:
        case Kind::Opaque:
            break;
    }

    const bool wrapper = shape.kind == Kind::Response || shape.looks_like_response();

    TokenCount payload = 0;
    if (shape.item) {
        payload = estimate_shape(*shape.item, category);
    } else if (shape.kind == Kind::Opaque) {
        payload = kOpaqueShapeTokens;
    } else {
        payload = object_formula(shape);
    }

    if (wrapper) {
        return kResponseEnvelopeTokens + std::max(kResponseMinimumPayload, payload);
    }
    return payload;
}

// ---------------------------------------------------------------------------
// Combined estimate
// ---------------------------------------------------------------------------

EstimateBreakdown CostEstimator::estimate_breakdown(const nlohmann::json& params,
                                                    const ShapeDescriptor& result_shape,
                                                    ToolCategory category,
                                                    double multiplier) {
    EstimateBreakdown b;
    b.base = base_estimate(category);
    b.text = estimate_value(params);
    b.shape = estimate_shape(result_shape, category);
    b.multiplier = multiplier;

    const double sum = static_cast<double>(b.base + b.text + b.shape);
    b.total = static_cast<TokenCount>(std::ceil(sum * multiplier));
    return b;
}

TokenCount CostEstimator::estimate(const nlohmann::json& params,
                                   const ShapeDescriptor& result_shape,
                                   ToolCategory category,
                                   double multiplier) {
    return estimate_breakdown(params, result_shape, category, multiplier).total;
}

double CostEstimator::accuracy(TokenCount estimate, TokenCount actual) {
    const TokenCount larger = std::max(estimate, actual);
    if (larger <= 0) {
        return 0.0;
    }
    return static_cast<double>(std::llabs(estimate - actual)) / static_cast<double>(larger);
}

} // namespace toolgov
