#pragma once

#include "toolgov/error_catalog.hpp"
#include "toolgov/exceptions.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <type_traits>
#include <vector>

namespace toolgov {

enum class ValueType {
    Any,
    String,
    Number,
    Integer,
    Boolean,
    Array,
    Object
};

const char* to_string(ValueType t);

// Declared constraint on one named parameter field
struct ParameterRule {
    std::string name;
    bool required{false};
    ValueType type{ValueType::Any};

    std::optional<double> minimum;
    std::optional<double> maximum;

    std::optional<std::size_t> min_length;
    std::optional<std::size_t> max_length;

    // ECMAScript regex the whole string must match
    std::optional<std::string> pattern;
};

// Ordered set of field rules. The explicit replacement for attribute
// reflection on the parameter type.
class ParameterSchema {
public:
    // Longest string a pattern rule will try to match. std::regex recurses per
    // character, so longer values are rejected without running the matcher.
    static constexpr std::size_t kMaxPatternInputLength = 4096;

    ParameterSchema() = default;

    // Throws std::regex_error if rule.pattern does not compile
    ParameterSchema& add(ParameterRule rule);

    ParameterSchema& required(std::string name, ValueType type = ValueType::Any);
    ParameterSchema& optional(std::string name, ValueType type = ValueType::Any);
    ParameterSchema& range(std::string name, double minimum, double maximum,
                           bool is_required = false);
    ParameterSchema& length(std::string name, std::size_t min_length, std::size_t max_length,
                            bool is_required = false);
    ParameterSchema& pattern(std::string name, std::string regex, bool is_required = false);

    const std::vector<ParameterRule>& rules() const noexcept;
    bool has_required_fields() const;
    bool empty() const noexcept;

private:
    std::vector<ParameterRule> rules_;
    std::vector<std::shared_ptr<const std::regex>> patterns_;  // parallel to rules_

    friend class Validator;
};

struct ValidationViolation {
    std::string parameter;
    std::string message;
    bool missing_required{false};
};

// All violations found in one pass
class ValidationReport {
public:
    void add(ValidationViolation violation);

    bool is_valid() const noexcept;
    const std::vector<ValidationViolation>& violations() const noexcept;

    // PARAMETER_REQUIRED when every violation is a missing field
    std::string code() const;

    // "Parameter validation failed: a; b; c"
    std::string message() const;

    // Throws ValidationException(message(), code()) unless valid
    void throw_if_invalid() const;

private:
    std::vector<ValidationViolation> violations_;
};

class Validator {
public:
    static ValidationReport validate(const nlohmann::json& params,
                                     const ParameterSchema& schema,
                                     const ErrorCatalog& catalog);
};

// Shared, stateless catalog used where no catalog is supplied
const ErrorCatalog& default_error_catalog();

// ==================== Single-value helpers ====================

bool is_blank(const std::string& s);

const std::string& require_non_empty(const std::string& value, const std::string& name,
                                     const ErrorCatalog& catalog = default_error_catalog());

const nlohmann::json& require_non_empty(const nlohmann::json& value, const std::string& name,
                                        const ErrorCatalog& catalog = default_error_catalog());

template <typename T>
const T& require_non_empty(const std::optional<T>& value, const std::string& name,
                           const ErrorCatalog& catalog = default_error_catalog()) {
    if (!value.has_value()) {
        throw ValidationException(catalog.parameter_required(name),
                                  error_codes::ParameterRequired);
    }
    if constexpr (std::is_same_v<T, std::string>) {
        if (is_blank(*value)) {
            throw ValidationException(catalog.parameter_required(name),
                                      error_codes::ParameterRequired);
        }
    }
    return *value;
}

template <typename T>
T require_positive(T value, const std::string& name,
                   const ErrorCatalog& catalog = default_error_catalog()) {
    static_assert(std::is_arithmetic_v<T>, "require_positive needs a numeric value");
    if (!(value > T{0})) {
        throw ValidationException(catalog.must_be_positive(name));
    }
    return value;
}

template <typename T>
T require_in_range(T value, T min, T max, const std::string& name,
                   const ErrorCatalog& catalog = default_error_catalog()) {
    static_assert(std::is_arithmetic_v<T>, "require_in_range needs a numeric value");
    if (value < min || value > max) {
        throw ValidationException(catalog.range_validation_failed(
            name, static_cast<double>(min), static_cast<double>(max)));
    }
    return value;
}

template <typename Collection>
const Collection& require_non_empty_collection(const Collection& collection,
                                               const std::string& name,
                                               const ErrorCatalog& catalog = default_error_catalog()) {
    if (collection.empty()) {
        throw ValidationException(catalog.cannot_be_empty(name));
    }
    return collection;
}

} // namespace toolgov
