#include "toolgov/validation.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace toolgov {

const char* to_string(ValueType t) {
    switch (t) {
        case ValueType::Any:     return "any";
        case ValueType::String:  return "string";
        case ValueType::Number:  return "number";
        case ValueType::Integer: return "integer";
        case ValueType::Boolean: return "boolean";
        case ValueType::Array:   return "array";
        case ValueType::Object:  return "object";
    }
    return "unknown";
}

namespace {

bool matches_type(const nlohmann::json& value, ValueType type) {
    switch (type) {
        case ValueType::Any:     return true;
        case ValueType::String:  return value.is_string();
        case ValueType::Number:  return value.is_number();
        case ValueType::Integer: return value.is_number_integer();
        case ValueType::Boolean: return value.is_boolean();
        case ValueType::Array:   return value.is_array();
        case ValueType::Object:  return value.is_object();
    }
    return false;
}

std::string format_bound(double v) {
    std::ostringstream oss;
    if (std::floor(v) == v && std::fabs(v) < 1e15) {
        oss << static_cast<long long>(v);
    } else {
        oss << v;
    }
    return oss.str();
}

void check_field(const ParameterRule& rule,
                 const std::shared_ptr<const std::regex>& regex,
                 const nlohmann::json& value,
                 const ErrorCatalog& catalog,
                 ValidationReport& report) {
    if (!matches_type(value, rule.type)) {
        report.add({rule.name,
                    catalog.validation_failed(rule.name,
                        std::string("expected ") + to_string(rule.type) +
                        " but got " + value.type_name()),
                    false});
        return;
    }

    if (value.is_number() && (rule.minimum || rule.maximum)) {
        const double v = value.get<double>();
        const bool below = rule.minimum && v < *rule.minimum;
        const bool above = rule.maximum && v > *rule.maximum;
        if (below || above) {
            std::string message;
            if (rule.minimum && rule.maximum) {
                message = catalog.range_validation_failed(rule.name, *rule.minimum, *rule.maximum);
            } else if (rule.minimum) {
                message = catalog.validation_failed(rule.name,
                    "must be at least " + format_bound(*rule.minimum));
            } else {
                message = catalog.validation_failed(rule.name,
                    "must be at most " + format_bound(*rule.maximum));
            }
            report.add({rule.name, message, false});
        }
    }

    if (value.is_string()) {
        const auto& str = value.get_ref<const std::string&>();
        const std::size_t len = str.size();
        const bool too_short = rule.min_length && len < *rule.min_length;
        const bool too_long = rule.max_length && len > *rule.max_length;
        if (too_short || too_long) {
            std::string requirement;
            if (rule.min_length && rule.max_length && *rule.min_length > 0) {
                requirement = "must be between " + std::to_string(*rule.min_length) +
                              " and " + std::to_string(*rule.max_length) + " characters";
            } else if (rule.max_length) {
                requirement = "must not exceed " + std::to_string(*rule.max_length) +
                              " characters";
            } else {
                requirement = "must be at least " + std::to_string(*rule.min_length) +
                              " characters";
            }
            report.add({rule.name, catalog.validation_failed(rule.name, requirement), false});
        }

        if (!regex || too_short || too_long) return;
        if (len > ParameterSchema::kMaxPatternInputLength) {
            report.add({rule.name,
                        catalog.validation_failed(rule.name,
                            "is too long to match pattern (limit " +
                            std::to_string(ParameterSchema::kMaxPatternInputLength) +
                            " characters)"),
                        false});
            return;
        }
        if (!std::regex_match(str, *regex)) {
            report.add({rule.name,
                        catalog.validation_failed(rule.name,
                            "must match pattern '" + *rule.pattern + "'"),
                        false});
        }
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ParameterSchema
// ---------------------------------------------------------------------------

ParameterSchema& ParameterSchema::add(ParameterRule rule) {
    std::shared_ptr<const std::regex> compiled;
    if (rule.pattern) {
        compiled = std::make_shared<const std::regex>(*rule.pattern, std::regex::ECMAScript);
    }
    rules_.push_back(std::move(rule));
    patterns_.push_back(std::move(compiled));
    return *this;
}

ParameterSchema& ParameterSchema::required(std::string name, ValueType type) {
    ParameterRule rule;
    rule.name = std::move(name);
    rule.required = true;
    rule.type = type;
    return add(std::move(rule));
}

ParameterSchema& ParameterSchema::optional(std::string name, ValueType type) {
    ParameterRule rule;
    rule.name = std::move(name);
    rule.type = type;
    return add(std::move(rule));
}

ParameterSchema& ParameterSchema::range(std::string name, double minimum, double maximum,
                                        bool is_required) {
    ParameterRule rule;
    rule.name = std::move(name);
    rule.required = is_required;
    rule.type = ValueType::Number;
    rule.minimum = minimum;
    rule.maximum = maximum;
    return add(std::move(rule));
}

ParameterSchema& ParameterSchema::length(std::string name, std::size_t min_length,
                                         std::size_t max_length, bool is_required) {
    ParameterRule rule;
    rule.name = std::move(name);
    rule.required = is_required;
    rule.type = ValueType::String;
    rule.min_length = min_length;
    rule.max_length = max_length;
    return add(std::move(rule));
}

ParameterSchema& ParameterSchema::pattern(std::string name, std::string regex, bool is_required) {
    ParameterRule rule;
    rule.name = std::move(name);
    rule.required = is_required;
    rule.type = ValueType::String;
    rule.pattern = std::move(regex);
    return add(std::move(rule));
}

const std::vector<ParameterRule>& ParameterSchema::rules() const noexcept {
    return rules_;
}

bool ParameterSchema::has_required_fields() const {
    return std::any_of(rules_.begin(), rules_.end(),
                       [](const ParameterRule& r) { return r.required; });
}

bool ParameterSchema::empty() const noexcept {
    return rules_.empty();
}

// ---------------------------------------------------------------------------
// ValidationReport
// ---------------------------------------------------------------------------

void ValidationReport::add(ValidationViolation violation) {
    violations_.push_back(std::move(violation));
}

bool ValidationReport::is_valid() const noexcept {
    return violations_.empty();
}

const std::vector<ValidationViolation>& ValidationReport::violations() const noexcept {
    return violations_;
}

std::string ValidationReport::code() const {
    if (violations_.empty()) {
        return {};
    }
    bool all_missing = std::all_of(violations_.begin(), violations_.end(),
                                   [](const ValidationViolation& v) { return v.missing_required; });
    return all_missing ? error_codes::ParameterRequired : error_codes::ValidationError;
}

std::string ValidationReport::message() const {
    std::string out = "Parameter validation failed: ";
    for (std::size_t i = 0; i < violations_.size(); ++i) {
        if (i > 0) out += "; ";
        out += violations_[i].message;
    }
    return out;
}

void ValidationReport::throw_if_invalid() const {
    if (!is_valid()) {
        throw ValidationException(message(), code());
    }
}

// ---------------------------------------------------------------------------
// Validator
// ---------------------------------------------------------------------------

ValidationReport Validator::validate(const nlohmann::json& params,
                                     const ParameterSchema& schema,
                                     const ErrorCatalog& catalog) {
    ValidationReport report;

    if (!params.is_null() && !params.is_object()) {
        report.add({"parameters",
                    catalog.validation_failed("parameters",
                        std::string("expected object but got ") + params.type_name()),
                    false});
        return report;
    }

    for (std::size_t i = 0; i < schema.rules_.size(); ++i) {
        const ParameterRule& rule = schema.rules_[i];

        const nlohmann::json* value = nullptr;
        if (params.is_object()) {
            auto it = params.find(rule.name);
            if (it != params.end() && !it->is_null()) {
                value = &*it;
            }
        }

        bool missing = value == nullptr;
        if (!missing && rule.required && value->is_string() &&
            is_blank(value->get_ref<const std::string&>())) {
            missing = true;
        }

        if (missing) {
            if (rule.required) {
                report.add({rule.name, catalog.parameter_required(rule.name), true});
            }
            continue;
        }

        check_field(rule, schema.patterns_[i], *value, catalog, report);
    }

    return report;
}

// ---------------------------------------------------------------------------
// Single-value helpers
// ---------------------------------------------------------------------------

const ErrorCatalog& default_error_catalog() {
    static const ErrorCatalog catalog;
    return catalog;
}

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

const std::string& require_non_empty(const std::string& value, const std::string& name,
                                     const ErrorCatalog& catalog) {
    if (is_blank(value)) {
        throw ValidationException(catalog.parameter_required(name),
                                  error_codes::ParameterRequired);
    }
    return value;
}

const nlohmann::json& require_non_empty(const nlohmann::json& value, const std::string& name,
                                        const ErrorCatalog& catalog) {
    if (value.is_null() ||
        (value.is_string() && is_blank(value.get_ref<const std::string&>()))) {
        throw ValidationException(catalog.parameter_required(name),
                                  error_codes::ParameterRequired);
    }
    return value;
}

} // namespace toolgov
