#include "toolgov/error_catalog.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <mutex>
#include <sstream>

namespace toolgov {

namespace {

std::string format_number(double v) {
    if (std::isfinite(v) && std::floor(v) == v && std::fabs(v) < 1e15) {
        return std::to_string(static_cast<long long>(v));
    }
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

std::string to_lower(std::string s) {
    for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return s;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

bool any_tool_contains(const std::vector<std::string>& tools, const std::string& fragment) {
    return std::any_of(tools.begin(), tools.end(),
                       [&](const std::string& t) { return contains(t, fragment); });
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ErrorRecord serialization
// ---------------------------------------------------------------------------

void to_json(nlohmann::json& j, const SuggestedAction& action) {
    j = nlohmann::json{{"tool", action.tool}, {"description", action.description}};
    if (!action.parameters.is_null()) {
        j["parameters"] = action.parameters;
    }
}

void to_json(nlohmann::json& j, const RecoveryInfo& recovery) {
    j = nlohmann::json{{"steps", recovery.steps},
                       {"suggestedActions", recovery.suggested_actions}};
}

void to_json(nlohmann::json& j, const ErrorRecord& record) {
    j = nlohmann::json{{"code", record.code},
                       {"message", record.message},
                       {"recovery", record.recovery}};
}

nlohmann::json ErrorRecord::to_json() const {
    nlohmann::json j;
    toolgov::to_json(j, *this);
    return j;
}

// ---------------------------------------------------------------------------
// ErrorCatalog -- messages
// ---------------------------------------------------------------------------

std::string ErrorCatalog::validation_failed(const std::string& param_name,
                                            const std::string& requirement) const {
    return "Parameter '" + param_name + "' validation failed: " + requirement;
}

std::string ErrorCatalog::tool_execution_failed(const std::string& tool_name,
                                                const std::string& details) const {
    return "Tool '" + tool_name + "' execution failed: " + details;
}

std::string ErrorCatalog::parameter_required(const std::string& param_name) const {
    return "Parameter '" + param_name + "' is required";
}

std::string ErrorCatalog::range_validation_failed(const std::string& param_name,
                                                  double min, double max) const {
    return "Parameter '" + param_name + "' must be between " +
           format_number(min) + " and " + format_number(max);
}

std::string ErrorCatalog::must_be_positive(const std::string& param_name) const {
    return "Parameter '" + param_name + "' must be positive";
}

std::string ErrorCatalog::cannot_be_empty(const std::string& param_name) const {
    return "Parameter '" + param_name + "' cannot be empty";
}

std::string ErrorCatalog::budget_exceeded(const std::string& tool_name,
                                          TokenCount estimate, TokenCount max_tokens) const {
    return "Tool '" + tool_name + "' estimated tokens (" + std::to_string(estimate) +
           ") exceeds budget (" + std::to_string(max_tokens) + ")";
}

std::string ErrorCatalog::tool_released(const std::string& tool_name) const {
    return "Tool '" + tool_name + "' has already released its resources";
}

// ---------------------------------------------------------------------------
// ErrorCatalog -- recovery
// ---------------------------------------------------------------------------

RecoveryInfo ErrorCatalog::recovery_info(const std::string& code,
                                         const std::string& /*context*/) const {
    {
        std::shared_lock lock(codes_mutex_);
        auto it = domain_codes_.find(code);
        if (it != domain_codes_.end() && !it->second.empty()) {
            return RecoveryInfo{it->second, {}};
        }
    }

    RecoveryInfo info;
    if (code == error_codes::ValidationError || code == error_codes::ParameterRequired) {
        info.steps = {
            "Check the parameter requirements in the tool documentation",
            "Ensure all required parameters are provided",
            "Verify parameter types and ranges are correct"
        };
    } else if (code == error_codes::ToolError) {
        info.steps = {
            "Review the error message for specific details",
            "Check if resources are available and accessible",
            "Retry the operation if the error is transient"
        };
    } else if (code == error_codes::Timeout) {
        info.steps = {
            "Consider using smaller input data",
            "Increase timeout if configurable",
            "Check system resources and network connectivity"
        };
    } else if (code == error_codes::ResourceLimitExceeded) {
        info.steps = {
            "Reduce the size of the request",
            "Process data in smaller batches",
            "Check token budget configuration"
        };
    } else if (code == error_codes::ToolReleased) {
        info.steps = {
            "Obtain a fresh tool instance from the registry",
            "Check whether the tool is configured to release on failure"
        };
    } else if (code == error_codes::ToolNotFound) {
        info.steps = {
            "Check the tool name for typos",
            "List the registered tools and pick an available one"
        };
    } else {
        info.steps = {"Check the error details and retry if appropriate"};
    }
    return info;
}

std::vector<SuggestedAction> ErrorCatalog::suggested_actions(const std::string& /*code*/,
                                                             const std::string& /*tool_name*/) const {
    return {};
}

std::string ErrorCatalog::classify_failure(const std::string& /*details*/) const {
    return error_codes::ToolError;
}

void ErrorCatalog::register_code(const std::string& code,
                                 std::vector<std::string> recovery_steps) {
    std::unique_lock lock(codes_mutex_);
    domain_codes_[code] = std::move(recovery_steps);
}

bool ErrorCatalog::has_code(const std::string& code) const {
    std::shared_lock lock(codes_mutex_);
    return domain_codes_.count(code) > 0;
}

ErrorRecord ErrorCatalog::lookup(const std::string& code,
                                 const std::string& message,
                                 const std::string& tool_name) const {
    ErrorRecord record;
    record.code = code;
    record.message = message;
    record.recovery = recovery_info(code, message);
    if (record.recovery.steps.empty()) {
        record.recovery.steps.push_back("Check the error details and retry if appropriate");
    }
    auto actions = suggested_actions(code, tool_name);
    for (auto& a : actions) {
        record.recovery.suggested_actions.push_back(std::move(a));
    }
    return record;
}

// ---------------------------------------------------------------------------
// AlternativeToolCatalog
// ---------------------------------------------------------------------------

AlternativeToolCatalog::AlternativeToolCatalog(ToolNameProvider tool_names,
                                               ErrorRecoveryOptions options,
                                               std::shared_ptr<Monitor> monitor)
    : tool_names_(std::move(tool_names))
    , options_(options)
    , monitor_(std::move(monitor)) {}

const ErrorRecoveryOptions& AlternativeToolCatalog::options() const noexcept {
    return options_;
}

std::vector<std::string> AlternativeToolCatalog::available_tools() const {
    if (!tool_names_) {
        return {};
    }
    try {
        return tool_names_();
    } catch (const std::exception& ex) {
        notify(monitor_.get(), make_event(EventType::ErrorCatalogFailure, LogLevel::Warning,
                                          std::string("Tool name provider failed: ") + ex.what()));
        return {};
    }
}

std::vector<std::string> AlternativeToolCatalog::enhanced_steps(
    const std::string& code, const std::vector<std::string>& tools) const {
    std::vector<std::string> steps;

    if (code == error_codes::TypeVerification) {
        if (any_tool_contains(tools, "goto_definition"))
            steps.push_back("Use goto_definition to verify exact method signatures and types");
        if (any_tool_contains(tools, "symbol_search"))
            steps.push_back("Use symbol_search to find comprehensive type information");
    } else if (code == error_codes::FileNotFound) {
        if (any_tool_contains(tools, "file_search"))
            steps.push_back("Use file_search to locate files by name or pattern");
        if (any_tool_contains(tools, "directory_search"))
            steps.push_back("Use directory_search to explore project structure");
    } else if (code == error_codes::WorkspaceNotIndexed) {
        if (any_tool_contains(tools, "index_workspace"))
            steps.push_back("Run index_workspace to enable high-performance search capabilities");
    }

    return steps;
}

RecoveryInfo AlternativeToolCatalog::recovery_info(const std::string& code,
                                                   const std::string& context) const {
    RecoveryInfo base = ErrorCatalog::recovery_info(code, context);
    if (!options_.enable_recovery_guidance) {
        return base;
    }

    auto tools = available_tools();
    if (tools.empty()) {
        return base;
    }

    auto steps = enhanced_steps(code, tools);
    if (!steps.empty()) {
        base.steps = std::move(steps);
    }
    return base;
}

std::vector<SuggestedAction> AlternativeToolCatalog::suggested_actions(
    const std::string& code, const std::string& tool_name) const {
    auto actions = ErrorCatalog::suggested_actions(code, tool_name);
    if (!options_.suggest_alternative_tools) {
        return actions;
    }

    for (const auto& candidate : available_tools()) {
        if (candidate == tool_name) continue;

        bool relevant = false;
        std::string description;
        if (code == error_codes::TypeVerification) {
            relevant = contains(candidate, "definition") || contains(candidate, "symbol") ||
                       contains(candidate, "reference");
            description = "Try using " + candidate + " for accurate type information";
        } else if (code == error_codes::FileNotFound) {
            relevant = contains(candidate, "file") || contains(candidate, "directory");
            description = "Try using " + candidate + " to locate the missing file";
        } else if (code == error_codes::WorkspaceNotIndexed) {
            relevant = contains(candidate, "index");
            description = "Try running " + candidate + " before retrying";
        }

        if (relevant) {
            actions.push_back(SuggestedAction{candidate, description,
                                              nlohmann::json{{"tool_name", candidate}}});
        }
    }
    return actions;
}

std::string AlternativeToolCatalog::classify_failure(const std::string& details) const {
    const std::string lower = to_lower(details);

    if (contains(lower, "file not found") || contains(lower, "path not found")) {
        return error_codes::FileNotFound;
    }
    if (contains(lower, "access") && contains(lower, "denied")) {
        return error_codes::AccessDenied;
    }
    if (contains(lower, "timeout") || contains(lower, "timed out")) {
        return error_codes::Timeout;
    }
    if (contains(lower, "not indexed") || contains(lower, "workspace")) {
        return error_codes::WorkspaceNotIndexed;
    }
    return error_codes::ToolError;
}

std::string AlternativeToolCatalog::type_verification_error(const std::string& type_name,
                                                            const std::string& suggestion) const {
    return "Type '" + type_name + "' could not be verified. Consider using " +
           suggestion + " for accurate type information.";
}

std::string AlternativeToolCatalog::file_not_found_error(const std::string& file_path) const {
    return "File not found: " + file_path;
}

std::string AlternativeToolCatalog::workspace_not_indexed_error() const {
    return "Workspace indexing required for optimal search performance. "
           "Run index_workspace first.";
}

} // namespace toolgov
