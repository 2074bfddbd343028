#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace toolgov {

// Built-in error codes. Tools may register additional domain codes
// with an ErrorCatalog; they reuse the same ErrorRecord shape.
namespace error_codes {

inline constexpr const char* ValidationError       = "VALIDATION_ERROR";
inline constexpr const char* ParameterRequired     = "PARAMETER_REQUIRED";
inline constexpr const char* ToolError             = "TOOL_ERROR";
inline constexpr const char* Timeout               = "TIMEOUT";
inline constexpr const char* ResourceLimitExceeded = "RESOURCE_LIMIT_EXCEEDED";
inline constexpr const char* ToolReleased          = "TOOL_RELEASED";
inline constexpr const char* ToolNotFound          = "TOOL_NOT_FOUND";

// Domain codes understood by AlternativeToolCatalog
inline constexpr const char* FileNotFound          = "FILE_NOT_FOUND";
inline constexpr const char* AccessDenied          = "ACCESS_DENIED";
inline constexpr const char* TypeVerification      = "TYPE_VERIFICATION_ERROR";
inline constexpr const char* WorkspaceNotIndexed   = "WORKSPACE_NOT_INDEXED";

} // namespace error_codes

struct SuggestedAction {
    std::string tool;
    std::string description;
    nlohmann::json parameters;
};

struct RecoveryInfo {
    std::vector<std::string> steps;
    std::vector<SuggestedAction> suggested_actions;
};

// Created fresh per failure, never persisted.
struct ErrorRecord {
    std::string code;
    std::string message;
    RecoveryInfo recovery;

    nlohmann::json to_json() const;
};

void to_json(nlohmann::json& j, const SuggestedAction& action);
void to_json(nlohmann::json& j, const RecoveryInfo& recovery);
void to_json(nlohmann::json& j, const ErrorRecord& record);

} // namespace toolgov
