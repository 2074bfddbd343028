#pragma once

#include "toolgov/config.hpp"
#include "toolgov/error_record.hpp"
#include "toolgov/monitor.hpp"

#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolgov {

// Maps an error code to a message, ordered recovery steps and optional
// suggested follow-up actions. Override per tool or per deployment.
class ErrorCatalog {
public:
    ErrorCatalog() = default;
    virtual ~ErrorCatalog() = default;

    ErrorCatalog(const ErrorCatalog&) = delete;
    ErrorCatalog& operator=(const ErrorCatalog&) = delete;

    // ==================== Message builders ====================

    virtual std::string validation_failed(const std::string& param_name,
                                          const std::string& requirement) const;
    virtual std::string tool_execution_failed(const std::string& tool_name,
                                              const std::string& details) const;
    virtual std::string parameter_required(const std::string& param_name) const;
    virtual std::string range_validation_failed(const std::string& param_name,
                                                double min, double max) const;
    virtual std::string must_be_positive(const std::string& param_name) const;
    virtual std::string cannot_be_empty(const std::string& param_name) const;
    virtual std::string budget_exceeded(const std::string& tool_name,
                                        TokenCount estimate, TokenCount max_tokens) const;
    virtual std::string tool_released(const std::string& tool_name) const;

    // ==================== Recovery ====================

    virtual RecoveryInfo recovery_info(const std::string& code,
                                       const std::string& context = {}) const;
    virtual std::vector<SuggestedAction> suggested_actions(const std::string& code,
                                                           const std::string& tool_name) const;

    // Map free-form failure text from a tool body to a code
    virtual std::string classify_failure(const std::string& details) const;

    // Domain codes registered by tool authors. Steps replace the generic
    // fallback for that code.
    void register_code(const std::string& code, std::vector<std::string> recovery_steps);
    bool has_code(const std::string& code) const;

    // Assemble a fresh record: message, steps (never empty), suggestions
    ErrorRecord lookup(const std::string& code,
                       const std::string& message,
                       const std::string& tool_name = {}) const;

private:
    mutable std::shared_mutex codes_mutex_;
    std::unordered_map<std::string, std::vector<std::string>> domain_codes_;
};

using ToolNameProvider = std::function<std::vector<std::string>()>;

// Catalog that knows which tools are currently registered and turns
// generic advice into "try tool X" guidance. Degrades to the base
// catalog when the provider is empty, absent or failing.
class AlternativeToolCatalog : public ErrorCatalog {
public:
    explicit AlternativeToolCatalog(ToolNameProvider tool_names,
                                    ErrorRecoveryOptions options = ErrorRecoveryOptions{},
                                    std::shared_ptr<Monitor> monitor = nullptr);

    RecoveryInfo recovery_info(const std::string& code,
                               const std::string& context = {}) const override;
    std::vector<SuggestedAction> suggested_actions(const std::string& code,
                                                   const std::string& tool_name) const override;
    std::string classify_failure(const std::string& details) const override;

    // Domain message helpers
    std::string type_verification_error(const std::string& type_name,
                                         const std::string& suggestion) const;
    std::string file_not_found_error(const std::string& file_path) const;
    std::string workspace_not_indexed_error() const;

    const ErrorRecoveryOptions& options() const noexcept;

private:
    ToolNameProvider tool_names_;
    ErrorRecoveryOptions options_;
    std::shared_ptr<Monitor> monitor_;

    std::vector<std::string> available_tools() const;
    std::vector<std::string> enhanced_steps(const std::string& code,
                                            const std::vector<std::string>& tools) const;
};

} // namespace toolgov
