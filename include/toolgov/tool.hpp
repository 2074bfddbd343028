#pragma once

#include "toolgov/cancellation.hpp"
#include "toolgov/config.hpp"
#include "toolgov/error_catalog.hpp"
#include "toolgov/exceptions.hpp"
#include "toolgov/middleware.hpp"
#include "toolgov/shape.hpp"
#include "toolgov/types.hpp"
#include "toolgov/validation.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolgov {

class ResourceLifecycle;

// Type-erased tool as the governor sees it. Configure (schema, budget,
// middleware, catalog) before the tool is shared between threads;
// execute() itself may run concurrently.
class Tool {
public:
    Tool(std::string name, std::string description,
         ToolCategory category = ToolCategory::General);
    virtual ~Tool() = default;

    Tool(const Tool&) = delete;
    Tool& operator=(const Tool&) = delete;

    const std::string& name() const noexcept { return name_; }
    const std::string& description() const noexcept { return description_; }
    ToolCategory category() const noexcept { return category_; }

    // ==================== Validation ====================

    const ParameterSchema& parameter_schema() const noexcept { return schema_; }

    // False: skip structural validation, the body reports malformed input
    bool validates_structure() const noexcept { return validates_structure_; }
    void set_validates_structure(bool enabled) noexcept { validates_structure_ = enabled; }

    // Coerce `params` and run semantic checks. Throws ValidationException.
    virtual void validate(const nlohmann::json& params) const = 0;

    // ==================== Execution ====================

    virtual nlohmann::json execute(const nlohmann::json& params,
                                   const CancellationToken& token) = 0;

    // Declared result shape for pre-execution estimation
    virtual ShapeDescriptor result_shape() const { return ShapeDescriptor::opaque(); }

    // Non-null for tools that own external handles
    virtual ResourceLifecycle* lifecycle() noexcept { return nullptr; }

    // ==================== Per-tool overrides ====================

    // Overrides any registry budget. Throws std::invalid_argument.
    void set_budget(BudgetConfiguration budget);
    std::optional<BudgetConfiguration> budget() const;

    void add_middleware(MiddlewarePtr middleware);
    std::vector<MiddlewarePtr> middleware() const;

    void set_error_catalog(std::shared_ptr<const ErrorCatalog> catalog);
    std::shared_ptr<const ErrorCatalog> error_catalog() const;

protected:
    // Filled by derived constructors
    ParameterSchema& schema() noexcept { return schema_; }

    // Catalog for messages raised from inside the tool. Never null; the
    // returned pointer keeps the catalog alive across set_error_catalog.
    std::shared_ptr<const ErrorCatalog> catalog() const;

private:
    std::string name_;
    std::string description_;
    ToolCategory category_;

    ParameterSchema schema_;
    bool validates_structure_{true};

    mutable std::mutex config_mutex_;
    std::optional<BudgetConfiguration> budget_;
    std::vector<MiddlewarePtr> middleware_;
    std::shared_ptr<const ErrorCatalog> catalog_;
};

// Tool with a concrete parameter and result type. TParams needs an
// nlohmann from_json, TResult a to_json. Coercion failures surface as
// VALIDATION_ERROR.
template <typename TParams, typename TResult>
class TypedTool : public Tool {
public:
    using Params = TParams;
    using Result = TResult;

    using Tool::Tool;

    void validate(const nlohmann::json& params) const override {
        validate_params(coerce(params));
    }

    nlohmann::json execute(const nlohmann::json& params,
                           const CancellationToken& token) override {
        return nlohmann::json(run(coerce(params), token));
    }

    ShapeDescriptor result_shape() const override { return shape_of<TResult>(); }

protected:
    virtual TResult run(const TParams& params, const CancellationToken& token) = 0;

    // Semantic checks after structural validation and coercion
    virtual void validate_params(const TParams&) const {}

    TParams coerce(const nlohmann::json& raw) const {
        try {
            return raw.get<TParams>();
        } catch (const nlohmann::json::exception& e) {
            const auto messages = catalog();
            throw ValidationException(messages->validation_failed("parameters", e.what()));
        }
    }
};

} // namespace toolgov
