#include "toolgov/tool.hpp"

#include <stdexcept>

namespace toolgov {

Tool::Tool(std::string name, std::string description, ToolCategory category)
    : name_(std::move(name))
    , description_(std::move(description))
    , category_(category) {
    if (is_blank(name_)) {
        throw std::invalid_argument("Tool name cannot be empty");
    }
}

void Tool::set_budget(BudgetConfiguration budget) {
    budget.validate();
    std::lock_guard<std::mutex> lock(config_mutex_);
    budget_ = budget;
}

std::optional<BudgetConfiguration> Tool::budget() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return budget_;
}

void Tool::add_middleware(MiddlewarePtr middleware) {
    if (!middleware) {
        throw std::invalid_argument("Tool::add_middleware: null middleware");
    }
    std::lock_guard<std::mutex> lock(config_mutex_);
    middleware_.push_back(std::move(middleware));
}

std::vector<MiddlewarePtr> Tool::middleware() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return middleware_;
}

void Tool::set_error_catalog(std::shared_ptr<const ErrorCatalog> catalog) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    catalog_ = std::move(catalog);
}

std::shared_ptr<const ErrorCatalog> Tool::error_catalog() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return catalog_;
}

std::shared_ptr<const ErrorCatalog> Tool::catalog() const {
    if (auto own = error_catalog()) return own;
    // Aliasing constructor: points at the process-wide default, owns nothing
    return std::shared_ptr<const ErrorCatalog>(std::shared_ptr<const ErrorCatalog>(),
                                               &default_error_catalog());
}

} // namespace toolgov
