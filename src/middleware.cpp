#include "toolgov/middleware.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace toolgov {

namespace {

void report_hook_failure(Monitor* monitor, const std::string& tool_name,
                         const char* hook, const std::string& details) {
    if (!monitor) return;
    notify(monitor, make_event(EventType::MiddlewareHookFailed, LogLevel::Warning,
                               std::string(hook) + " hook failed: " + details, tool_name));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// MiddlewareRegistry
// ---------------------------------------------------------------------------

void MiddlewareRegistry::add(MiddlewarePtr middleware) {
    if (!middleware) {
        throw std::invalid_argument("MiddlewareRegistry::add: null middleware");
    }
    MiddlewareOrder order = middleware->order();
    std::shared_ptr<Monitor> monitor;
    {
        std::unique_lock lock(mutex_);
        participants_.push_back(std::move(middleware));
        monitor = monitor_;
    }
    notify(monitor.get(), make_event(EventType::MiddlewareRegistered, LogLevel::Debug,
                                     "Middleware registered with order " +
                                         std::to_string(order)));
}

std::vector<MiddlewarePtr> MiddlewareRegistry::snapshot() const {
    std::shared_lock lock(mutex_);
    return participants_;
}

std::size_t MiddlewareRegistry::size() const {
    std::shared_lock lock(mutex_);
    return participants_.size();
}

void MiddlewareRegistry::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::unique_lock lock(mutex_);
    monitor_ = std::move(monitor);
}

// ---------------------------------------------------------------------------
// MiddlewareChain
// ---------------------------------------------------------------------------

MiddlewareChain MiddlewareChain::compose(const std::vector<MiddlewarePtr>& global,
                                         const std::vector<MiddlewarePtr>& tool_local) {
    // Order is read once per participant so a concurrent set_order()
    // cannot make the comparator inconsistent mid-sort.
    std::vector<std::pair<MiddlewareOrder, MiddlewarePtr>> keyed;
    keyed.reserve(global.size() + tool_local.size());

    auto collect = [&keyed](const std::vector<MiddlewarePtr>& source) {
        for (const auto& m : source) {
            if (m && m->is_enabled()) {
                keyed.emplace_back(m->order(), m);
            }
        }
    };
    collect(global);
    collect(tool_local);

    std::stable_sort(keyed.begin(), keyed.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    MiddlewareChain chain;
    chain.participants_.reserve(keyed.size());
    for (auto& [order, m] : keyed) {
        chain.participants_.push_back(std::move(m));
    }
    return chain;
}

void MiddlewareChain::run_before(const std::string& tool_name, const nlohmann::json& params,
                                 const CancellationToken& token) const {
    for (const auto& m : participants_) {
        token.throw_if_cancellation_requested();
        m->before_execution(tool_name, params);
    }
}

void MiddlewareChain::run_after(const std::string& tool_name, const nlohmann::json& params,
                                const nlohmann::json& result, double elapsed_ms,
                                Monitor* monitor) const {
    for (auto it = participants_.rbegin(); it != participants_.rend(); ++it) {
        try {
            (*it)->after_execution(tool_name, params, result, elapsed_ms);
        } catch (const std::exception& e) {
            report_hook_failure(monitor, tool_name, "after_execution", e.what());
        } catch (...) {
            report_hook_failure(monitor, tool_name, "after_execution", "unknown error");
        }
    }
}

void MiddlewareChain::run_on_error(const std::string& tool_name, const nlohmann::json& params,
                                   const std::exception& error, double elapsed_ms,
                                   Monitor* monitor) const {
    for (auto it = participants_.rbegin(); it != participants_.rend(); ++it) {
        try {
            (*it)->on_error(tool_name, params, error, elapsed_ms);
        } catch (const std::exception& e) {
            report_hook_failure(monitor, tool_name, "on_error", e.what());
        } catch (...) {
            report_hook_failure(monitor, tool_name, "on_error", "unknown error");
        }
    }
}

} // namespace toolgov
