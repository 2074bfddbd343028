#pragma once

#include "toolgov/cancellation.hpp"
#include "toolgov/monitor.hpp"
#include "toolgov/types.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <exception>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace toolgov {

// Lifecycle participant wrapped around every tool invocation.
// One instance serves many concurrent invocations; any shared state it
// keeps must be thread-safe.
class Middleware {
public:
    virtual ~Middleware() = default;

    // Ascending order runs earlier in before_execution and later in
    // after_execution / on_error
    virtual MiddlewareOrder order() const = 0;
    virtual bool is_enabled() const = 0;

    // Throwing aborts the invocation before later pre-hooks run
    virtual void before_execution(const std::string& tool_name,
                                  const nlohmann::json& params) = 0;

    virtual void after_execution(const std::string& tool_name,
                                 const nlohmann::json& params,
                                 const nlohmann::json& result,
                                 double elapsed_ms) = 0;

    // `error` is a ToolExecutionError or an OperationCancelledException
    virtual void on_error(const std::string& tool_name,
                          const nlohmann::json& params,
                          const std::exception& error,
                          double elapsed_ms) = 0;
};

// Convenience base: no-op hooks, order and enabled flag adjustable at
// runtime (takes effect on the next invocation).
class SimpleMiddleware : public Middleware {
public:
    explicit SimpleMiddleware(MiddlewareOrder order = 0, bool enabled = true)
        : order_(order), enabled_(enabled) {}

    MiddlewareOrder order() const override { return order_.load(std::memory_order_relaxed); }
    bool is_enabled() const override { return enabled_.load(std::memory_order_relaxed); }

    void set_order(MiddlewareOrder order) { order_.store(order, std::memory_order_relaxed); }
    void set_enabled(bool enabled) { enabled_.store(enabled, std::memory_order_relaxed); }

    void before_execution(const std::string&, const nlohmann::json&) override {}
    void after_execution(const std::string&, const nlohmann::json&,
                         const nlohmann::json&, double) override {}
    void on_error(const std::string&, const nlohmann::json&,
                  const std::exception&, double) override {}

private:
    std::atomic<MiddlewareOrder> order_;
    std::atomic<bool> enabled_;
};

using MiddlewarePtr = std::shared_ptr<Middleware>;

// Process-wide participants. Append-only; readers take a copy.
class MiddlewareRegistry {
public:
    MiddlewareRegistry() = default;

    MiddlewareRegistry(const MiddlewareRegistry&) = delete;
    MiddlewareRegistry& operator=(const MiddlewareRegistry&) = delete;

    // Throws std::invalid_argument on a null participant
    void add(MiddlewarePtr middleware);

    std::vector<MiddlewarePtr> snapshot() const;
    std::size_t size() const;

    void set_monitor(std::shared_ptr<Monitor> monitor);

private:
    mutable std::shared_mutex mutex_;
    std::vector<MiddlewarePtr> participants_;
    std::shared_ptr<Monitor> monitor_;
};

// Enabled participants of one invocation, stably sorted ascending by order.
class MiddlewareChain {
public:
    MiddlewareChain() = default;

    // Global participants first, then the tool's own, disabled ones
    // dropped. Equal orders keep that relative position.
    static MiddlewareChain compose(const std::vector<MiddlewarePtr>& global,
                                   const std::vector<MiddlewarePtr>& tool_local);

    const std::vector<MiddlewarePtr>& participants() const noexcept { return participants_; }
    std::size_t size() const noexcept { return participants_.size(); }
    bool empty() const noexcept { return participants_.empty(); }

    // Ascending. Checks `token` before each hook; the first exception
    // (including OperationCancelledException) propagates.
    void run_before(const std::string& tool_name, const nlohmann::json& params,
                    const CancellationToken& token) const;

    // Descending. Hook failures are reported to `monitor` and the
    // remaining hooks still run.
    void run_after(const std::string& tool_name, const nlohmann::json& params,
                   const nlohmann::json& result, double elapsed_ms,
                   Monitor* monitor) const;

    // Descending. Hook failures never replace `error`.
    void run_on_error(const std::string& tool_name, const nlohmann::json& params,
                      const std::exception& error, double elapsed_ms,
                      Monitor* monitor) const;

private:
    std::vector<MiddlewarePtr> participants_;
};

} // namespace toolgov
