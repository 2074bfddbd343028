#pragma once

#include "toolgov/monitor.hpp"
#include "toolgov/tool.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <string>

namespace toolgov {

// One-time, ordered teardown for tools holding external handles.
// The owner (normally ToolRegistry) must call release() deterministically;
// destroying an unreleased instance only logs a ToolLeaked event.
class ResourceLifecycle {
public:
    virtual ~ResourceLifecycle();

    ResourceLifecycle(const ResourceLifecycle&) = delete;
    ResourceLifecycle& operator=(const ResourceLifecycle&) = delete;

    // Idempotent. Managed resources first, then unmanaged even if the
    // managed step threw; the first failure is rethrown afterwards.
    void release();
    std::future<void> release_async();

    bool is_released() const noexcept { return released_.load(std::memory_order_acquire); }

    // Release immediately after any failed invocation
    bool release_on_failure() const noexcept {
        return release_on_failure_.load(std::memory_order_relaxed);
    }
    void set_release_on_failure(bool enabled) noexcept {
        release_on_failure_.store(enabled, std::memory_order_relaxed);
    }

    void set_lifecycle_monitor(std::shared_ptr<Monitor> monitor);

protected:
    explicit ResourceLifecycle(std::string owner_name, bool release_on_failure = false);

    // Buffers, caches
    virtual void release_managed() {}

    // Connections, file handles
    virtual void release_unmanaged() {}

private:
    std::string owner_name_;
    std::atomic<bool> release_on_failure_;

    std::mutex release_mutex_;
    std::atomic<bool> released_{false};

    mutable std::mutex monitor_mutex_;
    std::shared_ptr<Monitor> monitor_;

    void emit(EventType type, LogLevel level, const std::string& message) const;
};

// Typed tool that owns external handles
template <typename TParams, typename TResult>
class ScopedResourceTool : public TypedTool<TParams, TResult>, public ResourceLifecycle {
public:
    ScopedResourceTool(std::string name, std::string description,
                       ToolCategory category = ToolCategory::General,
                       bool release_on_failure = false)
        : TypedTool<TParams, TResult>(name, std::move(description), category)
        , ResourceLifecycle(name, release_on_failure) {}

    ResourceLifecycle* lifecycle() noexcept override { return this; }
};

} // namespace toolgov
