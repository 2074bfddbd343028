#include "toolgov/resource_lifecycle.hpp"

#include <exception>

namespace toolgov {

ResourceLifecycle::ResourceLifecycle(std::string owner_name, bool release_on_failure)
    : owner_name_(std::move(owner_name))
    , release_on_failure_(release_on_failure) {}

ResourceLifecycle::~ResourceLifecycle() {
    if (!is_released()) {
        emit(EventType::ToolLeaked, LogLevel::Error,
             "Destroyed without release(); external handles may have leaked");
    }
}

void ResourceLifecycle::release() {
    std::lock_guard<std::mutex> lock(release_mutex_);
    if (released_.load(std::memory_order_relaxed)) {
        return;
    }
    // Marked before running so a failed teardown is never retried
    released_.store(true, std::memory_order_release);

    std::exception_ptr first_failure;
    try {
        release_managed();
    } catch (...) {
        first_failure = std::current_exception();
    }
    try {
        release_unmanaged();
    } catch (...) {
        if (!first_failure) {
            first_failure = std::current_exception();
        }
    }

    if (first_failure) {
        emit(EventType::ToolReleaseFailed, LogLevel::Error, "Release failed");
        std::rethrow_exception(first_failure);
    }
    emit(EventType::ToolReleased, LogLevel::Info, "Resources released");
}

std::future<void> ResourceLifecycle::release_async() {
    return std::async(std::launch::async, [this] { release(); });
}

void ResourceLifecycle::set_lifecycle_monitor(std::shared_ptr<Monitor> monitor) {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    monitor_ = std::move(monitor);
}

void ResourceLifecycle::emit(EventType type, LogLevel level, const std::string& message) const {
    std::shared_ptr<Monitor> monitor;
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        monitor = monitor_;
    }
    notify(monitor.get(), make_event(type, level, message, owner_name_));
}

} // namespace toolgov
