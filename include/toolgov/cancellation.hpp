#pragma once

#include <atomic>
#include <memory>

namespace toolgov {

class CancellationSource;

// Cooperative cancellation signal. Cheap to copy; a default-constructed
// token can never be cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    bool is_cancellation_requested() const noexcept;
    bool can_be_cancelled() const noexcept;

    // Throws OperationCancelledException once cancellation is requested
    void throw_if_cancellation_requested() const;

    static CancellationToken none() { return CancellationToken{}; }

private:
    explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag);

    std::shared_ptr<const std::atomic<bool>> flag_;

    friend class CancellationSource;
};

// Owned by the caller (transport); fires the tokens it hands out.
class CancellationSource {
public:
    CancellationSource();

    CancellationToken token() const;
    void cancel() noexcept;
    bool is_cancellation_requested() const noexcept;

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace toolgov
