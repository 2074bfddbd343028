#include "toolgov/cancellation.hpp"
#include "toolgov/exceptions.hpp"

namespace toolgov {

CancellationToken::CancellationToken(std::shared_ptr<const std::atomic<bool>> flag)
    : flag_(std::move(flag)) {}

bool CancellationToken::is_cancellation_requested() const noexcept {
    return flag_ && flag_->load(std::memory_order_acquire);
}

bool CancellationToken::can_be_cancelled() const noexcept {
    return static_cast<bool>(flag_);
}

void CancellationToken::throw_if_cancellation_requested() const {
    if (is_cancellation_requested()) {
        throw OperationCancelledException();
    }
}

CancellationSource::CancellationSource()
    : flag_(std::make_shared<std::atomic<bool>>(false)) {}

CancellationToken CancellationSource::token() const {
    return CancellationToken(flag_);
}

void CancellationSource::cancel() noexcept {
    flag_->store(true, std::memory_order_release);
}

bool CancellationSource::is_cancellation_requested() const noexcept {
    return flag_->load(std::memory_order_acquire);
}

} // namespace toolgov
