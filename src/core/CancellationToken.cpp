#include "CancellationToken.hpp"

namespace mcpkit {

bool CancellationToken::is_cancelled() const noexcept {
    return state_ && state_->load(std::memory_order_acquire);
}

void CancellationToken::throw_if_cancelled() const {
    if (is_cancelled()) {
        throw OperationCancelled();
    }
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<std::atomic<bool>>(false)) {
}

void CancellationSource::cancel() noexcept {
    state_->store(true, std::memory_order_release);
}

bool CancellationSource::is_cancelled() const noexcept {
    return state_->load(std::memory_order_acquire);
}

CancellationToken CancellationSource::token() const {
    return CancellationToken(state_);
}

} // namespace mcpkit
