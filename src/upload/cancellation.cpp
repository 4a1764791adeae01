#include "mpu/upload/cancellation.hpp"

#include <algorithm>
#include <stdexcept>

namespace mpu::upload {

const char* to_string(CancelReason reason) noexcept {
    switch (reason) {
        case CancelReason::None: return "none";
        case CancelReason::Pausing: return "pausing";
        case CancelReason::Aborted: return "aborted";
    }
    return "unknown";
}

std::size_t CancellationToken::on_cancel(std::function<void(CancelReason)> callback) {
    const std::size_t id = state_->next_callback_id++;
    if (is_cancelled()) {
        callback(state_->reason);
        return id;
    }
    state_->callbacks.emplace_back(id, std::move(callback));
    return id;
}

void CancellationToken::remove_callback(std::size_t id) {
    auto& callbacks = state_->callbacks;
    callbacks.erase(
        std::remove_if(callbacks.begin(), callbacks.end(),
            [id](const auto& entry) { return entry.first == id; }),
        callbacks.end());
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

bool CancellationSource::cancel(CancelReason reason) {
    if (reason == CancelReason::None) {
        throw std::invalid_argument("Cancellation requires a reason");
    }
    if (is_cancelled()) {
        return false;
    }
    state_->reason = reason;

    // Callbacks may register or remove callbacks on the same token.
    auto callbacks = std::move(state_->callbacks);
    state_->callbacks.clear();
    for (auto& entry : callbacks) {
        entry.second(reason);
    }
    return true;
}

} // namespace mpu::upload
