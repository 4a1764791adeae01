#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace mpu::upload {

/**
 * @brief Why an attempt was cancelled
 *
 * Pausing and Aborted are both intentional: the session asked for them and
 * must never report the resulting cancellation as an upload error.
 */
enum class CancelReason {
    None,
    Pausing,
    Aborted
};

const char* to_string(CancelReason reason) noexcept;

[[nodiscard]] inline bool is_intentional(CancelReason reason) noexcept {
    return reason == CancelReason::Pausing || reason == CancelReason::Aborted;
}

namespace detail {

struct CancellationState {
    CancelReason reason = CancelReason::None;
    std::size_t next_callback_id = 0;
    std::vector<std::pair<std::size_t, std::function<void(CancelReason)>>> callbacks;
};

} // namespace detail

/**
 * @brief Observer side of a per-attempt cancellation context
 *
 * Tokens are cheap to copy and all copies observe the same state. A token
 * handed to a transport stays valid after the session that issued it has
 * moved on to a newer attempt.
 */
class CancellationToken {
public:
    [[nodiscard]] bool is_cancelled() const noexcept { return state_->reason != CancelReason::None; }
    [[nodiscard]] CancelReason reason() const noexcept { return state_->reason; }

    /**
     * @brief Register a callback run when the token is cancelled
     *
     * Runs immediately if the token is already cancelled.
     *
     * @return Registration id for remove_callback()
     */
    std::size_t on_cancel(std::function<void(CancelReason)> callback);

    void remove_callback(std::size_t id);

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

/**
 * @brief Owner side of a per-attempt cancellation context
 *
 * A source cancels exactly once. Callers that need a new attempt replace
 * the source instead of resetting it.
 */
class CancellationSource {
public:
    CancellationSource();

    [[nodiscard]] CancellationToken token() const { return CancellationToken(state_); }
    [[nodiscard]] bool is_cancelled() const noexcept { return state_->reason != CancelReason::None; }
    [[nodiscard]] CancelReason reason() const noexcept { return state_->reason; }

    /**
     * @brief Cancel with @p reason and run registered callbacks
     *
     * @return false if the source was already cancelled (the first reason wins)
     */
    bool cancel(CancelReason reason);

private:
    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace mpu::upload
