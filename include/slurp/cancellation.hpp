#ifndef SLURP_CANCELLATION_HPP
#define SLURP_CANCELLATION_HPP

#include <atomic>
#include <memory>
#include <utility>

namespace slurp {

class cancellation_source;

/// Observes a cancellation request.
///
/// Tokens are cheap to copy and safe to share between threads. A default
/// constructed token can never be cancelled. Operations only read tokens;
/// cancellation is requested through the @ref cancellation_source
/// that issued the token.
class cancellation_token {
public:
    /// Constructs a token that is never cancelled.
    cancellation_token() = default;

    /// True if cancellation has been requested.
    bool cancelled() const noexcept {
        return m_state && m_state->load(std::memory_order_acquire);
    }

    /// True if this token is connected to a source.
    bool can_be_cancelled() const noexcept { return m_state != nullptr; }

private:
    friend cancellation_source;

    explicit cancellation_token(std::shared_ptr<const std::atomic<bool>> state)
        : m_state(std::move(state)) {}

private:
    std::shared_ptr<const std::atomic<bool>> m_state;
};

/// Issues tokens and requests cancellation of the operations that observe them.
class cancellation_source {
public:
    cancellation_source()
        : m_state(std::make_shared<std::atomic<bool>>(false)) {}

    /// Returns a token connected to this source.
    cancellation_token token() const { return cancellation_token(m_state); }

    /// Requests cancellation. Operations notice the request at their next checkpoint.
    void cancel() noexcept { m_state->store(true, std::memory_order_release); }

    /// True if cancel() has been called.
    bool cancelled() const noexcept { return m_state->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> m_state;
};

} // namespace slurp

#endif // SLURP_CANCELLATION_HPP
