#ifndef SLURP_OUTCOME_HPP
#define SLURP_OUTCOME_HPP

#include <slurp/exception.hpp>

#include <optional>
#include <utility>

namespace slurp {

/// The result of an operation that may be cancelled: either a value
/// or the marker that the operation was cancelled at a checkpoint.
///
/// Errors are not represented here; they are thrown as exceptions.
template<typename T>
class outcome {
public:
    /// Creates a cancelled outcome.
    static outcome cancelled() { return outcome(); }

    outcome(T value)
        : m_value(std::move(value)) {}

    /// True if the operation was cancelled before it completed.
    bool is_cancelled() const noexcept { return !m_value.has_value(); }

    /// True if the operation completed.
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// @{
    /// Returns the value of a completed operation.
    /// Throws @ref operation_cancelled if the operation was cancelled.
    T& value() & {
        check_value();
        return *m_value;
    }

    const T& value() const& {
        check_value();
        return *m_value;
    }

    T&& value() && {
        check_value();
        return std::move(*m_value);
    }
    /// @}

private:
    outcome() = default;

    void check_value() const {
        if (!m_value)
            SLURP_THROW(operation_cancelled());
    }

private:
    std::optional<T> m_value;
};

/// Specialization for operations that produce no value.
template<>
class outcome<void> {
public:
    static outcome cancelled() { return outcome(false); }

    static outcome completed() { return outcome(true); }

    bool is_cancelled() const noexcept { return !m_completed; }

    explicit operator bool() const noexcept { return m_completed; }

    /// Throws @ref operation_cancelled if the operation was cancelled.
    void value() const {
        if (!m_completed)
            SLURP_THROW(operation_cancelled());
    }

private:
    explicit outcome(bool completed)
        : m_completed(completed) {}

private:
    bool m_completed = false;
};

} // namespace slurp

#endif // SLURP_OUTCOME_HPP
