#ifndef SLURP_DETAIL_IO_STRATEGY_HPP
#define SLURP_DETAIL_IO_STRATEGY_HPP

#include <slurp/cancellation.hpp>
#include <slurp/defs.hpp>
#include <slurp/log.hpp>
#include <slurp/vfs.hpp>

namespace slurp::detail {

/*
 * The transfer algorithms are written once and parameterized over an I/O strategy.
 * A strategy performs the individual read and write calls and answers whether
 * the operation has been cancelled. Algorithms ask at every checkpoint: before
 * an I/O call, after each growth step and after each line.
 *
 * A strategy must provide:
 *
 *      size_t read(file& f, void* buffer, size_t count);
 *      size_t write(file& f, const void* buffer, size_t count);
 *      bool cancelled();
 */

/// Occupies the calling thread for the whole operation; never cancelled.
class blocking_io {
public:
    size_t read(file& f, void* buffer, size_t count) { return f.read(buffer, count); }

    size_t write(file& f, const void* buffer, size_t count) { return f.write(buffer, count); }

    constexpr bool cancelled() const noexcept { return false; }
};

/// Observes a cancellation token at every checkpoint.
/// I/O calls that have already started run to completion.
class cancellable_io {
public:
    explicit cancellable_io(cancellation_token token)
        : m_token(std::move(token)) {}

    size_t read(file& f, void* buffer, size_t count) { return f.read(buffer, count); }

    size_t write(file& f, const void* buffer, size_t count) { return f.write(buffer, count); }

    bool cancelled() {
        if (!m_seen && m_token.cancelled()) {
            m_seen = true;
            SLURP_LOG_DEBUG("Cancellation observed at a checkpoint.");
        }
        return m_seen;
    }

private:
    cancellation_token m_token;
    bool m_seen = false;
};

/// Writes all `count` bytes through the strategy, checking for cancellation
/// before every write call. Returns false if the operation was cancelled.
template<typename Io>
bool write_all(Io& io, file& f, const void* buffer, size_t count) {
    const byte* data = static_cast<const byte*>(buffer);
    while (count > 0) {
        if (io.cancelled())
            return false;

        size_t n = io.write(f, data, count);
        SLURP_CHECK(n > 0 && n <= count, "invalid write result");
        data += n;
        count -= n;
    }
    return true;
}

} // namespace slurp::detail

#endif // SLURP_DETAIL_IO_STRATEGY_HPP
