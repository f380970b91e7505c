#ifndef SLURP_GROWABLE_READER_HPP
#define SLURP_GROWABLE_READER_HPP

#include <slurp/assert.hpp>
#include <slurp/buffer_pool.hpp>
#include <slurp/defs.hpp>
#include <slurp/exception.hpp>
#include <slurp/log.hpp>
#include <slurp/math.hpp>
#include <slurp/options.hpp>
#include <slurp/outcome.hpp>
#include <slurp/vfs.hpp>

#include <algorithm>
#include <cstring>
#include <optional>
#include <utility>
#include <vector>

namespace slurp {

/// Reads the entire content of a file into an exactly sized buffer.
///
/// The length reported by the file is not trusted blindly:
/// - If the file reports a non-zero length, a buffer of exactly that size is
///   allocated once. The read fails with @ref end_of_file if the file ends early.
/// - If the file reports no length or a length of zero (some virtual files do
///   although they have content), the file is read into scratch buffers from
///   the buffer pool whose capacity doubles whenever they become full.
///
/// No buffer ever exceeds the configured maximum length; larger files fail
/// with @ref file_too_large. Rented buffers are returned to the pool on every path.
class growable_reader {
public:
    /// Constructs a new reader.
    ///
    /// \param pool
    ///     Provides the scratch buffers of the unknown-length path.
    ///     The reference must remain valid for the lifetime of the reader.
    ///
    /// \param initial_buffer_size
    ///     The capacity of the first scratch buffer.
    ///
    /// \param max_buffer_length
    ///     The largest buffer that may be used.
    growable_reader(buffer_pool<byte>& pool, size_t initial_buffer_size, size_t max_buffer_length);

    growable_reader(buffer_pool<byte>& pool, const transfer_options& options)
        : growable_reader(pool, options.initial_buffer_size(), options.max_buffer_length()) {}

    /// Reads the file from its current position to its end.
    /// Blocks until the read is complete.
    std::vector<byte> read_all(file& f);

    /// Reads the file from its current position to its end using the given I/O strategy.
    /// Returns a cancelled outcome if the strategy reports cancellation at a checkpoint.
    template<typename Io>
    outcome<std::vector<byte>> read_all(Io& io, file& f);

    size_t initial_buffer_size() const noexcept { return m_initial_buffer_size; }
    size_t max_buffer_length() const noexcept { return m_max_buffer_length; }

private:
    template<typename Io>
    outcome<std::vector<byte>> read_known_length(Io& io, file& f, size_t length);

    template<typename Io>
    outcome<std::vector<byte>> read_unknown_length(Io& io, file& f);

    [[noreturn]] void too_large(file& f, u64 length) const;

private:
    buffer_pool<byte>* m_pool;
    size_t m_initial_buffer_size;
    size_t m_max_buffer_length;
};

template<typename Io>
outcome<std::vector<byte>> growable_reader::read_all(Io& io, file& f) {
    if (io.cancelled())
        return outcome<std::vector<byte>>::cancelled();

    std::optional<u64> length = f.length();
    if (length && *length > m_max_buffer_length)
        too_large(f, *length);

    if (length && *length > 0)
        return read_known_length(io, f, static_cast<size_t>(*length));

    if (length) {
        SLURP_LOG_DEBUG("`{}` reports a length of 0, reading until the end of the file.",
                        f.name());
    } else {
        SLURP_LOG_DEBUG("`{}` has no length, reading until the end of the file.", f.name());
    }
    return read_unknown_length(io, f);
}

template<typename Io>
outcome<std::vector<byte>> growable_reader::read_known_length(Io& io, file& f, size_t length) {
    std::vector<byte> bytes(length);

    size_t index = 0;
    while (index < length) {
        if (io.cancelled())
            return outcome<std::vector<byte>>::cancelled();

        size_t n = io.read(f, bytes.data() + index, length - index);
        if (n == 0) {
            SLURP_THROW(end_of_file(
                fmt::format("Unexpected end of file in `{}`: expected {} bytes but the file "
                            "ended after {} bytes.",
                            f.name(), length, index)));
        }
        index += n;
    }
    return outcome<std::vector<byte>>(std::move(bytes));
}

template<typename Io>
outcome<std::vector<byte>> growable_reader::read_unknown_length(Io& io, file& f) {
    pooled_buffer<byte> buffer = m_pool->rent(m_initial_buffer_size);
    size_t filled = 0;

    while (true) {
        // The pool may hand out more than requested; never use more than the ceiling.
        const size_t usable = std::min(buffer.capacity(), m_max_buffer_length);
        if (filled == usable) {
            if (usable == m_max_buffer_length) {
                // The buffer cannot grow. The file fits only if it ends right here.
                byte extra;
                if (io.cancelled())
                    return outcome<std::vector<byte>>::cancelled();
                if (io.read(f, &extra, 1) == 0)
                    break;
                too_large(f, u64(filled) + 1);
            }

            if (io.cancelled())
                return outcome<std::vector<byte>>::cancelled();

            const size_t next = grow_capped(usable, m_max_buffer_length);
            pooled_buffer<byte> larger = m_pool->rent(next);
            std::memcpy(larger.data(), buffer.data(), filled);
            buffer = std::move(larger); // Returns the old buffer.
            SLURP_LOG_DEBUG("Grew the read buffer for `{}` to {} bytes.", f.name(), next);
            continue;
        }

        if (io.cancelled())
            return outcome<std::vector<byte>>::cancelled();

        size_t n = io.read(f, buffer.data() + filled, usable - filled);
        if (n == 0)
            break;
        filled += n;
    }

    return std::vector<byte>(buffer.data(), buffer.data() + filled);
}

} // namespace slurp

#endif // SLURP_GROWABLE_READER_HPP
