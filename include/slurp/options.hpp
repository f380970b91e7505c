#ifndef SLURP_OPTIONS_HPP
#define SLURP_OPTIONS_HPP

#include <slurp/defs.hpp>

#include <string>
#include <utility>

namespace slurp {

/**
 * Tuning parameters of a @ref file_transfer.
 *
 * Uses chained setters for fluent configuration:
 * @code
 * slurp::transfer_options opts;
 * opts.initial_buffer_size(4096)
 *     .newline("\r\n");
 * slurp::file_transfer transfer(slurp::system_vfs(), opts);
 * @endcode
 *
 * Values are checked by `validate()`, which the transfer constructor calls.
 */
class transfer_options {
public:
    transfer_options() = default;

    /// Capacity of the first scratch buffer used to read files of unknown length.
    /// Default: 512 bytes.
    transfer_options& initial_buffer_size(size_t size) noexcept {
        m_initial_buffer_size = size;
        return *this;
    }

    /// The largest buffer that may be held in one piece. Files larger than this
    /// fail with @ref file_too_large. Default: @ref slurp::max_buffer_length.
    transfer_options& max_buffer_length(size_t size) noexcept {
        m_max_buffer_length = size;
        return *this;
    }

    /// Number of bytes requested by a single read of the line reader.
    /// Default: 4096 bytes.
    transfer_options& read_chunk_size(size_t size) noexcept {
        m_read_chunk_size = size;
        return *this;
    }

    /// Size of the buffer that collects encoded text before it is written.
    /// Default: 4096 bytes.
    transfer_options& write_buffer_size(size_t size) noexcept {
        m_write_buffer_size = size;
        return *this;
    }

    /// Terminator written after every line. Must be "\n", "\r\n" or "\r".
    /// Default: "\n".
    transfer_options& newline(std::string nl) {
        m_newline = std::move(nl);
        return *this;
    }

    size_t initial_buffer_size() const noexcept { return m_initial_buffer_size; }
    size_t max_buffer_length() const noexcept { return m_max_buffer_length; }
    size_t read_chunk_size() const noexcept { return m_read_chunk_size; }
    size_t write_buffer_size() const noexcept { return m_write_buffer_size; }
    const std::string& newline() const noexcept { return m_newline; }

    /// Throws @ref bad_argument if the options are inconsistent.
    void validate() const;

private:
    size_t m_initial_buffer_size = 512;
    size_t m_max_buffer_length = slurp::max_buffer_length;
    size_t m_read_chunk_size = 4096;
    size_t m_write_buffer_size = 4096;
    std::string m_newline = "\n";
};

} // namespace slurp

#endif // SLURP_OPTIONS_HPP
