#ifndef SLURP_TEXT_WRITER_HPP
#define SLURP_TEXT_WRITER_HPP

#include <slurp/buffer_pool.hpp>
#include <slurp/defs.hpp>
#include <slurp/text_codec.hpp>
#include <slurp/vfs.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace slurp {

/// Encodes text and writes it to a file through a pooled buffer.
///
/// The writer owns the file. It is flushed and closed by close() or,
/// if close() was never called, by the destructor. Errors in the destructor
/// are logged because they cannot be reported otherwise; call close()
/// to observe them.
///
/// A writer whose write failed with an I/O error or was cancelled is broken:
/// its buffered data is discarded instead of being written on close.
/// Encoding errors do not break the writer since nothing was written for
/// the rejected text.
///
/// \note Writers are not thread safe.
class text_writer {
public:
    /// Constructs a closed writer.
    text_writer() = default;

    /// Constructs a writer for `f`.
    ///
    /// \param codec
    ///     Encodes the text. Must remain valid for the lifetime of the writer.
    ///
    /// \param pool
    ///     Provides the write buffer. Must remain valid for the lifetime of the writer.
    ///
    /// \param buffer_size
    ///     Encoded bytes are collected until this many are available.
    ///
    /// \param newline
    ///     Terminator appended by write_line().
    ///
    /// \param write_preamble
    ///     Start the output with the codec's preamble (if it has one).
    text_writer(std::unique_ptr<file> f, const text_codec& codec, buffer_pool<byte>& pool,
                size_t buffer_size, std::string newline, bool write_preamble);

    text_writer(text_writer&&) noexcept;
    text_writer& operator=(text_writer&&) noexcept;

    ~text_writer();

    /// Encodes and writes `text`.
    void write(std::string_view text);

    /// Encodes and writes `text`, followed by the newline sequence.
    void write_line(std::string_view text);

    /// Hands all buffered bytes to the file.
    void flush();

    /// Flushes and closes the file. Closing a closed writer does nothing.
    void close();

    /// @{
    /// Variants that perform I/O through the given strategy.
    /// They return false if the operation was cancelled, which breaks the writer.
    template<typename Io>
    bool write(Io& io, std::string_view text);

    template<typename Io>
    bool write_line(Io& io, std::string_view text);

    template<typename Io>
    bool flush(Io& io);

    template<typename Io>
    bool close(Io& io);
    /// @}

    /// Releases the file and the buffer without writing the buffered data.
    void discard() noexcept;

    /// True until the writer has been closed or discarded.
    bool is_open() const noexcept { return m_file != nullptr; }

    /// True if buffered data will not be written anymore.
    bool broken() const noexcept { return m_broken; }

    /// The number of bytes waiting in the buffer.
    size_t buffered() const noexcept { return m_size; }

    text_writer(const text_writer&) = delete;
    text_writer& operator=(const text_writer&) = delete;

private:
    void check_open() const;

    // Closes the file and logs errors instead of throwing them.
    void close_quietly() noexcept;

    // Copies the encoded bytes into the buffer, flushing it when it becomes full.
    template<typename Io>
    bool append(Io& io, const byte* data, size_t size);

    template<typename Io>
    bool flush_buffer(Io& io);

private:
    std::unique_ptr<file> m_file;
    const text_codec* m_codec = nullptr;
    pooled_buffer<byte> m_buffer;
    size_t m_size = 0;
    std::string m_newline;
    std::vector<byte> m_encoded;
    bool m_broken = false;
};

} // namespace slurp

#endif // SLURP_TEXT_WRITER_HPP
