#ifndef SLURP_LINE_READER_HPP
#define SLURP_LINE_READER_HPP

#include <slurp/buffer_pool.hpp>
#include <slurp/cancellation.hpp>
#include <slurp/defs.hpp>
#include <slurp/io_executor.hpp>
#include <slurp/outcome.hpp>
#include <slurp/text_codec.hpp>
#include <slurp/vfs.hpp>

#include <cstddef>
#include <future>
#include <iterator>
#include <memory>
#include <optional>
#include <string>

namespace slurp {

/// Result of a single step of a @ref line_reader.
enum class read_status {
    /// A line has been produced.
    line,

    /// There are no more lines. The file has been closed.
    end,

    /// The operation was cancelled at a checkpoint. The reader stays usable.
    cancelled,
};

/// Produces the lines of a file one at a time.
///
/// The reader owns the file for its lifetime. The file is closed
/// as soon as the last line has been produced, when close() is called,
/// when an error occurs or when the reader is destroyed, whichever comes first.
///
/// Lines are separated by "\n", "\r\n" or "\r". A terminator at the very end
/// of the file does not start another (empty) line. The terminators are
/// not part of the lines.
///
/// A byte order mark at the start of the file selects the encoding;
/// otherwise the codec given to the constructor is used.
///
/// The sequence of lines cannot be restarted: iterating a second time
/// continues where the first iteration stopped.
///
/// \note Readers are not thread safe. At most one call may be active at a time,
/// including calls running on an executor via next_async().
class line_reader {
public:
    class iterator;

public:
    /// Constructs a closed reader that produces no lines.
    line_reader() = default;

    /// Constructs a reader for `f`.
    ///
    /// \param codec
    ///     The encoding of the file if it has no byte order mark.
    ///     Must remain valid for the lifetime of the reader.
    ///
    /// \param bytes, chars
    ///     Provide the read and decode buffers. Must remain valid
    ///     for the lifetime of the reader.
    ///
    /// \param chunk_size
    ///     The number of bytes requested from the file at a time.
    line_reader(std::unique_ptr<file> f, const text_codec& codec, buffer_pool<byte>& bytes,
                buffer_pool<char>& chars, size_t chunk_size);

    line_reader(line_reader&&) noexcept;
    line_reader& operator=(line_reader&&) noexcept;

    ~line_reader();

    /// Reads the next line into `line`. Returns false if there are no more lines.
    bool next(std::string& line);

    /// Reads the next line using the given I/O strategy.
    template<typename Io>
    read_status next(Io& io, std::string& line);

    /// Reads the next line on a worker thread of `executor`.
    /// The future holds an empty optional at the end of the file.
    /// The reader must outlive the returned future.
    std::future<outcome<std::optional<std::string>>>
    next_async(io_executor& executor, cancellation_token token = cancellation_token());

    /// Closes the file and returns all buffers. Further calls produce no lines.
    void close();

    /// True while the underlying file is open.
    bool is_open() const noexcept { return m_file != nullptr; }

    /// Name of the codec used for decoding. Only meaningful after the first line
    /// has been read, when the byte order mark (if any) has been inspected.
    const char* codec_name() const noexcept;

    /// @{
    /// Iteration support. begin() reads the next line.
    iterator begin();
    iterator end();
    /// @}

    line_reader(const line_reader&) = delete;
    line_reader& operator=(const line_reader&) = delete;

private:
    // Refills the decoded text buffer. Returns false if cancelled.
    template<typename Io>
    bool fill(Io& io);

    // Reads the first bytes of the file and selects the decoder.
    template<typename Io>
    bool start(Io& io);

    void decode(size_t raw_size);
    void finish();

    // Releases the file and all buffers without reporting errors.
    void release() noexcept;

private:
    std::unique_ptr<file> m_file;
    const text_codec* m_codec = nullptr;
    const text_codec* m_active_codec = nullptr;
    std::unique_ptr<text_decoder> m_decoder;

    pooled_buffer<byte> m_raw;
    pooled_buffer<char> m_text;
    size_t m_text_pos = 0;
    size_t m_text_size = 0;

    // Characters of the line that is currently being assembled.
    std::string m_line;

    // True if characters have been seen since the last line terminator.
    bool m_in_line = false;

    // The last terminator was a '\r': skip a directly following '\n'.
    bool m_skip_lf = false;

    // The file has been read completely and the decoder has been finished.
    bool m_eof = false;
};

/// An input iterator over the lines of a @ref line_reader.
class line_reader::iterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = std::string;
    using difference_type = std::ptrdiff_t;
    using pointer = const std::string*;
    using reference = const std::string&;

    iterator() = default;

    reference operator*() const { return m_line; }
    pointer operator->() const { return &m_line; }

    iterator& operator++() {
        advance();
        return *this;
    }

    void operator++(int) { advance(); }

    bool operator==(const iterator& other) const noexcept { return m_reader == other.m_reader; }
    bool operator!=(const iterator& other) const noexcept { return m_reader != other.m_reader; }

private:
    friend line_reader;

    explicit iterator(line_reader* reader)
        : m_reader(reader) {
        advance();
    }

    void advance() {
        if (m_reader && !m_reader->next(m_line))
            m_reader = nullptr;
    }

private:
    line_reader* m_reader = nullptr;
    std::string m_line;
};

} // namespace slurp

#endif // SLURP_LINE_READER_HPP
