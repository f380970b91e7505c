#ifndef SLURP_FILE_TRANSFER_HPP
#define SLURP_FILE_TRANSFER_HPP

#include <slurp/buffer_pool.hpp>
#include <slurp/cancellation.hpp>
#include <slurp/defs.hpp>
#include <slurp/detail/io_strategy.hpp>
#include <slurp/io_executor.hpp>
#include <slurp/line_reader.hpp>
#include <slurp/options.hpp>
#include <slurp/outcome.hpp>
#include <slurp/text_codec.hpp>
#include <slurp/text_writer.hpp>
#include <slurp/vfs.hpp>

#include <future>
#include <string>
#include <string_view>
#include <vector>

namespace slurp {

/// Reads and writes whole files: raw bytes, decoded text and sequences of lines.
///
/// Every operation exists in two forms. The blocking form occupies the calling thread
/// until the operation is complete. The `_async` form runs the same algorithm on a
/// worker thread of the executor and returns a future; it observes its cancellation
/// token before starting and at every checkpoint (before each read or write call,
/// after each growth step of the read buffer and after each line).
///
/// Arguments are validated before any file is opened, also in the asynchronous
/// forms, where @ref bad_argument is thrown by the call itself. All other errors
/// are thrown by the blocking form or stored in the future. On every exit path
/// (success, error or cancellation) the operation closes its file and returns
/// all rented buffers.
///
/// Objects of this class can be used by multiple threads at once; operations
/// never share files and the buffer pools are thread safe.
class file_transfer {
public:
    /// Uses the process wide buffer pools and executor.
    explicit file_transfer(vfs& fs = system_vfs(), transfer_options options = transfer_options());

    /// Uses the given collaborators, which must outlive this object.
    file_transfer(vfs& fs, transfer_options options, buffer_pool<byte>& bytes,
                  buffer_pool<char>& chars, io_executor& executor);

    /// \name Blocking operations
    /// @{

    /// Returns the exact content of the file at `path`.
    std::vector<byte> read_all_bytes(const char* path);

    /// Creates or truncates the file at `path` and writes `size` bytes from `data`.
    /// A null `data` is rejected even if `size` is zero.
    void write_all_bytes(const char* path, const byte* data, size_t size);
    void write_all_bytes(const char* path, const std::vector<byte>& bytes);

    /// Returns the decoded content of the file at `path`. A byte order mark
    /// overrides `codec` and is not part of the result.
    std::string read_all_text(const char* path, const text_codec& codec = utf8());

    /// Creates or truncates the file at `path` and writes the encoded `text`.
    /// Nothing (not even a byte order mark) is written for empty text.
    void write_all_text(const char* path, std::string_view text,
                        const text_codec& codec = utf8_no_bom());

    /// Appends the encoded `text` to the file at `path`, which is created if necessary.
    /// The byte order mark is written only to an empty file.
    void append_all_text(const char* path, std::string_view text,
                         const text_codec& codec = utf8_no_bom());

    /// Returns the lines of the file at `path`, without their terminators.
    std::vector<std::string> read_all_lines(const char* path, const text_codec& codec = utf8());

    /// Opens the file at `path` and returns a reader that produces its lines on demand.
    /// The file stays open until the reader is exhausted, closed or destroyed.
    line_reader read_lines(const char* path, const text_codec& codec = utf8());

    /// Creates or truncates the file at `path` and writes every element of `lines`
    /// followed by the configured newline.
    template<typename Range>
    void write_all_lines(const char* path, const Range& lines,
                         const text_codec& codec = utf8_no_bom());

    /// Like write_all_lines(), but appends to the file.
    template<typename Range>
    void append_all_lines(const char* path, const Range& lines,
                          const text_codec& codec = utf8_no_bom());

    /// Creates or truncates the file at `path` and returns a writer for it.
    text_writer create_text(const char* path, const text_codec& codec = utf8_no_bom());

    /// Opens the file at `path` for appending and returns a writer for it.
    text_writer append_text(const char* path, const text_codec& codec = utf8_no_bom());

    /// @}

    /// \name Non-blocking operations
    /// The codec must outlive the returned future. Data arguments are copied.
    /// @{

    std::future<outcome<std::vector<byte>>>
    read_all_bytes_async(const char* path, cancellation_token token = cancellation_token());

    std::future<outcome<void>> write_all_bytes_async(const char* path, const byte* data,
                                                     size_t size,
                                                     cancellation_token token = cancellation_token());

    std::future<outcome<void>>
    write_all_bytes_async(const char* path, std::vector<byte> bytes,
                          cancellation_token token = cancellation_token());

    std::future<outcome<std::string>>
    read_all_text_async(const char* path, const text_codec& codec = utf8(),
                        cancellation_token token = cancellation_token());

    std::future<outcome<void>>
    write_all_text_async(const char* path, std::string text,
                         const text_codec& codec = utf8_no_bom(),
                         cancellation_token token = cancellation_token());

    std::future<outcome<void>>
    append_all_text_async(const char* path, std::string text,
                          const text_codec& codec = utf8_no_bom(),
                          cancellation_token token = cancellation_token());

    std::future<outcome<std::vector<std::string>>>
    read_all_lines_async(const char* path, const text_codec& codec = utf8(),
                         cancellation_token token = cancellation_token());

    std::future<outcome<void>>
    write_all_lines_async(const char* path, std::vector<std::string> lines,
                          const text_codec& codec = utf8_no_bom(),
                          cancellation_token token = cancellation_token());

    std::future<outcome<void>>
    append_all_lines_async(const char* path, std::vector<std::string> lines,
                           const text_codec& codec = utf8_no_bom(),
                           cancellation_token token = cancellation_token());

    /// @}

    vfs& get_vfs() const noexcept { return *m_vfs; }
    const transfer_options& options() const noexcept { return m_options; }
    buffer_pool<byte>& byte_pool() const noexcept { return *m_bytes; }
    buffer_pool<char>& char_pool() const noexcept { return *m_chars; }
    io_executor& executor() const noexcept { return *m_executor; }

    file_transfer(const file_transfer&) = delete;
    file_transfer& operator=(const file_transfer&) = delete;

private:
    static void check_path(const char* path);
    static void check_data(const byte* data);

    std::unique_ptr<file> open_read(const char* path);

    // Opens a writer. The preamble is written if `allow_preamble` is set and the file
    // starts out empty.
    text_writer open_writer(const char* path, vfs::open_mode mode, const text_codec& codec,
                            bool allow_preamble);

    line_reader open_reader(const char* path, const text_codec& codec);

    template<typename Io>
    outcome<std::vector<byte>> do_read_all_bytes(Io& io, const char* path);

    template<typename Io>
    outcome<void> do_write_all_bytes(Io& io, const char* path, const byte* data, size_t size);

    template<typename Io>
    outcome<std::string> do_read_all_text(Io& io, const char* path, const text_codec& codec);

    template<typename Io>
    outcome<void> do_write_text(Io& io, const char* path, vfs::open_mode mode, std::string_view text,
                             const text_codec& codec);

    template<typename Io>
    outcome<std::vector<std::string>>
    do_read_all_lines(Io& io, const char* path, const text_codec& codec);

    template<typename Io, typename Range>
    outcome<void> do_write_lines(Io& io, const char* path, vfs::open_mode mode, const Range& lines,
                              const text_codec& codec);

    // Runs `fn(io)` on the executor unless the token has already been cancelled.
    template<typename Function>
    auto run_async(cancellation_token token, Function fn);

private:
    vfs* m_vfs;
    transfer_options m_options;
    buffer_pool<byte>* m_bytes;
    buffer_pool<char>* m_chars;
    io_executor* m_executor;
};

template<typename Range>
void file_transfer::write_all_lines(const char* path, const Range& lines,
                                    const text_codec& codec) {
    check_path(path);

    detail::blocking_io io;
    do_write_lines(io, path, vfs::create, lines, codec).value();
}

template<typename Range>
void file_transfer::append_all_lines(const char* path, const Range& lines,
                                     const text_codec& codec) {
    check_path(path);

    detail::blocking_io io;
    do_write_lines(io, path, vfs::append, lines, codec).value();
}

template<typename Io, typename Range>
outcome<void> file_transfer::do_write_lines(Io& io, const char* path, vfs::open_mode mode,
                                            const Range& lines, const text_codec& codec) {
    if (io.cancelled())
        return outcome<void>::cancelled();

    // On errors, the writer's destructor still writes the lines that were accepted.
    text_writer writer = open_writer(path, mode, codec, true);
    for (const auto& line : lines) {
        if (io.cancelled() || !writer.write_line(io, std::string_view(line))) {
            writer.discard();
            return outcome<void>::cancelled();
        }
    }
    if (!writer.close(io))
        return outcome<void>::cancelled();
    return outcome<void>::completed();
}

/// Returns the process wide transfer object for the system file system.
file_transfer& default_transfer();

} // namespace slurp

#endif // SLURP_FILE_TRANSFER_HPP
