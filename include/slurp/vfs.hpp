#ifndef SLURP_VFS_HPP
#define SLURP_VFS_HPP

#include <slurp/assert.hpp>
#include <slurp/defs.hpp>

#include <memory>
#include <optional>

namespace slurp {

class file;
class vfs;

/// Reference point of file::seek().
enum class seek_origin { begin, current, end };

/// An open file. A file object is owned by exactly one operation at a time
/// and is never shared between threads.
///
/// All I/O happens at the current position, which is advanced by reads and writes.
class file {
public:
    explicit file(slurp::vfs& v)
        : m_vfs(v) {}

    virtual ~file();

    /// The virtual file system that this file belongs to.
    slurp::vfs& get_vfs() const { return m_vfs; }

    /// Returns the name of this file (for error reporting only).
    virtual const char* name() const noexcept = 0;

    /// True if the file was opened with read access.
    virtual bool readable() const noexcept = 0;

    /// True if the file was opened with write access.
    virtual bool writable() const noexcept = 0;

    /// True until close() has been called.
    virtual bool is_open() const noexcept = 0;

    /// Returns the length of the file in bytes, if the file has one.
    /// Pipes, character devices and similar special files have no length.
    ///
    /// \note A reported length is only a hint: files may change
    /// concurrently and some virtual files report 0 although they have content.
    virtual std::optional<u64> length() = 0;

    /// Reads up to `count` bytes at the current position into `buffer`.
    /// Returns the number of bytes read, which may be less than `count`.
    /// Returns 0 if and only if the end of the file has been reached
    /// (or `count` was 0).
    virtual size_t read(void* buffer, size_t count) = 0;

    /// Writes up to `count` bytes from `buffer` at the current position.
    /// Returns the number of bytes written, which is greater than zero
    /// when `count` is greater than zero.
    virtual size_t write(const void* buffer, size_t count) = 0;

    /// Moves the current position and returns the new absolute position.
    virtual u64 seek(i64 offset, seek_origin origin) = 0;

    /// Closes this file handle. Closing a closed file does nothing.
    virtual void close() = 0;

    file(const file&) = delete;
    file& operator=(const file&) = delete;

private:
    slurp::vfs& m_vfs;
};

/// The virtual file system provides the bare necessities for opening files.
class vfs {
public:
    /// Requested access rights.
    enum access_t {
        read_only,
        write_only,
        read_write,
    };

    /// How to treat existing and missing files.
    enum open_mode {
        /// Open an existing file. Fails if the file does not exist.
        open_existing,

        /// Create a new file or truncate an existing one.
        create,

        /// Open the file for writing at its end, creating it if necessary.
        /// Every write is appended to the current end of the file.
        append,

        /// Open the file if it exists, otherwise create it.
        open_or_create,
    };

    /// Which concurrent accesses other openers are permitted. This is a hint:
    /// file systems without share modes (POSIX) accept and ignore it.
    enum share_t {
        share_none,
        share_read,
        share_write,
        share_read_write,
    };

public:
    vfs() = default;

    virtual ~vfs();

    /// Name of this vfs.
    virtual const char* name() const noexcept = 0;

    /// Opens the file at the given path or throws an exception.
    /// Errors reported by the operating system are propagated
    /// as @ref io_error with the original error code.
    virtual std::unique_ptr<file>
    open(const char* path, open_mode mode, access_t access, share_t share = share_read) = 0;

    /// Removes the file with the given name or throws an exception.
    virtual void remove(const char* path) = 0;

    vfs(const vfs&) = delete;
    vfs& operator=(const vfs&) = delete;

protected:
    void check_vfs(file& f) const {
        SLURP_CHECK(&f.get_vfs() == this, "The file does not belong to this filesystem.");
    }

    /// Throws @ref bad_argument if the combination of mode and access makes no sense.
    static void check_open_args(const char* path, open_mode mode, access_t access);
};

/// Returns the current platform's file system.
///
/// \relates vfs
vfs& system_vfs();

/// Returns the in-memory file system. Files live as long as the process
/// (or until they are removed) and are visible to all users of this instance.
///
/// \relates vfs
vfs& memory_vfs();

} // namespace slurp

#endif // SLURP_VFS_HPP
