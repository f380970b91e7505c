#include <slurp/vfs.hpp>

#include <slurp/assert.hpp>
#include <slurp/deferred.hpp>
#include <slurp/exception.hpp>
#include <slurp/log.hpp>

#include <cerrno>
#include <limits>
#include <string>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace slurp {

class unix_vfs;

class unix_file : public file {
private:
    int m_fd = -1;
    std::string m_name;
    vfs::access_t m_access;

public:
    unix_file(unix_vfs& vfs, int fd, std::string name, vfs::access_t access);

    ~unix_file();

    const char* name() const noexcept override { return m_name.c_str(); }

    bool readable() const noexcept override { return m_access != vfs::write_only; }

    bool writable() const noexcept override { return m_access != vfs::read_only; }

    bool is_open() const noexcept override { return m_fd != -1; }

    std::optional<u64> length() override;

    size_t read(void* buffer, size_t count) override;

    size_t write(const void* buffer, size_t count) override;

    u64 seek(i64 offset, seek_origin origin) override;

    void close() override;

private:
    void check_open() const;
};

class unix_vfs : public vfs {
public:
    unix_vfs() = default;

    const char* name() const noexcept override { return "unix_vfs"; }

    std::unique_ptr<file>
    open(const char* path, open_mode mode, access_t access, share_t share) override;

    void remove(const char* path) override;
};

// Larger requests are split by the kernel anyway; keep them within ssize_t.
static constexpr size_t max_io_size = 0x7ffff000;

unix_file::unix_file(unix_vfs& v, int fd, std::string name, vfs::access_t access)
    : file(v)
    , m_fd(fd)
    , m_name(std::move(name))
    , m_access(access) {}

unix_file::~unix_file() {
    if (m_fd != -1 && ::close(m_fd) == -1) {
        std::error_code ec(errno, std::system_category());
        SLURP_LOG_WARN("Failed to close `{}`: {}.", m_name, ec.message());
    }
}

std::optional<u64> unix_file::length() {
    check_open();

    struct stat st;
    if (::fstat(m_fd, &st) == -1)
        SLURP_THROW(errno_error(fmt::format("Failed to get attributes of `{}`", name())));

    // Only regular files have a meaningful size.
    if (!S_ISREG(st.st_mode))
        return std::nullopt;
    return static_cast<u64>(st.st_size);
}

size_t unix_file::read(void* buffer, size_t count) {
    SLURP_ASSERT(buffer != nullptr || count == 0, "null buffer");
    check_open();

    if (count == 0)
        return 0;
    if (count > max_io_size)
        count = max_io_size;

    while (true) {
        ssize_t n = ::read(m_fd, buffer, count);
        if (n == -1) {
            if (errno == EINTR)
                continue;
            SLURP_THROW(errno_error(fmt::format("Failed to read from `{}`", name())));
        }
        SLURP_PRINT_READ(name(), n);
        return static_cast<size_t>(n);
    }
}

size_t unix_file::write(const void* buffer, size_t count) {
    SLURP_ASSERT(buffer != nullptr || count == 0, "null buffer");
    check_open();

    if (count == 0)
        return 0;
    if (count > max_io_size)
        count = max_io_size;

    while (true) {
        ssize_t n = ::write(m_fd, buffer, count);
        if (n == -1) {
            if (errno == EINTR)
                continue;
            SLURP_THROW(errno_error(fmt::format("Failed to write to `{}`", name())));
        }
        if (n == 0) {
            SLURP_THROW(io_error(
                fmt::format("Failed to write to `{}`: No progress was made.", name())));
        }
        SLURP_PRINT_WRITE(name(), n);
        return static_cast<size_t>(n);
    }
}

u64 unix_file::seek(i64 offset, seek_origin origin) {
    check_open();

    int whence = SEEK_SET;
    switch (origin) {
    case seek_origin::begin:
        whence = SEEK_SET;
        break;
    case seek_origin::current:
        whence = SEEK_CUR;
        break;
    case seek_origin::end:
        whence = SEEK_END;
        break;
    }

    off_t result = ::lseek(m_fd, static_cast<off_t>(offset), whence);
    if (result == -1)
        SLURP_THROW(errno_error(fmt::format("Failed to seek in `{}`", name())));
    return static_cast<u64>(result);
}

void unix_file::close() {
    if (m_fd != -1) {
        int fd = std::exchange(m_fd, -1);
        SLURP_LOG_TRACE("Closing `{}`.", m_name);
        if (::close(fd) == -1)
            SLURP_THROW(errno_error(fmt::format("Failed to close `{}`", name())));
    }
}

void unix_file::check_open() const {
    if (m_fd == -1)
        SLURP_THROW(io_error(fmt::format("File `{}` is closed.", m_name)));
}

std::unique_ptr<file>
unix_vfs::open(const char* path, open_mode mode, access_t access, share_t share) {
    // POSIX has no share modes.
    unused(share);
    check_open_args(path, mode, access);

    int flags = O_CLOEXEC;
    switch (access) {
    case read_only:
        flags |= O_RDONLY;
        break;
    case write_only:
        flags |= O_WRONLY;
        break;
    case read_write:
        flags |= O_RDWR;
        break;
    }

    switch (mode) {
    case open_existing:
        break;
    case create:
        flags |= O_CREAT | O_TRUNC;
        break;
    case append:
        flags |= O_CREAT | O_APPEND;
        break;
    case open_or_create:
        flags |= O_CREAT;
        break;
    }

    int createmode = S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH | S_IWOTH;

    int fd;
    do {
        fd = ::open(path, flags, createmode);
    } while (fd == -1 && errno == EINTR);

    if (fd == -1)
        SLURP_THROW(errno_error(fmt::format("Failed to open `{}`", path)));

    deferred guard = [&] { ::close(fd); };

    // Opening a directory for reading succeeds on linux; reading it does not.
    struct stat st;
    if (::fstat(fd, &st) == -1)
        SLURP_THROW(errno_error(fmt::format("Failed to get attributes of `{}`", path)));
    if (S_ISDIR(st.st_mode)) {
        std::error_code ec = std::make_error_code(std::errc::is_a_directory);
        SLURP_THROW(io_error(fmt::format("Failed to open `{}`: {}.", path, ec.message()), ec));
    }

    auto ret = std::make_unique<unix_file>(*this, fd, path, access);
    guard.disable();
    SLURP_LOG_TRACE("Opened `{}` (fd {}).", path, fd);
    return ret;
}

void unix_vfs::remove(const char* path) {
    if (path == nullptr || *path == '\0')
        SLURP_THROW(bad_argument("Path must not be null or empty."));

    if (::unlink(path) == -1)
        SLURP_THROW(errno_error(fmt::format("Failed to remove `{}`", path)));
}

vfs& system_vfs() {
    static unix_vfs vfs;
    return vfs;
}

} // namespace slurp
