#include <slurp/vfs.hpp>

#include <slurp/assert.hpp>
#include <slurp/exception.hpp>
#include <slurp/log.hpp>

#include <algorithm>
#include <cstring>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace slurp {

file::~file() {}

vfs::~vfs() {}

void vfs::check_open_args(const char* path, open_mode mode, access_t access) {
    if (path == nullptr)
        SLURP_THROW(bad_argument("Path must not be a null pointer."));
    if (*path == '\0')
        SLURP_THROW(bad_argument("Path must not be empty."));
    if (mode == append && access != write_only)
        SLURP_THROW(bad_argument("Append mode requires write-only access."));
    if (mode == create && access == read_only)
        SLURP_THROW(bad_argument("Create mode requires write access."));
}

namespace {

class in_memory_vfs;

// Content of a named in-memory file. Shared by all handles that refer to it.
struct memory_node {
    std::mutex mutex;
    std::vector<byte> data;
};

class memory_file : public file {
public:
    memory_file(in_memory_vfs& v, std::string name, std::shared_ptr<memory_node> node,
                vfs::access_t access, bool append);

    const char* name() const noexcept override { return m_name.c_str(); }
    bool readable() const noexcept override { return m_access != vfs::write_only; }
    bool writable() const noexcept override { return m_access != vfs::read_only; }
    bool is_open() const noexcept override { return m_node != nullptr; }

    std::optional<u64> length() override;
    size_t read(void* buffer, size_t count) override;
    size_t write(const void* buffer, size_t count) override;
    u64 seek(i64 offset, seek_origin origin) override;
    void close() override { m_node.reset(); }

private:
    void check_open() const;

private:
    std::string m_name;
    std::shared_ptr<memory_node> m_node;
    vfs::access_t m_access;
    bool m_append = false;
    u64 m_position = 0;
};

class in_memory_vfs : public vfs {
public:
    in_memory_vfs() = default;

    const char* name() const noexcept override { return "memory"; }

    std::unique_ptr<file>
    open(const char* path, open_mode mode, access_t access, share_t share) override;

    void remove(const char* path) override;

private:
    std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<memory_node>> m_files;
};

memory_file::memory_file(in_memory_vfs& v, std::string name, std::shared_ptr<memory_node> node,
                         vfs::access_t access, bool append)
    : file(v)
    , m_name(std::move(name))
    , m_node(std::move(node))
    , m_access(access)
    , m_append(append) {}

void memory_file::check_open() const {
    if (!m_node)
        SLURP_THROW(io_error(fmt::format("File `{}` is closed.", m_name)));
}

std::optional<u64> memory_file::length() {
    check_open();
    std::lock_guard<std::mutex> lock(m_node->mutex);
    return m_node->data.size();
}

size_t memory_file::read(void* buffer, size_t count) {
    SLURP_ASSERT(buffer != nullptr || count == 0, "null buffer");
    check_open();
    if (!readable())
        SLURP_THROW(io_error(fmt::format("File `{}` was not opened for reading.", m_name)));

    if (count == 0)
        return 0;

    std::lock_guard<std::mutex> lock(m_node->mutex);
    const std::vector<byte>& data = m_node->data;
    if (m_position >= data.size())
        return 0;

    size_t n = static_cast<size_t>(std::min<u64>(count, data.size() - m_position));
    std::memcpy(buffer, data.data() + m_position, n);
    m_position += n;
    return n;
}

size_t memory_file::write(const void* buffer, size_t count) {
    SLURP_ASSERT(buffer != nullptr || count == 0, "null buffer");
    check_open();
    if (!writable())
        SLURP_THROW(io_error(fmt::format("File `{}` was not opened for writing.", m_name)));

    if (count == 0)
        return 0;

    std::lock_guard<std::mutex> lock(m_node->mutex);
    std::vector<byte>& data = m_node->data;
    if (m_append)
        m_position = data.size();
    if (m_position > std::numeric_limits<size_t>::max() - count)
        SLURP_THROW(io_error(fmt::format("File `{}` would become too large.", m_name)));

    size_t end = static_cast<size_t>(m_position) + count;
    if (data.size() < end)
        data.resize(end);
    std::memcpy(data.data() + m_position, buffer, count);
    m_position = end;
    return count;
}

u64 memory_file::seek(i64 offset, seek_origin origin) {
    check_open();

    i64 base = 0;
    switch (origin) {
    case seek_origin::begin:
        base = 0;
        break;
    case seek_origin::current:
        base = static_cast<i64>(m_position);
        break;
    case seek_origin::end: {
        std::lock_guard<std::mutex> lock(m_node->mutex);
        base = static_cast<i64>(m_node->data.size());
        break;
    }
    }

    if (offset < 0 && -offset > base)
        SLURP_THROW(io_error(fmt::format("Invalid seek before the start of `{}`.", m_name)));
    m_position = static_cast<u64>(base + offset);
    return m_position;
}

std::unique_ptr<file>
in_memory_vfs::open(const char* path, open_mode mode, access_t access, share_t share) {
    unused(share);
    check_open_args(path, mode, access);

    std::shared_ptr<memory_node> node;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto pos = m_files.find(path);
        if (pos == m_files.end()) {
            if (mode == open_existing) {
                std::error_code ec = std::make_error_code(std::errc::no_such_file_or_directory);
                SLURP_THROW(
                    io_error(fmt::format("Failed to open `{}`: {}.", path, ec.message()), ec));
            }
            pos = m_files.emplace(path, std::make_shared<memory_node>()).first;
        }
        node = pos->second;
    }

    if (mode == create) {
        std::lock_guard<std::mutex> lock(node->mutex);
        node->data.clear();
    }

    SLURP_LOG_TRACE("Opened `{}` in the memory vfs.", path);
    return std::make_unique<memory_file>(*this, path, std::move(node), access, mode == append);
}

void in_memory_vfs::remove(const char* path) {
    if (path == nullptr || *path == '\0')
        SLURP_THROW(bad_argument("Path must not be null or empty."));

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_files.erase(path) == 0) {
        std::error_code ec = std::make_error_code(std::errc::no_such_file_or_directory);
        SLURP_THROW(io_error(fmt::format("Failed to remove `{}`: {}.", path, ec.message()), ec));
    }
}

} // namespace

vfs& memory_vfs() {
    static in_memory_vfs v;
    return v;
}

} // namespace slurp
