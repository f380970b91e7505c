#include <slurp/growable_reader.hpp>

#include <slurp/detail/io_strategy.hpp>

namespace slurp {

growable_reader::growable_reader(buffer_pool<byte>& pool, size_t initial_buffer_size,
                                 size_t max_buffer_length)
    : m_pool(&pool)
    , m_initial_buffer_size(initial_buffer_size)
    , m_max_buffer_length(max_buffer_length) {
    if (initial_buffer_size == 0)
        SLURP_THROW(bad_argument("The initial buffer size must not be zero."));
    if (max_buffer_length < initial_buffer_size) {
        SLURP_THROW(bad_argument(
            fmt::format("The maximum buffer length ({}) is smaller than the initial buffer "
                        "size ({}).",
                        max_buffer_length, initial_buffer_size)));
    }
}

std::vector<byte> growable_reader::read_all(file& f) {
    detail::blocking_io io;
    return read_all(io, f).value();
}

void growable_reader::too_large(file& f, u64 length) const {
    SLURP_THROW(file_too_large(
        fmt::format("File `{}` is too large: {} bytes exceed the maximum buffer length of {} bytes.",
                    f.name(), length, m_max_buffer_length)));
}

} // namespace slurp
