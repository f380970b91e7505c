#include <slurp/shared_buffer_pool.hpp>

namespace slurp {

template class shared_buffer_pool<byte>;
template class shared_buffer_pool<char>;

shared_buffer_pool<byte>& shared_byte_pool() {
    static shared_buffer_pool<byte> pool;
    return pool;
}

shared_buffer_pool<char>& shared_char_pool() {
    static shared_buffer_pool<char> pool;
    return pool;
}

} // namespace slurp
