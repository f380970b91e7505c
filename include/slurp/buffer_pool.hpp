#ifndef SLURP_BUFFER_POOL_HPP
#define SLURP_BUFFER_POOL_HPP

#include <slurp/assert.hpp>
#include <slurp/defs.hpp>
#include <slurp/exception.hpp>

#include <utility>

namespace slurp {

template<typename T>
class buffer_pool;

/// A buffer on loan from a @ref buffer_pool.
///
/// The buffer is returned to its pool when the object is destroyed
/// or reset, so every exit path of the borrowing operation gives it back.
/// The contents of a freshly rented buffer are unspecified.
///
/// \note Pooled buffers can be invalid if they were default constructed or have been moved.
template<typename T>
class pooled_buffer {
public:
    /// Constructs an invalid buffer.
    pooled_buffer() = default;

    pooled_buffer(pooled_buffer&& other) noexcept
        : m_pool(std::exchange(other.m_pool, nullptr))
        , m_data(std::exchange(other.m_data, nullptr))
        , m_capacity(std::exchange(other.m_capacity, 0)) {}

    pooled_buffer& operator=(pooled_buffer&& other) noexcept {
        if (this != &other) {
            reset();
            m_pool = std::exchange(other.m_pool, nullptr);
            m_data = std::exchange(other.m_data, nullptr);
            m_capacity = std::exchange(other.m_capacity, 0);
        }
        return *this;
    }

    ~pooled_buffer() { reset(); }

    /// @{
    /// Returns true if this object currently holds a buffer.
    bool valid() const noexcept { return m_data != nullptr; }
    explicit operator bool() const noexcept { return valid(); }
    /// @}

    /// Pointer to the first element.
    T* data() const noexcept { return m_data; }

    /// Number of elements that fit into the buffer.
    size_t capacity() const noexcept { return m_capacity; }

    /// The pool this buffer was rented from.
    buffer_pool<T>* pool() const noexcept { return m_pool; }

    /// Returns the buffer to its pool. Does nothing if the buffer is invalid.
    void reset() noexcept;

    pooled_buffer(const pooled_buffer&) = delete;
    pooled_buffer& operator=(const pooled_buffer&) = delete;

private:
    friend buffer_pool<T>;

    pooled_buffer(buffer_pool<T>* pool, T* data, size_t capacity) noexcept
        : m_pool(pool)
        , m_data(data)
        , m_capacity(capacity) {}

private:
    buffer_pool<T>* m_pool = nullptr;
    T* m_data = nullptr;
    size_t m_capacity = 0;
};

/// Lends reusable scratch buffers of element type `T`.
///
/// Implementations must be safe to use from multiple threads at once.
/// Buffers are rented with `rent()` and go back to the pool either through
/// `give_back()` or when the @ref pooled_buffer is destroyed.
template<typename T>
class buffer_pool {
public:
    buffer_pool() = default;

    virtual ~buffer_pool() = default;

    /// Returns a buffer with a capacity of at least `min_capacity` elements.
    /// Throws @ref capacity_exceeded if `min_capacity` exceeds `max_capacity()`.
    pooled_buffer<T> rent(size_t min_capacity) {
        if (min_capacity > max_capacity()) {
            SLURP_THROW(capacity_exceeded(
                fmt::format("Cannot rent a buffer of {} elements (the limit is {}).", min_capacity,
                            max_capacity())));
        }

        allocation a = do_rent(min_capacity);
        SLURP_ASSERT(a.data != nullptr, "Pool returned a null buffer.");
        SLURP_ASSERT(a.capacity >= min_capacity, "Pool returned a buffer that is too small.");
        return pooled_buffer<T>(this, a.data, a.capacity);
    }

    /// Returns a buffer to this pool. The buffer becomes invalid.
    /// \pre `buffer` was rented from this pool (or is invalid).
    void give_back(pooled_buffer<T>&& buffer) noexcept {
        SLURP_ASSERT(!buffer.valid() || buffer.pool() == this,
                     "The buffer does not belong to this pool.");
        buffer.reset();
    }

    /// The largest capacity that can be rented from this pool.
    virtual size_t max_capacity() const noexcept = 0;

    buffer_pool(const buffer_pool&) = delete;
    buffer_pool& operator=(const buffer_pool&) = delete;

protected:
    struct allocation {
        T* data = nullptr;
        size_t capacity = 0;
    };

    /// Provides a buffer of at least `min_capacity` elements.
    /// \pre `min_capacity <= max_capacity()`.
    virtual allocation do_rent(size_t min_capacity) = 0;

    /// Takes a buffer back that was previously returned from `do_rent()`.
    virtual void do_give_back(T* data, size_t capacity) noexcept = 0;

private:
    friend pooled_buffer<T>;
};

template<typename T>
void pooled_buffer<T>::reset() noexcept {
    if (m_data) {
        SLURP_ASSERT(m_pool, "Valid buffer without a pool.");
        m_pool->do_give_back(std::exchange(m_data, nullptr), std::exchange(m_capacity, 0));
        m_pool = nullptr;
    }
}

} // namespace slurp

#endif // SLURP_BUFFER_POOL_HPP
