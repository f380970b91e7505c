#ifndef SLURP_SHARED_BUFFER_POOL_HPP
#define SLURP_SHARED_BUFFER_POOL_HPP

#include <slurp/assert.hpp>
#include <slurp/buffer_pool.hpp>
#include <slurp/defs.hpp>
#include <slurp/math.hpp>

#include <boost/intrusive/slist.hpp>

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <new>
#include <type_traits>

namespace slurp {

/// Usage counters of a @ref shared_buffer_pool.
struct buffer_pool_stats {
    /// Number of successful calls to rent().
    u64 rents = 0;

    /// Number of buffers that have been given back.
    u64 returns = 0;

    /// Number of times new memory had to be allocated
    /// because no cached buffer was available.
    u64 allocations = 0;

    /// Number of buffers currently on loan.
    u64 outstanding = 0;
};

/// A thread safe buffer pool that keeps returned buffers in power-of-two size classes.
///
/// Requests are rounded up to the next size class, starting at `min_bucket_capacity`.
/// Requests larger than `max_pooled_capacity` bypass the cache: they are allocated
/// with their exact size and freed when given back.
///
/// While a buffer is cached, its own storage holds the free list link,
/// so the pool needs no additional memory per cached buffer.
template<typename T>
class shared_buffer_pool final : public buffer_pool<T> {
    static_assert(std::is_trivial<T>::value, "Pooled elements must be trivial.");

    using allocation = typename buffer_pool<T>::allocation;

public:
    /// Smallest capacity handed out (in elements).
    static constexpr size_t min_bucket_capacity = 64;

public:
    /// Constructs a new pool.
    ///
    /// \param max_pooled_capacity
    ///     The largest size class that is cached, in elements.
    ///     Rounded up to a power of two.
    ///
    /// \param buffers_per_bucket
    ///     The number of buffers that are cached per size class.
    ///     Additional buffers are freed when given back.
    ///
    /// \param max_capacity
    ///     The largest capacity that can be rented at all.
    explicit shared_buffer_pool(size_t max_pooled_capacity = size_t(1) << 20,
                                size_t buffers_per_bucket = 16,
                                size_t max_capacity = slurp::max_buffer_length / sizeof(T));

    ~shared_buffer_pool();

    size_t max_capacity() const noexcept override { return m_max_capacity; }

    /// Returns a snapshot of the usage counters.
    buffer_pool_stats stats() const noexcept;

    /// Frees all cached buffers.
    void trim() noexcept;

private:
    allocation do_rent(size_t min_capacity) override;
    void do_give_back(T* data, size_t capacity) noexcept override;

    // Returns the index of the size class for the given capacity
    // or the number of buckets if the capacity is not cached.
    size_t bucket_index(size_t capacity) const noexcept;

    static T* allocate(size_t capacity);
    static void deallocate(T* data) noexcept;

private:
    // Placed into the storage of a cached buffer.
    struct free_slot : boost::intrusive::slist_base_hook<> {};

    static_assert(sizeof(free_slot) <= min_bucket_capacity * sizeof(T),
                  "Cached buffers must be able to hold a free list link.");

    using slot_list = boost::intrusive::slist<free_slot, boost::intrusive::constant_time_size<true>>;

    struct bucket {
        std::mutex mutex;
        slot_list slots;
    };

private:
    size_t m_max_capacity;
    size_t m_max_pooled_capacity;
    size_t m_buffers_per_bucket;
    std::unique_ptr<bucket[]> m_buckets;
    size_t m_bucket_count;

    std::atomic<u64> m_rents{0};
    std::atomic<u64> m_returns{0};
    std::atomic<u64> m_allocations{0};
};

template<typename T>
shared_buffer_pool<T>::shared_buffer_pool(size_t max_pooled_capacity, size_t buffers_per_bucket,
                                          size_t max_capacity)
    : m_max_capacity(max_capacity)
    , m_max_pooled_capacity(round_towards_pow2(std::max(max_pooled_capacity, min_bucket_capacity)))
    , m_buffers_per_bucket(buffers_per_bucket) {
    SLURP_CHECK(max_capacity > 0, "The maximum capacity must not be zero.");
    m_bucket_count = log2(m_max_pooled_capacity) - log2(min_bucket_capacity) + 1;
    m_buckets = std::make_unique<bucket[]>(m_bucket_count);
}

template<typename T>
shared_buffer_pool<T>::~shared_buffer_pool() {
    trim();
}

template<typename T>
buffer_pool_stats shared_buffer_pool<T>::stats() const noexcept {
    buffer_pool_stats s;
    s.rents = m_rents.load(std::memory_order_relaxed);
    s.returns = m_returns.load(std::memory_order_relaxed);
    s.allocations = m_allocations.load(std::memory_order_relaxed);
    s.outstanding = s.rents >= s.returns ? s.rents - s.returns : 0;
    return s;
}

template<typename T>
void shared_buffer_pool<T>::trim() noexcept {
    for (size_t i = 0; i < m_bucket_count; ++i) {
        bucket& b = m_buckets[i];
        std::lock_guard<std::mutex> lock(b.mutex);
        b.slots.clear_and_dispose([](free_slot* slot) {
            slot->~free_slot();
            deallocate(reinterpret_cast<T*>(slot));
        });
    }
}

template<typename T>
size_t shared_buffer_pool<T>::bucket_index(size_t capacity) const noexcept {
    if (capacity > m_max_pooled_capacity || !is_pow2(capacity) || capacity < min_bucket_capacity)
        return m_bucket_count;
    return log2(capacity) - log2(min_bucket_capacity);
}

template<typename T>
typename shared_buffer_pool<T>::allocation shared_buffer_pool<T>::do_rent(size_t min_capacity) {
    size_t capacity = std::max(min_capacity, min_bucket_capacity);
    if (capacity <= m_max_pooled_capacity)
        capacity = round_towards_pow2(capacity);

    // Size classes above the ceiling are never handed out.
    if (capacity > m_max_capacity)
        capacity = std::max(min_capacity, size_t(1));

    size_t index = bucket_index(capacity);
    if (index < m_bucket_count) {
        bucket& b = m_buckets[index];
        std::unique_lock<std::mutex> lock(b.mutex);
        if (!b.slots.empty()) {
            free_slot* slot = &b.slots.front();
            b.slots.pop_front();
            lock.unlock();

            slot->~free_slot();
            m_rents.fetch_add(1, std::memory_order_relaxed);
            return allocation{reinterpret_cast<T*>(slot), capacity};
        }
    }

    T* data = allocate(capacity);
    m_allocations.fetch_add(1, std::memory_order_relaxed);
    m_rents.fetch_add(1, std::memory_order_relaxed);
    return allocation{data, capacity};
}

template<typename T>
void shared_buffer_pool<T>::do_give_back(T* data, size_t capacity) noexcept {
    m_returns.fetch_add(1, std::memory_order_relaxed);

    size_t index = bucket_index(capacity);
    if (index < m_bucket_count) {
        bucket& b = m_buckets[index];
        std::lock_guard<std::mutex> lock(b.mutex);
        if (b.slots.size() < m_buffers_per_bucket) {
            free_slot* slot = new (data) free_slot();
            b.slots.push_front(*slot);
            return;
        }
    }
    deallocate(data);
}

template<typename T>
T* shared_buffer_pool<T>::allocate(size_t capacity) {
    return static_cast<T*>(::operator new(capacity * sizeof(T)));
}

template<typename T>
void shared_buffer_pool<T>::deallocate(T* data) noexcept {
    ::operator delete(static_cast<void*>(data));
}

extern template class shared_buffer_pool<byte>;
extern template class shared_buffer_pool<char>;

/// The process wide pool for byte buffers.
shared_buffer_pool<byte>& shared_byte_pool();

/// The process wide pool for character buffers.
shared_buffer_pool<char>& shared_char_pool();

} // namespace slurp

#endif // SLURP_SHARED_BUFFER_POOL_HPP
