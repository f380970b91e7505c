#include <slurp/io_executor.hpp>

#include <slurp/log.hpp>

#include <algorithm>
#include <thread>

namespace slurp {

io_executor::io_executor(size_t threads)
    : m_threads(std::max(threads, size_t(1)))
    , m_pool(m_threads) {
    SLURP_LOG_DEBUG("Started an I/O executor with {} threads.", m_threads);
}

io_executor::~io_executor() {
    join();
}

void io_executor::join() {
    m_pool.join();
}

size_t io_executor::default_thread_count() noexcept {
    return std::max(std::thread::hardware_concurrency(), 1u);
}

io_executor& default_executor() {
    static io_executor executor;
    return executor;
}

} // namespace slurp
