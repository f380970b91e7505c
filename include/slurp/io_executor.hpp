#ifndef SLURP_IO_EXECUTOR_HPP
#define SLURP_IO_EXECUTOR_HPP

#include <slurp/defs.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <future>
#include <memory>
#include <type_traits>
#include <utility>

namespace slurp {

/// Runs non-blocking transfers on a pool of worker threads.
///
/// Each submitted operation occupies one worker for its duration; the
/// submitting thread returns immediately with a future for the result.
class io_executor {
public:
    /// Starts `threads` worker threads (at least one).
    explicit io_executor(size_t threads = default_thread_count());

    /// Waits for all submitted operations to finish.
    ~io_executor();

    /// Schedules `fn` for execution on a worker thread and returns a future
    /// for its result. Exceptions thrown by `fn` are stored in the future.
    template<typename Function>
    std::future<std::invoke_result_t<std::decay_t<Function>&>> submit(Function&& fn) {
        using result_type = std::invoke_result_t<std::decay_t<Function>&>;

        auto task = std::make_shared<std::packaged_task<result_type()>>(std::forward<Function>(fn));
        std::future<result_type> result = task->get_future();
        boost::asio::post(m_pool, [task]() { (*task)(); });
        return result;
    }

    /// Waits until all submitted operations have completed.
    /// No new operations may be submitted afterwards.
    void join();

    /// The number of worker threads.
    size_t thread_count() const noexcept { return m_threads; }

    /// The number of hardware threads, but at least one.
    static size_t default_thread_count() noexcept;

    io_executor(const io_executor&) = delete;
    io_executor& operator=(const io_executor&) = delete;

private:
    size_t m_threads;
    boost::asio::thread_pool m_pool;
};

/// Returns the process wide executor.
io_executor& default_executor();

namespace detail {

/// Returns a future that already holds `value`.
template<typename T>
std::future<T> ready_future(T value) {
    std::promise<T> promise;
    promise.set_value(std::move(value));
    return promise.get_future();
}

} // namespace detail

} // namespace slurp

#endif // SLURP_IO_EXECUTOR_HPP
