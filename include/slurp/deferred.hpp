#ifndef SLURP_DEFERRED_HPP
#define SLURP_DEFERRED_HPP

#include <exception>
#include <type_traits>
#include <utility>

namespace slurp {

/// An object that performs some action when the enclosing scope ends.
///
/// Used to release files and rented buffers on every exit path of an
/// operation. The action can be disabled with `disable()`, typically once
/// ownership has been handed over to a result object.
///
/// Exceptions thrown by the action are propagated unless the scope
/// is already being left because of another exception.
template<typename Function>
class deferred {
public:
    deferred(const Function& fn)
        : m_fn(fn) {}

    deferred(Function&& fn)
        : m_fn(std::move(fn)) {}

    ~deferred() noexcept(noexcept(std::declval<Function&>()())) {
        if (m_invoke) {
            try {
                m_fn();
            } catch (...) {
                if (!std::uncaught_exceptions())
                    throw;
            }
        }
    }

    /// Disables the execution of the deferred function.
    void disable() noexcept { m_invoke = false; }

    deferred(deferred&& other) = delete;
    deferred& operator=(const deferred&) = delete;

private:
    Function m_fn;
    bool m_invoke = true;
};

} // namespace slurp

#endif // SLURP_DEFERRED_HPP
