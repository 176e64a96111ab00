#pragma once
///@file

#include <utility>
#include <cassert>
#include <exception>

/**
 * Run a function at the end of a scope, unless the `Finally` was
 * moved from or `cancel()`ed.
 */
template<typename Fn>
class [[nodiscard("Finally values must be used")]] Finally
{
private:
    Fn fun;
    bool movedFrom = false;

public:
    Finally(Fn fun)
        : fun(std::move(fun))
    {
    }

    // Copying would run the function twice.
    Finally(Finally & other) = delete;

    Finally(Finally && other) noexcept(std::is_nothrow_move_constructible_v<Fn>)
        : fun(std::move(other.fun))
    {
        other.movedFrom = true;
    }

    /**
     * Do not run the function at the end of the scope.
     */
    void cancel()
    {
        movedFrom = true;
    }

    ~Finally() noexcept(false)
    {
        try {
            if (!movedFrom)
                fun();
        } catch (...) {
            // Throwing while another exception is propagating would
            // terminate anyway; make the cause obvious.
            if (std::uncaught_exceptions()) {
                assert(
                    false
                    && "Finally function threw an exception during exception handling. "
                       "this is not what you want, please use some other methods (like "
                       "std::promise or async) instead.");
            }
            throw;
        }
    }
};
