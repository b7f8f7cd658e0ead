// =================================================================
// include/Cortex/TimedCall.hpp
// =================================================================
// Run a callable on its own thread and wait for it with a deadline.

#pragma once

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>

namespace Cortex {

/**
 * @brief Raised when a timed call does not finish within its budget
 */
class TimeoutError : public std::runtime_error {
public:
    explicit TimeoutError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Start a callable on a detached thread
 *
 * Unlike std::async, abandoning the returned future never blocks: a call
 * that overruns its deadline finishes in the background and its result is
 * discarded. Everything the callable touches must therefore be owned by it
 * (captured by value or through shared_ptr).
 */
template <typename Fn>
auto launchDetached(Fn fn) -> std::future<std::invoke_result_t<Fn>> {
    using Result = std::invoke_result_t<Fn>;

    auto promise = std::make_shared<std::promise<Result>>();
    auto future = promise->get_future();

    std::thread([promise, fn = std::move(fn)]() mutable {
        try {
            if constexpr (std::is_void_v<Result>) {
                fn();
                promise->set_value();
            } else {
                promise->set_value(fn());
            }
        } catch (...) {
            // Forwarded to the waiting side, which rethrows it from get()
            promise->set_exception(std::current_exception());
        }
    }).detach();

    return future;
}

/**
 * @brief Run a callable and wait at most @p timeout for its result
 * @throws TimeoutError if the deadline passes first
 * @throws whatever the callable throws
 */
template <typename Fn>
auto callWithTimeout(Fn fn, std::chrono::milliseconds timeout, const std::string& operation)
    -> std::invoke_result_t<Fn> {
    auto future = launchDetached(std::move(fn));

    if (future.wait_for(timeout) != std::future_status::ready) {
        throw TimeoutError(operation + " timed out after " +
                           std::to_string(timeout.count()) + "ms");
    }

    return future.get();
}

} // namespace Cortex
