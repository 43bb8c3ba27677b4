#pragma once

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

namespace askql {

template<typename T>
struct DeadlineOutcome {
    std::optional<T> value;     // set when fn returned in time
    bool timed_out = false;
    std::string error;          // what() of an exception thrown by fn
};

/**
 * @brief Run fn on a detached worker and wait at most `timeout` for it
 *
 * The worker is not interrupted on timeout; it finishes in the background
 * and its result is dropped. fn must therefore own (by value or shared_ptr)
 * everything it touches.
 *
 * Exceptions thrown by fn travel through the promise and are reported in
 * DeadlineOutcome::error. Thread creation failure (std::system_error)
 * propagates to the caller.
 */
template<typename Fn>
[[nodiscard]] DeadlineOutcome<std::invoke_result_t<Fn>> run_with_deadline(
    Fn fn, std::chrono::milliseconds timeout) {
    using T = std::invoke_result_t<Fn>;

    auto promise = std::make_shared<std::promise<T>>();
    auto future = promise->get_future();

    std::thread([promise, fn = std::move(fn)]() mutable {
        try {
            promise->set_value(fn());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    DeadlineOutcome<T> outcome;
    if (future.wait_for(timeout) != std::future_status::ready) {
        outcome.timed_out = true;
        return outcome;
    }

    try {
        outcome.value = future.get();
    } catch (const std::exception& e) {
        outcome.error = e.what();
    }
    return outcome;
}

} // namespace askql
