#ifndef ROOMSYNC_BASE_BLOCKING_H
#define ROOMSYNC_BASE_BLOCKING_H

#include <elio/elio.hpp>
#include <elio/time/timer.hpp>
#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>

namespace roomsync {

constexpr auto BLOCKING_POLL_INTERVAL = std::chrono::milliseconds(10);

// Runs a blocking function on its own thread so the scheduler worker that
// started it stays free. The thread is detached: a call nobody waits for any
// more finishes on its own and its result is dropped.
template <typename T>
class BlockingCall {
public:
    template <typename Fn>
    explicit BlockingCall(Fn fn) : state_(std::make_shared<State>()) {
        std::thread([state = state_, fn = std::move(fn)]() mutable {
            std::optional<T> value;
            std::exception_ptr error;
            try {
                value.emplace(fn());
            } catch (...) {
                error = std::current_exception();
            }
            std::lock_guard<std::mutex> lock(state->mutex);
            state->value = std::move(value);
            state->error = error;
            state->ready = true;
        }).detach();
    }

    bool ready() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->ready;
    }

    // Only after ready(); rethrows what the function threw
    T take() {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->error) std::rethrow_exception(state_->error);
        return std::move(*state_->value);
    }

private:
    struct State {
        std::mutex mutex;
        bool ready = false;
        std::optional<T> value;
        std::exception_ptr error;
    };
    std::shared_ptr<State> state_;
};

// Awaits fn on a side thread, polling from the calling coroutine
template <typename Fn, typename T = std::invoke_result_t<Fn&>>
elio::coro::task<T> run_blocking(Fn fn) {
    BlockingCall<T> call(std::move(fn));
    while (!call.ready()) {
        co_await elio::time::sleep_for(BLOCKING_POLL_INTERVAL);
    }
    co_return call.take();
}

} // namespace roomsync

#endif // ROOMSYNC_BASE_BLOCKING_H
