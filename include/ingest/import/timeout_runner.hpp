#pragma once

#include "ingest/core/io_error.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>

namespace ingest::import {

/**
 * @brief Races a blocking I/O operation against a deadline
 *
 * The operation runs on an Asio thread pool while the caller waits. On
 * expiry the caller gets ETIMEDOUT (retryable) and the operation is
 * abandoned: it keeps running, and when it finally returns its result is
 * discarded and the optional cleanup hook runs on the worker thread.
 *
 * An abandoned call may outlive the object that submitted it, so the
 * operation must capture only what outlives the runner itself. Owners keep
 * one runner for their whole lifetime so a hung call never blocks the
 * caller that gave up on it.
 */
class TimeoutRunner {
public:
    explicit TimeoutRunner(std::size_t threads = 2) : pool_(threads == 0 ? 1 : threads) {}

    /// Queued calls nobody waits for any more are dropped; running ones are joined.
    ~TimeoutRunner() {
        pool_.stop();
        pool_.join();
    }

    TimeoutRunner(const TimeoutRunner&) = delete;
    TimeoutRunner& operator=(const TimeoutRunner&) = delete;

    template<typename T>
    IoResult<T> run(std::function<IoResult<T>()> operation,
                    std::chrono::milliseconds timeout,
                    std::function<void()> on_abandoned = {}) {
        auto state = std::make_shared<State<T>>();

        boost::asio::post(pool_, [state, operation = std::move(operation), on_abandoned]() {
            std::optional<IoResult<T>> outcome;
            try {
                outcome.emplace(operation());
            } catch (const std::exception& e) {
                outcome.emplace(Err<T>(IoError{std::make_error_code(std::errc::state_not_recoverable), e.what()}));
            }

            std::unique_lock lock(state->mutex);
            if (state->abandoned) {
                lock.unlock();
                if (on_abandoned) {
                    on_abandoned();
                }
                return;
            }
            state->value = std::move(outcome);
            lock.unlock();
            state->cv.notify_one();
        });

        std::unique_lock lock(state->mutex);
        if (!state->cv.wait_for(lock, timeout, [&state]() { return state->value.has_value(); })) {
            state->abandoned = true;
            return Err<T>(IoError{std::make_error_code(std::errc::timed_out),
                                  "Operation timed out after " + std::to_string(timeout.count()) + "ms"});
        }
        return std::move(*state->value);
    }

private:
    template<typename T>
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        std::optional<IoResult<T>> value;
        bool abandoned = false;
    };

    boost::asio::thread_pool pool_;
};

} // namespace ingest::import
