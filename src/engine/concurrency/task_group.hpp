#pragma once
#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <exception>
#include <optional>
#include <string>

namespace Sightline {
namespace Engine {

// Value or error message of one fanned-out task.
template <typename T>
struct Outcome {
    std::optional<T> value;
    std::string      error;

    bool ok() const {
        return value.has_value();
    }
};

// Runs `task` and stores its value or the message of the std::exception it threw.
template <typename T>
boost::asio::awaitable<void> capture(boost::asio::awaitable<T> task, Outcome<T>& out) {
    try {
        out.value = co_await std::move(task);
    } catch (const std::exception& e) {
        out.error = e.what();
    }
}

// Join point for child coroutines spawned on one single-threaded executor.
// The group must outlive its children, which wait() guarantees.
class TaskGroup {
public:
    explicit TaskGroup(boost::asio::any_io_executor executor);
    TaskGroup(const TaskGroup&)            = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    void spawn(boost::asio::awaitable<void> task);

    // Completes once every spawned task has finished. Rethrows the first
    // exception that escaped a task.
    boost::asio::awaitable<void> wait();

    size_t pending() const {
        return pending_;
    }

private:
    boost::asio::any_io_executor executor_;
    boost::asio::steady_timer    done_;
    size_t                       pending_ = 0;
    std::exception_ptr           first_error_;
};

// Caps how many coroutines on one single-threaded executor run a section at once.
class Limiter {
public:
    Limiter(boost::asio::any_io_executor executor, size_t limit);
    Limiter(const Limiter&)            = delete;
    Limiter& operator=(const Limiter&) = delete;

    // Holds one slot from acquire() until destruction.
    class Slot {
    public:
        explicit Slot(Limiter& limiter) : limiter_(limiter) {
        }
        ~Slot() {
            limiter_.release();
        }
        Slot(const Slot&)            = delete;
        Slot& operator=(const Slot&) = delete;

    private:
        Limiter& limiter_;
    };

    boost::asio::awaitable<void> acquire();
    void                         release();

    size_t in_use() const {
        return in_use_;
    }
    size_t peak() const {
        return peak_;
    }

private:
    boost::asio::steady_timer freed_;
    size_t                    limit_;
    size_t                    in_use_ = 0;
    size_t                    peak_   = 0;
};

}  // namespace Engine
}  // namespace Sightline
