#include "task_group.hpp"
#include <algorithm>
#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace Sightline {
namespace Engine {

TaskGroup::TaskGroup(boost::asio::any_io_executor executor)
    : executor_(executor), done_(executor, boost::asio::steady_timer::time_point::max()) {
}

void TaskGroup::spawn(boost::asio::awaitable<void> task) {
    ++pending_;
    boost::asio::co_spawn(executor_, std::move(task), [this](std::exception_ptr e) {
        if (e && !first_error_)
            first_error_ = e;
        if (--pending_ == 0)
            done_.cancel();
    });
}

boost::asio::awaitable<void> TaskGroup::wait() {
    while (pending_ > 0) {
        boost::system::error_code ec;
        co_await done_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
    if (first_error_)
        std::rethrow_exception(first_error_);
}

Limiter::Limiter(boost::asio::any_io_executor executor, size_t limit)
    : freed_(executor, boost::asio::steady_timer::time_point::max()), limit_(limit == 0 ? 1 : limit) {
}

boost::asio::awaitable<void> Limiter::acquire() {
    while (in_use_ >= limit_) {
        boost::system::error_code ec;
        co_await freed_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
    ++in_use_;
    peak_ = std::max(peak_, in_use_);
}

void Limiter::release() {
    if (in_use_ > 0)
        --in_use_;
    freed_.cancel();
}

}  // namespace Engine
}  // namespace Sightline
