#pragma once
#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <exception>
#include <optional>

namespace Sightline {
namespace Engine {

// Drives `task` on `ioc` for at most `deadline`. Returns nothing on expiry; the
// context is stopped and whatever is still in flight is abandoned with it.
// Exceptions escaping `task` are rethrown.
template <typename T>
std::optional<T> run_with_deadline(boost::asio::io_context&            ioc,
                                   boost::asio::awaitable<T>           task,
                                   std::chrono::steady_clock::duration deadline) {
    std::optional<T>   result;
    std::exception_ptr error;
    boost::asio::co_spawn(ioc, std::move(task), [&](std::exception_ptr e, T value) {
        if (e)
            error = e;
        else
            result = std::move(value);
    });

    ioc.run_for(deadline);
    if (error)
        std::rethrow_exception(error);
    if (!result)
        ioc.stop();
    return result;
}

}  // namespace Engine
}  // namespace Sightline
