#ifndef TASKLIST_UTIL_CHECKOUT_QUEUE_H
#define TASKLIST_UTIL_CHECKOUT_QUEUE_H

#include <algorithm>
#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <tasklist/async.h>
#include <tasklist/exceptions.h>

namespace tasklist::util {

/**
 * @brief Hands idle items to coroutines, oldest waiter first.
 *
 * All state lives on one strand, so a release() can never slip in between a
 * waiter registering and its timer wait starting. A released item goes
 * straight to the front waiter; a waiter that times out removes itself.
 * The queue must outlive every pending acquire() and release().
 */
template<typename T>
class CheckoutQueue {
public:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

    CheckoutQueue(boost::asio::io_context& ctx, std::chrono::steady_clock::duration timeout)
        : strand_(boost::asio::make_strand(ctx)), timeout_(timeout) {}

    CheckoutQueue(const CheckoutQueue&) = delete;
    CheckoutQueue& operator=(const CheckoutQueue&) = delete;

    /**
     * @brief Resolves with an idle item.
     * @throws StoreError if none is released within the timeout.
     */
    Async<T> acquire() {
        co_return co_await boost::asio::co_spawn(strand_, take(), boost::asio::use_awaitable);
    }

    void release(T item) {
        boost::asio::post(strand_, [this, item = std::move(item)]() mutable {
            give(std::move(item));
        });
    }

private:
    struct Waiter {
        explicit Waiter(const Strand& strand) : timer(strand) {}

        boost::asio::steady_timer timer;
        std::optional<T> item;
    };

    Strand strand_;
    std::chrono::steady_clock::duration timeout_;
    std::deque<T> idle_;
    std::deque<std::shared_ptr<Waiter>> waiters_;

    Async<T> take() {
        if (!idle_.empty()) {
            T item = std::move(idle_.front());
            idle_.pop_front();
            co_return item;
        }

        auto waiter = std::make_shared<Waiter>(strand_);
        waiter->timer.expires_after(timeout_);
        waiters_.push_back(waiter);

        // give() cancels the timer; expiry means nobody handed us anything
        boost::system::error_code ec;
        co_await waiter->timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (waiter->item) {
            co_return std::move(*waiter->item);
        }

        waiters_.erase(std::find(waiters_.begin(), waiters_.end(), waiter));
        throw StoreError("Timed out waiting for a free connection");
    }

    void give(T item) {
        if (waiters_.empty()) {
            idle_.push_back(std::move(item));
            return;
        }
        auto waiter = std::move(waiters_.front());
        waiters_.pop_front();
        waiter->item = std::move(item);
        waiter->timer.cancel();
    }
};

} // namespace tasklist::util

#endif // TASKLIST_UTIL_CHECKOUT_QUEUE_H
