/*

async_mutex.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

#include <xmppxx/detail/asio_decl.hpp>

namespace xmppxx::detail
{

/// Exception thrown when async_mutex lock is cancelled
class lock_cancelled : public std::runtime_error
{
public:
    lock_cancelled() : std::runtime_error("async_mutex lock cancelled") {}
};

/**
Coroutine mutex serializing one direction of an XMPP stream.

Waiters are resumed in FIFO order. The lock is handed over directly to the next
waiter on unlock, so a released lock is never observed free by a late comer while
somebody is queued.
**/
class async_mutex
{
public:
    class scoped_lock
    {
    public:
        scoped_lock() noexcept = default;

        scoped_lock(const scoped_lock&) = delete;
        scoped_lock& operator=(const scoped_lock&) = delete;

        scoped_lock(scoped_lock&& other) noexcept
            : mutex_(std::exchange(other.mutex_, nullptr))
        {
        }

        scoped_lock& operator=(scoped_lock&& other) noexcept
        {
            if (this != &other)
            {
                unlock();
                mutex_ = std::exchange(other.mutex_, nullptr);
            }
            return *this;
        }

        ~scoped_lock()
        {
            unlock();
        }

    private:
        friend class async_mutex;

        explicit scoped_lock(async_mutex& mutex) noexcept
            : mutex_(&mutex)
        {
        }

        void unlock() noexcept
        {
            if (mutex_ != nullptr)
            {
                mutex_->unlock();
                mutex_ = nullptr;
            }
        }

        async_mutex* mutex_{nullptr};
    };

    explicit async_mutex(xmppxx::asio::any_io_executor executor)
        : executor_(std::move(executor))
    {
    }

    async_mutex(const async_mutex&) = delete;
    async_mutex& operator=(const async_mutex&) = delete;

    /// @throws lock_cancelled if the wait is aborted without the lock being handed over
    xmppxx::asio::awaitable<scoped_lock> lock()
    {
        bool expected = false;
        if (locked_.compare_exchange_strong(expected, true, std::memory_order_acquire))
            co_return scoped_lock(*this);

        auto waiter = std::make_shared<waiter_t>(executor_);
        waiter->timer.expires_at(xmppxx::asio::steady_timer::time_point::max());
        {
            std::lock_guard<std::mutex> guard(waiters_mutex_);
            waiters_.push_back(waiter);
        }

        xmppxx::asio::error_code ec;
        co_await waiter->timer.async_wait(xmppxx::asio::redirect_error(xmppxx::asio::use_awaitable, ec));

        if (!waiter->ready.load(std::memory_order_acquire))
        {
            std::lock_guard<std::mutex> guard(waiters_mutex_);
            auto it = std::find(waiters_.begin(), waiters_.end(), waiter);
            if (it != waiters_.end())
                waiters_.erase(it);
            throw lock_cancelled();
        }

        co_return scoped_lock(*this);
    }

    [[nodiscard]] bool is_locked() const noexcept
    {
        return locked_.load(std::memory_order_acquire);
    }

private:
    struct waiter_t
    {
        explicit waiter_t(xmppxx::asio::any_io_executor executor)
            : timer(std::move(executor))
        {
        }

        xmppxx::asio::steady_timer timer;
        std::atomic<bool> ready{false};
    };

    void unlock() noexcept
    {
        std::shared_ptr<waiter_t> waiter;
        {
            std::lock_guard<std::mutex> guard(waiters_mutex_);
            if (waiters_.empty())
            {
                locked_.store(false, std::memory_order_release);
                return;
            }
            waiter = waiters_.front();
            waiters_.pop_front();
        }

        // Ownership passes to the waiter; locked_ stays true.
        waiter->ready.store(true, std::memory_order_release);
        waiter->timer.cancel();
    }

    xmppxx::asio::any_io_executor executor_;
    std::atomic<bool> locked_{false};
    mutable std::mutex waiters_mutex_;
    std::deque<std::shared_ptr<waiter_t>> waiters_;
};

} // namespace xmppxx::detail
