/*

async_mutex.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <deque>
#include <memory>
#include <stdexcept>
#include <utility>

#include <mailsync/detail/asio_decl.hpp>

namespace mailsync::detail
{

/// Thrown when a pending lock is abandoned because its executor shut down.
class lock_cancelled : public std::runtime_error
{
public:
    lock_cancelled() : std::runtime_error("async_mutex lock cancelled") {}
};

/**
Coroutine mutex for one executor. Waiters are resumed in FIFO order.
Used by a session so that a keepalive probe and a regular command never read the same socket concurrently.
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

        void unlock() noexcept
        {
            if (mutex_ != nullptr)
            {
                mutex_->release();
                mutex_ = nullptr;
            }
        }

    private:
        friend class async_mutex;

        explicit scoped_lock(async_mutex& mutex) noexcept
            : mutex_(&mutex)
        {
        }

        async_mutex* mutex_{nullptr};
    };

    explicit async_mutex(mailsync::asio::any_io_executor executor)
        : executor_(std::move(executor))
    {
    }

    async_mutex(const async_mutex&) = delete;
    async_mutex& operator=(const async_mutex&) = delete;

    [[nodiscard]] bool locked() const noexcept
    {
        return locked_;
    }

    mailsync::asio::awaitable<scoped_lock> lock()
    {
        if (!locked_)
        {
            locked_ = true;
            co_return scoped_lock(*this);
        }

        auto waiter = std::make_shared<waiter_t>(executor_);
        waiter->timer.expires_at(mailsync::asio::steady_timer::time_point::max());
        waiters_.push_back(waiter);

        mailsync::asio::error_code ec;
        co_await waiter->timer.async_wait(mailsync::asio::redirect_error(mailsync::asio::use_awaitable, ec));

        if (!waiter->ready)
        {
            auto it = std::find(waiters_.begin(), waiters_.end(), waiter);
            if (it != waiters_.end())
                waiters_.erase(it);
            throw lock_cancelled();
        }

        // Ownership was handed over by release(); locked_ stayed true.
        co_return scoped_lock(*this);
    }

private:
    struct waiter_t
    {
        explicit waiter_t(mailsync::asio::any_io_executor executor)
            : timer(std::move(executor))
        {
        }

        mailsync::asio::steady_timer timer;
        bool ready{false};
    };

    void release() noexcept
    {
        if (waiters_.empty())
        {
            locked_ = false;
            return;
        }

        std::shared_ptr<waiter_t> waiter = waiters_.front();
        waiters_.pop_front();
        waiter->ready = true;
        mailsync::asio::error_code ignored;
        waiter->timer.cancel(ignored);
    }

    mailsync::asio::any_io_executor executor_;
    bool locked_{false};
    std::deque<std::shared_ptr<waiter_t>> waiters_;
};

} // namespace mailsync::detail
