#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace provider
{

/**
 * @brief Caps the number of in-flight requests a shared provider client issues.
 *
 * Callers block for at most the given wait, or until their cancel flag is
 * raised. A permit that could not be acquired reports acquired() == false;
 * the caller checks its cancel flag to tell a cancellation from a timeout.
 */
class ConcurrencyGate
{
public:
    class Permit
    {
    public:
        Permit() = default;
        explicit Permit(ConcurrencyGate* gate)
            : gate_(gate)
        {
        }
        ~Permit()
        {
            if (gate_)
                gate_->release();
        }

        Permit(Permit&& other) noexcept
            : gate_(other.gate_)
        {
            other.gate_ = nullptr;
        }
        Permit& operator=(Permit&& other) noexcept
        {
            if (this != &other)
            {
                if (gate_)
                    gate_->release();
                gate_ = other.gate_;
                other.gate_ = nullptr;
            }
            return *this;
        }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        bool acquired() const { return gate_ != nullptr; }

    private:
        ConcurrencyGate* gate_ = nullptr;
    };

    explicit ConcurrencyGate(std::size_t limit)
        : limit_(limit == 0 ? 1 : limit)
    {
    }

    // Granularity at which a queued caller notices its cancel flag
    static constexpr std::chrono::milliseconds kCancelPoll{ 20 };

    Permit acquire(std::chrono::milliseconds wait, const std::atomic<bool>* cancel_flag = nullptr)
    {
        const auto deadline = std::chrono::steady_clock::now() + wait;
        std::unique_lock<std::mutex> lock(mtx_);
        while (in_flight_ >= limit_)
        {
            if (cancel_flag && cancel_flag->load(std::memory_order_relaxed))
                return Permit{};
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
                return Permit{};
            cv_.wait_for(lock, std::min<std::chrono::steady_clock::duration>(kCancelPoll, deadline - now));
        }
        ++in_flight_;
        return Permit{ this };
    }

    std::size_t inFlight() const
    {
        std::lock_guard<std::mutex> lock(mtx_);
        return in_flight_;
    }

    std::size_t limit() const { return limit_; }

private:
    void release()
    {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            --in_flight_;
        }
        cv_.notify_one();
    }

    const std::size_t limit_;
    std::size_t in_flight_ = 0;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace provider
