#include "stop_signal.hpp"

void StopSignal::request_stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopped = true;
    }
    cv.notify_all();
}

bool StopSignal::stop_requested() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return stopped;
}

bool StopSignal::wait_until_released(const std::atomic<bool> &released)
{
    std::unique_lock<std::mutex> lock(mutex);
    cv.wait(lock, [this, &released] { return stopped || released.load(); });
    return stopped;
}

void StopSignal::wake()
{
    // Taking the lock orders the caller's store to released before a waiter's
    // predicate check.
    {
        std::lock_guard<std::mutex> lock(mutex);
    }
    cv.notify_all();
}
