#ifndef STOP_SIGNAL_HPP
#define STOP_SIGNAL_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>

// Externally owned request to stop a blocking operation.
class StopSignal
{
private:
    mutable std::mutex mutex;
    std::condition_variable cv;
    bool stopped = false;

public:
    void request_stop();
    bool stop_requested() const;

    // Blocks until stop is requested or released becomes true, whichever
    // happens first. Whoever sets released must call wake() afterwards.
    // Returns true if stop was requested.
    bool wait_until_released(const std::atomic<bool> &released);
    void wake();
};

#endif
