#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

// Lets one caller abandon its own pacing wait without touching anyone else's.
class CancelToken {
public:
    void cancel();
    bool cancelled() const;

    // Blocks until `deadline` or cancel(); true when the deadline was reached
    bool sleep_until(std::chrono::steady_clock::time_point deadline);

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
};
