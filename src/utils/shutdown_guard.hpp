#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace stockade::utils {

// Runs on_expire on its own thread unless Disarm() is called within the
// grace period. Bounds a shutdown that waits on a thread which may never
// return.
class ShutdownGuard {
public:
    ShutdownGuard() = default;
    ~ShutdownGuard();

    ShutdownGuard(const ShutdownGuard&) = delete;
    ShutdownGuard& operator=(const ShutdownGuard&) = delete;

    // A second Arm() keeps the first deadline.
    void Arm(std::chrono::milliseconds grace, std::function<void()> on_expire);
    void Disarm();

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool armed_ = false;
    bool disarmed_ = false;
    std::thread thread_;
};

}  // namespace stockade::utils
