#include "utils/shutdown_guard.hpp"

namespace stockade::utils {

ShutdownGuard::~ShutdownGuard() {
    Disarm();
}

void ShutdownGuard::Arm(std::chrono::milliseconds grace, std::function<void()> on_expire) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (armed_ || disarmed_) {
        return;
    }
    armed_ = true;
    thread_ = std::thread([this, grace, on_expire = std::move(on_expire)]() {
        std::unique_lock<std::mutex> wait_lock(mutex_);
        if (cv_.wait_for(wait_lock, grace, [this]() { return disarmed_; })) {
            return;
        }
        wait_lock.unlock();
        on_expire();
    });
}

void ShutdownGuard::Disarm() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        disarmed_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

}  // namespace stockade::utils
