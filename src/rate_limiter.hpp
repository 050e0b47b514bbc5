#pragma once
#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace todochat {

// Sliding one-minute window per client key (0 rpm = unlimited)
class RateLimiter {
public:
    explicit RateLimiter(int requests_per_minute)
        : rpm_(requests_per_minute) {}

    bool allow(const std::string& key) {
        return allow(key, std::chrono::steady_clock::now());
    }

    bool allow(const std::string& key, std::chrono::steady_clock::time_point now) {
        if (rpm_ <= 0) return true;

        std::lock_guard<std::mutex> lock(mutex_);
        auto cutoff = now - std::chrono::seconds(60);

        auto& timestamps = windows_[key];
        while (!timestamps.empty() && timestamps.front() <= cutoff) {
            timestamps.pop_front();
        }

        if (static_cast<int>(timestamps.size()) >= rpm_) {
            return false;
        }

        timestamps.push_back(now);
        prune(cutoff);
        return true;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        windows_.clear();
    }

private:
    int rpm_;
    std::mutex mutex_;
    std::unordered_map<std::string, std::deque<std::chrono::steady_clock::time_point>> windows_;

    // Drops idle clients so the map does not grow without bound
    void prune(std::chrono::steady_clock::time_point cutoff) {
        if (windows_.size() < 1024) return;
        for (auto it = windows_.begin(); it != windows_.end();) {
            if (it->second.empty() || it->second.back() <= cutoff) it = windows_.erase(it);
            else ++it;
        }
    }
};

} // namespace todochat
