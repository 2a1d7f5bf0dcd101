// In-memory MediaProbe for tests: fixed media table, failure injection,
// per-asset call counting and an optional artificial delay.
#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include "media_probe.hpp"

namespace test_utils {

class FakeMediaProbe : public reelforge::MediaProbe {
   public:
    void add(const std::string &asset, double duration, uint32_t width = 1280,
             uint32_t height = 720, bool has_audio = true) {
        std::lock_guard<std::mutex> lock(mutex_);
        reelforge::MediaInfo info;
        info.duration = duration;
        info.width = width;
        info.height = height;
        info.has_audio = has_audio;
        media_[asset] = info;
    }

    void add_audio(const std::string &asset, double duration) {
        add(asset, duration, 0, 0, true);
    }

    void fail(const std::string &asset, const std::string &message) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_[asset] = message;
    }

    void set_delay(std::chrono::milliseconds delay) { delay_ms_ = delay.count(); }

    // Overrides the global delay for one asset.
    void set_delay(const std::string &asset, std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        asset_delay_ms_[asset] = delay.count();
    }

    reelforge::ProbeResult probe(const std::string &asset) override {
        in_flight_max_update(++in_flight_);
        long long delay = delay_ms_.load();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto d = asset_delay_ms_.find(asset);
            if (d != asset_delay_ms_.end()) {
                delay = d->second;
            }
        }
        if (delay > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay));
        }
        reelforge::ProbeResult r;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++calls_[asset];
            auto f = failures_.find(asset);
            auto m = media_.find(asset);
            if (f != failures_.end()) {
                r.message = f->second;
            } else if (m == media_.end()) {
                r.message = "no such asset";
            } else {
                r.ok = true;
                r.info = m->second;
            }
        }
        --in_flight_;
        return r;
    }

    int calls(const std::string &asset) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(asset);
        return it == calls_.end() ? 0 : it->second;
    }

    int total_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        int n = 0;
        for (const auto &c : calls_) n += c.second;
        return n;
    }

    int max_in_flight() const { return max_in_flight_; }

   private:
    void in_flight_max_update(int now) {
        int prev = max_in_flight_.load();
        while (now > prev && !max_in_flight_.compare_exchange_weak(prev, now)) {
        }
    }

    mutable std::mutex mutex_;
    std::map<std::string, reelforge::MediaInfo> media_;
    std::map<std::string, std::string> failures_;
    std::map<std::string, int> calls_;
    std::atomic<long long> delay_ms_{0};
    std::map<std::string, long long> asset_delay_ms_;
    std::atomic<int> in_flight_{0};
    std::atomic<int> max_in_flight_{0};
};

}  // namespace test_utils
