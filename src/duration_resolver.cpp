//
//  duration_resolver.cpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "duration_resolver.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <set>
#include <thread>
#include <utility>

#include "logging.hpp"

namespace reelforge {

namespace {

ProbeResult run_probe(MediaProbe &probe, const std::string &asset) {
    try {
        return probe.probe(asset);
    } catch (const std::exception &e) {
        ProbeResult r;
        r.message = std::string("probe threw: ") + e.what();
        return r;
    }
}

}  // namespace

std::shared_ptr<std::promise<ProbeResult>> DurationCache::claim(const std::string &asset,
                                                                Slot &slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(asset);
    if (it != slots_.end()) {
        slot = it->second;
        return nullptr;
    }
    auto promise = std::make_shared<std::promise<ProbeResult>>();
    slot = promise->get_future().share();
    slots_.emplace(asset, slot);
    return promise;
}

std::optional<MediaInfo> DurationCache::find(const std::string &asset) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(asset);
    if (it == slots_.end() ||
        it->second.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return std::nullopt;
    }
    const ProbeResult &r = it->second.get();
    if (!r.ok) {
        return std::nullopt;
    }
    return r.info;
}

size_t DurationCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

DurationResolver::DurationResolver(std::shared_ptr<MediaProbe> probe, unsigned workers,
                                   double timeout_s)
    : probe_(std::move(probe)),
      workers_(std::max(1u, workers)),
      timeout_s_(timeout_s),
      slots_(std::make_shared<SlotCounter>()) {}

DurationResolver::~DurationResolver() {
    std::lock_guard<std::mutex> lock(threads_mutex_);
    size_t abandoned = 0;
    for (auto &entry : probe_threads_) {
        if (entry.second.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            entry.first.join();
        } else {
            entry.first.detach();
            ++abandoned;
        }
    }
    if (abandoned > 0) {
        RF_LOG("debug", abandoned << " hung probe thread(s) left running");
    }
}

ProbeResult DurationResolver::resolve(const std::string &asset) {
    DurationCache::Slot slot;
    auto promise = cache_.claim(asset, slot);
    if (timeout_s_ <= 0.0) {
        if (promise) {
            promise->set_value(run_probe(*probe_, asset));
        }
        return slot.get();
    }

    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                              std::chrono::duration<double>(timeout_s_));
    ProbeResult timed_out;
    timed_out.message = "probe timed out after " + fmt_seconds(timeout_s_);

    if (promise) {
        {
            std::unique_lock<std::mutex> lock(slots_->mutex);
            if (!slots_->cv.wait_until(lock, deadline,
                                       [this]() { return slots_->running < workers_; })) {
                RF_LOG("warn", "probe of " << asset << " timed out waiting for a free worker");
                promise->set_value(timed_out);
                return timed_out;
            }
            ++slots_->running;
        }
        // The thread only holds shared ownership of the probe, promise and counter.
        std::thread t([probe = probe_, promise, asset, slots = slots_]() {
            promise->set_value(run_probe(*probe, asset));
            {
                std::lock_guard<std::mutex> lock(slots->mutex);
                --slots->running;
            }
            slots->cv.notify_all();
        });
        std::lock_guard<std::mutex> lock(threads_mutex_);
        probe_threads_.emplace_back(std::move(t), slot);
    }

    if (slot.wait_until(deadline) != std::future_status::ready) {
        RF_LOG("warn", "probe of " << asset << " timed out");
        return timed_out;
    }
    return slot.get();
}

CompileStatus DurationResolver::resolve_all(const std::vector<std::string> &assets,
                                            MediaTable &out) {
    const auto t0 = std::chrono::steady_clock::now();
    std::vector<std::string> unique;
    std::set<std::string> seen;
    for (const auto &a : assets) {
        if (seen.insert(a).second) {
            unique.push_back(a);
        }
    }

    std::vector<ProbeResult> results(unique.size());
    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (size_t i = next.fetch_add(1); i < unique.size(); i = next.fetch_add(1)) {
            results[i] = resolve(unique[i]);
        }
    };
    const size_t pool = std::min<size_t>(workers_, unique.size());
    std::vector<std::thread> threads;
    threads.reserve(pool);
    for (size_t i = 0; i < pool; ++i) {
        threads.emplace_back(worker);
    }
    for (auto &t : threads) {
        t.join();
    }

    CompileStatus status = make_ok();
    for (size_t i = 0; i < unique.size(); ++i) {
        if (results[i].ok) {
            out[unique[i]] = results[i].info;
            continue;
        }
        RF_LOG("error", "asset unavailable: " << unique[i] << " (" << results[i].message << ")");
        if (status.ok) {
            status = make_error(ErrorKind::AssetUnavailableError,
                                "cannot probe " + unique[i] + ": " + results[i].message,
                                {Violation{unique[i], "asset-unavailable", results[i].message}});
        }
    }

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - t0)
                        .count();
    RF_LOG("debug", "resolved " << unique.size() << " asset(s) with " << pool
                                << " worker(s) in " << ms << "ms");
    return status;
}

std::vector<std::string> referenced_assets(const VideoSpec &spec) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    auto add = [&](const std::string &a) {
        if (!a.empty() && seen.insert(a).second) {
            out.push_back(a);
        }
    };
    for (const auto &c : spec.clips) {
        if (!c.blank) {
            add(c.asset);
        }
    }
    for (const auto &o : spec.overlays) add(o.asset);
    for (const auto &a : spec.audio) add(a.asset);
    return out;
}

}  // namespace reelforge
