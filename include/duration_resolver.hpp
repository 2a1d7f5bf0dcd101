//
//  duration_resolver.hpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <condition_variable>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "compile_status.hpp"
#include "media_probe.hpp"
#include "spec_model.hpp"

namespace reelforge {

/**
 * @brief Per-run cache of probe results.
 *
 * Populated exactly once per asset: the first claimant receives a promise to
 * fulfil, every later claimant waits on the same shared future. Lives only as
 * long as one compile run; there is no process-wide instance.
 */
class DurationCache {
   public:
    using Slot = std::shared_future<ProbeResult>;

    // Returns the promise when the caller is the first claimant, nullptr otherwise.
    // `slot` always receives the shared result.
    std::shared_ptr<std::promise<ProbeResult>> claim(const std::string &asset, Slot &slot);

    // Completed, successful entry for `asset`, if any.
    std::optional<MediaInfo> find(const std::string &asset) const;

    size_t size() const;

   private:
    mutable std::mutex mutex_;
    std::map<std::string, Slot> slots_;
};

/**
 * @brief Resolves native duration/resolution for every referenced asset.
 *
 * Distinct assets are probed concurrently by at most `workers` threads; each
 * probe is bounded by `timeout_s` seconds (<= 0 waits forever). A hung probe
 * is abandoned and reported as unavailable.
 *
 * With a timeout every probe runs on its own thread. An abandoned probe keeps
 * running, and keeps its worker slot, until the probe call returns, so the
 * `workers` limit holds across timeouts. Waiting for a free slot counts
 * against the same timeout. The destructor joins probe threads that have
 * finished and detaches the ones still hung. A detached probe owns its state
 * through shared pointers and may still log after the resolver is gone.
 */
class DurationResolver {
   public:
    DurationResolver(std::shared_ptr<MediaProbe> probe, unsigned workers, double timeout_s);
    ~DurationResolver();

    DurationResolver(const DurationResolver &) = delete;
    DurationResolver &operator=(const DurationResolver &) = delete;

    // Resolve a single asset through the cache.
    ProbeResult resolve(const std::string &asset);

    // Resolve all assets (duplicates allowed) and fill `out`. Returns
    // AssetUnavailableError naming the first failing asset in input order.
    CompileStatus resolve_all(const std::vector<std::string> &assets, MediaTable &out);

    const DurationCache &cache() const { return cache_; }

   private:
    // Probe threads currently running, shared with the threads themselves.
    struct SlotCounter {
        std::mutex mutex;
        std::condition_variable cv;
        unsigned running = 0;
    };

    std::shared_ptr<MediaProbe> probe_;
    unsigned workers_;
    double timeout_s_;
    DurationCache cache_;
    std::shared_ptr<SlotCounter> slots_;
    std::mutex threads_mutex_;
    std::vector<std::pair<std::thread, DurationCache::Slot>> probe_threads_;
};

// Every asset the spec references, first-reference order, without duplicates.
std::vector<std::string> referenced_assets(const VideoSpec &spec);

}  // namespace reelforge
