//
//  overlay_resolver.cpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "overlay_resolver.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <set>

#include "logging.hpp"

namespace reelforge {

namespace {

// Most encoders reject odd chroma-subsampled sizes.
PixelRect even_size(PixelRect r) {
    r.w = std::max<uint32_t>(2, r.w & ~1u);
    r.h = std::max<uint32_t>(2, r.h & ~1u);
    return r;
}

PixelRect to_pixels(const Overlay &o, const OutputSettings &output, const MediaTable &media) {
    PixelRect r;
    if (o.units == CoordinateUnits::Pixels) {
        r.x = static_cast<int32_t>(std::lround(o.x));
        r.y = static_cast<int32_t>(std::lround(o.y));
        r.w = static_cast<uint32_t>(std::lround(o.w));
        r.h = static_cast<uint32_t>(std::lround(o.h));
        return even_size(r);
    }
    r.x = static_cast<int32_t>(std::lround(o.x * output.width));
    r.y = static_cast<int32_t>(std::lround(o.y * output.height));
    double base_w = output.width;
    double base_h = output.height;
    if (o.units == CoordinateUnits::Source) {
        auto it = media.find(o.asset);
        base_w = it != media.end() ? it->second.width : 0.0;
        base_h = it != media.end() ? it->second.height : 0.0;
    }
    r.w = static_cast<uint32_t>(std::lround(o.w * base_w));
    r.h = static_cast<uint32_t>(std::lround(o.h * base_h));
    return even_size(r);
}

}  // namespace

std::vector<TimeWindow> normalize_windows(std::vector<TimeWindow> windows, double total_duration) {
    std::vector<TimeWindow> clipped;
    clipped.reserve(windows.size());
    for (auto w : windows) {
        w.start = std::max(0.0, w.start);
        w.end = std::min(total_duration, w.end);
        if (w.end > w.start) {
            clipped.push_back(w);
        }
    }
    std::sort(clipped.begin(), clipped.end(), [](const TimeWindow &a, const TimeWindow &b) {
        return a.start < b.start || (a.start == b.start && a.end < b.end);
    });

    std::vector<TimeWindow> merged;
    for (const auto &w : clipped) {
        if (!merged.empty() && w.start <= merged.back().end) {
            merged.back().end = std::max(merged.back().end, w.end);
        } else {
            merged.push_back(w);
        }
    }
    return merged;
}

OverlayPlan resolve_overlays(const std::vector<Overlay> &overlays, const OutputSettings &output,
                             const MediaTable &media, double total_duration) {
    OverlayPlan plan;
    plan.overlays.reserve(overlays.size());
    std::map<int, size_t> explicit_z_uses;
    for (size_t i = 0; i < overlays.size(); ++i) {
        const Overlay &o = overlays[i];
        ResolvedOverlay r;
        r.overlay_index = i;
        r.id = o.id;
        r.asset = o.asset;
        r.rect = to_pixels(o, output, media);
        r.z_index = o.z_index.value_or(0);
        r.loop = o.loop;
        r.intervals = normalize_windows(o.windows, total_duration);
        for (const auto &w : o.windows) {
            if (w.end > total_duration) {
                RF_LOG("warn", "overlay " << o.id << " window end " << fmt_seconds(w.end)
                                          << " clipped to " << fmt_seconds(total_duration));
            }
        }
        if (o.z_index) {
            ++explicit_z_uses[*o.z_index];
        }
        plan.overlays.push_back(std::move(r));
    }
    for (const auto &z : explicit_z_uses) {
        if (z.second > 1) {
            RF_LOG("debug", z.second << " overlays share z_index " << z.first
                                     << "; declaration order decides");
        }
    }

    // Stable sort keeps declaration order as the tie-break.
    std::stable_sort(plan.overlays.begin(), plan.overlays.end(),
                     [](const ResolvedOverlay &a, const ResolvedOverlay &b) {
                         return a.z_index < b.z_index;
                     });
    for (size_t i = 0; i < plan.overlays.size(); ++i) {
        plan.overlays[i].draw_rank = i;
    }

    // Elementary intervals between every window boundary.
    std::set<double> cuts;
    for (const auto &r : plan.overlays) {
        for (const auto &w : r.intervals) {
            cuts.insert(w.start);
            cuts.insert(w.end);
        }
    }
    std::vector<double> bounds(cuts.begin(), cuts.end());
    for (size_t b = 0; b + 1 < bounds.size(); ++b) {
        const double lo = bounds[b];
        const double hi = bounds[b + 1];
        const double mid = (lo + hi) / 2.0;
        std::vector<size_t> layers;
        for (size_t i = 0; i < plan.overlays.size(); ++i) {
            for (const auto &w : plan.overlays[i].intervals) {
                if (w.start <= mid && mid < w.end) {
                    layers.push_back(i);
                    break;
                }
            }
        }
        if (layers.empty()) {
            continue;
        }
        if (!plan.stacks.empty() && plan.stacks.back().end == lo &&
            plan.stacks.back().layers == layers) {
            plan.stacks.back().end = hi;
        } else {
            plan.stacks.push_back(OverlayStackSpan{lo, hi, std::move(layers)});
        }
    }

    RF_LOG("debug", "overlays: " << plan.overlays.size() << " resolved, " << plan.stacks.size()
                                 << " stack span(s)");
    return plan;
}

}  // namespace reelforge
