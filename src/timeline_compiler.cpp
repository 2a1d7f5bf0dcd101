//
//  timeline_compiler.cpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "timeline_compiler.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>
#include <utility>

#include "logging.hpp"

namespace reelforge {

const char *to_string(TimeTransform t) {
    switch (t) {
        case TimeTransform::None:
            return "none";
        case TimeTransform::SlowMotion:
            return "slow_motion";
        case TimeTransform::SpeedUp:
            return "speed_up";
        case TimeTransform::Trimmed:
            return "trimmed";
        case TimeTransform::Blank:
            return "blank";
    }
    return "unknown";
}

namespace {

std::string num(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

// Decide how the source material is fitted into its slot.
TimelineSegment fit_clip(const Clip &clip, size_t index, double native, double epsilon) {
    TimelineSegment seg;
    seg.clip_index = index;
    seg.clip_id = clip.id;
    seg.asset = clip.asset;
    seg.start = clip.start;
    seg.end = clip.end;
    seg.slot_duration = clip.end - clip.start;

    seg.source_in = clip.trim_in.value_or(0.0);
    seg.source_out = std::min(clip.trim_out.value_or(native), native);
    seg.source_duration = seg.source_out - seg.source_in;
    seg.speed_factor = seg.source_duration / seg.slot_duration;

    if (std::fabs(seg.source_duration - seg.slot_duration) <= epsilon) {
        seg.transform = TimeTransform::None;
    } else if (seg.source_duration < seg.slot_duration) {
        // Never loop or freeze: stretch the source to fill the slot.
        seg.transform = TimeTransform::SlowMotion;
    } else if (clip.allow_trim) {
        seg.source_out = seg.source_in + seg.slot_duration;
        seg.source_duration = seg.slot_duration;
        seg.speed_factor = 1.0;
        seg.transform = TimeTransform::Trimmed;
    } else {
        seg.transform = TimeTransform::SpeedUp;
    }
    return seg;
}

TimelineSegment blank_segment(const Clip &clip, size_t index) {
    TimelineSegment seg;
    seg.clip_index = index;
    seg.clip_id = clip.id;
    seg.start = clip.start;
    seg.end = clip.end;
    seg.slot_duration = clip.end - clip.start;
    seg.source_out = seg.slot_duration;
    seg.source_duration = seg.slot_duration;
    seg.transform = TimeTransform::Blank;
    return seg;
}

}  // namespace

CompileStatus compile_timeline(const VideoSpec &spec, const MediaTable &media, Timeline &out) {
    const auto t0 = std::chrono::steady_clock::now();
    const CompileOptions &opts = spec.options;
    std::vector<TimelineSegment> segments;
    segments.reserve(spec.clips.size());
    std::vector<Violation> infeasible;

    for (size_t i = 0; i < spec.clips.size(); ++i) {
        const Clip &clip = spec.clips[i];
        if (clip.blank) {
            segments.push_back(blank_segment(clip, i));
            continue;
        }
        auto it = media.find(clip.asset);
        if (it == media.end()) {
            return make_error(ErrorKind::InternalConsistencyError,
                              "clip " + clip.id + " reached the compiler without media info",
                              {Violation{clip.id, "unresolved-asset", clip.asset}});
        }
        TimelineSegment seg = fit_clip(clip, i, it->second.duration, opts.speed_epsilon);
        const bool stretched =
            seg.transform == TimeTransform::SlowMotion || seg.transform == TimeTransform::SpeedUp;
        if (stretched && (seg.speed_factor < opts.min_speed || seg.speed_factor > opts.max_speed)) {
            infeasible.push_back(Violation{
                clip.id, "speed-range",
                "speed factor " + num(seg.speed_factor) + " (source " +
                    num(seg.source_duration) + "s into slot " + num(seg.slot_duration) +
                    "s) is outside [" + num(opts.min_speed) + ", " + num(opts.max_speed) + "]"});
        }
        RF_LOG("timeline", "segment " << seg.clip_id << " [" << fmt_seconds(seg.start) << ", "
                                      << fmt_seconds(seg.end) << "] source="
                                      << fmt_seconds(seg.source_duration)
                                      << " speed=" << seg.speed_factor << " ("
                                      << to_string(seg.transform) << ")");
        segments.push_back(std::move(seg));
    }

    if (!infeasible.empty()) {
        RF_LOG("error", infeasible.size() << " clip(s) need an unwatchable speed change");
        std::string msg = std::to_string(infeasible.size()) +
                          " clip(s) cannot be fitted within the speed range";
        return make_error(ErrorKind::UnfeasibleTimingError, std::move(msg),
                          std::move(infeasible));
    }

    std::stable_sort(segments.begin(), segments.end(),
                     [](const TimelineSegment &a, const TimelineSegment &b) {
                         return a.start < b.start;
                     });

    // The base track must cover [0, total] without holes or double coverage.
    std::vector<Violation> gaps;
    std::vector<Violation> overlaps;
    double cursor = 0.0;
    std::string previous = "timeline start";
    for (const auto &seg : segments) {
        const double delta = seg.start - cursor;
        if (delta > opts.gap_tolerance) {
            gaps.push_back(Violation{seg.clip_id, "gap",
                                     "hole of " + num(delta) + "s between " + previous + " (" +
                                         num(cursor) + ") and " + seg.clip_id + " (" +
                                         num(seg.start) + ")"});
        } else if (delta < -opts.gap_tolerance) {
            overlaps.push_back(Violation{seg.clip_id, "overlap",
                                         seg.clip_id + " starts " + num(-delta) +
                                             "s before " + previous + " ends"});
        }
        cursor = std::max(cursor, seg.end);
        previous = seg.clip_id;
    }
    if (!gaps.empty()) {
        RF_LOG("error", "base track has " << gaps.size() << " gap(s)");
        return make_error(ErrorKind::TimelineGapError, "base track is not gapless",
                          std::move(gaps));
    }
    if (!overlaps.empty()) {
        return make_error(ErrorKind::TimelineOverlapError, "base track clips overlap",
                          std::move(overlaps));
    }

    out.segments = std::move(segments);
    out.total_duration = cursor;
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - t0)
                        .count();
    RF_LOG("debug", "timeline: " << out.segments.size() << " segment(s), total="
                                 << fmt_seconds(out.total_duration) << " in " << ms << "ms");
    return make_ok();
}

}  // namespace reelforge
