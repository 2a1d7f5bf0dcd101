//
//  spec_validator.cpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "spec_validator.hpp"

#include <algorithm>
#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "logging.hpp"

namespace reelforge {

namespace {

struct Interval {
    double start;
    double end;
    std::string id;
};

std::string seconds(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

class ViolationSink {
   public:
    void add(const std::string &entity, const std::string &rule, const std::string &msg) {
        RF_LOG("debug", "violation [" << entity << "] " << rule << ": " << msg);
        violations_.push_back(Violation{entity, rule, msg});
    }

    CompileStatus finish(const char *stage) {
        if (violations_.empty()) {
            return make_ok();
        }
        std::string msg =
            std::to_string(violations_.size()) + " violation(s) found during " + stage;
        return make_error(ErrorKind::ValidationError, std::move(msg), std::move(violations_));
    }

   private:
    std::vector<Violation> violations_;
};

// Shared time-range rule: negative start, zero length, inverted range.
bool check_range(ViolationSink &sink, const std::string &id, const char *what, double start,
                 double end) {
    bool ok = true;
    if (start < 0.0) {
        sink.add(id, "negative-time", std::string(what) + " starts before 0 (" + seconds(start) + ")");
        ok = false;
    }
    if (end == start) {
        sink.add(id, "zero-length",
                 std::string(what) + " has zero length (start == end == " + seconds(start) + ")");
        ok = false;
    } else if (end < start) {
        sink.add(id, "time-range",
                 std::string(what) + " ends before it starts (" + seconds(start) + " > " +
                     seconds(end) + ")");
        ok = false;
    }
    return ok;
}

// Intervals sorted by start; a later one overlaps if it begins before the
// furthest end seen so far (minus tolerance). Touching is fine.
void check_no_overlap(ViolationSink &sink, std::vector<Interval> intervals, double tolerance,
                      const char *what) {
    std::stable_sort(intervals.begin(), intervals.end(),
                     [](const Interval &a, const Interval &b) { return a.start < b.start; });
    const Interval *furthest = nullptr;
    for (const auto &cur : intervals) {
        if (furthest && cur.start < furthest->end - tolerance) {
            sink.add(cur.id, "overlap",
                     std::string(what) + " [" + seconds(cur.start) + ", " + seconds(cur.end) +
                         "] overlaps '" + furthest->id + "' [" + seconds(furthest->start) +
                         ", " + seconds(furthest->end) + "]");
        }
        if (!furthest || cur.end > furthest->end) {
            furthest = &cur;
        }
    }
}

void check_output(ViolationSink &sink, const VideoSpec &spec) {
    if (spec.output.width == 0 || spec.output.height == 0) {
        sink.add("output", "resolution", "output resolution must be positive");
    }
    if (!(spec.output.fps > 0.0)) {
        sink.add("output", "fps", "output fps must be positive");
    }
    const auto &o = spec.options;
    if (!(o.min_speed > 0.0) || o.max_speed < o.min_speed) {
        sink.add("settings", "speed-range",
                 "speed range [" + seconds(o.min_speed) + ", " + seconds(o.max_speed) +
                     "] is invalid");
    }
    if (o.speed_epsilon < 0.0 || o.gap_tolerance < 0.0) {
        sink.add("settings", "tolerance", "epsilon and gap tolerance must not be negative");
    }
    if (o.duck_db < 0.0) {
        sink.add("settings", "ducking", "duck_db is an attenuation and must not be negative");
    }
}

void check_duplicate_ids(ViolationSink &sink, const VideoSpec &spec) {
    std::map<std::string, int> seen;
    for (const auto &c : spec.clips) ++seen[c.id];
    for (const auto &o : spec.overlays) ++seen[o.id];
    for (const auto &s : spec.subtitles) ++seen[s.id];
    for (const auto &a : spec.audio) ++seen[a.id];
    for (const auto &entry : seen) {
        if (entry.second > 1) {
            sink.add(entry.first, "duplicate-id",
                     "identifier used by " + std::to_string(entry.second) + " entities");
        }
    }
}

void check_clips(ViolationSink &sink, const VideoSpec &spec) {
    if (spec.clips.empty()) {
        sink.add("spec", "no-clips", "spec has no base clips");
        return;
    }
    std::vector<Interval> ranges;
    for (const auto &c : spec.clips) {
        const bool range_ok = check_range(sink, c.id, "clip", c.start, c.end);
        if (!c.blank && c.asset.empty()) {
            sink.add(c.id, "missing-asset", "clip has no asset reference");
        }
        if (!c.blank) {
            if (c.trim_in && *c.trim_in < 0.0) {
                sink.add(c.id, "invalid-trim", "trim_in must not be negative");
            }
            if (c.trim_out && *c.trim_out <= c.trim_in.value_or(0.0)) {
                sink.add(c.id, "invalid-trim", "trim_out must be after trim_in");
            }
        }
        if (range_ok) {
            ranges.push_back(Interval{c.start, c.end, c.id});
        }
    }
    check_no_overlap(sink, std::move(ranges), spec.options.gap_tolerance, "clip");
}

void check_subtitles(ViolationSink &sink, const VideoSpec &spec, double total) {
    std::vector<Interval> ranges;
    for (const auto &s : spec.subtitles) {
        if (!check_range(sink, s.id, "subtitle", s.start, s.end)) {
            continue;
        }
        if (s.end > total + spec.options.gap_tolerance) {
            sink.add(s.id, "out-of-bounds",
                     "subtitle ends at " + seconds(s.end) + " past timeline end " +
                         seconds(total));
        }
        ranges.push_back(Interval{s.start, s.end, s.id});
    }
    check_no_overlap(sink, std::move(ranges), 0.0, "subtitle");
}

void check_overlays(ViolationSink &sink, const VideoSpec &spec, double total) {
    for (const auto &o : spec.overlays) {
        if (o.asset.empty()) {
            sink.add(o.id, "missing-asset", "overlay has no asset reference");
        }
        if (!(o.w > 0.0) || !(o.h > 0.0)) {
            sink.add(o.id, "size", "overlay size must be positive");
        }
        if (o.windows.empty()) {
            sink.add(o.id, "no-windows", "overlay has no visibility window");
        }
        for (const auto &w : o.windows) {
            if (o.window_end_from_asset) {
                if (w.start < 0.0) {
                    sink.add(o.id, "negative-time", "window starts before 0");
                }
            } else if (!check_range(sink, o.id, "window", w.start, w.end)) {
                continue;
            }
            // Windows running past the end are clipped later; ones that never
            // intersect the timeline are an error.
            if (w.start >= total) {
                sink.add(o.id, "out-of-bounds",
                         "window starts at " + seconds(w.start) + ", at or after timeline end " +
                             seconds(total));
            }
        }
    }
}

void check_audio(ViolationSink &sink, const VideoSpec &spec, double total) {
    std::vector<Interval> narration;
    for (const auto &a : spec.audio) {
        if (a.asset.empty()) {
            sink.add(a.id, "missing-asset", "audio track has no asset reference");
        }
        if (a.start_after_previous) {
            // Start is only known once the previous track has been probed.
        } else if (a.start < 0.0) {
            sink.add(a.id, "negative-time", "audio track starts before 0");
        } else if (a.start >= total) {
            sink.add(a.id, "out-of-bounds",
                     "audio track starts at " + seconds(a.start) +
                         ", at or after timeline end " + seconds(total));
        }
        if (a.end && *a.end <= a.start && !a.start_after_previous) {
            sink.add(a.id, "time-range", "audio end must be after its start");
        }
        if (a.fade_in < 0.0 || a.fade_out < 0.0) {
            sink.add(a.id, "invalid-fade", "fade durations must not be negative");
        }
        if (a.kind == AudioKind::Narration && a.end && *a.end > a.start &&
            !a.start_after_previous) {
            narration.push_back(Interval{a.start, *a.end, a.id});
        }
    }
    check_no_overlap(sink, std::move(narration), 0.0, "narration");
}

}  // namespace

CompileStatus validate_spec(const VideoSpec &spec) {
    ViolationSink sink;
    const double total = total_duration(spec);
    check_output(sink, spec);
    check_duplicate_ids(sink, spec);
    check_clips(sink, spec);
    // Bounds checks below are meaningless without a timeline.
    if (total > 0.0) {
        check_subtitles(sink, spec, total);
        check_overlays(sink, spec, total);
        check_audio(sink, spec, total);
    }
    auto status = sink.finish("validation");
    if (!status.ok) {
        RF_LOG("warn", "spec rejected: " << status.message);
    }
    return status;
}

void resolve_open_windows(VideoSpec &spec, const MediaTable &media) {
    for (auto &o : spec.overlays) {
        if (!o.window_end_from_asset) {
            continue;
        }
        auto it = media.find(o.asset);
        if (it == media.end()) {
            continue;
        }
        for (auto &w : o.windows) {
            w.end = w.start + it->second.duration;
        }
        o.window_end_from_asset = false;
        RF_LOG("debug", "overlay " << o.id << " window end taken from asset: "
                                   << fmt_seconds(o.windows.front().end));
    }
    for (size_t i = 1; i < spec.audio.size(); ++i) {
        AudioTrack &a = spec.audio[i];
        if (!a.start_after_previous) {
            continue;
        }
        a.start = audio_track_end(spec.audio[i - 1], media);
        a.start_after_previous = false;
        RF_LOG("debug", "audio " << a.id << " placed after " << spec.audio[i - 1].id << " at "
                                 << fmt_seconds(a.start));
    }
}

CompileStatus validate_resolved(const VideoSpec &spec, const MediaTable &media) {
    ViolationSink sink;
    const double eps = spec.options.speed_epsilon;

    for (const auto &c : spec.clips) {
        if (c.blank) {
            continue;
        }
        auto it = media.find(c.asset);
        if (it == media.end()) {
            sink.add(c.id, "unresolved-asset", "no media info for " + c.asset);
            continue;
        }
        const double native = it->second.duration;
        if (c.trim_in && *c.trim_in >= native) {
            sink.add(c.id, "invalid-trim",
                     "trim_in " + seconds(*c.trim_in) + " is past source end " + seconds(native));
        }
        if (c.trim_out && *c.trim_out > native + eps) {
            sink.add(c.id, "invalid-trim",
                     "trim_out " + seconds(*c.trim_out) + " is past source end " +
                         seconds(native));
        }
    }

    for (const auto &o : spec.overlays) {
        for (const auto &w : o.windows) {
            if (w.end <= w.start) {
                sink.add(o.id, "zero-length", "overlay window resolved to zero length");
            }
        }
        if (o.units == CoordinateUnits::Source) {
            auto it = media.find(o.asset);
            if (it == media.end() || it->second.width == 0 || it->second.height == 0) {
                sink.add(o.id, "size", "source-relative size needs a video asset, " + o.asset +
                                           " has no picture dimensions");
            }
        }
    }

    std::vector<Interval> narration;
    for (const auto &a : spec.audio) {
        if (a.kind != AudioKind::Narration) {
            continue;
        }
        const double end = audio_track_end(a, media);
        if (end <= a.start) {
            sink.add(a.id, "zero-length", "narration resolved to zero length");
            continue;
        }
        narration.push_back(Interval{a.start, end, a.id});
    }
    check_no_overlap(sink, std::move(narration), 0.0, "narration");

    return sink.finish("post-probe validation");
}

}  // namespace reelforge
