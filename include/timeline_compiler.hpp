//
//  timeline_compiler.hpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

#include "compile_status.hpp"
#include "spec_model.hpp"

namespace reelforge {

enum class TimeTransform {
    None,        ///< Source fits the slot within epsilon
    SlowMotion,  ///< Source shorter than the slot, stretched
    SpeedUp,     ///< Source longer than the slot, compressed
    Trimmed,     ///< Source longer than the slot, trim_out moved in
    Blank,       ///< Placeholder, no source
};

const char *to_string(TimeTransform t);

/// One resolved base-track interval.
struct TimelineSegment {
    size_t clip_index = 0;
    std::string clip_id;
    std::string asset;  ///< Empty for blank segments
    double start = 0.0;
    double end = 0.0;
    double slot_duration = 0.0;
    double source_in = 0.0;
    double source_out = 0.0;
    double source_duration = 0.0;
    /// source_duration / slot_duration (after any trim); 1 for blank segments.
    double speed_factor = 1.0;
    TimeTransform transform = TimeTransform::None;

    // Length on the output clock once the transform is applied.
    double rendered_duration() const {
        return transform == TimeTransform::SlowMotion || transform == TimeTransform::SpeedUp
                   ? source_duration / speed_factor
                   : source_duration;
    }
};

struct Timeline {
    std::vector<TimelineSegment> segments;  ///< Ordered by start, contiguous
    double total_duration = 0.0;
};

// Compute one segment per clip, then check the base track is gapless from 0.
// Fails with UnfeasibleTimingError (speed out of range), TimelineGapError or
// TimelineOverlapError. `media` must hold every non-blank clip asset.
CompileStatus compile_timeline(const VideoSpec &spec, const MediaTable &media, Timeline &out);

}  // namespace reelforge
