//
//  spec_model.cpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "spec_model.hpp"

#include <algorithm>

namespace reelforge {

const char *to_string(AudioKind kind) {
    switch (kind) {
        case AudioKind::Narration:
            return "narration";
        case AudioKind::Bgm:
            return "bgm";
        case AudioKind::Base:
            return "base";
    }
    return "unknown";
}

const char *to_string(SubtitleMode mode) {
    return mode == SubtitleMode::Soft ? "soft" : "burn";
}

double total_duration(const VideoSpec &spec) {
    double total = 0.0;
    for (const auto &c : spec.clips) {
        total = std::max(total, c.end);
    }
    return total;
}

double audio_track_end(const AudioTrack &track, const MediaTable &media) {
    if (track.end) {
        return *track.end;
    }
    auto it = media.find(track.asset);
    return it == media.end() ? track.start : track.start + it->second.duration;
}

}  // namespace reelforge
