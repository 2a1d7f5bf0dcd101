//
//  audio_mix_planner.hpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "spec_model.hpp"
#include "timeline_compiler.hpp"

namespace reelforge {

enum class MixLayerKind {
    ClipAudio,  ///< Original sound of an unstretched base segment
    Narration,
    Bgm,
    Bed,        ///< Explicit audio track of kind "base"
};

const char *to_string(MixLayerKind kind);

/// Constant gain over [start, end).
struct GainSpan {
    double start = 0.0;
    double end = 0.0;
    double gain_db = 0.0;
};

struct MixLayer {
    std::string id;
    MixLayerKind kind = MixLayerKind::ClipAudio;
    std::string asset;
    double start = 0.0;            ///< Timeline in-point
    double end = 0.0;              ///< Timeline out-point (exclusive)
    double source_in = 0.0;        ///< Offset into the asset at `start`
    double source_duration = 0.0;  ///< Native length, used to loop
    bool loop = false;
    double nominal_gain_db = 0.0;
    double fade_in = 0.0;
    double fade_out = 0.0;
    bool ducked = false;           ///< Attenuated under narration
    std::vector<GainSpan> envelope;  ///< Covers [start, end] without holes
};

struct MixPlan {
    double total_duration = 0.0;
    double duck_db = 0.0;
    std::vector<TimeWindow> narration;  ///< Narration intervals, sorted
    std::vector<MixLayer> layers;       ///< Clip audio, beds, bgm, then narration
};

// Build the layered mix. Stretched segments contribute no clip audio, so raw
// audio is never pitch-shifted; base/bgm/bed layers are ducked by
// options.duck_db under every narration interval.
MixPlan plan_audio_mix(const VideoSpec &spec, const Timeline &timeline, const MediaTable &media);

// Gain of `layer` at timeline time t, or nullopt when the layer is silent there.
std::optional<double> gain_at(const MixLayer &layer, double t);

}  // namespace reelforge
