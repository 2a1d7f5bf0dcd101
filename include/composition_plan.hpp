//
//  composition_plan.hpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

#include "audio_mix_planner.hpp"
#include "compile_status.hpp"
#include "overlay_resolver.hpp"
#include "spec_model.hpp"
#include "timeline_compiler.hpp"

namespace reelforge {

enum class OpKind {
    Trim,        ///< Cut [start, end) out of a source (source clock)
    Color,       ///< Generate a background frame sequence for a blank slot
    Speed,       ///< Retime by `factor` (>1 faster, <1 slow motion)
    Scale,       ///< Fit to the output frame at the output frame rate
    Concat,      ///< Join segment streams in order into the base track
    Overlay,     ///< Composite a scaled source at `rect` during `windows`
    Subtitles,   ///< Burn in or attach the plan's subtitle cues
    AudioLayer,  ///< Position one audio source on the timeline with its gain envelope
    Mix,         ///< Sum all audio layers into the program audio
    Finalize,    ///< Mux program video/audio, cut at total duration
};

const char *to_string(OpKind kind);

/**
 * @brief One step of the composition graph.
 *
 * Stream labels are either "in<N>" (the N-th plan input) or a label produced
 * by an earlier operation. Which numeric fields are meaningful depends on
 * `kind`; see plan_to_json for the exact per-kind field set.
 */
struct PlanOperation {
    OpKind kind = OpKind::Trim;
    std::string target;               ///< Entity id this op belongs to
    std::vector<std::string> inputs;  ///< Consumed stream labels
    std::string output;               ///< Produced stream label
    double start = 0.0;
    double end = 0.0;
    double factor = 1.0;
    double offset = 0.0;              ///< AudioLayer: source position at `start`
    bool loop = false;
    PixelRect rect;
    std::vector<TimeWindow> windows;
    std::vector<GainSpan> gains;
    double fade_in = 0.0;
    double fade_out = 0.0;
    std::string mode;                 ///< Subtitles: burn|soft, Color: colour name
};

struct PlanInput {
    std::string asset;
    MediaInfo info;
    bool loop = false;  ///< Repeat the source indefinitely (bgm)
};

/// Overlays visible over [start, end), bottom to top.
struct PlanStack {
    double start = 0.0;
    double end = 0.0;
    std::vector<std::string> overlay_ids;
};

struct CompositionPlan {
    double total_duration = 0.0;
    OutputSettings output;
    std::vector<PlanInput> inputs;
    std::vector<PlanOperation> operations;
    std::vector<PlanStack> overlay_stacks;
    std::vector<SubtitleCue> subtitles;  ///< Sorted by start
    std::string srt;                     ///< The cues rendered as SubRip text
    std::string video_label;             ///< Final video stream label
    std::string audio_label;             ///< Final audio stream label; empty = silent
};

// Linearize the compiled stages into a single operation list. Fails only with
// InternalConsistencyError when an upstream result breaks its own invariants.
CompileStatus emit_plan(const VideoSpec &spec, const Timeline &timeline,
                        const OverlayPlan &overlays, const MixPlan &mix, const MediaTable &media,
                        CompositionPlan &out);

// Deterministic JSON rendering (stable key order, fixed layout).
std::string plan_to_json(const CompositionPlan &plan, int indent = 2);

}  // namespace reelforge
