//
//  audio_mix_planner.cpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "audio_mix_planner.hpp"

#include <algorithm>
#include <utility>

#include "logging.hpp"

namespace reelforge {

const char *to_string(MixLayerKind kind) {
    switch (kind) {
        case MixLayerKind::ClipAudio:
            return "clip_audio";
        case MixLayerKind::Narration:
            return "narration";
        case MixLayerKind::Bgm:
            return "bgm";
        case MixLayerKind::Bed:
            return "bed";
    }
    return "unknown";
}

namespace {

// Piecewise-constant envelope: nominal gain, minus duck_db inside narration.
std::vector<GainSpan> build_envelope(const MixLayer &layer, const std::vector<TimeWindow> &duck,
                                     double duck_db) {
    std::vector<GainSpan> spans;
    double cursor = layer.start;
    for (const auto &n : duck) {
        const double lo = std::max(n.start, layer.start);
        const double hi = std::min(n.end, layer.end);
        if (hi <= lo) {
            continue;
        }
        if (lo > cursor) {
            spans.push_back(GainSpan{cursor, lo, layer.nominal_gain_db});
        }
        spans.push_back(GainSpan{lo, hi, layer.nominal_gain_db - duck_db});
        cursor = hi;
    }
    if (cursor < layer.end) {
        spans.push_back(GainSpan{cursor, layer.end, layer.nominal_gain_db});
    }
    return spans;
}

double native_duration(const MediaTable &media, const std::string &asset) {
    auto it = media.find(asset);
    return it == media.end() ? 0.0 : it->second.duration;
}

}  // namespace

MixPlan plan_audio_mix(const VideoSpec &spec, const Timeline &timeline, const MediaTable &media) {
    MixPlan plan;
    plan.total_duration = timeline.total_duration;
    plan.duck_db = spec.options.duck_db;
    const double total = timeline.total_duration;

    for (const auto &a : spec.audio) {
        if (a.kind != AudioKind::Narration) {
            continue;
        }
        const double end = std::min(audio_track_end(a, media), total);
        if (end > a.start) {
            plan.narration.push_back(TimeWindow{a.start, end});
        }
    }
    std::sort(plan.narration.begin(), plan.narration.end(),
              [](const TimeWindow &x, const TimeWindow &y) { return x.start < y.start; });

    // Clip audio follows the base track; stretched segments stay silent.
    for (const auto &seg : timeline.segments) {
        if (seg.transform != TimeTransform::None && seg.transform != TimeTransform::Trimmed) {
            if (seg.transform != TimeTransform::Blank) {
                RF_LOG("mix", "segment " << seg.clip_id << " is time-stretched ("
                                         << seg.speed_factor << "x); clip audio dropped");
            }
            continue;
        }
        const Clip &clip = spec.clips[seg.clip_index];
        auto it = media.find(seg.asset);
        if (clip.mute || it == media.end() || !it->second.has_audio) {
            continue;
        }
        MixLayer layer;
        layer.id = seg.clip_id;
        layer.kind = MixLayerKind::ClipAudio;
        layer.asset = seg.asset;
        layer.start = seg.start;
        layer.end = seg.end;
        layer.source_in = seg.source_in;
        layer.source_duration = it->second.duration;
        layer.nominal_gain_db = clip.gain_db;
        layer.ducked = true;
        plan.layers.push_back(std::move(layer));
    }

    auto add_track = [&](const AudioTrack &a, MixLayerKind kind) {
        MixLayer layer;
        layer.id = a.id;
        layer.kind = kind;
        layer.asset = a.asset;
        layer.start = a.start;
        layer.source_duration = native_duration(media, a.asset);
        layer.nominal_gain_db = a.gain_db;
        layer.fade_in = a.fade_in;
        layer.fade_out = a.fade_out;
        if (kind == MixLayerKind::Bgm) {
            // Background music repeats from its start and is cut at the end.
            layer.end = total;
            layer.loop = true;
        } else {
            layer.end = std::min(audio_track_end(a, media), total);
        }
        layer.ducked = kind != MixLayerKind::Narration;
        if (layer.end <= layer.start) {
            return;
        }
        plan.layers.push_back(std::move(layer));
    };
    for (const auto &a : spec.audio) {
        if (a.kind == AudioKind::Base) add_track(a, MixLayerKind::Bed);
    }
    for (const auto &a : spec.audio) {
        if (a.kind == AudioKind::Bgm) add_track(a, MixLayerKind::Bgm);
    }
    for (const auto &a : spec.audio) {
        if (a.kind == AudioKind::Narration) add_track(a, MixLayerKind::Narration);
    }

    static const std::vector<TimeWindow> kNoDucking;
    for (auto &layer : plan.layers) {
        layer.envelope =
            build_envelope(layer, layer.ducked ? plan.narration : kNoDucking, plan.duck_db);
    }

    RF_LOG("debug", "mix: " << plan.layers.size() << " layer(s), " << plan.narration.size()
                            << " narration interval(s), duck=" << plan.duck_db << "dB");
    return plan;
}

std::optional<double> gain_at(const MixLayer &layer, double t) {
    for (const auto &span : layer.envelope) {
        if (t >= span.start && t < span.end) {
            return span.gain_db;
        }
    }
    // The final instant belongs to the last span.
    if (!layer.envelope.empty() && t == layer.envelope.back().end) {
        return layer.envelope.back().gain_db;
    }
    return std::nullopt;
}

}  // namespace reelforge
