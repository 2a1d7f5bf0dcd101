//
//  composition_plan.cpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "composition_plan.hpp"

#include <algorithm>
#include <cmath>
#include <nlohmann/json.hpp>
#include <set>
#include <sstream>
#include <utility>

#include "logging.hpp"
#include "srt_writer.hpp"

namespace reelforge {

const char *to_string(OpKind kind) {
    switch (kind) {
        case OpKind::Trim:
            return "trim";
        case OpKind::Color:
            return "color";
        case OpKind::Speed:
            return "speed";
        case OpKind::Scale:
            return "scale";
        case OpKind::Concat:
            return "concat";
        case OpKind::Overlay:
            return "overlay";
        case OpKind::Subtitles:
            return "subtitles";
        case OpKind::AudioLayer:
            return "audio_layer";
        case OpKind::Mix:
            return "mix";
        case OpKind::Finalize:
            return "finalize";
    }
    return "unknown";
}

namespace {

// Upper bound for float noise accumulated by the timing arithmetic itself.
constexpr double kArithmeticSlack = 1e-9;

std::string num(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

// -----------------------------------------------------------------------------
// Invariant checks on upstream results.
// -----------------------------------------------------------------------------
void check_timeline(const Timeline &t, double tolerance, double epsilon,
                    std::vector<Violation> &v) {
    if (t.segments.empty()) {
        v.push_back(Violation{"timeline", "empty", "no segments to emit"});
        return;
    }
    double cursor = 0.0;
    for (const auto &seg : t.segments) {
        if (std::fabs(seg.start - cursor) > tolerance) {
            v.push_back(Violation{seg.clip_id, "contiguity",
                                  "segment starts at " + num(seg.start) + ", expected " +
                                      num(cursor)});
        }
        if (std::fabs(seg.rendered_duration() - seg.slot_duration) > epsilon + kArithmeticSlack) {
            v.push_back(Violation{seg.clip_id, "rendered-duration",
                                  "renders " + num(seg.rendered_duration()) +
                                      "s into a slot of " + num(seg.slot_duration) + "s"});
        }
        cursor = seg.end;
    }
    if (std::fabs(cursor - t.total_duration) > kArithmeticSlack) {
        v.push_back(Violation{"timeline", "total", "segments end at " + num(cursor) +
                                                       " but total is " +
                                                       num(t.total_duration)});
    }
}

void check_overlays(const OverlayPlan &plan, double total, std::vector<Violation> &v) {
    for (const auto &o : plan.overlays) {
        double prev_end = -1.0;
        for (const auto &w : o.intervals) {
            if (w.start < 0.0 || w.end > total + kArithmeticSlack || w.end <= w.start) {
                v.push_back(Violation{o.id, "overlay-bounds",
                                      "interval [" + num(w.start) + ", " + num(w.end) +
                                          "] outside [0, " + num(total) + "]"});
            }
            if (w.start < prev_end) {
                v.push_back(Violation{o.id, "overlay-overlap", "intervals overlap after merge"});
            }
            prev_end = w.end;
        }
    }
}

void check_mix(const MixPlan &mix, double total, std::vector<Violation> &v) {
    for (const auto &layer : mix.layers) {
        if (layer.start < 0.0 || layer.end > total + kArithmeticSlack) {
            v.push_back(Violation{layer.id, "layer-bounds", "layer leaves the timeline"});
        }
        double cursor = layer.start;
        for (const auto &g : layer.envelope) {
            if (g.start != cursor || g.end <= g.start) {
                v.push_back(Violation{layer.id, "envelope", "gain envelope has a hole at " +
                                                                num(cursor)});
                break;
            }
            cursor = g.end;
        }
        if (cursor != layer.end) {
            v.push_back(Violation{layer.id, "envelope", "gain envelope stops at " + num(cursor) +
                                                            " before layer end " +
                                                            num(layer.end)});
        }
    }
}

void check_labels(const CompositionPlan &plan, std::vector<Violation> &v) {
    std::set<std::string> known;
    for (size_t i = 0; i < plan.inputs.size(); ++i) {
        known.insert("in" + std::to_string(i));
    }
    for (const auto &op : plan.operations) {
        for (const auto &in : op.inputs) {
            if (!known.count(in)) {
                v.push_back(Violation{op.target, "dangling-input",
                                      std::string(to_string(op.kind)) + " reads undefined stream " +
                                          in});
            }
        }
        if (!op.output.empty()) {
            known.insert(op.output);
        }
    }
}

// -----------------------------------------------------------------------------
// Builder.
// -----------------------------------------------------------------------------
class PlanBuilder {
   public:
    PlanBuilder(CompositionPlan &plan, const MediaTable &media) : plan_(plan), media_(media) {}

    std::string input(const std::string &asset, bool loop) {
        PlanInput in;
        in.asset = asset;
        auto it = media_.find(asset);
        if (it != media_.end()) {
            in.info = it->second;
        }
        in.loop = loop;
        plan_.inputs.push_back(std::move(in));
        return "in" + std::to_string(plan_.inputs.size() - 1);
    }

    PlanOperation &op(OpKind kind, const std::string &target, std::vector<std::string> inputs,
                      std::string output, double start, double end) {
        PlanOperation o;
        o.kind = kind;
        o.target = target;
        o.inputs = std::move(inputs);
        o.output = std::move(output);
        o.start = start;
        o.end = end;
        plan_.operations.push_back(std::move(o));
        return plan_.operations.back();
    }

   private:
    CompositionPlan &plan_;
    const MediaTable &media_;
};

void emit_segments(PlanBuilder &b, const Timeline &timeline, const OutputSettings &output,
                   std::vector<std::string> &segment_labels) {
    for (size_t i = 0; i < timeline.segments.size(); ++i) {
        const auto &seg = timeline.segments[i];
        const std::string prefix = "v" + std::to_string(i);
        std::string cur = prefix + ".src";
        if (seg.transform == TimeTransform::Blank) {
            b.op(OpKind::Color, seg.clip_id, {}, cur, 0.0, seg.slot_duration).mode =
                output.background;
        } else {
            b.op(OpKind::Trim, seg.clip_id, {b.input(seg.asset, false)}, cur, seg.source_in,
                 seg.source_out);
        }
        if (seg.transform == TimeTransform::SlowMotion || seg.transform == TimeTransform::SpeedUp) {
            const std::string next = prefix + ".speed";
            b.op(OpKind::Speed, seg.clip_id, {cur}, next, seg.start, seg.end).factor =
                seg.speed_factor;
            cur = next;
        }
        PlanOperation &scale = b.op(OpKind::Scale, seg.clip_id, {cur}, prefix, seg.start, seg.end);
        scale.rect = PixelRect{0, 0, output.width, output.height};
        segment_labels.push_back(prefix);
    }
}

}  // namespace

CompileStatus emit_plan(const VideoSpec &spec, const Timeline &timeline,
                        const OverlayPlan &overlays, const MixPlan &mix, const MediaTable &media,
                        CompositionPlan &out) {
    std::vector<Violation> broken;
    check_timeline(timeline, spec.options.gap_tolerance, spec.options.speed_epsilon, broken);
    check_overlays(overlays, timeline.total_duration, broken);
    check_mix(mix, timeline.total_duration, broken);
    if (!broken.empty()) {
        RF_LOG("error", "upstream stage produced " << broken.size() << " inconsistent result(s)");
        return make_error(ErrorKind::InternalConsistencyError,
                          "compiled stages are internally inconsistent", std::move(broken));
    }

    CompositionPlan plan;
    plan.total_duration = timeline.total_duration;
    plan.output = spec.output;
    PlanBuilder b(plan, media);
    const double total = timeline.total_duration;

    // 1. trim -> speed -> scale per segment, then concatenate the base track.
    std::vector<std::string> segment_labels;
    emit_segments(b, timeline, spec.output, segment_labels);
    std::string video = "base";
    b.op(OpKind::Concat, "base", segment_labels, video, 0.0, total);

    // 2. overlays, bottom to top.
    for (const auto &o : overlays.overlays) {
        if (o.intervals.empty()) {
            continue;
        }
        const std::string next = "ov" + std::to_string(o.draw_rank);
        PlanOperation &op =
            b.op(OpKind::Overlay, o.id, {video, b.input(o.asset, o.loop)}, next,
                 o.intervals.front().start, o.intervals.back().end);
        op.rect = o.rect;
        op.windows = o.intervals;
        op.loop = o.loop;
        video = next;
    }
    for (const auto &span : overlays.stacks) {
        PlanStack stack;
        stack.start = span.start;
        stack.end = span.end;
        for (size_t idx : span.layers) {
            stack.overlay_ids.push_back(overlays.overlays[idx].id);
        }
        plan.overlay_stacks.push_back(std::move(stack));
    }

    // 3. subtitles.
    plan.subtitles = spec.subtitles;
    std::stable_sort(plan.subtitles.begin(), plan.subtitles.end(),
                     [](const SubtitleCue &a, const SubtitleCue &c) { return a.start < c.start; });
    if (!plan.subtitles.empty()) {
        plan.srt = render_srt(plan.subtitles);
        b.op(OpKind::Subtitles, "subtitles", {video}, "vsub", 0.0, total).mode =
            to_string(spec.output.subtitle_mode);
        video = "vsub";
    }
    plan.video_label = video;

    // 4. audio layers and mix.
    std::vector<std::string> audio_labels;
    for (size_t i = 0; i < mix.layers.size(); ++i) {
        const MixLayer &layer = mix.layers[i];
        const std::string label = "a" + std::to_string(i);
        PlanOperation &op = b.op(OpKind::AudioLayer, layer.id,
                                 {b.input(layer.asset, layer.loop)}, label, layer.start, layer.end);
        op.offset = layer.source_in;
        op.loop = layer.loop;
        op.gains = layer.envelope;
        op.fade_in = layer.fade_in;
        op.fade_out = layer.fade_out;
        op.mode = to_string(layer.kind);
        audio_labels.push_back(label);
    }
    if (!audio_labels.empty()) {
        b.op(OpKind::Mix, "audio", audio_labels, "aout", 0.0, total);
        plan.audio_label = "aout";
    }

    // 5. finalize.
    std::vector<std::string> finals = {plan.video_label};
    if (!plan.audio_label.empty()) {
        finals.push_back(plan.audio_label);
    }
    b.op(OpKind::Finalize, "output", finals, "", 0.0, total);

    check_labels(plan, broken);
    if (!broken.empty()) {
        return make_error(ErrorKind::InternalConsistencyError,
                          "emitted plan references undefined streams", std::move(broken));
    }

    RF_LOG("debug", "plan: " << plan.inputs.size() << " input(s), " << plan.operations.size()
                             << " operation(s), total=" << fmt_seconds(total));
    out = std::move(plan);
    return make_ok();
}

// -----------------------------------------------------------------------------
// Serialization.
// -----------------------------------------------------------------------------
std::string plan_to_json(const CompositionPlan &plan, int indent) {
    using ojson = nlohmann::ordered_json;

    ojson j;
    j["total_duration"] = plan.total_duration;
    j["output"] = {{"width", plan.output.width},
                   {"height", plan.output.height},
                   {"fps", plan.output.fps},
                   {"subtitle_mode", to_string(plan.output.subtitle_mode)},
                   {"background", plan.output.background}};

    ojson inputs = ojson::array();
    for (size_t i = 0; i < plan.inputs.size(); ++i) {
        const auto &in = plan.inputs[i];
        inputs.push_back({{"label", "in" + std::to_string(i)},
                          {"asset", in.asset},
                          {"duration", in.info.duration},
                          {"width", in.info.width},
                          {"height", in.info.height},
                          {"has_audio", in.info.has_audio},
                          {"loop", in.loop}});
    }
    j["inputs"] = inputs;

    ojson ops = ojson::array();
    for (const auto &op : plan.operations) {
        ojson o;
        o["op"] = to_string(op.kind);
        o["target"] = op.target;
        o["inputs"] = op.inputs;
        o["output"] = op.output;
        switch (op.kind) {
            case OpKind::Trim:
                o["source_in"] = op.start;
                o["source_out"] = op.end;
                break;
            case OpKind::Color:
                o["duration"] = op.end - op.start;
                o["color"] = op.mode;
                break;
            case OpKind::Speed:
                o["factor"] = op.factor;
                o["timeline_start"] = op.start;
                o["timeline_end"] = op.end;
                break;
            case OpKind::Scale:
                o["width"] = op.rect.w;
                o["height"] = op.rect.h;
                o["fps"] = plan.output.fps;
                o["timeline_start"] = op.start;
                o["timeline_end"] = op.end;
                break;
            case OpKind::Overlay: {
                o["x"] = op.rect.x;
                o["y"] = op.rect.y;
                o["width"] = op.rect.w;
                o["height"] = op.rect.h;
                o["loop"] = op.loop;
                ojson windows = ojson::array();
                for (const auto &w : op.windows) {
                    windows.push_back({w.start, w.end});
                }
                o["windows"] = windows;
                break;
            }
            case OpKind::Subtitles:
                o["mode"] = op.mode;
                o["cues"] = plan.subtitles.size();
                break;
            case OpKind::AudioLayer: {
                o["kind"] = op.mode;
                o["timeline_start"] = op.start;
                o["timeline_end"] = op.end;
                o["source_in"] = op.offset;
                o["loop"] = op.loop;
                o["fade_in"] = op.fade_in;
                o["fade_out"] = op.fade_out;
                ojson env = ojson::array();
                for (const auto &g : op.gains) {
                    env.push_back({{"start", g.start}, {"end", g.end}, {"gain_db", g.gain_db}});
                }
                o["envelope"] = env;
                break;
            }
            case OpKind::Concat:
            case OpKind::Mix:
            case OpKind::Finalize:
                o["duration"] = op.end - op.start;
                break;
        }
        ops.push_back(std::move(o));
    }
    j["operations"] = ops;

    ojson stacks = ojson::array();
    for (const auto &s : plan.overlay_stacks) {
        stacks.push_back({{"start", s.start}, {"end", s.end}, {"overlays", s.overlay_ids}});
    }
    j["overlay_stacks"] = stacks;

    ojson cues = ojson::array();
    for (const auto &c : plan.subtitles) {
        cues.push_back({{"id", c.id}, {"start", c.start}, {"end", c.end}, {"text", c.text}});
    }
    j["subtitles"] = cues;
    j["srt"] = plan.srt;
    j["video"] = plan.video_label;
    j["audio"] = plan.audio_label;
    return j.dump(indent);
}

}  // namespace reelforge
