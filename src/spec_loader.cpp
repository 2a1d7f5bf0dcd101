//
//  spec_loader.cpp
//  ReelForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "spec_loader.hpp"

#include <cerrno>
#include <climits>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>

#include "logging.hpp"
#include "spec_validator.hpp"

using json = nlohmann::json;

namespace reelforge {

namespace {

constexpr double kMaxFrameDimension = 16384.0;
constexpr double kMaxFontSize = 1000.0;
constexpr double kMaxProbeWorkers = 256.0;

struct LoadContext {
    std::vector<Violation> violations;
    std::filesystem::path base_dir;

    void fail(const std::string &entity, const std::string &rule, const std::string &msg) {
        violations.push_back(Violation{entity, rule, msg});
    }
};

std::optional<double> read_number(const json &obj, const char *key, const std::string &entity,
                                  LoadContext &ctx) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number()) {
        ctx.fail(entity, "type", std::string("'") + key + "' must be a number");
        return std::nullopt;
    }
    return it->get<double>();
}

double read_required_number(const json &obj, const char *key, const std::string &entity,
                            LoadContext &ctx) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        ctx.fail(entity, "missing-field", std::string("'") + key + "' is required");
        return 0.0;
    }
    return read_number(obj, key, entity, ctx).value_or(0.0);
}

// Whole number in [lo, hi]; anything else is a violation.
std::optional<long long> read_bounded_integer(const json &obj, const char *key, double lo,
                                              double hi, const std::string &entity,
                                              LoadContext &ctx) {
    auto value = read_number(obj, key, entity, ctx);
    if (!value) {
        return std::nullopt;
    }
    if (!(*value >= lo && *value <= hi) || std::floor(*value) != *value) {
        std::ostringstream msg;
        msg << "'" << key << "' must be a whole number in [" << lo << ", " << hi << "], got "
            << *value;
        ctx.fail(entity, "range", msg.str());
        return std::nullopt;
    }
    return static_cast<long long>(*value);
}

bool read_bool(const json &obj, const char *key, bool fallback, const std::string &entity,
               LoadContext &ctx) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_boolean()) {
        ctx.fail(entity, "type", std::string("'") + key + "' must be a boolean");
        return fallback;
    }
    return it->get<bool>();
}

std::string read_string(const json &obj, const char *key, const std::string &entity,
                        LoadContext &ctx) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return {};
    }
    if (!it->is_string()) {
        ctx.fail(entity, "type", std::string("'") + key + "' must be a string");
        return {};
    }
    return it->get<std::string>();
}

// Accepts both the array form [a, b] and the object form {first_key, second_key}.
std::optional<std::pair<double, double>> read_pair(const json &obj, const char *key,
                                                   const char *first_key, const char *second_key,
                                                   const std::string &entity, LoadContext &ctx) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    const json &v = *it;
    if (v.is_array() && v.size() == 2 && v[0].is_number() && v[1].is_number()) {
        return std::make_pair(v[0].get<double>(), v[1].get<double>());
    }
    if (v.is_object() && v.contains(first_key) && v.contains(second_key) &&
        v[first_key].is_number() && v[second_key].is_number()) {
        return std::make_pair(v[first_key].get<double>(), v[second_key].get<double>());
    }
    ctx.fail(entity, "type",
             std::string("'") + key + "' must be [" + first_key + ", " + second_key +
                 "] or {\"" + first_key + "\", \"" + second_key + "\"}");
    return std::nullopt;
}

// Array lookup with an optional legacy alias. `used` receives the key that matched.
const json *find_array(const json &root, const char *key, const char *alias, LoadContext &ctx,
                       const char **used = nullptr) {
    for (const char *k : {key, alias}) {
        if (k == nullptr) {
            continue;
        }
        auto it = root.find(k);
        if (it == root.end() || it->is_null()) {
            continue;
        }
        if (!it->is_array()) {
            ctx.fail("spec", "type", std::string("'") + k + "' must be an array");
            return nullptr;
        }
        if (used) {
            *used = k;
        }
        return &*it;
    }
    return nullptr;
}

std::string entity_id(const json &obj, const std::string &fallback, LoadContext &ctx) {
    std::string id = read_string(obj, "id", fallback, ctx);
    return id.empty() ? fallback : id;
}

std::string resolve_asset(const std::string &ref, const LoadContext &ctx) {
    if (ref.empty() || ctx.base_dir.empty()) {
        return ref;
    }
    // URLs and absolute paths are taken verbatim.
    if (ref.find("://") != std::string::npos) {
        return ref;
    }
    std::filesystem::path p(ref);
    if (p.is_absolute()) {
        return ref;
    }
    return (ctx.base_dir / p).lexically_normal().string();
}

std::string read_asset(const json &obj, const std::string &entity, LoadContext &ctx) {
    std::string asset = read_string(obj, "asset", entity, ctx);
    if (asset.empty()) {
        asset = read_string(obj, "file", entity, ctx);
    }
    return resolve_asset(asset, ctx);
}

Clip load_clip(const json &c, size_t index, LoadContext &ctx) {
    Clip clip;
    clip.id = entity_id(c, "clip-" + std::to_string(index + 1), ctx);
    clip.asset = read_asset(c, clip.id, ctx);
    clip.start = read_required_number(c, "start", clip.id, ctx);
    clip.end = read_required_number(c, "end", clip.id, ctx);
    clip.trim_in = read_number(c, "trim_in", clip.id, ctx);
    clip.trim_out = read_number(c, "trim_out", clip.id, ctx);
    clip.allow_trim = read_bool(c, "allow_trim", false, clip.id, ctx);
    clip.blank = read_bool(c, "blank", false, clip.id, ctx);
    clip.gain_db = read_number(c, "gain_db", clip.id, ctx).value_or(0.0);
    clip.mute = read_bool(c, "mute", false, clip.id, ctx);
    return clip;
}

std::optional<TimeWindow> load_window(const json &w, const std::string &entity,
                                      LoadContext &ctx) {
    if (w.is_array() && w.size() == 2 && w[0].is_number() && w[1].is_number()) {
        return TimeWindow{w[0].get<double>(), w[1].get<double>()};
    }
    if (w.is_object()) {
        TimeWindow tw;
        tw.start = read_required_number(w, "start", entity, ctx);
        tw.end = read_required_number(w, "end", entity, ctx);
        return tw;
    }
    ctx.fail(entity, "type", "window must be [start, end] or {\"start\", \"end\"}");
    return std::nullopt;
}

Overlay load_overlay(const json &o, size_t index, CoordinateUnits default_units,
                     LoadContext &ctx) {
    Overlay ov;
    ov.units = default_units;
    ov.id = entity_id(o, "overlay-" + std::to_string(index + 1), ctx);
    ov.asset = read_asset(o, ov.id, ctx);

    if (auto pos = read_pair(o, "position", "x", "y", ov.id, ctx)) {
        ov.x = pos->first;
        ov.y = pos->second;
    }
    if (auto size = read_pair(o, "size", "w", "h", ov.id, ctx)) {
        ov.w = size->first;
        ov.h = size->second;
    } else if (!o.contains("size")) {
        ctx.fail(ov.id, "missing-field", "'size' is required");
    }

    const std::string units = read_string(o, "units", ov.id, ctx);
    if (units == "pixels" || units == "px") {
        ov.units = CoordinateUnits::Pixels;
    } else if (units == "normalized") {
        ov.units = CoordinateUnits::Normalized;
    } else if (units == "source") {
        ov.units = CoordinateUnits::Source;
    } else if (!units.empty()) {
        ctx.fail(ov.id, "unknown-units",
                 "units '" + units + "' is not normalized|pixels|source");
    }

    auto zit = o.find("z_index");
    if (zit != o.end() && !zit->is_null()) {
        if (zit->is_number_integer()) {
            if (auto z = read_bounded_integer(o, "z_index", INT_MIN, INT_MAX, ov.id, ctx)) {
                ov.z_index = static_cast<int>(*z);
            }
        } else {
            ctx.fail(ov.id, "type", "'z_index' must be an integer");
        }
    }
    ov.loop = read_bool(o, "loop", false, ov.id, ctx);

    auto wit = o.find("windows");
    if (wit != o.end() && !wit->is_null()) {
        if (!wit->is_array()) {
            ctx.fail(ov.id, "type", "'windows' must be an array");
        } else {
            for (const auto &w : *wit) {
                if (auto tw = load_window(w, ov.id, ctx)) {
                    ov.windows.push_back(*tw);
                }
            }
        }
    } else {
        // Single-window legacy form: start defaults to 0, end to the asset length.
        TimeWindow tw;
        tw.start = read_number(o, "start", ov.id, ctx).value_or(0.0);
        if (auto end = read_number(o, "end", ov.id, ctx)) {
            tw.end = *end;
        } else {
            tw.end = tw.start;
            ov.window_end_from_asset = true;
        }
        ov.windows.push_back(tw);
    }
    return ov;
}

SubtitleCue load_cue(const json &s, size_t index, LoadContext &ctx) {
    SubtitleCue cue;
    cue.id = entity_id(s, "subtitle-" + std::to_string(index + 1), ctx);
    for (const char *key : {"text", "tetx", "content", "subtitle"}) {
        cue.text = read_string(s, key, cue.id, ctx);
        if (!cue.text.empty()) {
            break;
        }
    }
    cue.start = read_required_number(s, "start", cue.id, ctx);
    cue.end = read_required_number(s, "end", cue.id, ctx);

    auto sit = s.find("style");
    if (sit != s.end() && !sit->is_null()) {
        if (!sit->is_object()) {
            ctx.fail(cue.id, "type", "'style' must be an object");
        } else {
            SubtitleStyle style;
            style.font = read_string(*sit, "font", cue.id, ctx);
            if (auto size = read_bounded_integer(*sit, "size", 0, kMaxFontSize, cue.id, ctx)) {
                style.size = static_cast<int>(*size);
            }
            style.color = read_string(*sit, "color", cue.id, ctx);
            style.position = read_string(*sit, "position", cue.id, ctx);
            cue.style = style;
        }
    }
    return cue;
}

AudioTrack load_audio(const json &a, size_t index, AudioKind default_kind, LoadContext &ctx) {
    AudioTrack track;
    track.id = entity_id(a, "audio-" + std::to_string(index + 1), ctx);
    track.asset = read_asset(a, track.id, ctx);
    track.kind = default_kind;
    const std::string kind = read_string(a, "kind", track.id, ctx);
    if (kind == "narration") {
        track.kind = AudioKind::Narration;
    } else if (kind == "bgm") {
        track.kind = AudioKind::Bgm;
    } else if (kind == "base") {
        track.kind = AudioKind::Base;
    } else if (!kind.empty()) {
        ctx.fail(track.id, "unknown-kind", "kind '" + kind + "' is not narration|bgm|base");
    }
    track.start = read_number(a, "start", track.id, ctx).value_or(0.0);
    track.end = read_number(a, "end", track.id, ctx);
    track.gain_db = read_number(a, "gain_db", track.id, ctx).value_or(0.0);
    track.fade_in = read_number(a, "fade_in", track.id, ctx).value_or(0.0);
    track.fade_out = read_number(a, "fade_out", track.id, ctx).value_or(0.0);
    return track;
}

void load_output(const json &o, OutputSettings &out, LoadContext &ctx) {
    if (auto res = read_pair(o, "resolution", "width", "height", "output", ctx)) {
        if (res->first > kMaxFrameDimension || res->second > kMaxFrameDimension) {
            std::ostringstream msg;
            msg << "resolution " << res->first << "x" << res->second << " exceeds "
                << kMaxFrameDimension << " pixels";
            ctx.fail("output", "range", msg.str());
        } else {
            // Non-positive sizes map to 0, which validation rejects.
            out.width = res->first >= 1.0 ? static_cast<uint32_t>(res->first) : 0;
            out.height = res->second >= 1.0 ? static_cast<uint32_t>(res->second) : 0;
        }
    }
    if (auto fps = read_number(o, "fps", "output", ctx)) {
        out.fps = *fps;
    }
    const std::string mode = read_string(o, "subtitle_mode", "output", ctx);
    if (mode == "soft") {
        out.subtitle_mode = SubtitleMode::Soft;
    } else if (!mode.empty() && mode != "burn") {
        ctx.fail("output", "unknown-subtitle-mode", "subtitle_mode '" + mode + "' is not burn|soft");
    }
    const std::string bg = read_string(o, "background", "output", ctx);
    if (!bg.empty()) {
        out.background = bg;
    }
}

void load_settings(const json &s, CompileOptions &opts, LoadContext &ctx) {
    opts.speed_epsilon = read_number(s, "speed_epsilon", "settings", ctx).value_or(opts.speed_epsilon);
    opts.gap_tolerance = read_number(s, "gap_tolerance", "settings", ctx).value_or(opts.gap_tolerance);
    opts.min_speed = read_number(s, "min_speed", "settings", ctx).value_or(opts.min_speed);
    opts.max_speed = read_number(s, "max_speed", "settings", ctx).value_or(opts.max_speed);
    if (auto range = read_pair(s, "speed_range", "min", "max", "settings", ctx)) {
        opts.min_speed = range->first;
        opts.max_speed = range->second;
    }
    opts.duck_db = read_number(s, "duck_db", "settings", ctx).value_or(opts.duck_db);
    if (auto workers =
            read_bounded_integer(s, "probe_workers", 1, kMaxProbeWorkers, "settings", ctx)) {
        opts.probe_workers = static_cast<unsigned>(*workers);
    }
    opts.probe_timeout = read_number(s, "probe_timeout", "settings", ctx).value_or(opts.probe_timeout);
}

LoadResult load_document(const json &root, LoadContext &ctx) {
    LoadResult result;
    VideoSpec &spec = result.spec;
    if (!root.is_object()) {
        ctx.fail("spec", "type", "top-level JSON value must be an object");
    } else {
        if (const json *clips = find_array(root, "clips", "videos", ctx)) {
            for (size_t i = 0; i < clips->size(); ++i) {
                if (!(*clips)[i].is_object()) {
                    ctx.fail("clip-" + std::to_string(i + 1), "type", "clip must be an object");
                    continue;
                }
                spec.clips.push_back(load_clip((*clips)[i], i, ctx));
            }
        }
        const char *overlay_key = nullptr;
        if (const json *overlays = find_array(root, "overlays", "avatars", ctx, &overlay_key)) {
            // Legacy avatar sizes scale the avatar itself, not the frame.
            const CoordinateUnits default_units = std::string(overlay_key) == "avatars"
                                                      ? CoordinateUnits::Source
                                                      : CoordinateUnits::Normalized;
            for (size_t i = 0; i < overlays->size(); ++i) {
                if (!(*overlays)[i].is_object()) {
                    ctx.fail("overlay-" + std::to_string(i + 1), "type",
                             "overlay must be an object");
                    continue;
                }
                spec.overlays.push_back(load_overlay((*overlays)[i], i, default_units, ctx));
            }
        }
        if (const json *subs = find_array(root, "subtitles", nullptr, ctx)) {
            for (size_t i = 0; i < subs->size(); ++i) {
                if (!(*subs)[i].is_object()) {
                    ctx.fail("subtitle-" + std::to_string(i + 1), "type",
                             "subtitle must be an object");
                    continue;
                }
                spec.subtitles.push_back(load_cue((*subs)[i], i, ctx));
            }
        }
        // "audios" is the legacy narration-only list. Its entries default to
        // narration and, without a start, play back to back.
        size_t audio_index = 0;
        for (const char *key : {"audio", "audios"}) {
            const bool legacy = std::string(key) == "audios";
            if (const json *tracks = find_array(root, key, nullptr, ctx)) {
                for (const auto &a : *tracks) {
                    if (!a.is_object()) {
                        ctx.fail("audio-" + std::to_string(audio_index + 1), "type",
                                 "audio track must be an object");
                    } else {
                        AudioTrack track = load_audio(a, audio_index, AudioKind::Narration, ctx);
                        const bool has_start = a.contains("start") && !a["start"].is_null();
                        track.start_after_previous = legacy && !has_start && !spec.audio.empty();
                        spec.audio.push_back(std::move(track));
                    }
                    ++audio_index;
                }
            }
        }
        auto out = root.find("output");
        if (out != root.end() && out->is_object()) {
            load_output(*out, spec.output, ctx);
        } else if (out != root.end() && !out->is_null()) {
            ctx.fail("spec", "type", "'output' must be an object");
        }
        auto settings = root.find("settings");
        if (settings != root.end() && settings->is_object()) {
            load_settings(*settings, spec.options, ctx);
        } else if (settings != root.end() && !settings->is_null()) {
            ctx.fail("spec", "type", "'settings' must be an object");
        }
    }

    if (!ctx.violations.empty()) {
        std::string msg = std::to_string(ctx.violations.size()) + " malformed field(s)";
        // Rule checks still run on what did load, so one bad field does not
        // hide the rest of the problems.
        if (root.is_object()) {
            CompileStatus rules = validate_spec(spec);
            if (!rules.ok) {
                msg += " and " + std::to_string(rules.violations.size()) + " rule violation(s)";
                for (auto &v : rules.violations) {
                    ctx.violations.push_back(std::move(v));
                }
            }
        }
        msg += " in spec";
        result.status = make_error(ErrorKind::ValidationError, std::move(msg),
                                   std::move(ctx.violations));
    }
    RF_LOG("debug", "loaded spec: clips=" << spec.clips.size()
                                          << " overlays=" << spec.overlays.size()
                                          << " subtitles=" << spec.subtitles.size()
                                          << " audio=" << spec.audio.size());
    return result;
}

}  // namespace

LoadResult load_spec_string(const std::string &text) {
    LoadContext ctx;
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error &e) {
        LoadResult result;
        result.status = make_error(ErrorKind::ValidationError, "spec is not valid JSON",
                                   {Violation{"spec", "syntax", e.what()}});
        return result;
    }
    return load_document(root, ctx);
}

LoadResult load_spec_file(const std::string &path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        RF_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        LoadResult result;
        result.status = make_error(ErrorKind::ValidationError, "cannot open spec " + path,
                                   {Violation{"spec", "unreadable", path}});
        return result;
    }
    std::ostringstream buf;
    buf << f.rdbuf();

    LoadContext ctx;
    ctx.base_dir = std::filesystem::path(path).parent_path();
    json root;
    try {
        root = json::parse(buf.str());
    } catch (const json::parse_error &e) {
        LoadResult result;
        result.status = make_error(ErrorKind::ValidationError, "spec is not valid JSON",
                                   {Violation{"spec", "syntax", e.what()}});
        return result;
    }
    return load_document(root, ctx);
}

}  // namespace reelforge
