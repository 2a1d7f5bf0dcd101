// Unit coverage for the JSON spec loader: field contract, aliases, legacy forms and
// malformed input reporting.
#include <cmath>
#include <filesystem>
#include <iostream>
#include <string>

#include "spec_loader.hpp"

using namespace reelforge;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[spec_loader_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

std::string data_path(const std::string &name) {
    return (std::filesystem::path(TESTDATA_DIR) / name).string();
}

std::string resolved(const std::string &relative) {
    return (std::filesystem::path(TESTDATA_DIR) / relative).lexically_normal().string();
}

bool has_violation(const CompileStatus &st, const std::string &entity, const std::string &rule) {
    for (const auto &v : st.violations) {
        if (v.entity == entity && v.rule == rule) {
            return true;
        }
    }
    return false;
}

bool test_basic_spec() {
    auto res = load_spec_file(data_path("basic_spec.json"));
    bool ok = check(res.status.ok, "basic spec loads: " + describe(res.status));
    if (!ok) {
        return false;
    }
    const VideoSpec &spec = res.spec;

    ok &= check(spec.output.width == 1280 && spec.output.height == 720, "resolution array");
    ok &= check(near(spec.output.fps, 25.0), "fps");
    ok &= check(spec.output.subtitle_mode == SubtitleMode::Soft, "subtitle mode soft");
    ok &= check(spec.output.background == "#101010", "background colour");

    ok &= check(near(spec.options.gap_tolerance, 0.01), "gap tolerance override");
    ok &= check(near(spec.options.min_speed, 0.5) && near(spec.options.max_speed, 2.0),
                "speed range override");
    ok &= check(near(spec.options.duck_db, 9.0), "duck_db override");
    ok &= check(spec.options.probe_workers == 2, "probe workers override");
    ok &= check(near(spec.options.speed_epsilon, 0.001), "speed epsilon keeps default");

    ok &= check(spec.clips.size() == 3, "three clips");
    if (spec.clips.size() == 3) {
        ok &= check(spec.clips[0].asset == resolved("media/intro.mp4"),
                    "relative asset resolved against the spec directory");
        ok &= check(spec.clips[0].allow_trim, "allow_trim parsed");
        ok &= check(spec.clips[1].blank && spec.clips[1].asset.empty(), "blank clip");
        ok &= check(spec.clips[2].asset == "https://cdn.example.com/main.mp4",
                    "URL kept verbatim");
        ok &= check(spec.clips[2].trim_in && near(*spec.clips[2].trim_in, 1.5), "trim_in");
        ok &= check(spec.clips[2].trim_out && near(*spec.clips[2].trim_out, 8.5), "trim_out");
        ok &= check(near(spec.clips[2].gain_db, -3.0), "clip gain");
        ok &= check(!spec.clips[0].trim_in && !spec.clips[0].trim_out, "absent trims stay empty");
    }

    ok &= check(spec.overlays.size() == 2, "two overlays");
    if (spec.overlays.size() == 2) {
        const Overlay &host = spec.overlays[0];
        ok &= check(host.asset == "/abs/host.mov", "absolute path kept verbatim");
        ok &= check(near(host.x, 0.7) && near(host.y, 0.05), "position array");
        ok &= check(near(host.w, 0.25) && near(host.h, 0.3), "size object");
        ok &= check(host.units == CoordinateUnits::Normalized, "units default normalized");
        ok &= check(host.windows.size() == 2 && near(host.windows[1].start, 6.0) &&
                        near(host.windows[1].end, 9.0),
                    "windows in array and object form");
        ok &= check(host.z_index && *host.z_index == 2, "z_index");
        ok &= check(host.loop, "loop");
        const Overlay &logo = spec.overlays[1];
        ok &= check(logo.units == CoordinateUnits::Pixels, "pixel units");
        ok &= check(!logo.z_index, "z_index absent");
        ok &= check(near(logo.w, 128.0) && near(logo.h, 64.0), "pixel size");
    }

    ok &= check(spec.subtitles.size() == 2, "two cues");
    if (spec.subtitles.size() == 2) {
        ok &= check(spec.subtitles[0].style.has_value(), "style parsed");
        if (spec.subtitles[0].style) {
            ok &= check(spec.subtitles[0].style->font == "Inter", "style font");
            ok &= check(spec.subtitles[0].style->size == 32, "style size");
            ok &= check(spec.subtitles[0].style->position == "top", "style position");
        }
        ok &= check(!spec.subtitles[1].style, "no style on second cue");
    }

    ok &= check(spec.audio.size() == 2, "two audio tracks");
    if (spec.audio.size() == 2) {
        ok &= check(spec.audio[0].kind == AudioKind::Narration, "narration kind");
        ok &= check(spec.audio[0].end && near(*spec.audio[0].end, 3.5), "narration end");
        ok &= check(spec.audio[1].kind == AudioKind::Bgm, "bgm kind");
        ok &= check(!spec.audio[1].end, "bgm without end");
        ok &= check(near(spec.audio[1].fade_in, 1.0) && near(spec.audio[1].fade_out, 2.0),
                    "fades");
        ok &= check(near(spec.audio[1].gain_db, -6.0), "bgm gain");
    }
    return ok;
}

bool test_legacy_names() {
    auto res = load_spec_file(data_path("legacy_spec.json"));
    bool ok = check(res.status.ok, "legacy spec loads: " + describe(res.status));
    if (!ok) {
        return false;
    }
    const VideoSpec &spec = res.spec;
    ok &= check(spec.clips.size() == 2, "videos alias");
    if (spec.clips.size() == 2) {
        ok &= check(spec.clips[0].id == "clip-1" && spec.clips[1].id == "clip-2",
                    "generated clip ids");
        ok &= check(spec.clips[1].asset == resolved("b.mp4"), "file alias for asset");
    }
    ok &= check(spec.overlays.size() == 1, "avatars alias");
    if (!spec.overlays.empty()) {
        const Overlay &o = spec.overlays[0];
        ok &= check(o.id == "overlay-1", "generated overlay id");
        ok &= check(o.windows.size() == 1 && near(o.windows[0].start, 2.0),
                    "legacy single window start");
        ok &= check(o.window_end_from_asset, "missing end is taken from the asset later");
        ok &= check(o.units == CoordinateUnits::Source, "avatar size relative to the avatar");
    }
    ok &= check(spec.subtitles.size() == 2, "two cues");
    if (spec.subtitles.size() == 2) {
        ok &= check(spec.subtitles[0].text == "typo'd key still works", "tetx alias");
        ok &= check(spec.subtitles[1].text == "second", "content alias");
        ok &= check(spec.subtitles[0].id == "subtitle-1", "generated cue id");
    }
    ok &= check(spec.audio.size() == 2, "audios alias");
    if (spec.audio.size() == 2) {
        ok &= check(spec.audio[0].kind == AudioKind::Narration, "audios default to narration");
        ok &= check(!spec.audio[0].end, "narration end left to the probe");
        ok &= check(spec.audio[0].id == "audio-1", "generated audio id");
        ok &= check(!spec.audio[0].start_after_previous, "explicit start kept");
        ok &= check(spec.audio[1].start_after_previous,
                    "start-less entry follows the previous narration");
    }
    ok &= check(spec.output.width == 1920 && spec.output.height == 1080, "resolution object");
    return ok;
}

bool test_defaults_from_string() {
    auto res = load_spec_string(R"({"clips": [{"asset": "a.mp4", "start": 0, "end": 3}]})");
    bool ok = check(res.status.ok, "minimal spec loads");
    ok &= check(res.spec.clips.size() == 1 && res.spec.clips[0].asset == "a.mp4",
                "no base directory for in-memory specs");
    ok &= check(res.spec.output.width == 1920 && res.spec.output.height == 1080,
                "default resolution");
    ok &= check(near(res.spec.output.fps, 30.0), "default fps");
    ok &= check(res.spec.output.subtitle_mode == SubtitleMode::Burn, "default subtitle mode");
    ok &= check(res.spec.output.background == "black", "default background");
    ok &= check(near(res.spec.options.duck_db, 12.0), "default ducking");
    ok &= check(near(res.spec.options.min_speed, 0.25) && near(res.spec.options.max_speed, 4.0),
                "default speed range");
    return ok;
}

bool test_malformed() {
    auto res = load_spec_file(data_path("malformed_spec.json"));
    bool ok = check(!res.status.ok, "malformed spec rejected");
    ok &= check(res.status.kind == ErrorKind::ValidationError, "malformed is a ValidationError");
    ok &= check(has_violation(res.status, "c1", "type"), "string start reported");
    ok &= check(has_violation(res.status, "c2", "missing-field"), "missing start reported");
    ok &= check(has_violation(res.status, "o1", "missing-field"), "missing size reported");
    ok &= check(has_violation(res.status, "o1", "unknown-units"), "unknown units reported");
    ok &= check(has_violation(res.status, "a1", "unknown-kind"), "unknown audio kind reported");
    ok &= check(has_violation(res.status, "output", "unknown-subtitle-mode"),
                "unknown subtitle mode reported");
    size_t shape = 0;
    for (const auto &v : res.status.violations) {
        if (v.rule == "type" || v.rule == "missing-field" || v.rule.rfind("unknown-", 0) == 0) {
            ++shape;
        }
    }
    ok &= check(shape == 6, "every malformed field reported once");
    ok &= check(has_violation(res.status, "c2", "overlap"),
                "rule checks still run on the fields that loaded");
    ok &= check(res.status.message.find("6 malformed field(s)") != std::string::npos,
                "message counts the malformed fields: " + res.status.message);
    return ok;
}

bool test_error_message_counts() {
    auto res = load_spec_string(R"({"clips": [
        {"id": "c1", "asset": "a.mp4", "start": 0, "end": 5, "gain_db": "loud"}]})");
    bool ok = check(!res.status.ok && res.status.violations.size() == 1, "one bad field");
    ok &= check(res.status.message == "1 malformed field(s) in spec",
                "message counts the violation: " + res.status.message);
    return ok;
}

bool test_null_required_field() {
    auto res = load_spec_string(
        R"({"clips": [{"id": "c1", "asset": "a.mp4", "start": null, "end": 5}]})");
    bool ok = check(!res.status.ok, "null start rejected");
    ok &= check(has_violation(res.status, "c1", "missing-field"), "null counts as missing");

    res = load_spec_string(R"({"clips": [{"id": "c1", "asset": "a.mp4", "start": 0, "end": 5}],
        "overlays": [{"id": "o1", "asset": "o.png", "size": [0.1, 0.1],
                      "windows": [{"start": 1, "end": null}]}]})");
    ok &= check(has_violation(res.status, "o1", "missing-field"), "null window end rejected");
    return ok;
}

bool test_shape_and_rule_violations_together() {
    auto res = load_spec_string(R"({"clips": [
        {"id": "c1", "asset": "a.mp4", "start": 0, "end": 5},
        {"id": "c1", "asset": "b.mp4", "start": 3, "end": 8, "gain_db": "loud"}]})");
    bool ok = check(!res.status.ok && res.status.kind == ErrorKind::ValidationError,
                    "rejected as ValidationError");
    ok &= check(has_violation(res.status, "c1", "type"), "type error reported");
    ok &= check(has_violation(res.status, "c1", "duplicate-id"), "duplicate id reported");
    ok &= check(has_violation(res.status, "c1", "overlap"), "overlap reported");
    ok &= check(res.status.message.find("1 malformed field(s) and 2 rule violation(s)") !=
                    std::string::npos,
                "message counts both kinds: " + res.status.message);
    return ok;
}

bool test_out_of_range_numbers() {
    auto res = load_spec_string(R"({
        "clips": [{"id": "c1", "asset": "a.mp4", "start": 0, "end": 5}],
        "overlays": [{"id": "o1", "asset": "o.png", "size": [0.1, 0.1], "windows": [[0, 1]],
                      "z_index": 10000000000}],
        "subtitles": [{"id": "s1", "text": "hi", "start": 0, "end": 1, "style": {"size": -4}}],
        "output": {"resolution": [1000000000, 720]},
        "settings": {"probe_workers": 1e12}})");
    bool ok = check(!res.status.ok, "out-of-range values rejected");
    ok &= check(has_violation(res.status, "o1", "range"), "z_index beyond int");
    ok &= check(has_violation(res.status, "s1", "range"), "negative font size");
    ok &= check(has_violation(res.status, "output", "range"), "oversized resolution");
    ok &= check(has_violation(res.status, "settings", "range"), "worker count above the ceiling");

    res = load_spec_string(R"({"clips": [{"id": "c1", "asset": "a.mp4", "start": 0, "end": 5}],
        "settings": {"probe_workers": 2.5}})");
    ok &= check(has_violation(res.status, "settings", "range"), "fractional worker count");

    res = load_spec_string(R"({"clips": [{"id": "c1", "asset": "a.mp4", "start": 0, "end": 5}],
        "settings": {"probe_workers": 0}})");
    ok &= check(has_violation(res.status, "settings", "range"), "zero workers");
    return ok;
}

bool test_unreadable_and_syntax() {
    auto missing = load_spec_file(data_path("does_not_exist.json"));
    bool ok = check(!missing.status.ok, "missing file rejected");
    ok &= check(has_violation(missing.status, "spec", "unreadable"), "unreadable violation");

    auto broken = load_spec_file(data_path("broken_syntax.json"));
    ok &= check(!broken.status.ok, "syntax error rejected");
    ok &= check(broken.status.kind == ErrorKind::ValidationError, "syntax is a ValidationError");
    ok &= check(has_violation(broken.status, "spec", "syntax"), "syntax violation");

    auto not_object = load_spec_string("[1, 2, 3]");
    ok &= check(!not_object.status.ok, "top-level array rejected");

    auto wrong_list = load_spec_string(R"({"clips": {"asset": "a.mp4"}})");
    ok &= check(has_violation(wrong_list.status, "spec", "type"), "clips must be an array");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_basic_spec();
    ok &= test_legacy_names();
    ok &= test_defaults_from_string();
    ok &= test_malformed();
    ok &= test_error_message_counts();
    ok &= test_null_required_field();
    ok &= test_shape_and_rule_violations_together();
    ok &= test_out_of_range_numbers();
    ok &= test_unreadable_and_syntax();
    if (!ok) {
        return 1;
    }
    std::cout << "[spec_loader_unit] OK\n";
    return 0;
}
