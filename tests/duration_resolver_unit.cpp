// Duration resolution: per-run cache, deduplication, bounded parallelism, failures,
// timeouts and the ffprobe JSON reader.
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "duration_resolver.hpp"
#include "fake_media_probe.hpp"
#include "logging.hpp"

using namespace reelforge;
using test_utils::FakeMediaProbe;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[duration_resolver_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

bool test_dedupe_and_fill() {
    auto probe = std::make_shared<FakeMediaProbe>();
    probe->add("a.mp4", 5.0);
    probe->add("b.mp4", 7.5, 1920, 1080, false);
    probe->add_audio("vo.wav", 3.0);

    DurationResolver resolver(probe, 4, 5.0);
    MediaTable media;
    auto st = resolver.resolve_all({"a.mp4", "b.mp4", "a.mp4", "vo.wav", "a.mp4"}, media);
    bool ok = check(st.ok, "all assets resolve: " + describe(st));
    ok &= check(media.size() == 3, "one entry per distinct asset");
    ok &= check(probe->calls("a.mp4") == 1, "duplicated asset probed exactly once");
    ok &= check(probe->total_calls() == 3, "three probes in total");
    ok &= check(near(media["b.mp4"].duration, 7.5) && media["b.mp4"].width == 1920 &&
                    !media["b.mp4"].has_audio,
                "media info carried through");
    ok &= check(resolver.cache().size() == 3, "cache holds every asset");
    ok &= check(resolver.cache().find("vo.wav").has_value(), "cache lookup after resolve");

    // A second pass on the same resolver is answered from the cache.
    MediaTable again;
    st = resolver.resolve_all({"b.mp4"}, again);
    ok &= check(st.ok && again.size() == 1, "cached re-resolve");
    ok &= check(probe->calls("b.mp4") == 1, "cache hit does not re-probe");
    return ok;
}

bool test_fresh_cache_per_resolver() {
    auto probe = std::make_shared<FakeMediaProbe>();
    probe->add("a.mp4", 5.0);
    MediaTable m1;
    MediaTable m2;
    bool ok = true;
    {
        DurationResolver first(probe, 2, 0.0);
        ok &= check(first.resolve_all({"a.mp4"}, m1).ok, "first run resolves");
    }
    DurationResolver second(probe, 2, 0.0);
    ok &= check(second.resolve_all({"a.mp4"}, m2).ok, "second run resolves");
    ok &= check(probe->calls("a.mp4") == 2, "no state shared between resolver instances");
    return ok;
}

bool test_failure_names_asset() {
    auto probe = std::make_shared<FakeMediaProbe>();
    probe->add("a.mp4", 5.0);
    probe->add("c.mp4", 5.0);
    probe->fail("broken.mp4", "moov atom not found");

    DurationResolver resolver(probe, 2, 5.0);
    MediaTable media;
    auto st = resolver.resolve_all({"a.mp4", "broken.mp4", "missing.mp4", "c.mp4"}, media);
    bool ok = check(!st.ok, "failing asset fails the run");
    ok &= check(st.kind == ErrorKind::AssetUnavailableError, "AssetUnavailableError");
    ok &= check(!st.violations.empty() && st.violations[0].entity == "broken.mp4",
                "first failing asset in input order is named");
    ok &= check(st.message.find("moov atom not found") != std::string::npos,
                "probe message surfaces");
    ok &= check(!resolver.cache().find("broken.mp4").has_value(), "failures are not usable");
    return ok;
}

bool test_parallel_bounded() {
    auto probe = std::make_shared<FakeMediaProbe>();
    std::vector<std::string> assets;
    for (int i = 0; i < 8; ++i) {
        assets.push_back("clip" + std::to_string(i) + ".mp4");
        probe->add(assets.back(), 1.0 + i);
    }
    probe->set_delay(std::chrono::milliseconds(40));

    DurationResolver resolver(probe, 3, 0.0);
    MediaTable media;
    const auto t0 = std::chrono::steady_clock::now();
    auto st = resolver.resolve_all(assets, media);
    const auto elapsed = std::chrono::steady_clock::now() - t0;
    bool ok = check(st.ok, "parallel resolve succeeds");
    ok &= check(media.size() == 8, "all eight assets resolved");
    ok &= check(probe->max_in_flight() <= 3, "never more probes in flight than workers");
    ok &= check(probe->max_in_flight() >= 2, "probes overlap in time");
    ok &= check(elapsed < std::chrono::milliseconds(8 * 40), "faster than sequential probing");
    return ok;
}

bool test_timeout() {
    auto probe = std::make_shared<FakeMediaProbe>();
    probe->add("slow.mp4", 5.0);
    probe->set_delay(std::chrono::milliseconds(400));

    DurationResolver resolver(probe, 1, 0.05);
    MediaTable media;
    const auto t0 = std::chrono::steady_clock::now();
    auto st = resolver.resolve_all({"slow.mp4"}, media);
    const auto elapsed = std::chrono::steady_clock::now() - t0;
    bool ok = check(!st.ok, "hung probe fails the run");
    ok &= check(st.kind == ErrorKind::AssetUnavailableError, "timeout is AssetUnavailableError");
    ok &= check(st.message.find("timed out") != std::string::npos, "timeout named in message");
    ok &= check(elapsed < std::chrono::milliseconds(300), "caller does not wait for the hang");

    // Let the abandoned probe finish before the fixture goes away.
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    return ok;
}

// A lookup abandoned after its timeout still occupies a worker slot until it
// returns, so the remaining lookups never exceed the configured worker count.
bool test_timeout_keeps_worker_bound() {
    auto media_source = std::make_shared<FakeMediaProbe>();
    std::vector<std::string> assets = {"hung.mp4"};
    media_source->add("hung.mp4", 5.0);
    media_source->set_delay("hung.mp4", std::chrono::milliseconds(700));
    for (int i = 0; i < 12; ++i) {
        assets.push_back("quick" + std::to_string(i) + ".mp4");
        media_source->add(assets.back(), 1.0);
        media_source->set_delay(assets.back(), std::chrono::milliseconds(40));
    }

    bool ok = true;
    {
        DurationResolver resolver(media_source, 2, 0.3);
        MediaTable media;
        auto st = resolver.resolve_all(assets, media);
        ok &= check(!st.ok && st.kind == ErrorKind::AssetUnavailableError,
                    "hung asset fails the run");
        ok &= check(!st.violations.empty() && st.violations[0].entity == "hung.mp4",
                    "failure names the hung asset");
        // Outlive the hung lookup so the resolver joins it on destruction.
        std::this_thread::sleep_for(std::chrono::milliseconds(600));
    }
    ok &= check(media_source->max_in_flight() <= 2, "abandoned lookup still holds its worker");
    ok &= check(media_source->calls("quick11.mp4") == 1, "later assets still resolved");
    return ok;
}

bool test_referenced_assets() {
    VideoSpec spec;
    Clip c1;
    c1.asset = "a.mp4";
    Clip blank;
    blank.blank = true;
    Clip c2;
    c2.asset = "a.mp4";
    spec.clips = {c1, blank, c2};
    Overlay o;
    o.asset = "host.mov";
    spec.overlays = {o};
    AudioTrack t;
    t.asset = "vo.wav";
    AudioTrack again;
    again.asset = "host.mov";
    spec.audio = {t, again};
    const auto assets = referenced_assets(spec);
    bool ok = check(assets.size() == 3, "blank clips and duplicates skipped");
    ok &= check(assets.size() == 3 && assets[0] == "a.mp4" && assets[1] == "host.mov" &&
                    assets[2] == "vo.wav",
                "clips, overlays, then audio");
    return ok;
}

bool test_ffprobe_json() {
    const std::string full = R"({
        "streams": [
            {"codec_type": "video", "width": 1920, "height": 1080, "duration": "10.000000"},
            {"codec_type": "audio", "duration": "10.010000"}
        ],
        "format": {"duration": "10.010000", "format_name": "mov,mp4,m4a,3gp,3g2,mj2"}
    })";
    auto r = parse_ffprobe_json("a.mp4", full);
    bool ok = check(r.ok, "full ffprobe output parses");
    ok &= check(near(r.info.duration, 10.01), "container duration preferred");
    ok &= check(r.info.width == 1920 && r.info.height == 1080, "video dimensions");
    ok &= check(r.info.has_audio, "audio stream detected");

    const std::string audio_only = R"({
        "streams": [{"codec_type": "audio", "duration": "4.5"}],
        "format": {"duration": "N/A"}
    })";
    r = parse_ffprobe_json("vo.wav", audio_only);
    ok &= check(r.ok && near(r.info.duration, 4.5), "stream duration fallback");
    ok &= check(r.info.width == 0 && r.info.height == 0, "audio-only has no size");

    r = parse_ffprobe_json("still.png", R"({"streams": [{"codec_type": "video"}], "format": {}})");
    ok &= check(!r.ok, "no duration is a failure");

    r = parse_ffprobe_json("junk", "not json");
    ok &= check(!r.ok && !r.message.empty(), "garbage output is a failure");
    return ok;
}

}  // namespace

int main() {
    set_log_verbosity(LogVerbosity::Error);
    bool ok = true;
    ok &= test_dedupe_and_fill();
    ok &= test_fresh_cache_per_resolver();
    ok &= test_failure_names_asset();
    ok &= test_parallel_bounded();
    ok &= test_timeout();
    ok &= test_timeout_keeps_worker_bound();
    ok &= test_referenced_assets();
    ok &= test_ffprobe_json();
    if (!ok) {
        return 1;
    }
    std::cout << "[duration_resolver_unit] OK\n";
    return 0;
}
