// Command-line surface: help text, argument validation and usage exit codes.
#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <string>
#include <vector>

#include "process_util.hpp"

using namespace reelforge;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[cli_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

int run_cli(std::vector<std::string> args, std::string &out) {
    args.insert(args.begin(), REELFORGE_CLI);
    out.clear();
    return run_capture(join_command(args) + " 2>/dev/null", out);
}

std::string missing_spec() {
    return (std::filesystem::path(TESTDATA_DIR) / "does_not_exist.json").string();
}

bool test_help() {
    std::string out;
    int code = run_cli({"--help"}, out);
    bool ok = check(code == 0, "--help exits 0");
    ok &= check(out.find("--jobs N") != std::string::npos, "help lists the options");
    ok &= check(out.find("--help") != std::string::npos, "help lists itself");
    code = run_cli({"-h"}, out);
    ok &= check(code == 0 && !out.empty(), "-h is the short form");
    return ok;
}

bool test_jobs_validation() {
    std::string out;
    bool ok = true;
    for (const char *bad : {"2.5", "0", "-3", "abc", "99999999999999999999", "1000"}) {
        const int code = run_cli({missing_spec(), "--plan-only", "--jobs", bad}, out);
        ok &= check(code == 2, std::string("--jobs ") + bad + " is a usage error");
    }
    // A valid count gets past argument parsing and fails on the missing spec.
    const int code = run_cli({missing_spec(), "--plan-only", "--jobs", "3"}, out);
    ok &= check(code == 1, "--jobs 3 accepted");
    return ok;
}

bool test_usage_errors() {
    std::string out;
    bool ok = check(run_cli({"--bogus"}, out) == 2, "unknown option");
    ok &= check(run_cli({}, out) == 2, "no arguments");
    ok &= check(run_cli({missing_spec()}, out) == 2, "output path required without --plan-only");
    ok &= check(run_cli({"--version"}, out) == 0 && out.find("ReelForge") == 0, "version banner");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_help();
    ok &= test_jobs_validation();
    ok &= test_usage_errors();
    if (!ok) {
        return 1;
    }
    std::cout << "[cli_unit] OK\n";
    return 0;
}
