// Speaker -> palette color assignment: first-seen order, wrap-around and determinism.
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "logging.hpp"
#include "speaker_colors.hpp"

using namespace captionforge;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[speaker_colors_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

const std::vector<std::string> kPalette{"white", "yellow", "blue"};

bool test_first_seen_order() {
    SpeakerColorAssigner speakers(kPalette);
    bool ok = check(speakers.assign("Speaker B") == "white", "first speaker gets palette[0]");
    ok &= check(speakers.assign("Speaker A") == "yellow", "second speaker gets palette[1]");
    ok &= check(speakers.assign("Speaker B") == "white", "known speaker keeps its color");
    ok &= check(speakers.assign("Speaker C") == "blue", "third speaker gets palette[2]");
    ok &= check(speakers.speaker_count() == 3, "three distinct speakers");
    ok &= check(speakers.speakers() ==
                    std::vector<std::string>{"Speaker B", "Speaker A", "Speaker C"},
                "speakers listed in first-seen order");
    ok &= check(speakers.knows("Speaker A") && !speakers.knows("Speaker D"), "knows()");
    return ok;
}

bool test_wraps_palette() {
    SpeakerColorAssigner speakers(kPalette);
    std::vector<std::string> got;
    for (const char *name : {"a", "b", "c", "d", "e", "a"}) {
        got.push_back(speakers.assign(name));
    }
    return check(got == std::vector<std::string>{"white", "yellow", "blue", "white", "yellow",
                                                 "white"},
                 "palette wraps modulo its length");
}

bool test_deterministic() {
    const std::vector<std::string> sequence{"x", "y", "x", "z", "y", "w"};
    SpeakerColorAssigner first(kPalette);
    SpeakerColorAssigner second(kPalette);
    bool ok = true;
    for (const auto &s : sequence) {
        ok &= check(first.assign(s) == second.assign(s), "same input order, same colors: " + s);
    }
    return ok;
}

bool test_single_color_palette() {
    SpeakerColorAssigner speakers({"red"});
    bool ok = check(speakers.assign("one") == "red" && speakers.assign("two") == "red",
                    "single color palette shared by everyone");
    bool threw = false;
    try {
        SpeakerColorAssigner empty(std::vector<std::string>{});
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    ok &= check(threw, "empty palette rejected");
    return ok;
}

}  // namespace

int main() {
    set_log_verbosity(LogVerbosity::Error);
    bool ok = true;
    ok &= test_first_seen_order();
    ok &= test_wraps_palette();
    ok &= test_deterministic();
    ok &= test_single_color_palette();
    return ok ? 0 : 1;
}
