// StyleCompiler: override token order, palette/explicit colors, labels and per-cue skips.
#include <iostream>
#include <string>
#include <variant>
#include <vector>

#include "logging.hpp"
#include "style_compiler.hpp"
#include "test_utils.hpp"

using namespace captionforge;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[style_compiler_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

Cue make_cue(uint32_t index, uint32_t start, uint32_t end, std::vector<std::string> lines) {
    Cue cue{};
    cue.index = index;
    cue.start_ms = start;
    cue.end_ms = end;
    cue.lines = std::move(lines);
    return cue;
}

CaptionConfig still_config() {
    CaptionConfig config;
    config.animation.enabled = false;
    return config;
}

bool test_palette_colors() {
    StyleCompiler compiler(still_config(), FontCatalog::bundled());
    auto result = compiler.compile({make_cue(1, 0, 1000, {"Speaker 1: Hello"}),
                                    make_cue(2, 1000, 2000, {"Speaker 2: Hi"}),
                                    make_cue(3, 2000, 3000, {"Speaker 1: Again"}),
                                    make_cue(4, 3000, 4000, {"No label here"})});
    auto styled = result.styled();
    bool ok = check(result.emitted == 4 && result.skipped == 0 && styled.size() == 4,
                    "all cues emitted");
    if (!ok) {
        return false;
    }
    ok &= check(styled[0].overrides == "{\\c&HFFFFFF&}", "first speaker white, still emitted");
    ok &= check(styled[1].overrides == "{\\c&H00FFFF&}", "second speaker yellow");
    ok &= check(styled[2].overrides == "{\\c&HFFFFFF&}", "first speaker keeps white");
    ok &= check(styled[3].overrides.empty(), "unlabelled cue has no color token");
    ok &= check(styled[0].text == "Hello", "label removed from display text");
    ok &= check(styled[3].text == "No label here", "plain text untouched");
    return ok;
}

bool test_explicit_color() {
    StyleCompiler compiler(still_config(), FontCatalog::bundled());
    auto result = compiler.compile(
        {make_cue(1, 0, 1000, {"Speaker 1: one"}),
         make_cue(2, 0, 1000, {"Speaker 2: <font color=\"red\">two</font>"}),
         make_cue(3, 0, 1000, {"<font color=\"white\">three</font>"}),
         make_cue(4, 0, 1000, {"Speaker 3: four"})});
    auto styled = result.styled();
    if (!check(styled.size() == 4, "four cues")) {
        return false;
    }
    bool ok = check(styled[1].overrides == "{\\c&H0000FF&}", "explicit color beats the palette");
    ok &= check(styled[1].text == "two", "font markup stripped");
    ok &= check(styled[2].overrides.empty(), "explicit color equal to the default is omitted");
    // Speaker 2 still took the second palette slot.
    ok &= check(styled[3].overrides == "{\\c&HFF0000&}", "third speaker blue");

    std::string log;
    CompileResult unknown;
    log = test_utils::capture_stderr([&]() {
        unknown = compiler.compile(
            {make_cue(1, 0, 1000, {"Speaker 1: <font color=\"nope\">x</font>"})});
    });
    ok &= check(unknown.emitted == 1 && unknown.styled()[0].overrides == "{\\c&HFFFFFF&}",
                "unknown inline color falls back to the palette");
    ok &= check(log.find("unknown color") != std::string::npos, "unknown color logged");
    return ok;
}

bool test_diarization_settings() {
    auto config = still_config();
    config.diarization.enabled = false;
    StyleCompiler off(config, FontCatalog::bundled());
    auto styled = off.compile({make_cue(1, 0, 1000, {"Speaker 1: hello"})}).styled();
    bool ok = check(styled.size() == 1 && styled[0].overrides.empty(),
                    "no palette color without diarization");
    ok &= check(styled.size() == 1 && styled[0].text == "hello", "label dropped");

    config.diarization.enabled = true;
    config.diarization.keep_speaker_labels = true;
    StyleCompiler keep(config, FontCatalog::bundled());
    styled = keep.compile({make_cue(1, 0, 1000, {"Speaker 1: hello", "there"})}).styled();
    ok &= check(styled.size() == 1 && styled[0].text == "Speaker 1: hello\\Nthere",
                "label kept and lines joined with \\N");

    config.diarization.enabled = false;
    StyleCompiler keep_off(config, FontCatalog::bundled());
    styled = keep_off.compile({make_cue(1, 0, 1000, {"Speaker 1: hello"})}).styled();
    ok &= check(styled.size() == 1 && styled[0].text == "hello",
                "labels only kept while diarization is on");
    return ok;
}

bool test_token_order() {
    auto config = still_config();
    config.style.auto_scale_font = true;
    const auto cue =
        make_cue(1, 0, 1000, {"Speaker 1: <font color=\"red\">This is long text</font>"});

    StyleCompiler still(config, FontCatalog::bundled());
    auto styled = still.compile({cue}).styled();
    bool ok = check(styled.size() == 1 &&
                        styled[0].overrides == "{\\c&H0000FF&}{\\fscx82\\fscy82}",
                    "color then standalone auto-scale");

    config.animation.enabled = true;
    config.animation.keyframes = 2;
    StyleCompiler animated(config, FontCatalog::bundled());
    styled = animated.compile({cue}).styled();
    ok &= check(styled.size() == 1 &&
                    styled[0].overrides == "{\\c&H0000FF&}{\\t(0,0,\\fscx82\\fscy82)}"
                                           "{\\t(1000,1000,\\fscx66\\fscy66)}",
                "color then animation composed with the auto-scale baseline");

    config.style.auto_scale_font = false;
    StyleCompiler plain(config, FontCatalog::bundled());
    styled = plain.compile({make_cue(1, 0, 1000, {"short"})}).styled();
    ok &= check(styled.size() == 1 &&
                    styled[0].overrides ==
                        "{\\t(0,0,\\fscx100\\fscy100)}{\\t(1000,1000,\\fscx80\\fscy80)}",
                "animation only");
    return ok;
}

bool test_skips() {
    StyleCompiler compiler(still_config(), FontCatalog::bundled());
    CompileResult result;
    auto log = test_utils::capture_stderr([&]() {
        result = compiler.compile({make_cue(1, 0, 1000, {"ok"}), make_cue(2, 2000, 2000, {"zero"}),
                                   make_cue(3, 3000, 2500, {"backwards"}),
                                   make_cue(4, 4000, 5000, {"ok too"})});
    });
    bool ok = check(result.results.size() == 4, "one result per input cue");
    ok &= check(result.emitted == 2 && result.skipped == 2, "two emitted, two skipped");
    ok &= check(std::holds_alternative<StyledCue>(result.results[0]) &&
                    std::holds_alternative<CueIssue>(result.results[1]) &&
                    std::holds_alternative<CueIssue>(result.results[2]) &&
                    std::holds_alternative<StyledCue>(result.results[3]),
                "results in input order");
    auto issues = result.issues();
    ok &= check(issues.size() == 2 && issues[0].index == 2 && issues[1].index == 3,
                "skipped cue indices");
    ok &= check(issues.size() == 2 && issues[0].kind == CueErrorKind::Validation &&
                    issues[0].reason.find("duration") != std::string::npos,
                "non-positive duration is a validation error");
    ok &= check(log.find("skipping cue 2") != std::string::npos, "skip logged with index");

    auto config = still_config();
    config.style.font = "Comic Sans MS";
    StyleCompiler unknown_font(config, FontCatalog::bundled());
    CompileResult fonts;
    test_utils::capture_stderr([&]() {
        fonts = unknown_font.compile({make_cue(1, 0, 1000, {"a"}), make_cue(2, 1000, 2000, {"b"})});
    });
    ok &= check(fonts.emitted == 0 && fonts.skipped == 2, "unknown font skips every cue");
    ok &= check(!fonts.issues().empty() &&
                    fonts.issues()[0].reason.find("unknown font") != std::string::npos,
                "unknown font reason");

    FontCatalog catalog;
    catalog.add("Comic Sans MS");
    StyleCompiler custom_font(config, catalog);
    ok &= check(custom_font.compile({make_cue(1, 0, 1000, {"a"})}).emitted == 1,
                "font accepted once the catalog knows it");

    auto bad = still_config();
    bad.animation.enabled = true;
    bad.animation.keyframes = 1;
    StyleCompiler bad_animation(bad, FontCatalog::bundled());
    CompileResult anim;
    test_utils::capture_stderr(
        [&]() { anim = bad_animation.compile({make_cue(1, 0, 1000, {"a"})}); });
    ok &= check(anim.skipped == 1 &&
                    anim.issues()[0].reason.find("invalid animation") != std::string::npos,
                "keyframes < 2 skips the cue");
    return ok;
}

bool test_repeatable() {
    StyleCompiler compiler(CaptionConfig{}, FontCatalog::bundled());
    const std::vector<Cue> cues{make_cue(1, 0, 900, {"Speaker B: first"}),
                                make_cue(2, 900, 2100, {"Speaker A: second"})};
    auto a = compiler.compile(cues).styled();
    auto b = compiler.compile(cues).styled();
    bool ok = check(a.size() == 2 && b.size() == 2, "both runs emit");
    for (size_t i = 0; ok && i < a.size(); ++i) {
        ok &= check(a[i].overrides == b[i].overrides && a[i].text == b[i].text,
                    "runs are identical at cue " + std::to_string(i + 1));
    }
    ok &= check(a[0].overrides.rfind("{\\c&HFFFFFF&}", 0) == 0,
                "speaker table starts fresh for every run");
    return ok;
}

}  // namespace

int main() {
    set_log_verbosity(LogVerbosity::Warn);
    bool ok = true;
    ok &= test_palette_colors();
    ok &= test_explicit_color();
    ok &= test_diarization_settings();
    ok &= test_token_order();
    ok &= test_skips();
    ok &= test_repeatable();
    return ok ? 0 : 1;
}
