//
//  text_processor.cpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "text_processor.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "logging.hpp"

namespace {

constexpr size_t kMaxNameTokenLength = 32;
constexpr std::string_view kSpeakerPrefix = "Speaker ";
constexpr std::string_view kTerminalPunctuation = ".!?:;";

static bool is_alpha(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; }
static bool is_alnum(char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; }
static bool is_space(char c) { return c == ' ' || c == '\t' || c == '\r'; }

static std::string lower(std::string_view s) {
    std::string out(s);
    for (auto &c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

static std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

// Value of a `color` attribute inside a tag body such as `font color="red" size=3`.
static std::optional<std::string> find_color_attribute(std::string_view body) {
    const std::string lowered = lower(body);
    size_t pos = 0;
    while ((pos = lowered.find("color", pos)) != std::string::npos) {
        // Must be a whole attribute name.
        const bool starts_word = pos == 0 || is_space(lowered[pos - 1]);
        size_t p = pos + 5;
        while (p < body.size() && is_space(body[p])) {
            ++p;
        }
        if (!starts_word || p >= body.size() || body[p] != '=') {
            pos += 5;
            continue;
        }
        ++p;
        while (p < body.size() && is_space(body[p])) {
            ++p;
        }
        if (p >= body.size()) {
            return std::nullopt;
        }
        if (body[p] == '"' || body[p] == '\'') {
            const char quote = body[p];
            const size_t close = body.find(quote, p + 1);
            if (close == std::string_view::npos) {
                return std::nullopt;
            }
            return std::string(body.substr(p + 1, close - p - 1));
        }
        size_t e = p;
        while (e < body.size() && !is_space(body[e]) && body[e] != '/') {
            ++e;
        }
        return std::string(body.substr(p, e - p));
    }
    return std::nullopt;
}

static void handle_tag(std::string_view body, captionforge::MarkupResult &out) {
    if (body.empty() || body.front() == '/') {
        return;  // closing tags carry nothing we keep.
    }
    size_t n = 0;
    while (n < body.size() && is_alnum(body[n])) {
        ++n;
    }
    if (lower(body.substr(0, n)) != "font" || out.color) {
        return;
    }
    auto color = find_color_attribute(body.substr(n));
    if (color && !color->empty()) {
        out.color = std::move(color);
    }
}

}  // namespace

namespace captionforge {

MarkupResult strip_markup(std::string_view text) {
    enum class State { Text, Tag, Override };

    MarkupResult out;
    out.text.reserve(text.size());
    State state = State::Text;
    size_t markup_start = 0;

    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        switch (state) {
            case State::Text:
                if (c == '<' && i + 1 < text.size() &&
                    (is_alpha(text[i + 1]) || text[i + 1] == '/' || text[i + 1] == '!')) {
                    state = State::Tag;
                    markup_start = i;
                } else if (c == '{') {
                    state = State::Override;
                    markup_start = i;
                } else {
                    out.text.push_back(c);
                }
                break;
            case State::Tag:
                if (c == '>') {
                    handle_tag(text.substr(markup_start + 1, i - markup_start - 1), out);
                    state = State::Text;
                } else if (c == '\n') {
                    // Markup does not span lines; what we collected so far was literal text.
                    out.text.append(text.substr(markup_start, i - markup_start + 1));
                    state = State::Text;
                }
                break;
            case State::Override:
                if (c == '}') {
                    state = State::Text;
                } else if (c == '\n') {
                    out.text.append(text.substr(markup_start, i - markup_start + 1));
                    state = State::Text;
                }
                break;
        }
    }
    if (state != State::Text) {
        out.text.append(text.substr(markup_start));
    }
    return out;
}

bool is_speaker_label(std::string_view label) {
    if (label.size() > kSpeakerPrefix.size() &&
        label.substr(0, kSpeakerPrefix.size()) == kSpeakerPrefix) {
        const auto id = label.substr(kSpeakerPrefix.size());
        return std::all_of(id.begin(), id.end(),
                           [](char c) { return is_alnum(c) || c == '_' || c == '-'; });
    }
    if (label.empty() || label.size() > kMaxNameTokenLength || !is_alpha(label.front())) {
        return false;
    }
    return std::all_of(label.begin(), label.end(), [](char c) {
        return is_alnum(c) || c == '_' || c == '-' || c == '.' || c == '\'' ||
               static_cast<unsigned char>(c) >= 0x80;
    });
}

SpeakerSplit extract_speaker(std::string_view line) {
    SpeakerSplit split;
    // A label alone on its line ("Speaker 1:") leaves an empty remainder.
    const auto trimmed = trim(line);
    if (!trimmed.empty() && trimmed.back() == ':') {
        const auto label = trim(trimmed.substr(0, trimmed.size() - 1));
        if (is_speaker_label(label)) {
            split.speaker = std::string(label);
            return split;
        }
    }
    const size_t colon = line.find(": ");
    if (colon != std::string_view::npos) {
        const auto label = trim(line.substr(0, colon));
        if (is_speaker_label(label)) {
            split.speaker = std::string(label);
            split.text = std::string(trim(line.substr(colon + 2)));
            return split;
        }
    }
    split.text = std::string(line);
    return split;
}

std::vector<std::string> group_words(const std::vector<std::string> &lines,
                                     int max_words_per_line) {
    const size_t cap = max_words_per_line <= 0 ? 1 : static_cast<size_t>(max_words_per_line);
    std::vector<std::string> grouped;
    std::string current;
    size_t words_in_line = 0;
    for (const auto &line : lines) {
        std::istringstream iss(line);
        std::string word;
        while (iss >> word) {
            if (words_in_line > 0) {
                current.push_back(' ');
            }
            current += word;
            ++words_in_line;
            const bool terminal = kTerminalPunctuation.find(word.back()) != std::string_view::npos;
            if (terminal || words_in_line >= cap) {
                grouped.push_back(std::move(current));
                current.clear();
                words_in_line = 0;
            }
        }
    }
    if (words_in_line > 0) {
        grouped.push_back(std::move(current));
    }
    return grouped;
}

size_t count_display_chars(std::string_view text) {
    size_t n = 0;
    for (char c : text) {
        const auto b = static_cast<unsigned char>(c);
        if (c != '\n' && (b & 0xC0) != 0x80) {
            ++n;
        }
    }
    return n;
}

double auto_scale_percent(size_t char_count) {
    const double n = static_cast<double>(char_count);
    if (n <= kAutoScaleFullChars) {
        return 100.0;
    }
    return std::max(kAutoScaleFloorPercent,
                    100.0 - kAutoScaleStepPercent * (n - kAutoScaleFullChars));
}

ProcessedText process_cue_text(const Cue &cue, const StyleConfig &style) {
    ProcessedText out;
    std::string joined;
    for (size_t i = 0; i < cue.lines.size(); ++i) {
        if (i > 0) {
            joined.push_back('\n');
        }
        joined += cue.lines[i];
    }
    auto markup = strip_markup(joined);
    out.color_override = cue.color_override ? cue.color_override : markup.color;

    std::vector<std::string> lines;
    std::istringstream iss(markup.text);
    std::string line;
    while (std::getline(iss, line)) {
        auto trimmed = trim(line);
        if (!trimmed.empty()) {
            lines.emplace_back(trimmed);
        }
    }
    out.speaker = cue.speaker;
    if (!lines.empty()) {
        auto split = extract_speaker(lines.front());
        // With a known speaker only its own label is stripped; "follows:" stays a word.
        if (split.speaker && (!out.speaker || split.speaker == out.speaker)) {
            out.speaker = std::move(split.speaker);
            lines.front() = std::move(split.text);
            if (lines.front().empty()) {
                lines.erase(lines.begin());
            }
        }
    }

    for (const auto &l : lines) {
        out.char_count += count_display_chars(l);
    }
    if (style.auto_scale_font) {
        out.scale_percent = auto_scale_percent(out.char_count);
    }
    out.lines = style.max_words_per_line ? group_words(lines, *style.max_words_per_line)
                                         : std::move(lines);
    CF_LOG("debug", "text: cue " << cue.index << " speaker="
                                 << (out.speaker ? *out.speaker : std::string("-"))
                                 << " color=" << (out.color_override ? *out.color_override : "-")
                                 << " chars=" << out.char_count << " lines=" << out.lines.size()
                                 << " scale=" << out.scale_percent);
    return out;
}

}  // namespace captionforge
