//
//  srt_parser.cpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "srt_parser.hpp"

#include <cerrno>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

#include "logging.hpp"

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";
constexpr std::string_view kArrow = "-->";
constexpr uint32_t kMaxHours = 999;

static std::string_view trim(std::string_view s) {
    size_t b = 0;
    while (b < s.size() && (s[b] == ' ' || s[b] == '\t' || s[b] == '\r')) {
        ++b;
    }
    size_t e = s.size();
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r')) {
        --e;
    }
    return s.substr(b, e - b);
}

static bool is_digits(std::string_view s) {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}

// Accumulate a decimal field; rejects empty and overlong fields.
static std::optional<uint32_t> parse_field(std::string_view s, size_t max_digits) {
    if (!is_digits(s) || s.size() > max_digits) {
        return std::nullopt;
    }
    uint32_t v = 0;
    for (char c : s) {
        v = v * 10 + static_cast<uint32_t>(c - '0');
    }
    return v;
}

// Split into lines, dropping '\r' of CRLF endings.
static std::vector<std::string_view> split_lines(std::string_view content) {
    std::vector<std::string_view> lines;
    size_t pos = 0;
    while (pos <= content.size()) {
        size_t nl = content.find('\n', pos);
        if (nl == std::string_view::npos) {
            if (pos < content.size()) {
                lines.push_back(content.substr(pos));
            }
            break;
        }
        std::string_view line = content.substr(pos, nl - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        pos = nl + 1;
    }
    return lines;
}

struct Block {
    size_t ordinal = 0;
    std::vector<std::string_view> lines;
};

static std::vector<Block> split_blocks(const std::vector<std::string_view> &lines) {
    std::vector<Block> blocks;
    Block current;
    for (const auto &line : lines) {
        if (trim(line).empty()) {
            if (!current.lines.empty()) {
                blocks.push_back(std::move(current));
                current = Block{};
            }
            continue;
        }
        current.lines.push_back(line);
    }
    if (!current.lines.empty()) {
        blocks.push_back(std::move(current));
    }
    for (size_t i = 0; i < blocks.size(); ++i) {
        blocks[i].ordinal = i + 1;
    }
    return blocks;
}

}  // namespace

namespace captionforge {

std::optional<uint32_t> parse_srt_timestamp(std::string_view text) {
    text = trim(text);
    const size_t c1 = text.find(':');
    if (c1 == std::string_view::npos) {
        return std::nullopt;
    }
    const size_t c2 = text.find(':', c1 + 1);
    if (c2 == std::string_view::npos) {
        return std::nullopt;
    }
    const size_t frac = text.find_first_of(",.", c2 + 1);
    if (frac == std::string_view::npos) {
        return std::nullopt;
    }
    auto hh = parse_field(text.substr(0, c1), 3);
    auto mm = parse_field(text.substr(c1 + 1, c2 - c1 - 1), 2);
    auto ss = parse_field(text.substr(c2 + 1, frac - c2 - 1), 2);
    auto ms = parse_field(text.substr(frac + 1), 3);
    if (!hh || !mm || !ss || !ms) {
        return std::nullopt;
    }
    if (*hh > kMaxHours || *mm > 59 || *ss > 59 || text.size() - frac - 1 != 3) {
        return std::nullopt;
    }
    return ((*hh * 60 + *mm) * 60 + *ss) * 1000 + *ms;
}

SrtParseResult parse_srt(std::string_view content) {
    SrtParseResult result;
    if (content.substr(0, kUtf8Bom.size()) == kUtf8Bom) {
        content.remove_prefix(kUtf8Bom.size());
    }
    const auto blocks = split_blocks(split_lines(content));
    result.cues.reserve(blocks.size());

    auto skip = [&](const Block &block, uint32_t index, std::string reason) {
        CF_LOG("warn", "srt: skipping block " << block.ordinal << " (index " << index
                                              << "): " << reason);
        result.issues.push_back(CueIssue{index, CueErrorKind::Parse, std::move(reason)});
    };

    for (const auto &block : blocks) {
        const auto fallback_index = static_cast<uint32_t>(block.ordinal);
        auto index = parse_field(trim(block.lines[0]), 9);
        if (!index || *index == 0) {
            skip(block, fallback_index,
                 "invalid cue index '" + std::string(trim(block.lines[0])) + "'");
            continue;
        }
        if (block.lines.size() < 2) {
            skip(block, *index, "missing timing line");
            continue;
        }
        const std::string_view timing = block.lines[1];
        const size_t arrow = timing.find(kArrow);
        if (arrow == std::string_view::npos) {
            skip(block, *index, "missing '-->' separator");
            continue;
        }
        // The end field may be followed by positioning hints ("X1:...").
        std::string_view end_field = trim(timing.substr(arrow + kArrow.size()));
        end_field = end_field.substr(0, end_field.find_first_of(" \t"));
        auto start = parse_srt_timestamp(timing.substr(0, arrow));
        auto end = parse_srt_timestamp(end_field);
        if (!start || !end) {
            skip(block, *index, "malformed timestamp '" + std::string(trim(timing)) + "'");
            continue;
        }
        if (block.lines.size() < 3) {
            skip(block, *index, "missing text");
            continue;
        }
        Cue cue{};
        cue.index = *index;
        cue.start_ms = *start;
        cue.end_ms = *end;
        for (size_t i = 2; i < block.lines.size(); ++i) {
            cue.lines.emplace_back(block.lines[i]);
        }
        CF_LOG("debug", "srt: cue " << cue.index << " [" << cue.start_ms << ", " << cue.end_ms
                                    << "] \"" << text_preview(cue.lines.front()) << "\"");
        result.cues.push_back(std::move(cue));
    }
    CF_LOG("debug", "srt: parsed cues=" << result.cues.size()
                                        << " skipped=" << result.issues.size());
    return result;
}

std::optional<SrtParseResult> load_srt_file(const std::string &path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        CF_LOG("error", "open failed for " << path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return std::nullopt;
    }
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return parse_srt(content);
}

}  // namespace captionforge
