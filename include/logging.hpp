//
//  logging.hpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <atomic>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace captionforge {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Parse a CLI/config level name; unknown names map to Error.
LogVerbosity parse_log_verbosity(std::string_view name);

// Short preview of cue text for debug logs (keeps log lines single-line and bounded).
inline constexpr size_t kTextPreviewChars = 32;
inline std::string text_preview(std::string_view text, size_t max_len = kTextPreviewChars) {
    size_t cut = std::min(max_len, text.size());
    // Never split a UTF-8 sequence: back up over continuation bytes.
    while (cut > 0 && cut < text.size() &&
           (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    std::string out;
    out.reserve(cut + 3);
    for (size_t i = 0; i < cut; ++i) {
        const char c = text[i];
        out.push_back((c == '\n' || c == '\r') ? ' ' : c);
    }
    if (cut < text.size()) {
        out += "...";
    }
    return out;
}

}  // namespace captionforge

inline constexpr captionforge::LogVerbosity cf_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return captionforge::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return captionforge::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return captionforge::LogVerbosity::Info;
    }
    // Everything else (parser/style/io/etc.) treated as debug-level.
    return captionforge::LogVerbosity::Debug;
}

inline bool cf_should_log(const char* level) {
    const auto current = captionforge::get_log_verbosity();
    const auto sev = cf_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void cf_log_impl(const char* level, const std::string& msg, const char* file, int line,
                        const char* func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[CaptionForge][" << level << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[CaptionForge][" << level << "] " << msg << std::endl;
    }
}

#define CF_LOG(level, message)                                              \
    do {                                                                    \
        if (cf_should_log(level)) {                                         \
            std::ostringstream _cf_log_ss;                                  \
            _cf_log_ss << message;                                          \
            cf_log_impl(level, _cf_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
