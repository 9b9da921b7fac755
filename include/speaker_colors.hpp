//
//  speaker_colors.hpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace captionforge {

// Hands out palette colors to speakers in first-seen order, cycling once the palette is used up.
// Keep one instance per compilation run; the mapping depends only on the order of assign() calls.
class SpeakerColorAssigner {
public:
    explicit SpeakerColorAssigner(std::vector<std::string> palette);

    // Color for `speaker`, assigning the next palette entry on first sight.
    const std::string &assign(const std::string &speaker);

    bool knows(const std::string &speaker) const;
    size_t speaker_count() const { return order_.size(); }

    // Speakers in first-seen order.
    const std::vector<std::string> &speakers() const { return order_; }

private:
    std::vector<std::string> palette_;
    std::unordered_map<std::string, size_t> slots_;  // speaker -> palette index
    std::vector<std::string> order_;
};

}  // namespace captionforge
