//
//  speaker_colors.cpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "speaker_colors.hpp"

#include <stdexcept>
#include <utility>

#include "logging.hpp"

namespace captionforge {

SpeakerColorAssigner::SpeakerColorAssigner(std::vector<std::string> palette)
    : palette_(std::move(palette)) {
    if (palette_.empty()) {
        throw std::invalid_argument("speaker palette must not be empty");
    }
}

const std::string &SpeakerColorAssigner::assign(const std::string &speaker) {
    auto it = slots_.find(speaker);
    if (it != slots_.end()) {
        return palette_[it->second];
    }
    const size_t slot = order_.size() % palette_.size();
    slots_.emplace(speaker, slot);
    order_.push_back(speaker);
    CF_LOG("debug", "speaker '" << speaker << "' -> " << palette_[slot] << " (speaker #"
                                << order_.size() << ")");
    return palette_[slot];
}

bool SpeakerColorAssigner::knows(const std::string &speaker) const {
    return slots_.find(speaker) != slots_.end();
}

}  // namespace captionforge
