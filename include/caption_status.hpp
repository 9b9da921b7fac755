//
//  caption_status.hpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <utility>

namespace captionforge {

/**
 * @brief Result object with success flag and optional error message.
 *
 * When `ok == true`, `message` is empty. On failure, `message` contains a short description of
 * what went wrong (e.g., failure to parse input, validate configuration, or write the output).
 */
struct CaptionStatus {
    bool ok{false};
    std::string message;
};

inline CaptionStatus make_status(bool ok, std::string msg = {}) {
    return CaptionStatus{ok, std::move(msg)};
}

}  // namespace captionforge
