//
//  captionforge.hpp
//  CaptionForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "ass_document.hpp"
#include "caption_config.hpp"
#include "caption_status.hpp"
#include "cue.hpp"
#include "font_catalog.hpp"
#include "media_tools.hpp"

namespace captionforge {

/// @defgroup api CaptionForge Public API
/// Public, supported C++ interfaces for compiling subtitles into styled ASS documents.
/// @{

/**
 * @brief Outcome of one compilation run.
 *
 * `status.ok` reports whether a document was produced (and written, for the file variants).
 * Individual cues that were dropped do not fail the run; they are listed in `skipped` with the
 * reason (parse errors from the SRT reader, validation errors from styling).
 */
struct CompileReport {
    CaptionStatus status;
    std::string document;          ///< Complete ASS text
    size_t input_cues = 0;         ///< Cues handed to the styler (after parsing)
    size_t emitted = 0;            ///< Dialogue rows in the document
    std::vector<CueIssue> skipped;
};

/**
 * @brief Return the CaptionForge library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3` or `v0.3+abcd123`).
 */
std::string version_string();  ///< @ingroup api

/// Bundled fonts plus the config's extra `fonts` entries.
FontCatalog make_font_catalog(const CaptionConfig &config);  ///< @ingroup api

/// Style already-parsed cues into an ASS document (no I/O).
CompileReport compile_cues_to_ass(const std::vector<Cue> &cues, const CaptionConfig &config,
                                  const FontCatalog &catalog,
                                  const CanvasSize &canvas = {});  ///< @ingroup api

/// Parse SRT text and style it into an ASS document (no I/O).
CompileReport compile_srt_to_ass(std::string_view srt_content, const CaptionConfig &config,
                                 const FontCatalog &catalog,
                                 const CanvasSize &canvas = {});  ///< @ingroup api

/// @overload uses the bundled font catalog plus the config's fonts.
CompileReport compile_srt_to_ass(std::string_view srt_content, const CaptionConfig &config,
                                 const CanvasSize &canvas = {});  ///< @ingroup api

/**
 * @brief Read cues from a file: `.json` is a transcript, anything else SRT.
 *
 * @param input_path Path to an SRT file or a transcript JSON.
 * @param issues Receives the SRT blocks that were skipped.
 * @return Status plus cues; status fails only when the input cannot be read at all.
 */
CaptionStatus load_cues(const std::string &input_path, std::vector<Cue> &cues,
                        std::vector<CueIssue> &issues);  ///< @ingroup api

/**
 * @brief Compile an input file to an ASS file.
 *
 * @param input_path SRT or transcript JSON.
 * @param output_path Destination .ass; written atomically.
 * @param config Validated caption configuration.
 * @param canvas PlayResX/PlayResY of the document.
 */
CompileReport compile_file_to_ass(const std::string &input_path, const std::string &output_path,
                                  const CaptionConfig &config,
                                  const CanvasSize &canvas = {});  ///< @ingroup api

/// @overload canvas size taken from `video_path` through `inspector`; failing to inspect is fatal.
CompileReport compile_file_to_ass(const std::string &input_path, const std::string &output_path,
                                  const CaptionConfig &config, const std::string &video_path,
                                  VideoInspector &inspector);  ///< @ingroup api

/// Write a styled SRT (speaker lines wrapped in <font color>) from an SRT/transcript input.
CaptionStatus write_styled_srt(const std::string &input_path, const std::string &output_path,
                               const CaptionConfig &config);  ///< @ingroup api

/**
 * @brief Compile captions for a video and burn them in.
 *
 * The ASS document is written next to `output_video_path` (same stem, `.ass`).
 */
CompileReport caption_video(const std::string &video_path, const std::string &input_path,
                            const std::string &output_video_path, const CaptionConfig &config,
                            VideoInspector &inspector,
                            VideoRenderer &renderer);  ///< @ingroup api

/// @overload the ASS document is written to `document_path`.
CompileReport caption_video(const std::string &video_path, const std::string &input_path,
                            const std::string &output_video_path,
                            const std::string &document_path, const CaptionConfig &config,
                            VideoInspector &inspector,
                            VideoRenderer &renderer);  ///< @ingroup api

/// @}

}  // namespace captionforge
