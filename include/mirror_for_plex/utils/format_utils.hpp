#pragma once

#include "mirror_for_plex/core/models.hpp"
#include <cstddef>
#include <string>

namespace mirror_for_plex::utils {

/**
 * @brief Convert catalog HTML into plain text
 *
 * Line-break tags become newlines, every other tag is dropped, and named
 * and numeric character references are decoded to UTF-8.
 *
 * @param html Text that may contain markup
 * @return Plain text with surrounding whitespace trimmed
 */
std::string strip_html(const std::string& html);

/**
 * @brief Shorten text to at most max_chars bytes, cutting at a word boundary
 *
 * Shortened text ends with "...". Text that already fits is returned unchanged.
 */
std::string truncate_at_word(const std::string& text, std::size_t max_chars);

// One-line status text for a snapshot, e.g. "Playing: Frieren [Anime]"
std::string format_snapshot(const core::PlaybackSnapshot& snapshot);

} // namespace mirror_for_plex::utils
