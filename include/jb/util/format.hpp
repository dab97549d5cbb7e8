#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace jb::util {

// "M:SS" below an hour, "H:MM:SS" above; "Live" for durations <= 0.
std::string format_duration(std::int64_t seconds);

// "[=====>              ] 1:23 / 3:45", or "[>...] 1:23 / Live" for live input.
std::string render_progress_bar(std::int64_t elapsed_seconds, std::int64_t total_seconds,
                                std::size_t width = 20);

// Cuts `text` to at most `max_chars` bytes without splitting a UTF-8 sequence.
std::string truncate_utf8(const std::string& text, std::size_t max_chars);

} // namespace jb::util
