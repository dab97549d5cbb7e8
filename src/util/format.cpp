#include "jb/util/format.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace jb::util {

std::string format_duration(std::int64_t seconds)
{
    if (seconds <= 0) {
        return "Live";
    }

    const std::int64_t hours   = seconds / 3600;
    const std::int64_t minutes = (seconds % 3600) / 60;
    const std::int64_t secs    = seconds % 60;

    std::ostringstream oss;
    if (hours > 0) {
        oss << hours << ':' << std::setw(2) << std::setfill('0') << minutes;
    } else {
        oss << minutes;
    }
    oss << ':' << std::setw(2) << std::setfill('0') << secs;
    return oss.str();
}

std::string render_progress_bar(std::int64_t elapsed_seconds, std::int64_t total_seconds,
                                std::size_t width)
{
    const std::int64_t elapsed = std::max<std::int64_t>(elapsed_seconds, 0);

    std::size_t filled = 0;
    if (total_seconds > 0 && width > 0) {
        const std::int64_t clamped = std::min(elapsed, total_seconds);
        filled = static_cast<std::size_t>(clamped * static_cast<std::int64_t>(width) / total_seconds);
        filled = std::min(filled, width - 1);
    }

    std::string bar = "[";
    bar.append(filled, '=');
    if (width > 0) {
        bar += '>';
        bar.append(width - filled - 1, ' ');
    }
    bar += "] ";

    // elapsed 0 would render as "Live"
    std::string elapsed_text = elapsed > 0 ? format_duration(elapsed) : "0:00";
    return bar + elapsed_text + " / " + format_duration(total_seconds);
}

std::string truncate_utf8(const std::string& text, std::size_t max_chars)
{
    if (text.size() <= max_chars) {
        return text;
    }

    std::size_t cut = max_chars;
    // back off continuation bytes (10xxxxxx)
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

} // namespace jb::util
