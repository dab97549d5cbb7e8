#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "jb/music/track.hpp"

namespace jb::music {

enum class resolve_status {
    ok,
    not_found,
    missing_runtime,   // backend needs a component it does not have (e.g. a JS runtime)
    error
};

struct resolve_result {
    resolve_status       status = resolve_status::not_found;
    std::optional<track> value;
    std::string          error_message;

    bool ok() const { return status == resolve_status::ok && value.has_value(); }
};

// Turns URLs, ids and search text into playable tracks. Calls are slow and
// may block; callers run them off the scheduler thread where they can.
class track_resolver {
public:
    virtual ~track_resolver() = default;

    virtual resolve_result resolve(const std::string& query_or_url) = 0;
    virtual std::vector<playlist_entry> resolve_playlist(const std::string& url) = 0;
    virtual std::optional<track> search(const std::string& text) = 0;
};

// Music catalog used for autocomplete and "similar tracks".
class catalog {
public:
    virtual ~catalog() = default;

    virtual std::vector<catalog_entry> search_tracks(const std::string& text, std::size_t limit) = 0;
    virtual std::vector<catalog_entry> get_similar(const std::string& identifier, std::size_t limit) = 0;
};

} // namespace jb::music
