#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace jb::music {

// A resolved, playable item. Only local_path changes after resolution,
// once the prefetch cache has a file for it.
struct track {
    std::string  stream_url;
    std::string  title;
    std::string  author;
    std::int64_t duration = 0;   // seconds, <= 0 means live/unknown
    std::string  thumbnail;
    std::string  identifier;
    std::string  page_url;
    std::string  encoded;        // Lavalink blob, empty for other resolvers
    bool         cacheable = false;  // stream_url is direct media the downloader can fetch

    std::optional<std::string> local_path;

    bool is_live() const { return duration <= 0; }
};

// Lightweight result from the catalog; must go through a resolver to play.
struct catalog_entry {
    std::string  identifier;
    std::string  title;
    std::string  artist;
    std::int64_t duration = 0;
};

struct playlist_entry {
    std::string identifier;
    std::string title;
    std::string url;
};

// True for http(s) URLs with a non-empty host.
bool is_network_url(const std::string& url);

// True for URLs that name a playlist rather than a single track.
bool is_playlist_url(const std::string& url);

} // namespace jb::music
