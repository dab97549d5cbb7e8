#pragma once

#include <string>
#include <vector>

#include "jb/core/logger.hpp"
#include "jb/lavalink/client.hpp"
#include "jb/music/resolver.hpp"

namespace jb::lavalink {

// Bare 11-character YouTube video ids.
bool is_video_id(const std::string& text);

music::track to_track(const track_info& info);

// Resolves and searches through Lavalink's YouTube source.
class resolver : public music::track_resolver, public music::catalog {
public:
    resolver(node& lavalink, logger log);

    music::resolve_result resolve(const std::string& query_or_url) override;
    std::vector<music::playlist_entry> resolve_playlist(const std::string& url) override;
    std::optional<music::track> search(const std::string& text) override;

    std::vector<music::catalog_entry> search_tracks(const std::string& text, std::size_t limit) override;
    std::vector<music::catalog_entry> get_similar(const std::string& identifier, std::size_t limit) override;

private:
    node&  m_node;
    logger m_log;
};

// Maps a load result to a resolve_result. Split out for tests.
music::resolve_result to_resolve_result(const load_result& loaded);

} // namespace jb::lavalink
