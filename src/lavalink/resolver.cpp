#include "jb/lavalink/resolver.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace jb::lavalink {

namespace {

const std::string watch_prefix = "https://www.youtube.com/watch?v=";

bool mentions_missing_runtime(const std::string& message)
{
    std::string lower(message);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const bool runtime = lower.find("javascript") != std::string::npos ||
                         lower.find("js runtime") != std::string::npos ||
                         lower.find("deno") != std::string::npos ||
                         lower.find("nodejs") != std::string::npos;
    return runtime && (lower.find("runtime") != std::string::npos ||
                       lower.find("not found") != std::string::npos ||
                       lower.find("missing") != std::string::npos);
}

music::catalog_entry to_catalog_entry(const track_info& info)
{
    music::catalog_entry e;
    e.identifier = info.identifier;
    e.title      = info.title;
    e.artist     = info.author;
    e.duration   = info.is_stream ? 0 : info.length_ms / 1000;
    return e;
}

} // namespace

bool is_video_id(const std::string& text)
{
    if (text.size() != 11) {
        return false;
    }
    return std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_';
    });
}

music::track to_track(const track_info& info)
{
    music::track t;
    t.stream_url = info.uri;
    t.page_url   = info.uri;
    t.title      = info.title;
    t.author     = info.author;
    t.duration   = info.is_stream ? 0 : info.length_ms / 1000;
    t.thumbnail  = info.artwork_url;
    t.identifier = info.identifier;
    t.encoded    = info.encoded;
    // YouTube and friends hand out page URLs; only plain HTTP sources are media files
    t.cacheable  = !info.is_stream && info.source == "http" && music::is_network_url(info.uri);
    return t;
}

music::resolve_result to_resolve_result(const load_result& loaded)
{
    music::resolve_result res;

    switch (loaded.type) {
        case load_type::error:
            res.status = mentions_missing_runtime(loaded.error_message)
                       ? music::resolve_status::missing_runtime
                       : music::resolve_status::error;
            res.error_message = loaded.error_message;
            return res;
        case load_type::empty:
            res.status = music::resolve_status::not_found;
            return res;
        default:
            break;
    }

    if (loaded.tracks.empty()) {
        res.status = music::resolve_status::not_found;
        return res;
    }

    res.status = music::resolve_status::ok;
    res.value  = to_track(loaded.tracks.front());
    return res;
}

resolver::resolver(node& lavalink, logger log)
    : m_node(lavalink)
    , m_log(std::move(log))
{
}

music::resolve_result resolver::resolve(const std::string& query_or_url)
{
    std::string identifier;
    if (is_video_id(query_or_url)) {
        identifier = watch_prefix + query_or_url;
    } else if (music::is_network_url(query_or_url)) {
        identifier = query_or_url;
    } else {
        identifier = "ytsearch:" + query_or_url;
    }

    music::resolve_result res = to_resolve_result(m_node.load_tracks(identifier));

    if (res.status == music::resolve_status::missing_runtime) {
        m_log.log(dpp::ll_warning,
                  "[Lavalink] YouTube source needs a JavaScript runtime to resolve '" + query_or_url + "'");
    } else if (!res.ok()) {
        m_log.log(dpp::ll_debug, "[Lavalink] Could not resolve '" + query_or_url + "'");
    }
    return res;
}

std::vector<music::playlist_entry> resolver::resolve_playlist(const std::string& url)
{
    std::vector<music::playlist_entry> entries;

    const load_result loaded = m_node.load_tracks(url);
    if (loaded.type == load_type::error || loaded.type == load_type::empty) {
        return entries;
    }

    for (const auto& info : loaded.tracks) {
        if (info.identifier.empty()) {
            continue;
        }
        music::playlist_entry e;
        e.identifier = info.identifier;
        e.title      = info.title;
        e.url        = info.uri.empty() ? watch_prefix + info.identifier : info.uri;
        entries.push_back(std::move(e));
    }

    std::ostringstream oss;
    oss << "[Lavalink] Playlist '" << loaded.playlist_name << "' has " << entries.size() << " entries";
    m_log.log(dpp::ll_debug, oss.str());
    return entries;
}

std::optional<music::track> resolver::search(const std::string& text)
{
    auto res = to_resolve_result(m_node.load_tracks("ytsearch:" + text));
    return res.value;
}

std::vector<music::catalog_entry> resolver::search_tracks(const std::string& text, std::size_t limit)
{
    std::vector<music::catalog_entry> results;
    if (text.size() < 2 || limit == 0) {
        return results;
    }

    const load_result loaded = m_node.load_tracks("ytmsearch:" + text);
    for (const auto& info : loaded.tracks) {
        if (results.size() >= limit) {
            break;
        }
        if (!info.identifier.empty()) {
            results.push_back(to_catalog_entry(info));
        }
    }
    return results;
}

std::vector<music::catalog_entry> resolver::get_similar(const std::string& identifier, std::size_t limit)
{
    std::vector<music::catalog_entry> results;
    if (identifier.empty() || limit == 0) {
        return results;
    }

    // YouTube's radio mix for a video
    const std::string mix = watch_prefix + identifier + "&list=RD" + identifier;
    const load_result loaded = m_node.load_tracks(mix);

    for (const auto& info : loaded.tracks) {
        if (results.size() >= limit) {
            break;
        }
        if (info.identifier.empty() || info.identifier == identifier) {
            continue;
        }
        results.push_back(to_catalog_entry(info));
    }

    std::ostringstream oss;
    oss << "[Autoplay] " << results.size() << " similar track(s) for " << identifier;
    m_log.log(dpp::ll_debug, oss.str());
    return results;
}

} // namespace jb::lavalink
