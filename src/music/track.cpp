#include "jb/music/track.hpp"

namespace jb::music {

bool is_network_url(const std::string& url)
{
    std::string rest;
    if (url.rfind("https://", 0) == 0) {
        rest = url.substr(8);
    } else if (url.rfind("http://", 0) == 0) {
        rest = url.substr(7);
    } else {
        return false;
    }

    const auto host_end = rest.find_first_of("/?#");
    const std::string host = rest.substr(0, host_end);
    if (host.empty() || host.front() == ':' || host.find(' ') != std::string::npos) {
        return false;
    }
    return true;
}

bool is_playlist_url(const std::string& url)
{
    return url.find("list=") != std::string::npos ||
           url.find("/playlist") != std::string::npos;
}

} // namespace jb::music
