#pragma once

#include <filesystem>
#include <optional>

#include "jb/core/logger.hpp"
#include "jb/music/track.hpp"

namespace dpp {
class cluster;
}

namespace jb::music {

// Blocking fetch of a track's audio into `directory`. Returns the written
// file, or nullopt on any failure.
class downloader {
public:
    virtual ~downloader() = default;

    virtual std::optional<std::filesystem::path> download(const track& t,
                                                          const std::filesystem::path& directory) = 0;
};

// Downloads the stream URL over HTTP through the D++ REST client. Responses
// that are not audio (an HTML watch page, an error document) are rejected.
class http_downloader : public downloader {
public:
    http_downloader(dpp::cluster& cluster, logger log);

    std::optional<std::filesystem::path> download(const track& t,
                                                  const std::filesystem::path& directory) override;

private:
    dpp::cluster& m_cluster;
    logger        m_log;
};

// Maps a Content-Type to a file extension, empty if it is not audio.
std::string extension_for_content_type(const std::string& content_type);

} // namespace jb::music
