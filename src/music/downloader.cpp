#include "jb/music/downloader.hpp"

#include <dpp/dpp.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <future>
#include <sstream>
#include <system_error>

namespace jb::music {

std::string extension_for_content_type(const std::string& content_type)
{
    std::string type = content_type.substr(0, content_type.find(';'));
    std::transform(type.begin(), type.end(), type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    type.erase(std::remove_if(type.begin(), type.end(),
                              [](unsigned char c) { return std::isspace(c); }),
               type.end());

    if (type == "audio/webm" || type == "video/webm") {
        return "webm";
    }
    if (type == "audio/mp4" || type == "audio/m4a" || type == "audio/x-m4a") {
        return "m4a";
    }
    if (type == "audio/mpeg" || type == "audio/mp3") {
        return "mp3";
    }
    if (type == "audio/ogg" || type == "audio/opus") {
        return "ogg";
    }
    if (type == "audio/flac" || type == "audio/x-flac") {
        return "flac";
    }
    if (type == "audio/wav" || type == "audio/x-wav") {
        return "wav";
    }
    if (type == "application/octet-stream") {
        return "audio";
    }
    return {};
}

http_downloader::http_downloader(dpp::cluster& cluster, logger log)
    : m_cluster(cluster)
    , m_log(std::move(log))
{
}

std::optional<std::filesystem::path> http_downloader::download(const track& t,
                                                               const std::filesystem::path& directory)
{
    if (!is_network_url(t.stream_url) || t.identifier.empty()) {
        return std::nullopt;
    }

    m_log.log(dpp::ll_debug, "[Download] GET " + t.stream_url + " for " + t.identifier);

    auto prom = std::make_shared<std::promise<dpp::http_request_completion_t>>();
    auto fut  = prom->get_future();

    m_cluster.request(
        t.stream_url,
        dpp::m_get,
        [prom](const dpp::http_request_completion_t& cc) {
            prom->set_value(cc);
        }
    );

    const auto cc = fut.get();
    if (cc.status < 200 || cc.status >= 300 || cc.body.empty()) {
        std::ostringstream oss;
        oss << "[Download] HTTP " << cc.status << " for " << t.identifier
            << " (" << cc.body.size() << " bytes)";
        m_log.log(dpp::ll_warning, oss.str());
        return std::nullopt;
    }

    std::string content_type;
    for (const auto& [name, value] : cc.headers) {
        std::string lowered = name;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lowered == "content-type") {
            content_type = value;
            break;
        }
    }

    const std::string ext = extension_for_content_type(content_type);
    if (ext.empty()) {
        m_log.log(dpp::ll_warning,
                  "[Download] Not an audio response for " + t.identifier +
                  " (Content-Type: " + content_type + ")");
        return std::nullopt;
    }

    const auto path = directory / (t.identifier + "." + ext);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        m_log.log(dpp::ll_warning, "[Download] Cannot open " + path.string() + " for writing");
        return std::nullopt;
    }
    out.write(cc.body.data(), static_cast<std::streamsize>(cc.body.size()));
    out.close();
    if (!out) {
        m_log.log(dpp::ll_warning, "[Download] Short write to " + path.string());
        std::error_code ec;
        std::filesystem::remove(path, ec);
        return std::nullopt;
    }

    return path;
}

} // namespace jb::music
