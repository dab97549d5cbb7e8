#pragma once

#include <functional>
#include <string>

#include <dpp/misc-enum.h>

namespace dpp {
class cluster;
}

namespace jb {

/// Log sink shared by every component. In the bot it forwards to
/// dpp::cluster::log; a default-constructed logger drops everything.
class logger {
public:
    using handler = std::function<void(dpp::loglevel, const std::string&)>;

    logger() = default;
    explicit logger(handler h);

    static logger for_cluster(dpp::cluster& cluster);

    void log(dpp::loglevel severity, const std::string& msg) const;

private:
    handler m_handler;
};

} // namespace jb
