#include "jb/core/logger.hpp"

#include <dpp/dpp.h>

namespace jb {

logger::logger(handler h)
    : m_handler(std::move(h))
{
}

logger logger::for_cluster(dpp::cluster& cluster)
{
    return logger([&cluster](dpp::loglevel severity, const std::string& msg) {
        cluster.log(severity, msg);
    });
}

void logger::log(dpp::loglevel severity, const std::string& msg) const
{
    if (m_handler) {
        m_handler(severity, msg);
    }
}

} // namespace jb
