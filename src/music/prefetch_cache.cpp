#include "jb/music/prefetch_cache.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace jb::music {

prefetch_cache::prefetch_cache(cache_config cfg, downloader& dl, core::worker_pool& pool, logger log)
    : m_cfg(std::move(cfg))
    , m_downloader(dl)
    , m_pool(pool)
    , m_log(std::move(log))
{
    purge_stale_files();

    std::ostringstream oss;
    oss << "[Cache] Using " << m_cfg.directory.string()
        << " (max_files=" << m_cfg.max_files
        << ", max_bytes=" << m_cfg.max_bytes << ")";
    m_log.log(dpp::ll_info, oss.str());
}

prefetch_cache::~prefetch_cache()
{
    std::vector<std::shared_future<bool>> pending;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_generation;
        for (const auto& [identifier, fut] : m_in_flight) {
            (void)identifier;
            pending.push_back(fut);
        }
    }

    // Workers reference this object until their job returns.
    for (const auto& fut : pending) {
        fut.wait();
    }
}

void prefetch_cache::purge_stale_files()
{
    std::error_code ec;
    fs::create_directories(m_cfg.directory, ec);
    if (ec) {
        m_log.log(dpp::ll_warning,
                  "[Cache] Cannot create " + m_cfg.directory.string() + ": " + ec.message());
        return;
    }

    std::size_t removed = 0;
    for (const auto& item : fs::directory_iterator(m_cfg.directory, ec)) {
        std::error_code item_ec;
        if (item.is_regular_file(item_ec) && fs::remove(item.path(), item_ec)) {
            ++removed;
        }
    }

    if (removed > 0) {
        std::ostringstream oss;
        oss << "[Cache] Removed " << removed << " stale file(s) from a previous run";
        m_log.log(dpp::ll_info, oss.str());
    }
}

void prefetch_cache::remove_matching_files(const std::string& identifier) const
{
    std::error_code ec;
    for (const auto& item : fs::directory_iterator(m_cfg.directory, ec)) {
        std::error_code item_ec;
        if (item.is_regular_file(item_ec) && item.path().stem().string() == identifier) {
            fs::remove(item.path(), item_ec);
        }
    }
}

bool prefetch_cache::ensure_downloaded(track& t)
{
    if (t.identifier.empty() || !t.cacheable) {
        return false;
    }

    std::shared_future<bool> pending;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto it = m_index.find(t.identifier);
        if (it != m_index.end()) {
            std::error_code ec;
            if (fs::exists(it->second->path, ec)) {
                t.local_path = it->second->path.string();
                return true;
            }
            remove_locked(t.identifier);
        }

        auto flight = m_in_flight.find(t.identifier);
        if (flight != m_in_flight.end()) {
            m_discarded.erase(t.identifier);
            pending = flight->second;
        } else {
            pending = launch_locked(t);
        }
    }

    if (pending.wait_for(m_cfg.download_timeout) != std::future_status::ready) {
        m_log.log(dpp::ll_warning, "[Cache] Download timed out for " + t.identifier);
        return false;
    }
    if (!pending.get()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_index.find(t.identifier);
    if (it == m_index.end()) {
        // evicted again straight away (single file above the byte ceiling)
        return false;
    }
    t.local_path = it->second->path.string();
    return true;
}

void prefetch_cache::start_background_download(const track& t)
{
    if (t.identifier.empty() || !t.cacheable) {
        return;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_in_flight.count(t.identifier) > 0) {
        // wanted again after a purge
        m_discarded.erase(t.identifier);
        return;
    }
    if (m_index.count(t.identifier) > 0) {
        return;
    }

    m_log.log(dpp::ll_debug, "[Cache] Prefetching " + t.identifier);
    launch_locked(t);
}

std::optional<fs::path> prefetch_cache::cached_path(const std::string& identifier)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_index.find(identifier);
    if (it == m_index.end()) {
        return std::nullopt;
    }

    std::error_code ec;
    if (!fs::exists(it->second->path, ec)) {
        remove_locked(identifier);
        return std::nullopt;
    }
    return it->second->path;
}

std::shared_future<bool> prefetch_cache::launch_locked(const track& t)
{
    const std::uint64_t generation = m_generation;

    auto fut = m_pool.submit([this, copy = t, generation]() {
        bool ok = false;
        try {
            ok = run_download(copy, generation);
        } catch (const std::exception& e) {
            m_log.log(dpp::ll_error,
                      "[Cache] Download of " + copy.identifier + " threw: " + e.what());
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_in_flight.erase(copy.identifier);
        m_discarded.erase(copy.identifier);
        return ok;
    }).share();

    m_in_flight[t.identifier] = fut;
    return fut;
}

bool prefetch_cache::run_download(const track& t, std::uint64_t generation)
{
    remove_matching_files(t.identifier);

    const auto path = m_downloader.download(t, m_cfg.directory);
    if (!path) {
        m_log.log(dpp::ll_warning, "[Cache] Download failed for " + t.identifier);
        return false;
    }

    std::error_code ec;
    const auto size = fs::file_size(*path, ec);
    if (ec) {
        m_log.log(dpp::ll_warning,
                  "[Cache] Downloaded file missing for " + t.identifier + ": " + ec.message());
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (generation != m_generation || m_discarded.erase(t.identifier) > 0) {
        m_log.log(dpp::ll_debug, "[Cache] Dropping " + t.identifier + ", removed while downloading");
        fs::remove(*path, ec);
        return false;
    }

    insert_locked(t.identifier, *path, size);
    enforce_limits_locked();

    std::ostringstream oss;
    oss << "[Cache] Cached " << t.identifier << " (" << size << " bytes, "
        << m_entries.size() << " file(s), " << m_total_bytes << " bytes total)";
    m_log.log(dpp::ll_debug, oss.str());

    return m_index.count(t.identifier) > 0;
}

void prefetch_cache::insert_locked(const std::string& identifier, const fs::path& path, std::uint64_t size)
{
    auto it = m_index.find(identifier);
    if (it != m_index.end()) {
        if (it->second->path == path) {
            m_total_bytes -= std::min(m_total_bytes, it->second->size);
            m_entries.erase(it->second);
            m_index.erase(it);
        } else {
            remove_locked(identifier);
        }
    }

    m_entries.push_back(entry{identifier, path, size});
    m_index[identifier] = std::prev(m_entries.end());
    m_total_bytes += size;
}

void prefetch_cache::remove(const std::string& identifier)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    discard_locked(identifier);
}

void prefetch_cache::purge(const std::vector<std::string>& identifiers)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& identifier : identifiers) {
        discard_locked(identifier);
    }
}

void prefetch_cache::discard_locked(const std::string& identifier)
{
    remove_locked(identifier);
    if (m_in_flight.count(identifier) > 0) {
        m_discarded.insert(identifier);
    }
}

void prefetch_cache::remove_locked(const std::string& identifier)
{
    auto it = m_index.find(identifier);
    if (it == m_index.end()) {
        return;
    }

    const entry e = *it->second;
    m_entries.erase(it->second);
    m_index.erase(it);
    m_total_bytes -= std::min(m_total_bytes, e.size);

    std::error_code ec;
    fs::remove(e.path, ec);
    if (ec) {
        m_log.log(dpp::ll_warning,
                  "[Cache] Failed to delete " + e.path.string() + ": " + ec.message());
    }
}

void prefetch_cache::enforce_limits_locked()
{
    while (m_entries.size() > m_cfg.max_files) {
        m_log.log(dpp::ll_debug, "[Cache] Evicting " + m_entries.front().identifier + " (file limit)");
        remove_locked(m_entries.front().identifier);
    }

    while (m_total_bytes > m_cfg.max_bytes && !m_entries.empty()) {
        m_log.log(dpp::ll_debug, "[Cache] Evicting " + m_entries.front().identifier + " (size limit)");
        remove_locked(m_entries.front().identifier);
    }
}

void prefetch_cache::cleanup_all()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_generation;
    while (!m_entries.empty()) {
        remove_locked(m_entries.front().identifier);
    }
    m_total_bytes = 0;
}

bool prefetch_cache::is_ready(const std::string& identifier) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.count(identifier) > 0;
}

bool prefetch_cache::is_downloading(const std::string& identifier) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_in_flight.count(identifier) > 0;
}

std::size_t prefetch_cache::entry_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

std::uint64_t prefetch_cache::total_bytes() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_total_bytes;
}

} // namespace jb::music
