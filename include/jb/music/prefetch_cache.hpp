#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <future>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "jb/core/logger.hpp"
#include "jb/core/worker_pool.hpp"
#include "jb/music/downloader.hpp"
#include "jb/music/track.hpp"

namespace jb::music {

struct cache_config {
    std::filesystem::path directory        = "data/audio_cache";
    std::size_t           max_files        = 10;
    std::uint64_t         max_bytes        = 500ULL * 1024 * 1024;
    std::chrono::milliseconds download_timeout{60000};
};

// Downloads upcoming tracks ahead of time into a scratch directory it owns.
// Entries are evicted oldest-download-first whenever the count or byte
// ceiling is exceeded. Concurrent requests for one identifier share a
// single download.
class prefetch_cache {
public:
    prefetch_cache(cache_config cfg, downloader& dl, core::worker_pool& pool, logger log = {});
    ~prefetch_cache();

    prefetch_cache(const prefetch_cache&) = delete;
    prefetch_cache& operator=(const prefetch_cache&) = delete;

    // Sets t.local_path and returns true once a file is available. Timeouts,
    // download failures and tracks that are not cacheable return false and
    // leave t untouched. Blocks; never call it from the scheduler thread.
    bool ensure_downloaded(track& t);

    // Fire-and-forget; no-op when cached, already downloading or not cacheable.
    void start_background_download(const track& t);

    // Path of a finished download, without waiting for one in flight.
    std::optional<std::filesystem::path> cached_path(const std::string& identifier);

    // Safe to call for unknown or already-removed identifiers. A download
    // still running for the identifier is thrown away when it finishes.
    void remove(const std::string& identifier);
    void purge(const std::vector<std::string>& identifiers);

    // Drops every entry; downloads still running are discarded when they finish.
    void cleanup_all();

    bool is_ready(const std::string& identifier) const;
    bool is_downloading(const std::string& identifier) const;

    std::size_t   entry_count() const;
    std::uint64_t total_bytes() const;

    const cache_config& config() const { return m_cfg; }

private:
    struct entry {
        std::string           identifier;
        std::filesystem::path path;
        std::uint64_t         size = 0;
    };

    void purge_stale_files();
    std::shared_future<bool> launch_locked(const track& t);
    bool run_download(const track& t, std::uint64_t generation);
    void remove_matching_files(const std::string& identifier) const;

    void insert_locked(const std::string& identifier, const std::filesystem::path& path, std::uint64_t size);
    void remove_locked(const std::string& identifier);
    void discard_locked(const std::string& identifier);
    void enforce_limits_locked();

    cache_config        m_cfg;
    downloader&         m_downloader;
    core::worker_pool&  m_pool;
    logger              m_log;

    mutable std::mutex m_mutex;
    std::list<entry>   m_entries;   // oldest download first
    std::unordered_map<std::string, std::list<entry>::iterator> m_index;
    std::unordered_map<std::string, std::shared_future<bool>>   m_in_flight;
    std::unordered_set<std::string> m_discarded;   // in flight, but removed meanwhile
    std::uint64_t      m_total_bytes = 0;
    std::uint64_t      m_generation  = 0;
};

} // namespace jb::music
