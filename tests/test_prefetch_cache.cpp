#include "jb/music/prefetch_cache.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <thread>

#include "fakes.hpp"

using namespace jb;
using namespace jb::music;
using jb::testing::fake_downloader;
using jb::testing::make_track;
using jb::testing::temp_dir;
using namespace std::chrono_literals;

namespace {

cache_config config_for(const temp_dir& dir, std::size_t max_files = 10,
                        std::uint64_t max_bytes = 500ULL * 1024 * 1024)
{
    cache_config cfg;
    cfg.directory        = dir.path() / "cache";
    cfg.max_files        = max_files;
    cfg.max_bytes        = max_bytes;
    cfg.download_timeout = 2000ms;
    return cfg;
}

} // namespace

// A downloaded track gets a local path inside the cache directory
TEST(PrefetchCacheTest, EnsureDownloadedSetsLocalPath)
{
    temp_dir dir;
    fake_downloader dl(100);
    core::worker_pool pool(2);
    prefetch_cache cache(config_for(dir), dl, pool);

    track t = make_track("aaa");
    ASSERT_TRUE(cache.ensure_downloaded(t));
    ASSERT_TRUE(t.local_path.has_value());
    EXPECT_TRUE(std::filesystem::exists(*t.local_path));
    EXPECT_TRUE(cache.is_ready("aaa"));
    EXPECT_EQ(cache.entry_count(), 1u);
    EXPECT_EQ(cache.total_bytes(), 100u);

    // second call is served from the index
    track again = make_track("aaa");
    EXPECT_TRUE(cache.ensure_downloaded(again));
    EXPECT_EQ(dl.calls("aaa"), 1);
}

// Files left by a previous run are removed on startup
TEST(PrefetchCacheTest, StaleFilesPurgedOnConstruction)
{
    temp_dir dir;
    std::filesystem::create_directories(dir.path() / "cache");
    dir.write_file("cache/old.webm");

    fake_downloader dl;
    core::worker_pool pool(1);
    prefetch_cache cache(config_for(dir), dl, pool);

    EXPECT_FALSE(std::filesystem::exists(dir.path() / "cache" / "old.webm"));
    EXPECT_EQ(cache.entry_count(), 0u);
}

// Failed downloads report false and leave the track untouched
TEST(PrefetchCacheTest, FailedDownloadLeavesTrackUntouched)
{
    temp_dir dir;
    fake_downloader dl;
    dl.fail("bad");
    core::worker_pool pool(1);
    prefetch_cache cache(config_for(dir), dl, pool);

    track t = make_track("bad");
    EXPECT_FALSE(cache.ensure_downloaded(t));
    EXPECT_FALSE(t.local_path.has_value());
    EXPECT_EQ(cache.entry_count(), 0u);
}

// With 10 entries at the ceiling, an 11th evicts exactly the oldest
TEST(PrefetchCacheTest, FileCeilingEvictsOldest)
{
    temp_dir dir;
    fake_downloader dl(10);
    core::worker_pool pool(2);
    prefetch_cache cache(config_for(dir), dl, pool);

    for (int i = 0; i < 10; ++i) {
        track t = make_track("t" + std::to_string(i));
        ASSERT_TRUE(cache.ensure_downloaded(t));
    }
    ASSERT_EQ(cache.entry_count(), 10u);

    track eleventh = make_track("t10");
    ASSERT_TRUE(cache.ensure_downloaded(eleventh));

    EXPECT_EQ(cache.entry_count(), 10u);
    EXPECT_FALSE(cache.is_ready("t0"));
    EXPECT_TRUE(cache.is_ready("t1"));
    EXPECT_TRUE(cache.is_ready("t10"));
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "cache" / "t0.mp3"));
}

// Byte ceiling holds after every call
TEST(PrefetchCacheTest, ByteCeilingHolds)
{
    temp_dir dir;
    fake_downloader dl(400);
    core::worker_pool pool(1);
    prefetch_cache cache(config_for(dir, 10, 1000), dl, pool);

    for (int i = 0; i < 5; ++i) {
        track t = make_track("b" + std::to_string(i));
        cache.ensure_downloaded(t);
        EXPECT_LE(cache.total_bytes(), 1000u);
        EXPECT_LE(cache.entry_count(), 10u);
    }
    EXPECT_EQ(cache.entry_count(), 2u);
    EXPECT_TRUE(cache.is_ready("b4"));
    EXPECT_TRUE(cache.is_ready("b3"));
}

// A single file above the byte ceiling is never kept
TEST(PrefetchCacheTest, OversizedFileRejected)
{
    temp_dir dir;
    fake_downloader dl(2000);
    core::worker_pool pool(1);
    prefetch_cache cache(config_for(dir, 10, 1000), dl, pool);

    track t = make_track("huge");
    EXPECT_FALSE(cache.ensure_downloaded(t));
    EXPECT_EQ(cache.total_bytes(), 0u);
}

// remove() twice is harmless
TEST(PrefetchCacheTest, RemoveIsIdempotent)
{
    temp_dir dir;
    fake_downloader dl(50);
    core::worker_pool pool(1);
    prefetch_cache cache(config_for(dir), dl, pool);

    track t = make_track("r");
    ASSERT_TRUE(cache.ensure_downloaded(t));

    cache.remove("r");
    cache.remove("r");
    cache.remove("never-added");

    EXPECT_EQ(cache.total_bytes(), 0u);
    EXPECT_EQ(cache.entry_count(), 0u);
    EXPECT_FALSE(std::filesystem::exists(*t.local_path));
}

// Concurrent requests for one identifier share a single download
TEST(PrefetchCacheTest, ConcurrentRequestsShareDownload)
{
    temp_dir dir;
    fake_downloader dl(10);
    dl.hold();
    core::worker_pool pool(3);
    prefetch_cache cache(config_for(dir), dl, pool);

    cache.start_background_download(make_track("same"));
    cache.start_background_download(make_track("same"));
    EXPECT_TRUE(cache.is_downloading("same"));

    bool first = false;
    bool second = false;
    std::thread a([&] { track t = make_track("same"); first = cache.ensure_downloaded(t); });
    std::thread b([&] { track t = make_track("same"); second = cache.ensure_downloaded(t); });

    std::this_thread::sleep_for(20ms);
    dl.release();
    a.join();
    b.join();

    EXPECT_TRUE(first);
    EXPECT_TRUE(second);
    EXPECT_EQ(dl.calls("same"), 1);
    EXPECT_EQ(cache.entry_count(), 1u);
}

// A slow download times out for the caller but still lands in the cache
TEST(PrefetchCacheTest, TimeoutReturnsFalse)
{
    temp_dir dir;
    fake_downloader dl(10);
    dl.hold();
    core::worker_pool pool(1);

    cache_config cfg = config_for(dir);
    cfg.download_timeout = 30ms;
    prefetch_cache cache(cfg, dl, pool);

    track t = make_track("slow");
    EXPECT_FALSE(cache.ensure_downloaded(t));
    EXPECT_FALSE(t.local_path.has_value());

    dl.release();
    pool.wait_idle();
    EXPECT_TRUE(cache.is_ready("slow"));
}

// cleanup_all drops entries and discards downloads still running
TEST(PrefetchCacheTest, CleanupAllDiscardsInFlight)
{
    temp_dir dir;
    fake_downloader dl(10);
    core::worker_pool pool(1);
    prefetch_cache cache(config_for(dir), dl, pool);

    track done = make_track("done");
    ASSERT_TRUE(cache.ensure_downloaded(done));

    dl.hold();
    cache.start_background_download(make_track("late"));
    cache.cleanup_all();
    EXPECT_EQ(cache.entry_count(), 0u);

    dl.release();
    pool.wait_idle();
    EXPECT_FALSE(cache.is_ready("late"));
    EXPECT_EQ(cache.total_bytes(), 0u);
}

// purge() removes a batch and ignores unknown ids
TEST(PrefetchCacheTest, PurgeRemovesListed)
{
    temp_dir dir;
    fake_downloader dl(10);
    core::worker_pool pool(1);
    prefetch_cache cache(config_for(dir), dl, pool);

    for (const char* id : {"p1", "p2", "p3"}) {
        track t = make_track(id);
        ASSERT_TRUE(cache.ensure_downloaded(t));
    }

    cache.purge({"p1", "p3", "unknown"});
    EXPECT_EQ(cache.entry_count(), 1u);
    EXPECT_TRUE(cache.is_ready("p2"));
}

// A download purged while running is dropped when it finishes
TEST(PrefetchCacheTest, PurgeDiscardsInFlight)
{
    temp_dir dir;
    fake_downloader dl(10);
    core::worker_pool pool(1);
    prefetch_cache cache(config_for(dir), dl, pool);

    dl.hold();
    cache.start_background_download(make_track("gone"));
    EXPECT_TRUE(cache.is_downloading("gone"));
    cache.purge({"gone"});

    dl.release();
    pool.wait_idle();
    EXPECT_FALSE(cache.is_ready("gone"));
    EXPECT_EQ(cache.entry_count(), 0u);
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "cache" / "gone.mp3"));
}

// Asking for a purged download again keeps it
TEST(PrefetchCacheTest, RequestAfterPurgeKeepsDownload)
{
    temp_dir dir;
    fake_downloader dl(10);
    core::worker_pool pool(1);
    prefetch_cache cache(config_for(dir), dl, pool);

    dl.hold();
    cache.start_background_download(make_track("back"));
    cache.remove("back");
    cache.start_background_download(make_track("back"));

    dl.release();
    pool.wait_idle();
    EXPECT_TRUE(cache.is_ready("back"));
    EXPECT_EQ(dl.calls("back"), 1);
}

// Tracks that are not direct media are never downloaded
TEST(PrefetchCacheTest, NonCacheableSkipsDownloader)
{
    temp_dir dir;
    fake_downloader dl(10);
    core::worker_pool pool(1);
    prefetch_cache cache(config_for(dir), dl, pool);

    track page = make_track("watch");
    page.cacheable = false;
    EXPECT_FALSE(cache.ensure_downloaded(page));
    cache.start_background_download(page);
    pool.wait_idle();

    EXPECT_FALSE(page.local_path.has_value());
    EXPECT_FALSE(cache.is_downloading("watch"));
    EXPECT_EQ(dl.calls("watch"), 0);
}

// cached_path answers from the index without downloading
TEST(PrefetchCacheTest, CachedPathNeverDownloads)
{
    temp_dir dir;
    fake_downloader dl(10);
    core::worker_pool pool(1);
    prefetch_cache cache(config_for(dir), dl, pool);

    EXPECT_FALSE(cache.cached_path("later").has_value());
    EXPECT_EQ(dl.calls("later"), 0);

    track t = make_track("later");
    ASSERT_TRUE(cache.ensure_downloaded(t));
    auto path = cache.cached_path("later");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->string(), *t.local_path);

    // a file deleted behind the cache's back is forgotten
    std::filesystem::remove(*path);
    EXPECT_FALSE(cache.cached_path("later").has_value());
    EXPECT_EQ(cache.entry_count(), 0u);
}
