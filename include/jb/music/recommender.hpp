#pragma once

#include <cstddef>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <dpp/snowflake.h>

#include "jb/core/logger.hpp"
#include "jb/music/lru_cache.hpp"
#include "jb/music/rating_store.hpp"
#include "jb/music/resolver.hpp"
#include "jb/music/track.hpp"

namespace jb::music {

struct recommender_config {
    std::size_t played_history_cap = 200;
    std::size_t seed_cache_cap     = 50;
    std::size_t max_seeds          = 3;
    std::size_t similar_fetch_size = 25;
};

// Insertion-ordered set with a size cap; the oldest identifier goes first.
class played_history {
public:
    explicit played_history(std::size_t cap);

    void insert(const std::string& identifier);
    bool contains(const std::string& identifier) const;
    void clear();

    std::size_t size() const { return m_order.size(); }

private:
    std::size_t            m_cap;
    std::list<std::string> m_order;
    std::unordered_map<std::string, std::list<std::string>::iterator> m_index;
};

// Rank bucket used by the blended list: liked, neutral, disliked, heavily disliked.
int rating_tier(int score);

// Stable: liked tracks first (higher score first), then unrated, then
// disliked, then heavily disliked (<= -2).
void sort_by_rating(std::vector<catalog_entry>& entries, const rating_map& ratings);

// Autoplay recommendations for one session.
class recommender {
public:
    recommender(catalog& cat, const rating_store& ratings, dpp::snowflake session_key,
                recommender_config cfg = {}, logger log = {});

    // Similar tracks for one seed, minus the seed and anything already played.
    std::vector<catalog_entry> get_recommendations(const std::string& seed, std::size_t limit);

    // Merges the newest seeds of `recent` (ordered oldest to newest), drops
    // duplicates and the seeds themselves, then orders by community rating.
    std::vector<catalog_entry> blended_recommendations(const std::vector<std::string>& recent,
                                                       std::size_t limit);

    void mark_played(const std::string& identifier);
    bool was_played(const std::string& identifier) const;

    // Forgets played tracks and cached seed lookups.
    void clear_history();

    std::size_t played_count() const;
    std::size_t cached_seed_count() const;

private:
    std::vector<catalog_entry> similar_for_seed(const std::string& seed);

    catalog&            m_catalog;
    const rating_store& m_ratings;
    dpp::snowflake      m_session_key;
    recommender_config  m_cfg;
    logger              m_log;

    mutable std::mutex m_mutex;
    played_history     m_played;
    lru_cache<std::string, std::vector<catalog_entry>> m_seed_cache;
};

} // namespace jb::music
