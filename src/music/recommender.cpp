#include "jb/music/recommender.hpp"

#include <algorithm>
#include <sstream>
#include <unordered_set>

namespace jb::music {

// ---------- played_history ----------

played_history::played_history(std::size_t cap)
    : m_cap(cap == 0 ? 1 : cap)
{
}

void played_history::insert(const std::string& identifier)
{
    auto it = m_index.find(identifier);
    if (it != m_index.end()) {
        m_order.erase(it->second);
        m_index.erase(it);
    }

    m_order.push_back(identifier);
    m_index[identifier] = std::prev(m_order.end());

    while (m_order.size() > m_cap) {
        m_index.erase(m_order.front());
        m_order.pop_front();
    }
}

bool played_history::contains(const std::string& identifier) const
{
    return m_index.count(identifier) > 0;
}

void played_history::clear()
{
    m_order.clear();
    m_index.clear();
}

// ---------- rating order ----------

int rating_tier(int score)
{
    if (score > 0) {
        return 0;
    }
    if (score == 0) {
        return 1;
    }
    if (score > -2) {
        return 2;
    }
    return 3;
}

void sort_by_rating(std::vector<catalog_entry>& entries, const rating_map& ratings)
{
    auto score_of = [&ratings](const catalog_entry& e) {
        auto it = ratings.find(e.identifier);
        return it == ratings.end() ? 0 : it->second;
    };

    std::stable_sort(entries.begin(), entries.end(),
        [&score_of](const catalog_entry& a, const catalog_entry& b) {
            const int sa = score_of(a);
            const int sb = score_of(b);
            const int ta = rating_tier(sa);
            const int tb = rating_tier(sb);
            if (ta != tb) {
                return ta < tb;
            }
            // only liked tracks are ordered by strength
            return ta == 0 && sa > sb;
        });
}

// ---------- recommender ----------

recommender::recommender(catalog& cat, const rating_store& ratings, dpp::snowflake session_key,
                         recommender_config cfg, logger log)
    : m_catalog(cat)
    , m_ratings(ratings)
    , m_session_key(session_key)
    , m_cfg(cfg)
    , m_log(std::move(log))
    , m_played(cfg.played_history_cap)
    , m_seed_cache(cfg.seed_cache_cap)
{
}

std::vector<catalog_entry> recommender::similar_for_seed(const std::string& seed)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (auto hit = m_seed_cache.get(seed)) {
            return *hit;
        }
    }

    // Catalog lookups are slow; never hold the lock across them.
    std::vector<catalog_entry> fetched = m_catalog.get_similar(seed, m_cfg.similar_fetch_size);

    std::ostringstream oss;
    oss << "[Autoplay] Fetched " << fetched.size() << " similar track(s) for seed " << seed;
    m_log.log(dpp::ll_debug, oss.str());

    std::lock_guard<std::mutex> lock(m_mutex);
    m_seed_cache.put(seed, fetched);
    return fetched;
}

std::vector<catalog_entry> recommender::get_recommendations(const std::string& seed, std::size_t limit)
{
    std::vector<catalog_entry> out;
    if (seed.empty() || limit == 0) {
        return out;
    }

    const auto all = similar_for_seed(seed);

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& entry : all) {
        if (entry.identifier.empty() || entry.identifier == seed || m_played.contains(entry.identifier)) {
            continue;
        }
        out.push_back(entry);
        if (out.size() >= limit) {
            break;
        }
    }
    return out;
}

std::vector<catalog_entry> recommender::blended_recommendations(const std::vector<std::string>& recent,
                                                                std::size_t limit)
{
    std::vector<catalog_entry> merged;
    if (recent.empty() || limit == 0) {
        return merged;
    }

    std::vector<std::string> seeds;
    for (auto it = recent.rbegin(); it != recent.rend() && seeds.size() < m_cfg.max_seeds; ++it) {
        seeds.push_back(*it);
    }

    const std::size_t per_seed = std::max<std::size_t>(limit / seeds.size(), 2) + 2;
    const std::unordered_set<std::string> excluded(recent.begin(), recent.end());
    std::unordered_set<std::string> seen;

    for (const auto& seed : seeds) {
        for (auto& entry : get_recommendations(seed, per_seed)) {
            if (excluded.count(entry.identifier) > 0 || !seen.insert(entry.identifier).second) {
                continue;
            }
            merged.push_back(std::move(entry));
        }
    }

    sort_by_rating(merged, m_ratings.get_ratings_for_session(m_session_key));

    if (merged.size() > limit) {
        merged.resize(limit);
    }
    return merged;
}

void recommender::mark_played(const std::string& identifier)
{
    if (identifier.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_played.insert(identifier);
}

bool recommender::was_played(const std::string& identifier) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_played.contains(identifier);
}

void recommender::clear_history()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_played.clear();
    m_seed_cache.clear();
}

std::size_t recommender::played_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_played.size();
}

std::size_t recommender::cached_seed_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_seed_cache.size();
}

} // namespace jb::music
