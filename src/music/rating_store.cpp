#include "jb/music/rating_store.hpp"

namespace jb::music {

bool memory_rating_store::rate(dpp::snowflake session_key, const std::string& identifier,
                               dpp::snowflake user_id, int rating)
{
    if ((rating != 1 && rating != -1) || identifier.empty()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_ratings[session_key][identifier][user_id] = rating;
    return true;
}

bool memory_rating_store::remove_rating(dpp::snowflake session_key, const std::string& identifier,
                                        dpp::snowflake user_id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto session = m_ratings.find(session_key);
    if (session == m_ratings.end()) {
        return false;
    }
    auto track_votes = session->second.find(identifier);
    if (track_votes == session->second.end()) {
        return false;
    }

    const bool removed = track_votes->second.erase(user_id) > 0;
    if (track_votes->second.empty()) {
        session->second.erase(track_votes);
    }
    return removed;
}

const memory_rating_store::votes*
memory_rating_store::find_votes_locked(dpp::snowflake session_key, const std::string& identifier) const
{
    auto session = m_ratings.find(session_key);
    if (session == m_ratings.end()) {
        return nullptr;
    }
    auto track_votes = session->second.find(identifier);
    if (track_votes == session->second.end()) {
        return nullptr;
    }
    return &track_votes->second;
}

int memory_rating_store::score(dpp::snowflake session_key, const std::string& identifier) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const votes* v = find_votes_locked(session_key, identifier);
    if (!v) {
        return 0;
    }

    int total = 0;
    for (const auto& [user, rating] : *v) {
        (void)user;
        total += rating;
    }
    return total;
}

std::optional<int> memory_rating_store::user_rating(dpp::snowflake session_key,
                                                    const std::string& identifier,
                                                    dpp::snowflake user_id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const votes* v = find_votes_locked(session_key, identifier);
    if (!v) {
        return std::nullopt;
    }
    auto it = v->find(user_id);
    if (it == v->end()) {
        return std::nullopt;
    }
    return it->second;
}

std::pair<int, int> memory_rating_store::counts(dpp::snowflake session_key,
                                                const std::string& identifier) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const votes* v = find_votes_locked(session_key, identifier);
    if (!v) {
        return {0, 0};
    }

    int likes = 0;
    int dislikes = 0;
    for (const auto& [user, rating] : *v) {
        (void)user;
        if (rating > 0) {
            ++likes;
        } else if (rating < 0) {
            ++dislikes;
        }
    }
    return {likes, dislikes};
}

rating_map memory_rating_store::get_ratings_for_session(dpp::snowflake session_key) const
{
    rating_map result;

    std::lock_guard<std::mutex> lock(m_mutex);
    auto session = m_ratings.find(session_key);
    if (session == m_ratings.end()) {
        return result;
    }

    for (const auto& [identifier, v] : session->second) {
        int total = 0;
        for (const auto& [user, rating] : v) {
            (void)user;
            total += rating;
        }
        result.emplace(identifier, total);
    }
    return result;
}

} // namespace jb::music
