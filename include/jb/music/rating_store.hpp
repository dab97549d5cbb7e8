#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include <dpp/snowflake.h>

namespace jb::music {

// identifier -> summed score (+1 per like, -1 per dislike)
using rating_map = std::unordered_map<std::string, int>;

class rating_store {
public:
    virtual ~rating_store() = default;

    virtual rating_map get_ratings_for_session(dpp::snowflake session_key) const = 0;
};

// Per-guild like/dislike votes, one vote per user per track.
class memory_rating_store : public rating_store {
public:
    // rating must be +1 or -1; a repeated vote by the same user replaces the old one.
    bool rate(dpp::snowflake session_key, const std::string& identifier,
              dpp::snowflake user_id, int rating);

    bool remove_rating(dpp::snowflake session_key, const std::string& identifier,
                       dpp::snowflake user_id);

    int score(dpp::snowflake session_key, const std::string& identifier) const;

    std::optional<int> user_rating(dpp::snowflake session_key, const std::string& identifier,
                                   dpp::snowflake user_id) const;

    // (likes, dislikes)
    std::pair<int, int> counts(dpp::snowflake session_key, const std::string& identifier) const;

    rating_map get_ratings_for_session(dpp::snowflake session_key) const override;

private:
    using votes = std::unordered_map<dpp::snowflake, int>;

    const votes* find_votes_locked(dpp::snowflake session_key, const std::string& identifier) const;

    mutable std::mutex m_mutex;
    std::unordered_map<dpp::snowflake, std::unordered_map<std::string, votes>> m_ratings;
};

} // namespace jb::music
