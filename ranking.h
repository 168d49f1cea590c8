#ifndef REFNET_RANKING_H
#define REFNET_RANKING_H

#include <string>
#include <vector>
#include "ReferralGraph.h"

/*!
 * @brief A user with its score under some ranking (total reach, unique coverage, or centrality).
 */
struct RankItem {
    UserId      user;
    std::size_t score;

    friend bool operator == (const RankItem&, const RankItem&) = default;
};

using RankList = std::vector<RankItem>;

/*!
 * @brief Dumps the rank list as "[(user, score), ...]".
 */
inline std::string toString(const RankList& list) {
    auto res = std::string{"["};
    for (const auto& [user, score]: list) {
        if (res.size() > 1) {
            res += ", ";
        }
        res += fmt::format("({}, {})", user, score);
    }
    return res + "]";
}

/*!
 * @brief Gets the top-k referrers by total reach.
 *
 * Only users with non-zero total reach are candidates.
 * Sorted in descending order of reach; the order among ties is unspecified.
 * k <= 0 yields an empty list, k larger than the candidate count yields all of them.
 *
 * @param graph The referral graph
 * @param k Maximum number of referrers
 * @return The list of (user, totalReach)
 */
RankList topReferrers(const ReferralGraph& graph, int k);

/*!
 * @brief Greedy set cover on the reachable sets of all the users.
 *
 * Each turn picks the user that covers the most not-yet-covered users, until everyone reachable
 * from any referrer is covered. The picked user's score is its incremental coverage at the time it was picked.
 * The result is an approximation (ln n competitive), not necessarily a minimum cover.
 *
 * The result is sorted by coverage in descending order. Ties, both during selection and in the final order,
 * are broken in unspecified order.
 *
 * @param graph The referral graph
 * @return The list of (user, incrementalCoverage)
 */
RankList uniqueReachExpansion(const ReferralGraph& graph);

/*!
 * @brief Flow centrality of every user: for how many ordered pairs (s, t) the user lies on a shortest path from s to t.
 *
 * v lies on a shortest path from s to t (v != s, v != t) iff d(s, v) + d(v, t) == d(s, t).
 * Takes O(|V|^3) time. An empty list is returned if the graph contains fewer than 3 users.
 *
 * @param graph The referral graph
 * @return The list of (user, score) for all users, sorted by score in descending order (ties unspecified)
 */
RankList flowCentrality(const ReferralGraph& graph);

#endif //REFNET_RANKING_H
