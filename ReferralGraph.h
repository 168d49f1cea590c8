#ifndef REFNET_REFERRALGRAPH_H
#define REFNET_REFERRALGRAPH_H

#include <cstddef>
#include <optional>
#include <queue>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include "errors.h"
#include "global.h"

using UserId = std::string;
using UserSet = std::unordered_set<UserId>;
// distance[v] = number of referral links from the start user to v
using DistanceMap = std::unordered_map<UserId, std::size_t>;

/*!
 * @brief Basic counts of a referral graph.
 */
struct NetworkStats {
    std::size_t totalUsers      = 0;
    std::size_t totalReferrals  = 0;
    // Users whose total reach (direct + indirect) is non-zero
    std::size_t activeReferrers = 0;

    friend bool operator == (const NetworkStats&, const NetworkStats&) = default;
};

inline std::string toString(const NetworkStats& stats) {
    return fmt::format("{{.totalUsers = {}, .totalReferrals = {}, .activeReferrers = {}}}",
                       stats.totalUsers, stats.totalReferrals, stats.activeReferrers);
}

/*!
 * @brief Directed referral graph among users.
 *
 * Each accepted referral (referrer, candidate) is stored twice:
 *   - candidate -> referrer as the primary index (every candidate has at most one referrer);
 *   - referrer -> {candidates} as the fan-out index, which all the traversals follow.
 *
 * Invariants checked on every insertion:
 *   - no self-referral;
 *   - no candidate is referred twice;
 *   - no directed cycle, so the graph is always a forest of in-trees.
 *
 * The graph only grows. Nothing derived from it is cached, every query is computed from the current state.
 * Not thread-safe for concurrent mutation.
 */
class ReferralGraph {
    // referrerOf[c] = the user who referred candidate c
    std::unordered_map<UserId, UserId>  _referrerOf;
    // referred[r] = all the candidates referred directly by r. Keys always map to non-empty sets.
    std::unordered_map<UserId, UserSet> _referred;
    // All the users that have appeared in an accepted referral
    UserSet                             _users;

    static const UserSet emptySet;

public:
    ReferralGraph() = default;

    /*!
     * @brief Adds a referral from referrer to candidate.
     *
     * Checked in order, with the graph left unchanged on any failure:
     *   - InvalidInput if either user is an empty string;
     *   - CycleDetected if referrer == candidate;
     *   - DuplicateReferrer if candidate already has a referrer;
     *   - CycleDetected if referrer is already reachable from candidate.
     *
     * @return An empty Result on success, or the error.
     */
    Result<> addReferral(const UserId& referrer, const UserId& candidate);

    /*!
     * @brief Gets the candidates referred directly by the user.
     *
     * An empty set is returned for unknown users or users without referrals.
     */
    [[nodiscard]] UserSet directReferrals(const UserId& user) const;

    [[nodiscard]] NetworkStats stats() const;

    [[nodiscard]] std::optional<UserId> referrerOf(const UserId& candidate) const;

    [[nodiscard]] bool contains(const UserId& user) const {
        return _users.contains(user);
    }

    [[nodiscard]] const UserSet& users() const {
        return _users;
    }

    [[nodiscard]] std::size_t nUsers() const {
        return _users.size();
    }

    [[nodiscard]] std::size_t nReferrals() const {
        return _referrerOf.size();
    }

    /*!
     * @brief Number of distinct users reachable from user (direct and indirect referrals), user itself excluded.
     *
     * Returns 0 for unknown users.
     */
    [[nodiscard]] std::size_t totalReach(const UserId& user) const;

    /*!
     * @brief All the users reachable from user, user itself excluded.
     */
    [[nodiscard]] UserSet reachableSet(const UserId& user) const;

    /*!
     * @brief BFS distances from start along referral links.
     *
     * start is at distance 0; users not reachable from start are absent.
     */
    [[nodiscard]] DistanceMap shortestPaths(const UserId& start) const;

private:
    [[nodiscard]] const UserSet& fanOut(const UserId& user) const {
        auto it = _referred.find(user);
        return it == _referred.end() ? emptySet : it->second;
    }

    // Whether target is reachable from source via the existing referral links
    [[nodiscard]] bool reaches(const UserId& source, const UserId& target) const;

    /*!
     * @brief Breadth-first traversal from start. func(v, dist) is invoked once per user v discovered,
     * start itself excluded, where dist >= 1 is its distance from start.
     */
    template <class Func>
    void forEachReachable(const UserId& start, Func&& func) const {
        auto dist = DistanceMap{{start, 0}};
        auto Q = std::queue<const UserId*>();
        Q.push(&start);

        for (; !Q.empty(); Q.pop()) {
            const auto& cur = *Q.front();
            auto next = dist.at(cur) + 1;
            for (const auto& to: fanOut(cur)) {
                // Never true in a forest of in-trees
                if (dist.contains(to)) {
                    continue;
                }
                dist.emplace(to, next);
                func(to, next);
                Q.push(&to);
            }
        }
    }
};

#endif //REFNET_REFERRALGRAPH_H
