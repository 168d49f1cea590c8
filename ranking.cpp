#include <algorithm>
#include <unordered_map>
#include "Logger.h"
#include "ProgressCounter.h"
#include "ranking.h"

namespace {
    void sortByScore(RankList& list) {
        rs::sort(list, rs::greater{}, &RankItem::score);
    }
}

RankList topReferrers(const ReferralGraph& graph, int k) {
    if (k <= 0) {
        return {};
    }
    auto res = RankList{};
    for (const auto& user: graph.users()) {
        if (auto reach = graph.totalReach(user); reach > 0) {
            res.push_back(RankItem{.user = user, .score = reach});
        }
    }
    sortByScore(res);

    if (res.size() > static_cast<std::size_t>(k)) {
        res.resize(k);
    }
    return res;
}

RankList uniqueReachExpansion(const ReferralGraph& graph) {
    // reachable[u] = reachable set of u, users with empty reachable set excluded
    auto reachable = std::unordered_map<UserId, UserSet>{};
    for (const auto& user: graph.users()) {
        if (auto s = graph.reachableSet(user); !s.empty()) {
            reachable.emplace(user, std::move(s));
        }
    }

    // Initially, every user reachable from some referrer
    auto uncovered = UserSet{};
    for (const auto& s: reachable | vs::values) {
        uncovered.insert(s.begin(), s.end());
    }

    auto res = RankList{};
    while (!uncovered.empty() && !reachable.empty()) {
        auto best = reachable.end();
        auto bestCoverage = std::size_t{0};

        for (auto it = reachable.begin(); it != reachable.end(); ++it) {
            auto coverage = static_cast<std::size_t>(rs::count_if(it->second, [&](const UserId& v) {
                return uncovered.contains(v);
            }));
            if (coverage > bestCoverage) {
                best = it;
                bestCoverage = coverage;
            }
        }
        if (best == reachable.end()) {
            break;
        }

        LOG_DEBUG(fmt::format("Selected #{}: user = '{}', new coverage = {}, uncovered before = {}",
                              res.size() + 1, best->first, bestCoverage, uncovered.size()));
        res.push_back(RankItem{.user = best->first, .score = bestCoverage});
        for (const auto& v: best->second) {
            uncovered.erase(v);
        }
        // Never selected again
        reachable.erase(best);
    }

    sortByScore(res);
    return res;
}

RankList flowCentrality(const ReferralGraph& graph) {
    if (graph.nUsers() < 3) {
        return {};
    }

    // dist[s] = shortest path distances from s
    auto dist = std::unordered_map<UserId, DistanceMap>{};
    for (const auto& user: graph.users()) {
        dist.emplace(user, graph.shortestPaths(user));
    }

    auto score = std::unordered_map<UserId, std::size_t>{};
    for (const auto& user: graph.users()) {
        score.emplace(user, 0);
    }

    auto progress = ProgressCounter("Flow centrality", graph.nUsers());
    for (const auto& s: graph.users()) {
        const auto& ds = dist.at(s);

        for (const auto& t: graph.users()) {
            if (s == t) {
                continue;
            }
            auto st = ds.find(t);
            if (st == ds.end()) {
                continue;
            }
            for (const auto& v: graph.users()) {
                if (v == s || v == t) {
                    continue;
                }
                auto sv = ds.find(v);
                if (sv == ds.end()) {
                    continue;
                }
                const auto& dv = dist.at(v);
                auto vt = dv.find(t);
                if (vt == dv.end()) {
                    continue;
                }
                if (sv->second + vt->second == st->second) {
                    score[v] += 1;
                }
            }
        }
        progress.increment();
    }

    auto res = RankList{};
    res.reserve(score.size());
    for (auto& [user, value]: score) {
        res.push_back(RankItem{.user = user, .score = value});
    }
    sortByScore(res);
    return res;
}
