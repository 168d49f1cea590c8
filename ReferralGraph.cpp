#include <stack>
#include <string_view>
#include "Logger.h"
#include "ReferralGraph.h"

const UserSet ReferralGraph::emptySet = {};

Result<> ReferralGraph::addReferral(const UserId& referrer, const UserId& candidate) {
    if (referrer.empty() || candidate.empty()) {
        return fail(ErrorCode::InvalidInput, "Referrer and candidate must be non-empty");
    }
    if (referrer == candidate) {
        return fail(ErrorCode::CycleDetected, fmt::format("Self-referral of '{}' is not allowed", referrer));
    }
    if (auto it = _referrerOf.find(candidate); it != _referrerOf.end()) {
        return fail(ErrorCode::DuplicateReferrer,
                    fmt::format("Candidate '{}' is already referred by '{}'", candidate, it->second));
    }
    // referrer -> candidate closes a cycle iff candidate -> ... -> referrer exists already
    if (reaches(candidate, referrer)) {
        return fail(ErrorCode::CycleDetected,
                    fmt::format("Referral '{}' -> '{}' would create a cycle", referrer, candidate));
    }

    _referrerOf.emplace(candidate, referrer);
    _referred[referrer].insert(candidate);
    _users.insert(referrer);
    _users.insert(candidate);

    LOG_DEBUG(fmt::format("Referral added: '{}' -> '{}'", referrer, candidate));
    return {};
}

bool ReferralGraph::reaches(const UserId& source, const UserId& target) const {
    auto visited = std::unordered_set<std::string_view>{};
    auto S = std::stack<std::string_view>{};
    S.push(source);

    while (!S.empty()) {
        auto cur = S.top();
        S.pop();
        if (cur == target) {
            return true;
        }
        if (!visited.insert(cur).second) {
            continue;
        }
        for (const auto& next: fanOut(UserId(cur))) {
            if (!visited.contains(next)) {
                S.push(next);
            }
        }
    }
    return false;
}

UserSet ReferralGraph::directReferrals(const UserId& user) const {
    return fanOut(user);
}

std::optional<UserId> ReferralGraph::referrerOf(const UserId& candidate) const {
    auto it = _referrerOf.find(candidate);
    if (it == _referrerOf.end()) {
        return std::nullopt;
    }
    return it->second;
}

NetworkStats ReferralGraph::stats() const {
    // A user has non-zero total reach iff it has at least one direct referral,
    //  i.e. iff it is a key of the fan-out index
    return NetworkStats{
        .totalUsers      = _users.size(),
        .totalReferrals  = _referrerOf.size(),
        .activeReferrers = _referred.size()
    };
}

std::size_t ReferralGraph::totalReach(const UserId& user) const {
    if (!contains(user)) {
        return 0;
    }
    auto count = std::size_t{0};
    forEachReachable(user, [&](const UserId&, std::size_t) { ++count; });
    return count;
}

UserSet ReferralGraph::reachableSet(const UserId& user) const {
    auto res = UserSet{};
    if (!contains(user)) {
        return res;
    }
    forEachReachable(user, [&](const UserId& v, std::size_t) { res.insert(v); });
    return res;
}

DistanceMap ReferralGraph::shortestPaths(const UserId& start) const {
    auto res = DistanceMap{{start, 0}};
    forEachReachable(start, [&](const UserId& v, std::size_t dist) { res.emplace(v, dist); });
    return res;
}
