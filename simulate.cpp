#include <algorithm>
#include <cmath>
#include <numeric>
#include "Logger.h"
#include "simulate.h"
#include "utils/random.h"

Result<> checkSimulationArgs(double p, int days) {
    // NaN fails both comparisons
    if (!(p >= 0.0 && p <= 1.0)) {
        return fail(ErrorCode::InvalidProbability,
                    fmt::format("Probability p must be between 0.0 and 1.0, got {}", p));
    }
    if (days < 0) {
        return fail(ErrorCode::InvalidDuration, fmt::format("Days must be non-negative, got {}", days));
    }
    return {};
}

GrowthSimulator::GrowthSimulator(unsigned seed, GrowthParams params):
        _params(params), _gen(utils::makeGenerator(seed)) {}

Result<std::vector<std::size_t>> GrowthSimulator::simulate(double p, int days) {
    if (auto check = checkSimulationArgs(p, days); !check) {
        return check.error();
    }
    auto res = std::vector<std::size_t>();
    res.reserve(days);

    // counts[i] = referrals made by the i-th referrer so far
    auto counts = std::vector<std::size_t>(_params.initialReferrers, 0);
    // Indices of the referrers still active
    auto active = std::vector<std::size_t>(_params.initialReferrers);
    std::iota(active.begin(), active.end(), std::size_t{0});

    auto reachesCapacity = [&](std::size_t i) { return counts[i] >= _params.capacity; };
    std::erase_if(active, reachesCapacity);

    auto trial = std::bernoulli_distribution(p);
    auto total = std::size_t{0};

    for (int day = 0; day < days; day++) {
        for (auto i: active) {
            if (trial(_gen)) {
                counts[i] += 1;
                total += 1;
            }
        }
        std::erase_if(active, reachesCapacity);
        res.push_back(total);
    }
    return res;
}

Result<std::vector<double>> GrowthSimulator::simulateExpected(double p, int days) const {
    if (auto check = checkSimulationArgs(p, days); !check) {
        return check.error();
    }
    auto res = std::vector<double>();
    res.reserve(days);

    // counts[i] = expected referrals made by the i-th referrer so far
    auto counts = std::vector<double>(_params.initialReferrers, 0.0);
    auto active = std::vector<std::size_t>(_params.initialReferrers);
    std::iota(active.begin(), active.end(), std::size_t{0});

    auto capacity = static_cast<double>(_params.capacity);
    auto reachesCapacity = [&](std::size_t i) { return counts[i] >= capacity; };
    std::erase_if(active, reachesCapacity);

    auto total = 0.0;
    for (int day = 0; day < days; day++) {
        auto daily = 0.0;
        for (auto i: active) {
            // The last day before deactivation only fills the remaining capacity
            if (counts[i] + p >= capacity) {
                daily += capacity - counts[i];
                counts[i] = capacity;
            } else {
                daily += p;
                counts[i] += p;
            }
        }
        std::erase_if(active, reachesCapacity);
        total += daily;
        res.push_back(total);
    }
    return res;
}

Result<std::optional<int>> GrowthSimulator::daysToTarget(double p, double targetTotal) const {
    if (targetTotal <= 0.0) {
        return std::optional<int>(0);
    }
    if (p <= 0.0) {
        return std::optional<int>{};
    }
    // Final total of simulateExpected(p, days), 0 for days = 0
    auto finalTotal = [&](int days) -> Result<double> {
        auto sim = simulateExpected(p, days);
        if (!sim) {
            return sim.error();
        }
        return sim.value().empty() ? 0.0 : sim.value().back();
    };

    auto left = 0;
    auto right = _params.maxDays;
    while (left < right) {
        auto mid = left + (right - left) / 2;
        auto total = finalTotal(mid);
        if (!total) {
            return total.error();
        }
        if (total.value() >= targetTotal) {
            right = mid;
        } else {
            left = mid + 1;
        }
    }

    // The upper bound itself may still miss the target
    auto total = finalTotal(left);
    if (!total) {
        return total.error();
    }
    if (total.value() >= targetTotal) {
        LOG_DEBUG(fmt::format("daysToTarget(p = {}, target = {}) = {}", p, targetTotal, left));
        return std::optional<int>(left);
    }
    return std::optional<int>{};
}
