#ifndef REFNET_SIMULATE_H
#define REFNET_SIMULATE_H

#include <cstddef>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "errors.h"

/*!
 * @brief Parameters of the referrer population in growth simulation.
 */
struct GrowthParams {
    // Number of referrers active on day 1, i.e. N0
    std::size_t initialReferrers = 100;
    // A referrer becomes inactive after making this many referrals, i.e. C
    std::size_t capacity         = 10;
    // Upper bound of the binary search in daysToTarget. N0 * C is reachable within it for any p > 0 in practice
    int         maxDays          = 1000;
};

inline std::string toString(const GrowthParams& params) {
    return fmt::format("{{.initialReferrers = {}, .capacity = {}, .maxDays = {}}}",
                       params.initialReferrers, params.capacity, params.maxDays);
}

/*!
 * @brief Day-stepped simulation of a capacity-limited referrer population.
 *
 * The population starts with N0 active referrers, each with 0 referrals.
 * Every day, each active referrer makes a successful referral with probability p.
 * A referrer whose referral count reaches the capacity C is deactivated at the end of that day.
 *
 * The population state is local to each call. The only state kept across calls is the random generator.
 */
class GrowthSimulator {
    GrowthParams    _params;
    std::mt19937    _gen;

public:
    /*!
     * @param seed Seed of the random generator. 0 for a non-reproducible random seed.
     * @param params Population parameters
     */
    explicit GrowthSimulator(unsigned seed = 0, GrowthParams params = {});

    [[nodiscard]] const GrowthParams& params() const {
        return _params;
    }

    /*!
     * @brief Stochastic simulation: one Bernoulli trial per active referrer per day.
     *
     * @param p Probability of a successful referral per active referrer per day, in [0, 1]
     * @param days Number of days, non-negative
     * @return Cumulative number of referrals at the end of each day (empty if days == 0),
     *  or InvalidProbability / InvalidDuration.
     */
    Result<std::vector<std::size_t>> simulate(double p, int days);

    /*!
     * @brief Deterministic simulation with expectations: each active referrer contributes exactly p per day.
     *
     * The referral count of each referrer accumulates p per day as well, truncated at C,
     * and the referrer is deactivated once its count reaches C. The final total never exceeds N0 * C.
     *
     * @return Cumulative expected referrals at the end of each day (empty if days == 0),
     *  or InvalidProbability / InvalidDuration.
     */
    [[nodiscard]] Result<std::vector<double>> simulateExpected(double p, int days) const;

    /*!
     * @brief Minimum number of days for the expected cumulative referrals to reach targetTotal.
     *
     * Binary search over [0, maxDays] with simulateExpected, which is non-decreasing in days.
     *   - 0 if targetTotal <= 0;
     *   - std::nullopt (impossible) if p <= 0, or the target is not reached within maxDays.
     *
     * @return Minimum days, std::nullopt if impossible, or InvalidProbability if p > 1.
     */
    [[nodiscard]] Result<std::optional<int>> daysToTarget(double p, double targetTotal) const;
};

/*!
 * @brief Checks the arguments of a simulation.
 * @return An empty Result if p is in [0, 1] and days >= 0, or the error.
 */
Result<> checkSimulationArgs(double p, int days);

#endif //REFNET_SIMULATE_H
