#ifndef REFNET_BONUS_H
#define REFNET_BONUS_H

#include <algorithm>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include "errors.h"
#include "simulate.h"

/*!
 * @brief Strategy interface: probability that a referrer makes a successful referral per day, given a bonus amount.
 *
 * Implementations are expected (but not verified) to be non-decreasing in bonus.
 * Values out of [0, 1] are rejected by BonusOptimizer as InvalidProbabilityFunction.
 */
class AdoptionModel {
public:
    virtual ~AdoptionModel() = default;

    [[nodiscard]] virtual double probabilityOf(int bonus) const = 0;
};

/*!
 * @brief p(bonus) = min(base + perDollar * bonus, cap)
 */
class LinearAdoptionModel : public AdoptionModel {
    double _base;
    double _perDollar;
    double _cap;

public:
    LinearAdoptionModel(double base, double perDollar, double cap = 1.0):
            _base(base), _perDollar(perDollar), _cap(cap) {}

    [[nodiscard]] double probabilityOf(int bonus) const override {
        return std::min(_base + _perDollar * bonus, _cap);
    }
};

/*!
 * @brief Piecewise constant model: p(bonus) = probability of the greatest threshold <= bonus.
 *
 * base is used for bonus amounts below all the thresholds.
 */
class StepAdoptionModel : public AdoptionModel {
    double                  _base;
    // _steps[threshold] = probability for bonus >= threshold
    std::map<int, double>   _steps;

public:
    StepAdoptionModel(double base, std::map<int, double> steps):
            _base(base), _steps(std::move(steps)) {}

    [[nodiscard]] double probabilityOf(int bonus) const override {
        auto it = _steps.upper_bound(bonus);
        return it == _steps.begin() ? _base : std::prev(it)->second;
    }
};

/*!
 * @brief Adapts a callable bonus -> probability as an AdoptionModel.
 */
class FunctionAdoptionModel : public AdoptionModel {
    std::function<double(int)> _func;

public:
    explicit FunctionAdoptionModel(std::function<double(int)> func): _func(std::move(func)) {}

    [[nodiscard]] double probabilityOf(int bonus) const override {
        return _func(bonus);
    }
};

/*!
 * @brief Wraps an arbitrary callable as an adoption model.
 *
 * @return The model, or InvalidSignature if func is not invocable with a single bonus amount
 *  returning a number, or is an empty function (pointer).
 */
template <class Func>
Result<std::shared_ptr<const AdoptionModel>> makeAdoptionModel(Func&& func) {
    if constexpr (std::is_invocable_r_v<double, Func, int>) {
        if constexpr (requires { func == nullptr; }) {
            if (func == nullptr) {
                return fail(ErrorCode::InvalidSignature, "Adoption function is empty");
            }
        }
        return std::shared_ptr<const AdoptionModel>(
                std::make_shared<FunctionAdoptionModel>(std::forward<Func>(func)));
    } else {
        return fail(ErrorCode::InvalidSignature,
                    "Adoption function must accept a single bonus parameter and return a probability");
    }
}

/*!
 * @brief Parameters of bonus searching.
 */
struct BonusParams {
    // Bonus amounts are always multiples of this increment
    int increment   = 10;
    // Maximum bonus to consider
    int maxBonus    = 10000;
};

inline std::string toString(const BonusParams& params) {
    return fmt::format("{{.increment = {}, .maxBonus = {}}}", params.increment, params.maxBonus);
}

/*!
 * @brief Summary of the minimum bonus for a hiring target.
 *
 * minBonus, totalCost and costPerHire are present iff achievable.
 */
struct BonusAnalysis {
    bool                        achievable = false;
    std::optional<int>          minBonus;
    // minBonus * targetHires
    std::optional<long long>    totalCost;
    // Same as minBonus
    std::optional<int>          costPerHire;
    int                         days = 0;
    int                         targetHires = 0;
};

std::string toString(const BonusAnalysis& analysis);

/*!
 * @brief Searches the minimum referral bonus that reaches a hiring target within given days.
 *
 * Each probe converts a bonus to a probability via the adoption model,
 * and runs GrowthSimulator::simulateExpected with it.
 */
class BonusOptimizer {
    BonusParams     _params;
    GrowthSimulator _simulator;

public:
    /*!
     * @throw std::invalid_argument if the increment is not positive or maxBonus is negative
     */
    explicit BonusOptimizer(BonusParams params = {}, GrowthParams growthParams = {});

    // Seed of the internal simulator. Only expected simulation is run, so it never affects the results.
    static constexpr unsigned simulatorSeed = 1;

    [[nodiscard]] const BonusParams& params() const {
        return _params;
    }

    /*!
     * @brief Gets the minimum bonus (a multiple of the increment) for the expected hires to reach targetHires.
     *
     * Procedure:
     *   - std::nullopt (impossible) if days <= 0 or targetHires <= 0;
     *   - InvalidSignature if model is nullptr, InvalidTolerance if eps <= 0;
     *   - the model is probed at bonus 0 first; any probability out of [0, 1] fails with InvalidProbabilityFunction;
     *   - std::nullopt if even the maximum bonus misses the target;
     *   - otherwise binary search over [0, maxBonus], rounding each probe down to the increment,
     *     with the final candidate checked again before it is returned.
     *
     * eps is validated only. The search is exact on the bonus grid.
     *
     * @param days Number of days for hiring
     * @param targetHires Target number of hires
     * @param model The adoption model (monotonically non-decreasing expected)
     * @param eps Tolerance, must be positive
     * @return The minimum bonus, std::nullopt if impossible, or the error.
     */
    [[nodiscard]] Result<std::optional<int>> minBonusForTarget(
            int days, int targetHires, const AdoptionModel* model, double eps = 0.01) const;

    [[nodiscard]] Result<std::optional<int>> minBonusForTarget(
            int days, int targetHires, const AdoptionModel& model, double eps = 0.01) const {
        return minBonusForTarget(days, targetHires, &model, eps);
    }

    /*!
     * @brief Wraps the result of minBonusForTarget with cost figures.
     */
    [[nodiscard]] Result<BonusAnalysis> analyzeBonusEffectiveness(
            int days, int targetHires, const AdoptionModel* model, double eps = 0.01) const;

    [[nodiscard]] Result<BonusAnalysis> analyzeBonusEffectiveness(
            int days, int targetHires, const AdoptionModel& model, double eps = 0.01) const {
        return analyzeBonusEffectiveness(days, targetHires, &model, eps);
    }

private:
    // Probability of the model at given bonus, checked in range [0, 1]
    Result<double> probabilityAt(const AdoptionModel& model, int bonus) const;

    // Whether the expected hires with given bonus reach targetHires within days
    Result<bool> meetsTarget(const AdoptionModel& model, int bonus, int days, int targetHires) const;
};

#endif //REFNET_BONUS_H
