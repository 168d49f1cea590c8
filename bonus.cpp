#include <stdexcept>
#include "bonus.h"
#include "Logger.h"

std::string toString(const BonusAnalysis& analysis) {
    auto optionalToString = [](const auto& v) {
        return v.has_value() ? fmt::format("{}", *v) : std::string{"null"};
    };
    return fmt::format("{{.achievable = {}, .minBonus = {}, .totalCost = {}, .costPerHire = {}, "
                       ".days = {}, .targetHires = {}}}",
                       analysis.achievable,
                       optionalToString(analysis.minBonus),
                       optionalToString(analysis.totalCost),
                       optionalToString(analysis.costPerHire),
                       analysis.days, analysis.targetHires);
}

BonusOptimizer::BonusOptimizer(BonusParams params, GrowthParams growthParams):
        _params(params), _simulator(simulatorSeed, growthParams) {
    if (_params.increment <= 0) {
        throw std::invalid_argument("Bonus increment must be positive");
    }
    if (_params.maxBonus < 0) {
        throw std::invalid_argument("Maximum bonus must be non-negative");
    }
}

Result<double> BonusOptimizer::probabilityAt(const AdoptionModel& model, int bonus) const {
    auto p = model.probabilityOf(bonus);
    // NaN fails both comparisons
    if (!(p >= 0.0 && p <= 1.0)) {
        return fail(ErrorCode::InvalidProbabilityFunction,
                    fmt::format("Adoption model returned invalid probability {} for bonus {}", p, bonus));
    }
    return p;
}

Result<bool> BonusOptimizer::meetsTarget(const AdoptionModel& model, int bonus, int days, int targetHires) const {
    auto p = probabilityAt(model, bonus);
    if (!p) {
        return p.error();
    }
    auto sim = _simulator.simulateExpected(p.value(), days);
    if (!sim) {
        return sim.error();
    }
    const auto& totals = sim.value();
    return !totals.empty() && totals.back() >= static_cast<double>(targetHires);
}

Result<std::optional<int>> BonusOptimizer::minBonusForTarget(
        int days, int targetHires, const AdoptionModel* model, double eps) const {
    if (days <= 0 || targetHires <= 0) {
        return std::optional<int>{};
    }
    if (model == nullptr) {
        return fail(ErrorCode::InvalidSignature, "Adoption model must be provided");
    }
    if (!(eps > 0.0)) {
        return fail(ErrorCode::InvalidTolerance, fmt::format("Tolerance eps must be positive, got {}", eps));
    }
    if (auto p0 = probabilityAt(*model, 0); !p0) {
        return p0.error();
    }

    auto step = _params.increment;
    auto feasible = meetsTarget(*model, _params.maxBonus, days, targetHires);
    if (!feasible) {
        return feasible.error();
    }
    if (!feasible.value()) {
        LOG_DEBUG(fmt::format("Target {} in {} days is impossible even with bonus {}",
                              targetHires, days, _params.maxBonus));
        return std::optional<int>{};
    }

    // left and right are always multiples of step
    auto left = 0;
    auto right = _params.maxBonus / step * step;
    while (left < right) {
        auto mid = (left + (right - left) / 2) / step * step;
        auto meets = meetsTarget(*model, mid, days, targetHires);
        if (!meets) {
            return meets.error();
        }
        if (meets.value()) {
            right = mid;
        } else {
            left = mid + step;
        }
    }

    if (left > _params.maxBonus) {
        return std::optional<int>{};
    }
    auto meets = meetsTarget(*model, left, days, targetHires);
    if (!meets) {
        return meets.error();
    }
    if (!meets.value()) {
        return std::optional<int>{};
    }
    LOG_DEBUG(fmt::format("Minimum bonus for {} hires in {} days: {}", targetHires, days, left));
    return std::optional<int>(left);
}

Result<BonusAnalysis> BonusOptimizer::analyzeBonusEffectiveness(
        int days, int targetHires, const AdoptionModel* model, double eps) const {
    auto minBonus = minBonusForTarget(days, targetHires, model, eps);
    if (!minBonus) {
        return minBonus.error();
    }

    auto res = BonusAnalysis{.days = days, .targetHires = targetHires};
    if (auto bonus = minBonus.value(); bonus.has_value()) {
        res.achievable  = true;
        res.minBonus    = *bonus;
        res.totalCost   = static_cast<long long>(*bonus) * targetHires;
        res.costPerHire = *bonus;
    }
    return res;
}
