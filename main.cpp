#include <stdexcept>
#include <fmt/ranges.h>
#include "args.h"
#include "bonus.h"
#include "input.h"
#include "Logger.h"
#include "ranking.h"
#include "ReferralGraph.h"
#include "simulate.h"
#include "utils/Timer.h"

namespace {
    // Failed results in the driver are fatal
    template <class T>
    T unwrap(Result<T> res, std::string_view what) {
        if (!res) {
            throw std::runtime_error(fmt::format("{} failed. {}", what, toString(res.error())));
        }
        return std::move(res).value();
    }

    template <class T>
    std::string orImpossible(const std::optional<T>& opt) {
        return opt ? fmt::format("{}", *opt) : "impossible"s;
    }

    void doRanking(const ReferralGraph& graph, const ProgramArgs& args) {
        LOG_INFO("Network stats: " + toString(graph.stats()));
        LOG_INFO(fmt::format("Top {} referrers by total reach: {}",
                             args.topK, toString(topReferrers(graph, args.topK))));
        LOG_INFO("Unique reach expansion: " + toString(uniqueReachExpansion(graph)));

        if (args.skipCentrality) {
            LOG_INFO("Flow centrality skipped.");
            return;
        }
        auto timer = utils::Timer{};
        auto centrality = flowCentrality(graph);
        LOG_INFO(fmt::format("Flow centrality ({:.3f} sec): {}", timer.elapsed().count(), toString(centrality)));
    }

    void doSimulation(const ProgramArgs& args) {
        auto simulator = GrowthSimulator(args.seed, args.growth);

        auto actual = unwrap(simulator.simulate(args.probability, args.days), "Simulation");
        LOG_INFO(fmt::format("Simulated cumulative referrals with p = {} in {} days: [{}]",
                             args.probability, args.days, fmt::join(actual, ", ")));

        auto expected = unwrap(simulator.simulateExpected(args.probability, args.days), "Expected simulation");
        LOG_INFO(fmt::format("Expected cumulative referrals with p = {} in {} days: [{:.2f}]",
                             args.probability, args.days, fmt::join(expected, ", ")));

        auto days = unwrap(simulator.daysToTarget(args.probability, args.target), "Days-to-target search");
        LOG_INFO(fmt::format("Days to reach {} referrals with p = {}: {}", args.target, args.probability, orImpossible(days)));
    }

    void doBonusAnalysis(const ProgramArgs& args) {
        auto optimizer = BonusOptimizer(args.bonus, args.growth);
        auto model = LinearAdoptionModel(args.adoptionBase, args.adoptionPerDollar, args.adoptionCap);

        auto analysis = unwrap(
                optimizer.analyzeBonusEffectiveness(args.bonusDays, args.hireTarget, model, args.eps),
                "Bonus optimization");
        LOG_INFO("Bonus analysis: " + toString(analysis));
    }
}

int mainWorker(int argc, char** argv) {
    auto args = prepareProgramArgs(argc, argv);
    logger::Loggers::get("output")->setMinLevel(args.logLevel);
    LOG_INFO("Overall Arguments:\n" + args.dump());

    auto graph = ReferralGraph{};
    auto summary = loadReferrals(graph, readReferrals(args.referralsPath));
    LOG_INFO(fmt::format("Referrals loaded from '{}': {} accepted, {} rejected",
                         args.referralsPath.string(), summary.accepted, summary.rejected));

    doRanking(graph, args);
    doSimulation(args);
    doBonusAnalysis(args);

    return 0;
}

int main(int argc, char** argv) try {
    // To standard error, log level adjusted after parsing the arguments
    logger::Loggers::add(std::make_shared<logger::Logger>("output", std::cerr, logger::LogLevel::Info));
    return mainWorker(argc, argv);
} catch (std::exception& e) {
    LOG_CRITICAL("Exception caught: "s + e.what());
    LOG_CRITICAL("Abort.");
    return -1;
}
