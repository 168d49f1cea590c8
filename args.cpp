#include <limits>
#include <stdexcept>
#include "args.h"

namespace {
    template <class T>
    T checkRange(T value, T lowest, T highest, const char* name) {
        if (!(value >= lowest && value <= highest)) {
            throw std::invalid_argument(fmt::format("Argument {} = {} out of range [{}, {}]",
                                                    name, value, lowest, highest));
        }
        return value;
    }

    constexpr auto intMax = std::numeric_limits<int>::max();

    ProgramArgs fromParser(const argparse::ArgumentParser& parser) {
        auto A = ProgramArgs{};

        A.referralsPath     = parser.get<std::string>("--referrals-path");
        A.topK              = parser.get<int>("--top-k");

        A.probability       = checkRange(parser.get<double>("--probability"), 0.0, 1.0, "probability");
        A.days              = checkRange(parser.get<int>("--days"), 0, intMax, "days");
        A.target            = parser.get<int>("--target");

        A.bonusDays         = parser.get<int>("--bonus-days");
        A.hireTarget        = parser.get<int>("--hire-target");
        A.adoptionBase      = parser.get<double>("--adoption-base");
        A.adoptionPerDollar = parser.get<double>("--adoption-per-dollar");
        A.adoptionCap       = checkRange(parser.get<double>("--adoption-cap"), 0.0, 1.0, "adoption-cap");
        A.eps               = parser.get<double>("--eps");

        A.growth.initialReferrers = checkRange(parser.get<int>("--initial-referrers"), 1, intMax, "initial-referrers");
        A.growth.capacity         = checkRange(parser.get<int>("--capacity"), 1, intMax, "capacity");
        A.growth.maxDays          = checkRange(parser.get<int>("--max-days"), 1, intMax, "max-days");
        A.bonus.increment         = checkRange(parser.get<int>("--bonus-increment"), 1, intMax, "bonus-increment");
        A.bonus.maxBonus          = checkRange(parser.get<int>("--max-bonus"), 0, intMax, "max-bonus");
        A.seed                    = static_cast<unsigned>(checkRange(parser.get<int>("--seed"), 0, intMax, "seed"));

        A.logLevel          = logger::logLevelOf(parser.get<std::string>("--log-level"));
        A.skipCentrality    = parser.get<bool>("--skip-centrality");

        return A;
    }
}

std::string ProgramArgs::dump() const {
    auto res = std::string{};
    auto line = [&](const char* name, const auto& value) {
        res += fmt::format("    {:<20} = {}\n", name, value);
    };

    line("referrals-path", referralsPath.string());
    line("top-k", topK);
    line("probability", probability);
    line("days", days);
    line("target", target);
    line("bonus-days", bonusDays);
    line("hire-target", hireTarget);
    line("adoption-base", adoptionBase);
    line("adoption-per-dollar", adoptionPerDollar);
    line("adoption-cap", adoptionCap);
    line("eps", eps);
    line("growth", toString(growth));
    line("bonus", toString(bonus));
    line("seed", seed);
    line("log-level", logger::toString(logLevel));
    line("skip-centrality", skipCentrality);

    // Trailing new line removed
    res.pop_back();
    return res;
}

argparse::ArgumentParser makeArgParser() {
    auto parser = argparse::ArgumentParser("refnet", "1.0.0");

    parser.add_argument("--referrals-path")
            .required()
            .help("Path of the referral list file, one 'referrer candidate' pair per line");
    parser.add_argument("-k", "--top-k")
            .help("Number of top referrers to report")
            .default_value(5)
            .scan<'i', int>();

    parser.add_argument("-p", "--probability")
            .help("Daily probability of a successful referral in growth simulation")
            .default_value(0.5)
            .scan<'g', double>();
    parser.add_argument("--days")
            .help("Number of days in growth simulation")
            .default_value(30)
            .scan<'i', int>();
    parser.add_argument("--target")
            .help("Target total referrals for the days-to-target search")
            .default_value(500)
            .scan<'i', int>();

    parser.add_argument("--bonus-days")
            .help("Number of days available for hiring in bonus optimization")
            .default_value(30)
            .scan<'i', int>();
    parser.add_argument("--hire-target")
            .help("Target number of hires in bonus optimization")
            .default_value(200)
            .scan<'i', int>();
    parser.add_argument("--adoption-base")
            .help("Adoption probability with no bonus")
            .default_value(0.1)
            .scan<'g', double>();
    parser.add_argument("--adoption-per-dollar")
            .help("Increase of adoption probability per dollar of bonus")
            .default_value(0.001)
            .scan<'g', double>();
    parser.add_argument("--adoption-cap")
            .help("Upper limit of adoption probability")
            .default_value(1.0)
            .scan<'g', double>();
    parser.add_argument("--eps")
            .help("Tolerance of bonus optimization, must be positive")
            .default_value(0.01)
            .scan<'g', double>();

    parser.add_argument("--initial-referrers")
            .help("Number of active referrers on day 1")
            .default_value(100)
            .scan<'i', int>();
    parser.add_argument("--capacity")
            .help("Maximum referrals per referrer before it becomes inactive")
            .default_value(10)
            .scan<'i', int>();
    parser.add_argument("--max-days")
            .help("Upper bound of the days-to-target search")
            .default_value(1000)
            .scan<'i', int>();
    parser.add_argument("--bonus-increment")
            .help("Bonus amounts are multiples of this increment")
            .default_value(10)
            .scan<'i', int>();
    parser.add_argument("--max-bonus")
            .help("Maximum bonus to consider")
            .default_value(10000)
            .scan<'i', int>();
    parser.add_argument("--seed")
            .help("Seed of stochastic simulation, 0 for a random seed")
            .default_value(0)
            .scan<'i', int>();

    parser.add_argument("--log-level")
            .help("Minimum log level: debug, info, warning, error or critical")
            .default_value(std::string{"info"});
    parser.add_argument("--skip-centrality")
            .help("Skips flow centrality, which takes O(|V|^3) time")
            .default_value(false)
            .implicit_value(true);

    return parser;
}

ProgramArgs prepareProgramArgs(const std::vector<std::string>& tokens) {
    auto parser = makeArgParser();
    parser.parse_args(tokens);
    return fromParser(parser);
}

ProgramArgs prepareProgramArgs(int argc, char** argv) {
    return prepareProgramArgs(std::vector<std::string>(argv, argv + argc));
}
