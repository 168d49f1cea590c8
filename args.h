#ifndef REFNET_ARGS_H
#define REFNET_ARGS_H

#include <string>
#include <vector>
#include "argparse/argparse.hpp"
#include "bonus.h"
#include "global.h"
#include "Logger.h"
#include "simulate.h"

/*!
 * @brief All the program arguments of the refnet command-line tool.
 */
struct ProgramArgs {
    // Path of the referral list file, see readReferrals for its format
    fs::path            referralsPath;
    // Number of top referrers to report
    int                 topK                = 5;

    // Daily success probability of growth simulation
    double              probability         = 0.5;
    // Days of growth simulation
    int                 days                = 30;
    // Target total referrals of daysToTarget
    int                 target              = 500;

    // Days and hiring target of bonus optimization
    int                 bonusDays           = 30;
    int                 hireTarget          = 200;
    // Linear adoption model: p(bonus) = min(adoptionBase + adoptionPerDollar * bonus, adoptionCap)
    double              adoptionBase        = 0.1;
    double              adoptionPerDollar   = 0.001;
    double              adoptionCap         = 1.0;
    double              eps                 = 0.01;

    GrowthParams        growth;
    BonusParams         bonus;
    // 0 for a random seed
    unsigned            seed                = 0;

    logger::LogLevel    logLevel            = logger::LogLevel::Info;
    bool                skipCentrality      = false;

    /*!
     * @brief Dumps all the arguments as a multi-line string, one argument per line.
     */
    [[nodiscard]] std::string dump() const;
};

/*!
 * @brief Creates the argument parser with all the options and their default values.
 */
argparse::ArgumentParser makeArgParser();

/*!
 * @brief Parses the program arguments, with the program name as tokens[0].
 *
 * @throw std::runtime_error on parsing failure (by argparse)
 * @throw std::invalid_argument if some value is out of its valid range
 */
ProgramArgs prepareProgramArgs(const std::vector<std::string>& tokens);

ProgramArgs prepareProgramArgs(int argc, char** argv);

#endif //REFNET_ARGS_H
