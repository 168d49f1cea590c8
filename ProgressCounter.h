#ifndef REFNET_PROGRESSCOUNTER_H
#define REFNET_PROGRESSCOUNTER_H

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include "Logger.h"
#include "utils/Timer.h"

/*!
 * @brief Logs the progress of a long loop each time another logPerPercentage percent is finished.
 */
class ProgressCounter {
    std::string         name;

    std::uint64_t       finished;
    std::uint64_t       total;

    double              logPerPercentage;
    logger::LogLevel    level;
    utils::Timer        timer;

public:
    ProgressCounter(std::string name, std::uint64_t total, double logPerPercentage = 10.0,
                    logger::LogLevel level = logger::LogLevel::Debug):
    name(std::move(name)), finished(0), total(total), logPerPercentage(logPerPercentage), level(level) {}

    // Returns: whether a log message is triggered
    bool increment(std::uint64_t n = 1) {
        if (total == 0) {
            return false;
        }
        auto before = finished;
        finished = std::min(finished + n, total);

        auto r0 = 100.0 * (double)before   / (double)total;
        auto r1 = 100.0 * (double)finished / (double)total;
        auto triggered = std::floor(r0 / logPerPercentage) != std::floor(r1 / logPerPercentage);

        if (triggered) {
            logger::Loggers::log(level, fmt::format("{}: {:.1f}% finished. Time elapsed = {:.3f} sec.",
                                                    name, r1, timer.elapsed().count()));
        }
        return triggered;
    }
};

#endif //REFNET_PROGRESSCOUNTER_H
