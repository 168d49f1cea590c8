#ifndef REFNET_UTILS_TIMER_H
#define REFNET_UTILS_TIMER_H

/*!
 * @file utils/Timer.h
 * @brief A lightweight timer based on the steady clock
 */

#include <chrono>

namespace utils {
    class Timer {
    public:
        using Clock = std::chrono::steady_clock;
        // In seconds
        using Duration = std::chrono::duration<double>;

    private:
        Clock::time_point start = Clock::now();

    public:
        /*!
         * @brief Timer starts automatically on construction.
         */
        Timer() = default;

        void restart() {
            start = Clock::now();
        }

        /*!
         * @brief Gets the time elapsed since the timer starts.
         *
         * To get the seconds as a floating point value, call elapsed().count().
         */
        [[nodiscard]] Duration elapsed() const {
            return std::chrono::duration_cast<Duration>(Clock::now() - start);
        }
    };
}

#endif //REFNET_UTILS_TIMER_H
