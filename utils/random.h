#ifndef REFNET_UTILS_RANDOM_H
#define REFNET_UTILS_RANDOM_H

/*!
 * @file utils/random.h
 * @brief Helper for random generation
 */

#include <random>

namespace utils {
    /*!
     * @brief Factory function for std::mt19937 generator with given seed.
     *
     * If seed is left as 0, a seed from std::random_device is used,
     * so the generated sequence is not reproducible.
     *
     * @param seed seed of the random generator (default = 0)
     * @return a std::mt19937 object
     */
    inline std::mt19937 makeGenerator(unsigned seed = 0) {
        return std::mt19937(seed != 0 ? seed : std::random_device()());
    }
}

#endif //REFNET_UTILS_RANDOM_H
