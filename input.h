#ifndef REFNET_INPUT_H
#define REFNET_INPUT_H

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "Logger.h"
#include "ReferralGraph.h"

// (referrer, candidate)
using ReferralPair = std::pair<UserId, UserId>;

/*!
 * @brief Reads the referral list from given input stream.
 *
 * Format of input:
 *   - Each line contains 2 tokens "referrer candidate" separated by spaces or tabs;
 *   - Empty lines and lines starting with '#' (leading spaces ignored) are skipped.
 *
 * @param in Input stream
 * @return The list of (referrer, candidate) in input order
 * @throw std::invalid_argument if a line contains a number of tokens other than 2
 */
inline std::vector<ReferralPair> readReferrals(std::istream& in) {
    auto res = std::vector<ReferralPair>{};
    auto line = std::string{};

    for (std::size_t lineNo = 1; std::getline(in, line); lineNo++) {
        auto tokens = std::vector<std::string>{};
        auto iss = std::istringstream(line);
        for (std::string token; iss >> token; ) {
            tokens.push_back(std::move(token));
        }
        if (tokens.empty() || tokens[0].starts_with('#')) {
            continue;
        }
        if (tokens.size() != 2) {
            throw std::invalid_argument(fmt::format(
                    "Line {}: expects 'referrer candidate', got {} token(s)", lineNo, tokens.size()));
        }
        res.emplace_back(std::move(tokens[0]), std::move(tokens[1]));
    }
    return res;
}

/*!
 * @brief Reads the referral list from given file path.
 *
 * See readReferrals(std::istream&) for details.
 *
 * @param path Path of the input file
 * @throw std::invalid_argument if the file fails to open, or the content is malformed
 */
inline std::vector<ReferralPair> readReferrals(const fs::path& path) {
    auto fin = std::ifstream(path);
    if (!fin.is_open()) {
        throw std::invalid_argument(fmt::format("Referral file '{}' not found!", path.string()));
    }
    return readReferrals(fin);
}

struct LoadSummary {
    std::size_t accepted = 0;
    std::size_t rejected = 0;
};

/*!
 * @brief Adds all the referrals to the graph in order.
 *
 * Rejected referrals are logged as warnings and skipped.
 */
inline LoadSummary loadReferrals(ReferralGraph& graph, const std::vector<ReferralPair>& referrals) {
    auto res = LoadSummary{};
    for (const auto& [referrer, candidate]: referrals) {
        if (auto added = graph.addReferral(referrer, candidate); added) {
            res.accepted += 1;
        } else {
            res.rejected += 1;
            LOG_WARNING(fmt::format("Referral '{}' -> '{}' rejected. {}", referrer, candidate, toString(added.error())));
        }
    }
    return res;
}

#endif //REFNET_INPUT_H
