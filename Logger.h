#ifndef REFNET_LOGGER_H
#define REFNET_LOGGER_H

#include <algorithm>
#include <array>
#include <cctype>
#include <compare>
#include <ctime>
#include <iostream>
#include <memory>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <syncstream>
#include <vector>
#include <fmt/chrono.h>
#include "global.h"

namespace logger {
    enum class LogLevel { Debug, Info, Warning, Error, Critical };

    constexpr std::size_t nLogLevels = 5;

    inline auto operator <=> (LogLevel lhs, LogLevel rhs) {
        return static_cast<int>(lhs) <=> static_cast<int>(rhs);
    }

    // Levels from Warning on are in upper case to stand out
    constexpr const char* toString(LogLevel level) {
        constexpr auto names = std::array<const char*, nLogLevels>{
            "debug", "info", "WARNING", "ERROR", "CRITICAL"
        };
        auto index = static_cast<std::size_t>(level);
        return index < nLogLevels ? names[index] : "(ERROR)";
    }

    /*!
     * @brief Gets the log level by its case-insensitive name.
     *
     * @param name One of debug, info, warning, error, critical
     * @throw std::invalid_argument if the name matches none of them
     */
    inline LogLevel logLevelOf(std::string_view name) {
        auto lower = std::string(name);
        rs::transform(lower, lower.begin(), [](unsigned char c) { return (char)std::tolower(c); });

        for (std::size_t i = 0; i < nLogLevels; i++) {
            auto level = static_cast<LogLevel>(i);
            auto candidate = std::string(toString(level));
            rs::transform(candidate, candidate.begin(), [](unsigned char c) { return (char)std::tolower(c); });
            if (lower == candidate) {
                return level;
            }
        }
        throw std::invalid_argument(fmt::format("Unknown log level '{}'", name));
    }

    /*!
     * @brief Layout of the head of each log line, e.g. "[10-19 14:03:22][simulate.cpp:57] info: ".
     */
    struct LogHeadFormat {
        // Chrono specifiers of fmt
        std::string timeFormat      = "%m-%d %T";
        // Whether the logger id is put after the time stamp
        bool        withId          = false;
        // Whether the function name is put after the line number
        bool        withFunction    = false;
    };

    class Logger {
        std::string     _id;
        std::ostream&   out;
        LogHeadFormat   headFormat;
        LogLevel        minLevel;

    public:
        Logger(std::string id, std::ostream& out, LogLevel minLevel, LogHeadFormat headFormat = {}):
                _id(std::move(id)), out(out), headFormat(std::move(headFormat)), minLevel(minLevel) {}

        [[nodiscard]] const std::string& id() const {
            return _id;
        }

        [[nodiscard]] LogLevel level() const {
            return minLevel;
        }

        void setMinLevel(LogLevel level) {
            minLevel = level;
        }

        void setHeadFormat(LogHeadFormat format) {
            headFormat = std::move(format);
        }

        // Messages lower than the minimum level are dropped
        void log(LogLevel level, std::string_view content,
                 const std::source_location loc = std::source_location::current()) const {
            if (level < minLevel) {
                return;
            }
            std::osyncstream(out) << head(level, loc) << content << '\n';
        }

    private:
        [[nodiscard]] std::string head(LogLevel level, const std::source_location& loc) const {
            auto now = ch::system_clock::to_time_t(ch::system_clock::now());
            auto res = fmt::format("[{}]", fmt::format(fmt::runtime("{:" + headFormat.timeFormat + "}"),
                                                      fmt::localtime(now)));
            if (headFormat.withId) {
                res += fmt::format("[{}]", _id);
            }
            // Parent directories of the source file are stripped
            res += fmt::format("[{}:{}", fs::path(loc.file_name()).filename().string(), loc.line());
            if (headFormat.withFunction) {
                res += fmt::format(" {}", loc.function_name());
            }
            return res + fmt::format("] {}: ", toString(level));
        }
    };

    /*!
     * @brief Process-wide list of loggers. Each message is dispatched to all of them,
     * and nothing is output while the list is empty.
     */
    class Loggers {
        static inline std::vector<std::shared_ptr<Logger>> registered;

        static auto find(std::string_view id) {
            return rs::find(registered, id, [](const auto& p) -> std::string_view { return p->id(); });
        }

    public:
        // Returns false if another logger with the same id exists
        static bool add(std::shared_ptr<Logger> logger) {
            if (find(logger->id()) != registered.end()) {
                return false;
            }
            registered.push_back(std::move(logger));
            return true;
        }

        static bool remove(std::string_view id) {
            if (auto it = find(id); it != registered.end()) {
                registered.erase(it);
                return true;
            }
            return false;
        }

        // nullptr if not found
        static std::shared_ptr<Logger> get(std::string_view id) {
            auto it = find(id);
            return it != registered.end() ? *it : nullptr;
        }

        static void log(LogLevel level, std::string_view content,
                        const std::source_location loc = std::source_location::current()) {
            for (const auto& p: registered) {
                p->log(level, content, loc);
            }
        }
    };
}

// LOG_LEVEL filters at compile time: 0 = all, 1 = from info, 2 = from warning, 3 = from error.
// Critical messages are never filtered.
#ifndef LOG_LEVEL
#define LOG_LEVEL 0
#endif

#define REFNET_LOG(level, ...) logger::Loggers::log(logger::LogLevel::level, __VA_ARGS__)

#if LOG_LEVEL <= 0
#define LOG_DEBUG(...) REFNET_LOG(Debug, __VA_ARGS__)
#else
#define LOG_DEBUG(...) ((void)0)
#endif

#if LOG_LEVEL <= 1
#define LOG_INFO(...) REFNET_LOG(Info, __VA_ARGS__)
#else
#define LOG_INFO(...) ((void)0)
#endif

#if LOG_LEVEL <= 2
#define LOG_WARNING(...) REFNET_LOG(Warning, __VA_ARGS__)
#else
#define LOG_WARNING(...) ((void)0)
#endif

#if LOG_LEVEL <= 3
#define LOG_ERROR(...) REFNET_LOG(Error, __VA_ARGS__)
#else
#define LOG_ERROR(...) ((void)0)
#endif

#define LOG_CRITICAL(...) REFNET_LOG(Critical, __VA_ARGS__)

#endif //REFNET_LOGGER_H
