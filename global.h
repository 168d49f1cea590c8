#ifndef REFNET_GLOBAL_H
#define REFNET_GLOBAL_H

#include <chrono>
#include <filesystem>
#include <ranges>
#include <version>
#include <fmt/format.h>

// Abbreviations for std sub-namespaces
namespace ch = std::chrono;
namespace fs = std::filesystem;
namespace rs = std::ranges;
namespace vs = std::views;

// Enables all the literals in namespace std
using namespace std::literals;

#endif //REFNET_GLOBAL_H
