/**
 * @file ConfigData.hpp
 * @brief Configuration data structures.
 *
 * This file defines the POD (Plain Old Data) structs used to hold configuration
 * values. It is separated from the logic classes to keep headers lean and
 * avoid circular dependencies.
 */

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include "util/Types.hpp"

namespace pa {

namespace fs = std::filesystem;

// How a fractional frame position is turned into a frame index
enum class FrameRounding {
    HalfUp,   // floor(x + 0.5)
    HalfEven, // banker's rounding
    Floor     // truncation toward zero for non-negative times
};

inline constexpr FrameRounding kDefaultFrameRounding = FrameRounding::HalfUp;

std::string_view toString(FrameRounding rounding);
std::optional<FrameRounding> frameRoundingFromString(std::string_view name);

// Validation of parsed and constructed alignments
struct AlignmentConfig {
    // Boundaries closer than this many seconds are treated as one boundary
    f64 contiguityTolerance{1e-4};
};

struct FrameConfig {
    FrameRounding rounding{kDefaultFrameRounding};
};

struct TextGridConfig {
    // Phone-tier mark that reads as, and is written for, silence
    std::string silenceMark{"sil"};
};

struct JsonConfig {
    bool indent{true};
};

struct LogConfig {
    fs::path file; // empty: console only
};

} // namespace pa
