/**
 * @file ConfigParsers.hpp
 * @brief TOML parsing and serialization logic.
 *
 * This file defines the ConfigParsers class which handles the conversion
 * between TOML data structures and the library's C++ configuration structs.
 *
 * @section Dependencies
 * - toml++
 * - ConfigData
 */

#pragma once
#include <toml++/toml.h>
#include "ConfigData.hpp"

namespace pa {

class ConfigParsers {
public:
    static void parseAlignment(const toml::table& tbl, AlignmentConfig& cfg);
    static void parseFrames(const toml::table& tbl, FrameConfig& cfg);
    static void parseTextGrid(const toml::table& tbl, TextGridConfig& cfg);
    static void parseJson(const toml::table& tbl, JsonConfig& cfg);
    static void parseLog(const toml::table& tbl, LogConfig& cfg);

    static toml::table serialize(const AlignmentConfig& alignment,
                                 const FrameConfig& frames,
                                 const TextGridConfig& textgrid,
                                 const JsonConfig& json,
                                 const LogConfig& log,
                                 bool debug);
};

} // namespace pa
