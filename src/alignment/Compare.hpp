/**
 * @file Compare.hpp
 * @brief Relative speaking rate between two alignments of the same text.
 *
 * Both alignments must hold the same number of phonemes; phoneme i of one
 * is taken to correspond to phoneme i of the other. A rate of 2 means the
 * target spends twice as long on that phoneme as the source.
 */

#pragma once
#include <optional>
#include <vector>
#include "Alignment.hpp"

namespace pa::compare {

// target.duration / source.duration for each phoneme pair
Result<std::vector<f64>> perPhonemeRate(const Alignment& source,
                                        const Alignment& target);

// The per-phoneme rate of the source phoneme active at each of frameCount
// evenly spaced times from source start to source end (inclusive). By
// default one frame per hop plus one for the end point.
Result<std::vector<f64>> perFrameRate(const Alignment& source,
                                      const Alignment& target,
                                      u32 sampleRate,
                                      u32 hopsize,
                                      std::optional<usize> frameCount = std::nullopt);

} // namespace pa::compare
