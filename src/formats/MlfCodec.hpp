/**
 * @file MlfCodec.hpp
 * @brief HTK master label file (MLF) format.
 *
 * One utterance per file:
 *
 *   #!MLF!#
 *   "*\/utt.lab"
 *   0 300000 DH -120.5 THE
 *   300000 600000 AH0 -98.2
 *   .
 *
 * Label lines are "start end phone [score [word]]" with times in 100 ns
 * ticks. A line carrying a word label starts that word; following lines
 * without one continue it.
 */

#pragma once
#include "AlignmentCodec.hpp"

namespace pa::formats {

class MlfCodec : public AlignmentCodec {
public:
    // HTK time unit: ticks per second
    static constexpr f64 kTicksPerSecond = 1e7;

    std::string_view name() const override {
        return "mlf";
    }

    Result<std::vector<Word>> parse(std::string_view bytes) const override;
    Result<std::string> serialize(
            const std::vector<Word>& words) const override;
};

} // namespace pa::formats
