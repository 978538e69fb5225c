/**
 * @file TextGridCodec.hpp
 * @brief Praat TextGrid format (long and short text layouts).
 *
 * Reading needs an interval tier whose name contains "word" and one whose
 * name contains "phon" (case-insensitive); other tiers are ignored. Each word
 * interval owns the phone intervals that end inside it, and those phones must
 * start and end on the word's boundaries within the contiguity tolerance.
 *
 * Phone marks equal to the configured silence mark ("sil") and empty marks
 * read as silence, as do empty word marks. Zero-length intervals are dropped.
 *
 * Writing produces the long layout with a "phone" tier followed by a "word"
 * tier.
 */

#pragma once
#include "AlignmentCodec.hpp"

namespace pa::formats {

class TextGridCodec : public AlignmentCodec {
public:
    std::string_view name() const override {
        return "textgrid";
    }

    Result<std::vector<Word>> parse(std::string_view bytes) const override;
    Result<std::string> serialize(
            const std::vector<Word>& words) const override;
};

} // namespace pa::formats
