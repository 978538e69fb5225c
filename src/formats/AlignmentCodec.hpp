/**
 * @file AlignmentCodec.hpp
 * @brief Interface shared by the alignment file formats.
 *
 * A codec turns the bytes of one file format into words and back. Codecs are
 * stateless: parse() and serialize() may be called any number of times, from
 * any thread, without affecting each other.
 *
 * parse() only reports what the format itself can detect (syntax, missing
 * fields, bad numbers, cross-tier mismatches). Contiguity of the returned
 * words is checked by Alignment afterwards.
 */

#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "alignment/Word.hpp"
#include "util/Result.hpp"

namespace pa::formats {

class AlignmentCodec {
public:
    virtual ~AlignmentCodec() = default;

    virtual std::string_view name() const = 0;

    virtual Result<std::vector<Word>> parse(std::string_view bytes) const = 0;
    virtual Result<std::string> serialize(
            const std::vector<Word>& words) const = 0;
};

} // namespace pa::formats
