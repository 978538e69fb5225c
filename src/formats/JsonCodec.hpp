/**
 * @file JsonCodec.hpp
 * @brief JSON alignment format.
 *
 * Layout:
 *
 *   { "words": [ { "alignedWord": "THE", "start": 0.0, "end": 0.06,
 *                  "phonemes": [ ["DH", 0.0, 0.03], ["AH0", 0.03, 0.06] ] },
 *                { "start": 0.06, "end": 0.2 } ] }
 *
 * Array order is word order. An entry without "alignedWord" is a silence
 * spanning start..end.
 *
 * @section Dependencies
 * - Qt JSON (QJsonDocument)
 */

#pragma once
#include <QJsonObject>
#include "AlignmentCodec.hpp"

namespace pa::formats {

class JsonCodec : public AlignmentCodec {
public:
    std::string_view name() const override {
        return "json";
    }

    Result<std::vector<Word>> parse(std::string_view bytes) const override;
    Result<std::string> serialize(
            const std::vector<Word>& words) const override;

    static Result<std::vector<Word>> fromObject(const QJsonObject& json);
    static QJsonObject toObject(const std::vector<Word>& words);
};

} // namespace pa::formats
