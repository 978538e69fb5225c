#include "JsonCodec.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <algorithm>
#include <utility>
#include <spdlog/fmt/fmt.h>
#include "core/Config.hpp"
#include "core/Logger.hpp"

namespace pa::formats {

namespace {

using WordsResult = Result<std::vector<Word>>;

WordsResult formatError(const std::string& where, std::string_view what) {
    return WordsResult::err(ErrorCode::Format,
                            fmt::format("JSON {}: {}", where, what));
}

} // namespace

Result<std::vector<Word>> JsonCodec::parse(std::string_view bytes) const {
    QJsonParseError error;
    auto doc = QJsonDocument::fromJson(
            QByteArray(bytes.data(), static_cast<qsizetype>(bytes.size())),
            &error);

    if (error.error != QJsonParseError::NoError) {
        auto offset = std::min(static_cast<usize>(std::max(error.offset, 0)),
                               bytes.size());
        auto line = 1 + std::count(bytes.begin(),
                                   bytes.begin() + static_cast<std::ptrdiff_t>(offset),
                                   '\n');
        return WordsResult::err(
                ErrorCode::Format,
                fmt::format("JSON parse error at line {} (offset {}): {}",
                            line,
                            offset,
                            error.errorString().toStdString()));
    }
    if (!doc.isObject())
        return formatError("document", "top level is not an object");

    return fromObject(doc.object());
}

Result<std::vector<Word>> JsonCodec::fromObject(const QJsonObject& json) {
    if (!json.contains("words") || !json["words"].isArray())
        return formatError("document", "missing \"words\" array");

    std::vector<Word> words;
    const auto entries = json["words"].toArray();
    words.reserve(static_cast<usize>(entries.size()));

    for (qsizetype i = 0; i < entries.size(); ++i) {
        const auto where = fmt::format("words[{}]", i);
        if (!entries[i].isObject())
            return formatError(where, "entry is not an object");
        const auto entry = entries[i].toObject();

        if (!entry.contains("alignedWord")) {
            // Silence entries only carry their span
            if (!entry["start"].isDouble() || !entry["end"].isDouble()) {
                return formatError(where,
                                   "silence entry needs numeric \"start\" and "
                                   "\"end\"");
            }
            words.emplace_back(std::string(kSilence),
                               std::vector<Phoneme>{
                                       Phoneme(std::string(kSilence),
                                               entry["start"].toDouble(),
                                               entry["end"].toDouble())});
            continue;
        }

        if (!entry["alignedWord"].isString())
            return formatError(where + ".alignedWord", "not a string");
        if (!entry["phonemes"].isArray())
            return formatError(where + ".phonemes", "missing or not an array");

        const auto triples = entry["phonemes"].toArray();
        std::vector<Phoneme> phonemes;
        phonemes.reserve(static_cast<usize>(triples.size()));

        for (qsizetype j = 0; j < triples.size(); ++j) {
            const auto pwhere = fmt::format("{}.phonemes[{}]", where, j);
            if (!triples[j].isArray())
                return formatError(pwhere, "not a [label, start, end] array");

            const auto triple = triples[j].toArray();
            if (triple.size() != 3) {
                return formatError(pwhere,
                                   fmt::format("expected 3 elements, got {}",
                                               triple.size()));
            }
            if (!triple[0].isString())
                return formatError(pwhere + "[0]", "label is not a string");
            if (!triple[1].isDouble() || !triple[2].isDouble())
                return formatError(pwhere, "start/end are not numbers");

            phonemes.emplace_back(triple[0].toString().toStdString(),
                                  triple[1].toDouble(),
                                  triple[2].toDouble());
        }

        words.emplace_back(entry["alignedWord"].toString().toStdString(),
                           std::move(phonemes));
    }

    LOG_TRACE("JsonCodec: Parsed {} words", words.size());
    return WordsResult::ok(std::move(words));
}

QJsonObject JsonCodec::toObject(const std::vector<Word>& words) {
    QJsonArray entries;
    for (const auto& word : words) {
        QJsonArray phonemes;
        for (const auto& phoneme : word.phonemes()) {
            phonemes.append(QJsonArray{QString::fromStdString(phoneme.label()),
                                       phoneme.start(),
                                       phoneme.end()});
        }

        QJsonObject entry;
        entry["alignedWord"] = QString::fromStdString(word.label());
        entry["start"] = word.start();
        entry["end"] = word.end();
        entry["phonemes"] = phonemes;
        entries.append(entry);
    }

    QJsonObject root;
    root["words"] = entries;
    return root;
}

Result<std::string> JsonCodec::serialize(const std::vector<Word>& words) const {
    const auto& config = std::as_const(CONFIG);
    auto format = config.json().indent ? QJsonDocument::Indented
                                       : QJsonDocument::Compact;
    auto bytes = QJsonDocument(toObject(words)).toJson(format);
    return Result<std::string>::ok(
            std::string(bytes.constData(), static_cast<usize>(bytes.size())));
}

} // namespace pa::formats
