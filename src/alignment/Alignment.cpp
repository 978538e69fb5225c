#include "Alignment.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <type_traits>
#include <utility>
#include <spdlog/fmt/fmt.h>
#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "formats/CodecRegistry.hpp"
#include "formats/JsonCodec.hpp"
#include "util/FileUtils.hpp"

namespace pa {

namespace {

Seconds tolerance() {
    return std::as_const(CONFIG).alignment().contiguityTolerance;
}

template <typename T>
Result<T> emptyError(std::string_view what) {
    return Result<T>::err(ErrorCode::Empty,
                          fmt::format("{} of an empty alignment", what));
}

} // namespace

Result<Alignment> Alignment::create(AlignmentSource source) {
    return std::visit(
            [](auto&& value) -> Result<Alignment> {
                using T = std::decay_t<decltype(value)>;
                if constexpr (std::is_same_v<T, fs::path>) {
                    return load(value);
                } else if constexpr (std::is_same_v<T, std::vector<Word>>) {
                    return fromWords(std::move(value));
                } else {
                    return fromJson(value);
                }
            },
            std::move(source));
}

Result<Alignment> Alignment::load(const fs::path& path) {
    const auto* codec = formats::CodecRegistry::instance().forPath(path);
    if (codec == nullptr) {
        return Result<Alignment>::err(
                ErrorCode::Format,
                fmt::format("No alignment codec for extension '{}' ({})",
                            path.extension().string(),
                            path.string()));
    }

    auto text = file::readText(path);
    if (!text)
        return Result<Alignment>::err(text.error());

    auto words = codec->parse(text.value());
    if (!words) {
        return Result<Alignment>::err(
                words.error().code,
                fmt::format("{}: {}", path.string(), words.error().message));
    }

    auto alignment = validated(std::move(words).value());
    if (!alignment) {
        return Result<Alignment>::err(
                alignment.error().code,
                fmt::format("{}: {}",
                            path.string(),
                            alignment.error().message));
    }

    LOG_DEBUG("Alignment: Loaded {} words from {} ({})",
              alignment.value().size(),
              path.string(),
              codec->name());
    return alignment;
}

Result<Alignment> Alignment::fromWords(std::vector<Word> words) {
    return validated(std::move(words));
}

Result<Alignment> Alignment::fromJson(const QJsonObject& json) {
    auto words = formats::JsonCodec::fromObject(json);
    if (!words)
        return Result<Alignment>::err(words.error());
    return validated(std::move(words).value());
}

Result<Alignment> Alignment::validated(std::vector<Word> words) {
    const Seconds tol = tolerance();

    for (usize i = 0; i < words.size(); ++i) {
        auto& word = words[i];
        auto res = word.normalize(tol,
                                  fmt::format("word {} '{}'", i, word.label()));
        if (!res)
            return Result<Alignment>::err(res.error());

        if (i == 0)
            continue;

        const Seconds prevEnd = words[i - 1].end();
        const Seconds delta = word.start() - prevEnd;
        if (std::abs(delta) > tol) {
            return Result<Alignment>::err(
                    ErrorCode::Validation,
                    fmt::format("{} of {:.6f}s between word {} '{}' and word "
                                "{} '{}'",
                                delta > 0 ? "Gap" : "Overlap",
                                std::abs(delta),
                                i - 1,
                                words[i - 1].label(),
                                i,
                                word.label()));
        }
        if (delta != 0.0) {
            auto& first = word.phonemes_.front();
            first.setBounds(prevEnd, std::max(prevEnd, first.end()));
        }
    }

    return Result<Alignment>::ok(Alignment(std::move(words)));
}

std::vector<Phoneme> Alignment::phonemes() const {
    std::vector<Phoneme> result;
    result.reserve(phonemeCount());
    for (const auto& word : words_) {
        for (const auto& phoneme : word.phonemes())
            result.push_back(phoneme);
    }
    return result;
}

usize Alignment::phonemeCount() const {
    usize count = 0;
    for (const auto& word : words_)
        count += word.size();
    return count;
}

Result<Seconds> Alignment::start() const {
    if (words_.empty())
        return emptyError<Seconds>("Start time");
    return Result<Seconds>::ok(words_.front().start());
}

Result<Seconds> Alignment::end() const {
    if (words_.empty())
        return emptyError<Seconds>("End time");
    return Result<Seconds>::ok(words_.back().end());
}

Result<Seconds> Alignment::duration() const {
    if (words_.empty())
        return emptyError<Seconds>("Duration");
    return Result<Seconds>::ok(words_.back().end() - words_.front().start());
}

Result<Word> Alignment::at(usize i) const {
    if (i >= words_.size()) {
        return Result<Word>::err(
                ErrorCode::Range,
                fmt::format("Word index {} out of range for alignment with {} "
                            "words",
                            i,
                            words_.size()));
    }
    return Result<Word>::ok(words_[i]);
}

Result<Alignment> Alignment::slice(usize begin, usize end) const {
    if (begin > end || end > words_.size()) {
        return Result<Alignment>::err(
                ErrorCode::Range,
                fmt::format("Slice [{}, {}) out of range for alignment with {} "
                            "words",
                            begin,
                            end,
                            words_.size()));
    }
    return Result<Alignment>::ok(Alignment(std::vector<Word>(
            words_.begin() + static_cast<std::ptrdiff_t>(begin),
            words_.begin() + static_cast<std::ptrdiff_t>(end))));
}

Alignment Alignment::concat(const Alignment& other) const {
    if (words_.empty())
        return other;
    if (other.words_.empty())
        return *this;

    std::vector<Word> words = words_;
    words.reserve(words_.size() + other.words_.size());

    Seconds cursor = words_.back().end();
    for (auto word : other.words_) {
        word.placeAt(cursor);
        cursor = word.end();
        words.push_back(std::move(word));
    }
    return Alignment(std::move(words));
}

Result<Alignment> Alignment::replace(usize begin,
                                     usize end,
                                     std::vector<Word> words) const {
    if (begin > end || end > words_.size()) {
        return Result<Alignment>::err(
                ErrorCode::Range,
                fmt::format("Replace range [{}, {}) out of range for "
                            "alignment with {} words",
                            begin,
                            end,
                            words_.size()));
    }

    const Seconds tol = tolerance();
    for (usize i = 0; i < words.size(); ++i) {
        auto res = words[i].normalize(
                tol,
                fmt::format("replacement word {} '{}'", i, words[i].label()));
        if (!res)
            return Result<Alignment>::err(res.error());
    }

    // The replaced range begins where word `begin` began (or where the
    // alignment ends when appending)
    std::optional<Seconds> cursor;
    if (begin < words_.size())
        cursor = words_[begin].start();
    else if (!words_.empty())
        cursor = words_.back().end();

    std::vector<Word> result(words_.begin(),
                             words_.begin() + static_cast<std::ptrdiff_t>(begin));
    result.reserve(words_.size() - (end - begin) + words.size());

    auto append = [&](Word word) {
        if (cursor)
            word.placeAt(*cursor);
        cursor = word.end();
        result.push_back(std::move(word));
    };

    for (auto& word : words)
        append(std::move(word));
    for (usize i = end; i < words_.size(); ++i)
        append(words_[i]);

    return Result<Alignment>::ok(Alignment(std::move(result)));
}

bool Alignment::approxEquals(const Alignment& other, Seconds tolerance) const {
    if (words_.size() != other.words_.size())
        return false;
    for (usize i = 0; i < words_.size(); ++i) {
        if (!words_[i].approxEquals(other.words_[i], tolerance))
            return false;
    }
    return true;
}

i64 Alignment::find(std::string_view text) const {
    std::vector<std::string> tokens;
    {
        std::istringstream ss{std::string(text)};
        std::string token;
        while (ss >> token)
            tokens.push_back(token);
    }
    if (tokens.empty())
        return -1;

    for (usize i = 0; i < words_.size(); ++i) {
        if (words_[i].isSilence())
            continue;

        usize matched = 0;
        usize k = i;
        while (matched < tokens.size() && k < words_.size()) {
            if (words_[k].label() != tokens[matched])
                break;
            ++matched;
            ++k;
            while (k < words_.size() && words_[k].isSilence())
                ++k;
        }

        if (matched == tokens.size())
            return static_cast<i64>(i);
    }
    return -1;
}

const Word* Alignment::wordAtTime(Seconds time) const {
    if (words_.empty() || time < words_.front().start() ||
        time > words_.back().end())
        return nullptr;

    for (const auto& word : words_) {
        if (word.start() <= time && time < word.end())
            return &word;
    }
    return &words_.back();
}

const Phoneme* Alignment::phonemeAtTime(Seconds time) const {
    const auto* word = wordAtTime(time);
    return word ? word->phonemeAtTime(time) : nullptr;
}

std::optional<usize> Alignment::phonemeIndexAtTime(Seconds time) const {
    if (words_.empty() || time < words_.front().start() ||
        time > words_.back().end())
        return std::nullopt;

    usize index = 0;
    for (const auto& word : words_) {
        for (const auto& phoneme : word.phonemes()) {
            if (phoneme.start() <= time && time < phoneme.end())
                return index;
            ++index;
        }
    }
    return index - 1;
}

Result<std::vector<FrameBounds>> Alignment::wordBounds(u32 sampleRate,
                                                       u32 hopsize,
                                                       bool silences) const {
    if (sampleRate == 0 || hopsize == 0) {
        return Result<std::vector<FrameBounds>>::err(
                ErrorCode::Range, "Sample rate and hopsize must be positive");
    }
    if (words_.empty())
        return Result<std::vector<FrameBounds>>::ok({});

    std::vector<Seconds> edges;
    edges.reserve(words_.size() + 1);
    edges.push_back(words_.front().start());
    for (const auto& word : words_)
        edges.push_back(word.end());

    auto all = frames::boundsFromEdges(
            edges, sampleRate, hopsize, frames::activeRounding());
    if (silences)
        return Result<std::vector<FrameBounds>>::ok(std::move(all));

    std::vector<FrameBounds> bounds;
    for (usize i = 0; i < words_.size(); ++i) {
        if (!words_[i].isSilence())
            bounds.push_back(all[i]);
    }
    return Result<std::vector<FrameBounds>>::ok(std::move(bounds));
}

Result<std::vector<FrameBounds>> Alignment::phonemeBounds(u32 sampleRate,
                                                          u32 hopsize,
                                                          bool silences) const {
    if (sampleRate == 0 || hopsize == 0) {
        return Result<std::vector<FrameBounds>>::err(
                ErrorCode::Range, "Sample rate and hopsize must be positive");
    }
    if (words_.empty())
        return Result<std::vector<FrameBounds>>::ok({});

    auto flat = phonemes();
    std::vector<Seconds> edges;
    edges.reserve(flat.size() + 1);
    edges.push_back(flat.front().start());
    for (const auto& phoneme : flat)
        edges.push_back(phoneme.end());

    auto all = frames::boundsFromEdges(
            edges, sampleRate, hopsize, frames::activeRounding());
    if (silences)
        return Result<std::vector<FrameBounds>>::ok(std::move(all));

    std::vector<FrameBounds> bounds;
    for (usize i = 0; i < flat.size(); ++i) {
        if (!flat[i].isSilence())
            bounds.push_back(all[i]);
    }
    return Result<std::vector<FrameBounds>>::ok(std::move(bounds));
}

Result<std::vector<i64>> Alignment::framewisePhonemeIndices(
        const PhonemeMap& phonemeMap,
        Seconds hopsize,
        const std::optional<std::vector<Seconds>>& times) const {
    using R = Result<std::vector<i64>>;
    if (words_.empty())
        return emptyError<std::vector<i64>>("Frame labels");

    std::vector<Seconds> frameTimes;
    if (times) {
        frameTimes = *times;
    } else {
        if (!(hopsize > 0.0))
            return R::err(ErrorCode::Range, "Hopsize must be positive");
        frameTimes = frames::frameTimes(
                words_.front().start(), words_.back().end(), hopsize);
    }

    std::vector<i64> indices;
    indices.reserve(frameTimes.size());
    for (auto time : frameTimes) {
        const auto* phoneme = phonemeAtTime(time);
        if (phoneme == nullptr) {
            return R::err(ErrorCode::Range,
                          fmt::format("No phoneme at {}s; alignment spans "
                                      "[{}, {}]",
                                      time,
                                      words_.front().start(),
                                      words_.back().end()));
        }
        auto it = phonemeMap.find(phoneme->label());
        if (it == phonemeMap.end()) {
            return R::err(ErrorCode::Lookup,
                          fmt::format("Phoneme '{}' at {}s is not in the "
                                      "phoneme map",
                                      phoneme->label(),
                                      time));
        }
        indices.push_back(it->second);
    }
    return R::ok(std::move(indices));
}

Result<void> Alignment::update(usize idx,
                               const std::vector<Seconds>& durations,
                               std::optional<Seconds> start) {
    const usize total = phonemeCount();
    if (idx >= total) {
        return Result<void>::err(
                ErrorCode::Range,
                fmt::format("Phoneme index {} out of range for alignment with "
                            "{} phonemes",
                            idx,
                            total));
    }
    if (durations.size() > total - idx) {
        return Result<void>::err(
                ErrorCode::Range,
                fmt::format("{} durations given from phoneme {}, but only {} "
                            "phonemes remain",
                            durations.size(),
                            idx,
                            total - idx));
    }
    for (usize k = 0; k < durations.size(); ++k) {
        if (!std::isfinite(durations[k]) || durations[k] < 0.0) {
            return Result<void>::err(
                    ErrorCode::Validation,
                    fmt::format("Invalid duration {} for phoneme {}",
                                durations[k],
                                idx + k));
        }
    }

    std::vector<Phoneme*> flat;
    flat.reserve(total);
    for (auto& word : words_) {
        for (auto& phoneme : word.phonemes_)
            flat.push_back(&phoneme);
    }

    Seconds cursor = flat[idx]->start();
    if (start) {
        if (!std::isfinite(*start)) {
            return Result<void>::err(ErrorCode::Validation,
                                     "Start time must be finite");
        }
        cursor = *start;
        if (idx > 0) {
            const Seconds prevEnd = flat[idx - 1]->end();
            if (std::abs(cursor - prevEnd) > tolerance()) {
                return Result<void>::err(
                        ErrorCode::Validation,
                        fmt::format("Start {}s for phoneme {} would detach it "
                                    "from phoneme {} ending at {}s",
                                    cursor,
                                    idx,
                                    idx - 1,
                                    prevEnd));
            }
            cursor = prevEnd;
        }
    }

    usize g = idx;
    for (; g < idx + durations.size(); ++g) {
        flat[g]->setBounds(cursor, cursor + durations[g - idx]);
        cursor = flat[g]->end();
    }

    // Untouched durations: shift by one offset so shared boundaries stay
    // bit-identical
    if (g < total) {
        const Seconds offset = cursor - flat[g]->start();
        if (offset != 0.0) {
            for (; g < total; ++g) {
                flat[g]->setBounds(cursor, flat[g]->end() + offset);
                cursor = flat[g]->end();
            }
        }
    }
    return Result<void>::ok();
}

Result<void> Alignment::save(const fs::path& path) const {
    const auto* codec = formats::CodecRegistry::instance().forPath(path);
    if (codec == nullptr) {
        return Result<void>::err(
                ErrorCode::Format,
                fmt::format("No save routine for files with extension '{}'",
                            path.extension().string()));
    }

    auto bytes = codec->serialize(words_);
    if (!bytes)
        return Result<void>::err(bytes.error());

    auto written = file::writeText(path, bytes.value());
    if (!written)
        return written;

    LOG_DEBUG("Alignment: Saved {} words to {} ({})",
              words_.size(),
              path.string(),
              codec->name());
    return Result<void>::ok();
}

QJsonObject Alignment::toJson() const {
    return formats::JsonCodec::toObject(words_);
}

std::string Alignment::toText() const {
    std::string text;
    for (const auto& word : words_) {
        if (word.isSilence())
            continue;
        if (!text.empty())
            text += ' ';
        text += word.label();
    }
    return text;
}

} // namespace pa
