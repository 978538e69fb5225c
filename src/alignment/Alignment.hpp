/**
 * @file Alignment.hpp
 * @brief Word/phoneme timing of one utterance.
 *
 * This file defines the Alignment class, the aggregate root of the library.
 * An Alignment owns an ordered, contiguous sequence of Words (each owning its
 * Phonemes) and answers time, frame and text queries about it.
 *
 * Alignments are built through the static factories, which validate the
 * contiguity invariant: every word (and phoneme) starts exactly where the
 * previous one ends. Boundaries closer than the configured tolerance are
 * unified; anything further apart is rejected, never patched.
 *
 * update() is the only mutating operation. slice(), concat() and replace()
 * return independent copies.
 *
 * @section Dependencies
 * - Word, Phoneme
 * - FrameMapper
 * - CodecRegistry (load / save)
 * - Qt JSON (in-memory JSON source)
 */

#pragma once
#include <QJsonObject>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include "FrameMapper.hpp"
#include "Word.hpp"
#include "util/Result.hpp"

namespace pa {

namespace fs = std::filesystem;

// Label -> class index used by framewisePhonemeIndices()
using PhonemeMap = std::map<std::string, i64, std::less<>>;

// A file on disk, pre-built words, or an object in the JSON codec's schema
using AlignmentSource = std::variant<fs::path, std::vector<Word>, QJsonObject>;

class Alignment {
public:
    // Empty alignment
    Alignment() = default;

    static Result<Alignment> create(AlignmentSource source);
    static Result<Alignment> load(const fs::path& path);
    static Result<Alignment> fromWords(std::vector<Word> words);
    static Result<Alignment> fromJson(const QJsonObject& json);

    const std::vector<Word>& words() const {
        return words_;
    }
    // Phonemes of all words, flattened in order
    std::vector<Phoneme> phonemes() const;

    usize size() const {
        return words_.size();
    }
    bool empty() const {
        return words_.empty();
    }
    usize phonemeCount() const;

    Result<Seconds> start() const;
    Result<Seconds> end() const;
    Result<Seconds> duration() const;

    const Word& operator[](usize i) const {
        return words_[i];
    }
    Result<Word> at(usize i) const;

    // Words [begin, end) with their absolute times
    Result<Alignment> slice(usize begin, usize end) const;

    // other's words follow ours, shifted to start at our end
    Alignment concat(const Alignment& other) const;
    Alignment operator+(const Alignment& other) const {
        return concat(other);
    }

    // Words [begin, end) swapped for words, later words shifted to follow
    Result<Alignment> replace(usize begin,
                              usize end,
                              std::vector<Word> words) const;

    bool operator==(const Alignment& other) const {
        return words_ == other.words_;
    }
    bool operator!=(const Alignment& other) const {
        return !(*this == other);
    }
    bool approxEquals(const Alignment& other, Seconds tolerance) const;

    // Index of the first word of a run of non-silence words whose labels are
    // the whitespace-separated tokens of text; silence between matched words
    // is skipped. -1 if there is no such run.
    i64 find(std::string_view text) const;

    const Word* wordAtTime(Seconds time) const;
    const Phoneme* phonemeAtTime(Seconds time) const;
    std::optional<usize> phonemeIndexAtTime(Seconds time) const;

    Result<std::vector<FrameBounds>> wordBounds(u32 sampleRate,
                                                u32 hopsize = 1,
                                                bool silences = true) const;
    Result<std::vector<FrameBounds>> phonemeBounds(u32 sampleRate,
                                                   u32 hopsize = 1,
                                                   bool silences = true) const;

    // One phonemeMap index per frame. Frames sit every hopsize seconds from
    // start() up to (excluding) end(), or at the explicit times given.
    Result<std::vector<i64>> framewisePhonemeIndices(
            const PhonemeMap& phonemeMap,
            Seconds hopsize,
            const std::optional<std::vector<Seconds>>& times =
                    std::nullopt) const;

    // Rewrites phoneme boundaries from global phoneme index idx onward.
    // Phoneme idx starts at start (default: where it starts now), phoneme
    // idx + k lasts durations[k], later phonemes keep their durations and
    // are shifted to stay contiguous.
    Result<void> update(usize idx = 0,
                        const std::vector<Seconds>& durations = {},
                        std::optional<Seconds> start = std::nullopt);

    Result<void> save(const fs::path& path) const;

    QJsonObject toJson() const;

    // Non-silence word labels joined by single spaces
    std::string toText() const;

private:
    explicit Alignment(std::vector<Word> words) : words_(std::move(words)) {
    }

    static Result<Alignment> validated(std::vector<Word> words);

    std::vector<Word> words_;
};

} // namespace pa
