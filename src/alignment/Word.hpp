#pragma once
// Word.hpp - A labelled word made of contiguous phonemes

#include <string>
#include <vector>
#include "Phoneme.hpp"
#include "util/Result.hpp"

namespace pa {

class Word {
public:
    Word(std::string label, std::vector<Phoneme> phonemes)
        : label_(std::move(label)), phonemes_(std::move(phonemes)) {
    }

    // Checks the phoneme invariants (non-empty, ordered, contiguous) before
    // constructing. Boundaries within tolerance are unified.
    static Result<Word> create(std::string label,
                               std::vector<Phoneme> phonemes,
                               Seconds tolerance);

    const std::string& label() const {
        return label_;
    }

    // Start of the first phoneme; 0 for a word without phonemes
    Seconds start() const {
        return phonemes_.empty() ? 0.0 : phonemes_.front().start();
    }
    // End of the last phoneme; 0 for a word without phonemes
    Seconds end() const {
        return phonemes_.empty() ? 0.0 : phonemes_.back().end();
    }
    Seconds duration() const {
        return end() - start();
    }
    bool isSilence() const {
        return label_ == kSilence;
    }

    usize size() const {
        return phonemes_.size();
    }
    bool empty() const {
        return phonemes_.empty();
    }

    const Phoneme& operator[](usize i) const {
        return phonemes_[i];
    }
    Result<Phoneme> at(usize i) const;

    // In-order view; iterate it as many times as needed
    const std::vector<Phoneme>& phonemes() const {
        return phonemes_;
    }

    // Phoneme whose [start, end) holds time. The last phoneme also owns the
    // word's end time. nullptr outside [start(), end()].
    const Phoneme* phonemeAtTime(Seconds time) const;

    bool operator==(const Word& other) const {
        return label_ == other.label_ && phonemes_ == other.phonemes_;
    }
    bool operator!=(const Word& other) const {
        return !(*this == other);
    }

    bool approxEquals(const Word& other, Seconds tolerance) const;

    std::string toText() const {
        return label_;
    }

private:
    friend class Alignment;

    // Snaps near-equal boundaries, fails on gaps, overlaps and inverted
    // intervals. "where" prefixes the error message.
    Result<void> normalize(Seconds tolerance, const std::string& where);

    void shift(Seconds offset);

    // Shifts the word so it starts exactly at cursor
    void placeAt(Seconds cursor);

    std::string label_;
    std::vector<Phoneme> phonemes_;
};

} // namespace pa
