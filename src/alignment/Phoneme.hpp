#pragma once
// Phoneme.hpp - One labelled, timed phoneme interval

#include <string>
#include <string_view>
#include <utility>
#include "util/Types.hpp"

namespace pa {

// Reserved label for non-speech intervals (words and phonemes alike)
inline constexpr std::string_view kSilence = "sp";

class Phoneme {
public:
    Phoneme(std::string label, Seconds start, Seconds end)
        : label_(std::move(label)), start_(start), end_(end) {
    }

    const std::string& label() const {
        return label_;
    }
    Seconds start() const {
        return start_;
    }
    Seconds end() const {
        return end_;
    }
    Seconds duration() const {
        return end_ - start_;
    }
    bool isSilence() const {
        return label_ == kSilence;
    }

    // Exact comparison of label and both boundaries
    bool operator==(const Phoneme& other) const {
        return label_ == other.label_ && start_ == other.start_ &&
               end_ == other.end_;
    }
    bool operator!=(const Phoneme& other) const {
        return !(*this == other);
    }

    bool approxEquals(const Phoneme& other, Seconds tolerance) const;

    std::string toText() const {
        return label_;
    }

private:
    friend class Alignment;
    friend class Word;

    void setBounds(Seconds start, Seconds end) {
        start_ = start;
        end_ = end;
    }

    std::string label_;
    Seconds start_{0.0};
    Seconds end_{0.0};
};

} // namespace pa
