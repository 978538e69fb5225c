#include "Word.hpp"
#include <cmath>
#include <algorithm>
#include <spdlog/fmt/fmt.h>

namespace pa {

Result<Word> Word::create(std::string label,
                          std::vector<Phoneme> phonemes,
                          Seconds tolerance) {
    Word word(std::move(label), std::move(phonemes));
    auto res = word.normalize(tolerance, fmt::format("word '{}'", word.label_));
    if (!res)
        return Result<Word>::err(res.error());
    return Result<Word>::ok(std::move(word));
}

Result<Phoneme> Word::at(usize i) const {
    if (i >= phonemes_.size()) {
        return Result<Phoneme>::err(
                ErrorCode::Range,
                fmt::format("Phoneme index {} out of range for word '{}' with "
                            "{} phonemes",
                            i,
                            label_,
                            phonemes_.size()));
    }
    return Result<Phoneme>::ok(phonemes_[i]);
}

const Phoneme* Word::phonemeAtTime(Seconds time) const {
    if (phonemes_.empty() || time < start() || time > end())
        return nullptr;

    for (const auto& phoneme : phonemes_) {
        if (phoneme.start() <= time && time < phoneme.end())
            return &phoneme;
    }
    return &phonemes_.back();
}

bool Word::approxEquals(const Word& other, Seconds tolerance) const {
    if (label_ != other.label_ || phonemes_.size() != other.phonemes_.size())
        return false;
    for (usize i = 0; i < phonemes_.size(); ++i) {
        if (!phonemes_[i].approxEquals(other.phonemes_[i], tolerance))
            return false;
    }
    return true;
}

Result<void> Word::normalize(Seconds tolerance, const std::string& where) {
    if (phonemes_.empty()) {
        return Result<void>::err(ErrorCode::Validation,
                                 where + " has no phonemes");
    }

    for (usize i = 0; i < phonemes_.size(); ++i) {
        auto& phoneme = phonemes_[i];
        if (!std::isfinite(phoneme.start()) || !std::isfinite(phoneme.end())) {
            return Result<void>::err(
                    ErrorCode::Validation,
                    fmt::format("{}: phoneme {} '{}' has a non-finite time",
                                where,
                                i,
                                phoneme.label()));
        }
        if (phoneme.end() < phoneme.start()) {
            return Result<void>::err(
                    ErrorCode::Validation,
                    fmt::format("{}: phoneme {} '{}' ends ({}) before it "
                                "starts ({})",
                                where,
                                i,
                                phoneme.label(),
                                phoneme.end(),
                                phoneme.start()));
        }
        if (i == 0)
            continue;

        const auto& prev = phonemes_[i - 1];
        Seconds delta = phoneme.start() - prev.end();
        if (std::abs(delta) > tolerance) {
            return Result<void>::err(
                    ErrorCode::Validation,
                    fmt::format("{}: {} of {:.6f}s between phoneme {} '{}' and "
                                "phoneme {} '{}'",
                                where,
                                delta > 0 ? "gap" : "overlap",
                                std::abs(delta),
                                i - 1,
                                prev.label(),
                                i,
                                phoneme.label()));
        }
        if (delta != 0.0) {
            // Keep the earlier boundary; never shrink below zero length
            phoneme.setBounds(prev.end(), std::max(prev.end(), phoneme.end()));
        }
    }
    return Result<void>::ok();
}

void Word::shift(Seconds offset) {
    for (auto& phoneme : phonemes_)
        phoneme.setBounds(phoneme.start() + offset, phoneme.end() + offset);
}

void Word::placeAt(Seconds cursor) {
    if (phonemes_.empty())
        return;
    const Seconds offset = cursor - start();
    if (offset != 0.0)
        shift(offset);
    auto& first = phonemes_.front();
    first.setBounds(cursor, std::max(cursor, first.end()));
}

} // namespace pa
