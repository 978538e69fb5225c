#include "Compare.hpp"
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace pa::compare {

Result<std::vector<f64>> perPhonemeRate(const Alignment& source,
                                        const Alignment& target) {
    using R = Result<std::vector<f64>>;

    const auto sourcePhonemes = source.phonemes();
    const auto targetPhonemes = target.phonemes();
    if (sourcePhonemes.size() != targetPhonemes.size()) {
        return R::err(ErrorCode::Validation,
                      fmt::format("Alignments must have the same number of "
                                  "phonemes ({} vs {})",
                                  sourcePhonemes.size(),
                                  targetPhonemes.size()));
    }

    std::vector<f64> rates;
    rates.reserve(sourcePhonemes.size());
    for (usize i = 0; i < sourcePhonemes.size(); ++i) {
        const f64 from = sourcePhonemes[i].duration();
        const f64 to = targetPhonemes[i].duration();
        if (from == 0.0) {
            if (to != 0.0) {
                return R::err(ErrorCode::Validation,
                              fmt::format("Phoneme {} '{}' has zero duration "
                                          "in the source only",
                                          i,
                                          sourcePhonemes[i].label()));
            }
            rates.push_back(1.0);
            continue;
        }
        rates.push_back(to / from);
    }
    return R::ok(std::move(rates));
}

Result<std::vector<f64>> perFrameRate(const Alignment& source,
                                      const Alignment& target,
                                      u32 sampleRate,
                                      u32 hopsize,
                                      std::optional<usize> frameCount) {
    using R = Result<std::vector<f64>>;

    if (sampleRate == 0 || hopsize == 0)
        return R::err(ErrorCode::Range, "Sample rate and hopsize must be positive");

    auto rates = perPhonemeRate(source, target);
    if (!rates)
        return rates;

    auto start = source.start();
    auto end = source.end();
    if (!start || !end)
        return R::err(ErrorCode::Empty, "Cannot compare empty alignments");

    if (!frameCount) {
        // Round the end time first so 1.2 * 100 does not land on 119.99...
        const f64 rounded = std::round(*end * 1e6) / 1e6;
        frameCount = 1 + static_cast<usize>(std::floor(
                             rounded * static_cast<f64>(sampleRate) /
                             static_cast<f64>(hopsize) + 1e-9));
    }

    std::vector<f64> result;
    result.reserve(*frameCount);
    for (auto time : frames::linspace(*start, *end, *frameCount)) {
        auto index = source.phonemeIndexAtTime(time);
        if (!index) {
            return R::err(ErrorCode::Range,
                          fmt::format("No source phoneme at {}s", time));
        }
        result.push_back(rates.value()[*index]);
    }
    return R::ok(std::move(result));
}

} // namespace pa::compare
