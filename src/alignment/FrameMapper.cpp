#include "FrameMapper.hpp"
#include <cmath>
#include <utility>
#include "core/Config.hpp"

namespace pa::frames {

namespace {
// Absorbs representation error such as 0.27 * 100 == 26.999999999999996
constexpr f64 kFrameEpsilon = 1e-9;
} // namespace

FrameRounding activeRounding() {
    return std::as_const(CONFIG).frames().rounding;
}

i64 round(f64 position, FrameRounding rounding) {
    switch (rounding) {
    case FrameRounding::HalfUp:
        return static_cast<i64>(std::floor(position + 0.5 + kFrameEpsilon));
    case FrameRounding::HalfEven: {
        f64 lower = std::floor(position);
        f64 frac = position - lower;
        if (std::abs(frac - 0.5) <= kFrameEpsilon) {
            auto base = static_cast<i64>(lower);
            return (base % 2 == 0) ? base : base + 1;
        }
        return static_cast<i64>(std::floor(position + 0.5));
    }
    case FrameRounding::Floor:
        return static_cast<i64>(std::floor(position + kFrameEpsilon));
    }
    return static_cast<i64>(std::floor(position + 0.5 + kFrameEpsilon));
}

i64 secondsToFrameIndex(Seconds seconds,
                        u32 sampleRate,
                        u32 hopsize,
                        FrameRounding rounding) {
    f64 position = seconds * static_cast<f64>(sampleRate) /
                   static_cast<f64>(hopsize);
    return round(position, rounding);
}

i64 secondsToFrameIndex(Seconds seconds, u32 sampleRate, u32 hopsize) {
    return secondsToFrameIndex(seconds, sampleRate, hopsize, activeRounding());
}

std::vector<FrameBounds> boundsFromEdges(const std::vector<Seconds>& edges,
                                         u32 sampleRate,
                                         u32 hopsize,
                                         FrameRounding rounding) {
    std::vector<FrameBounds> bounds;
    if (edges.size() < 2)
        return bounds;

    std::vector<i64> indices;
    indices.reserve(edges.size());
    for (auto edge : edges)
        indices.push_back(
                secondsToFrameIndex(edge, sampleRate, hopsize, rounding));

    bounds.reserve(edges.size() - 1);
    for (usize i = 0; i + 1 < indices.size(); ++i)
        bounds.push_back({indices[i], indices[i + 1]});
    return bounds;
}

std::vector<Seconds> frameTimes(Seconds start, Seconds end, Seconds hopsize) {
    std::vector<Seconds> times;
    if (hopsize <= 0.0 || end <= start)
        return times;

    auto count = static_cast<usize>(
            std::ceil((end - start) / hopsize - kFrameEpsilon));
    times.reserve(count);
    for (usize k = 0; k < count; ++k)
        times.push_back(start + static_cast<f64>(k) * hopsize);
    return times;
}

std::vector<Seconds> linspace(Seconds start, Seconds end, usize count) {
    std::vector<Seconds> times;
    if (count == 0)
        return times;
    if (count == 1) {
        times.push_back(start);
        return times;
    }

    times.reserve(count);
    f64 step = (end - start) / static_cast<f64>(count - 1);
    for (usize k = 0; k + 1 < count; ++k)
        times.push_back(start + static_cast<f64>(k) * step);
    times.push_back(end);
    return times;
}

} // namespace pa::frames
