/**
 * @file FrameMapper.hpp
 * @brief Conversion between alignment time and fixed-hop frame indices.
 *
 * Feature pipelines see audio as frames advancing by hopsize samples. A time t
 * in seconds lands on frame round(t * sampleRate / hopsize), where the rounding
 * rule is a FrameRounding (HalfUp unless configured otherwise).
 *
 * Interval bounds are always derived from one ordered list of edges, so two
 * neighbouring intervals share the frame computed for their common edge and
 * the resulting ranges never gap or overlap.
 *
 * @section Dependencies
 * - Config (default rounding rule)
 */

#pragma once
#include <vector>
#include "core/ConfigData.hpp"
#include "util/Types.hpp"

namespace pa {

// Half-open [start, end) range of frame indices
struct FrameBounds {
    i64 start{0};
    i64 end{0};

    i64 size() const {
        return end - start;
    }
    bool operator==(const FrameBounds& other) const {
        return start == other.start && end == other.end;
    }
    bool operator!=(const FrameBounds& other) const {
        return !(*this == other);
    }
};

namespace frames {

// Rounding rule taken from the active configuration
FrameRounding activeRounding();

i64 round(f64 position, FrameRounding rounding);

i64 secondsToFrameIndex(Seconds seconds,
                        u32 sampleRate,
                        u32 hopsize,
                        FrameRounding rounding);
i64 secondsToFrameIndex(Seconds seconds, u32 sampleRate, u32 hopsize = 1);

// edges.size() - 1 adjacent bounds; empty for fewer than two edges
std::vector<FrameBounds> boundsFromEdges(const std::vector<Seconds>& edges,
                                         u32 sampleRate,
                                         u32 hopsize,
                                         FrameRounding rounding);

// start, start + hop, start + 2 * hop, ... while strictly before end
std::vector<Seconds> frameTimes(Seconds start, Seconds end, Seconds hopsize);

// count evenly spaced times from start to end inclusive
std::vector<Seconds> linspace(Seconds start, Seconds end, usize count);

} // namespace frames

} // namespace pa
