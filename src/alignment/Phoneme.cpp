#include "Phoneme.hpp"
#include <cmath>

namespace pa {

bool Phoneme::approxEquals(const Phoneme& other, Seconds tolerance) const {
    return label_ == other.label_ &&
           std::abs(start_ - other.start_) <= tolerance &&
           std::abs(end_ - other.end_) <= tolerance;
}

} // namespace pa
