#pragma once

#include "embedding.hpp"

#include <cstddef>
#include <vector>

namespace faceverify {

struct MatchResult {
  std::size_t best_index = 0;
  double best_distance = 0.0;
};

// Cosine distance 1 - dot(a, b). Both inputs must be normalized, in which
// case the result lies in [0, 2]. Throws VerificationError(CODEC) when the
// lengths differ.
double cosine_distance(const Embedding &a, const Embedding &b);

// Linear scan for the closest template. Ties keep the earliest template.
// Throws VerificationError(NO_TEMPLATES) on an empty set.
MatchResult bestMatch(const Embedding &probe,
                      const std::vector<Embedding> &templates);

// Match iff best_distance <= threshold.
inline bool decide(double best_distance, double threshold) {
  return best_distance <= threshold;
}

} // namespace faceverify
