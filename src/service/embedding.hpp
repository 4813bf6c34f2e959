#pragma once

#include "constants.hpp"

#include <vector>

namespace faceverify {

// Face feature vector as emitted by the recognizer (raw) or after
// normalize() (unit L2 norm).
using Embedding = std::vector<float>;

// Euclidean length, accumulated in double.
double l2Norm(const Embedding &v);

// Returns v / (|v| + eps). Never fails: an all-zero vector stays all-zero.
Embedding normalize(const Embedding &v, double eps = DEFAULT_EPSILON);

} // namespace faceverify
