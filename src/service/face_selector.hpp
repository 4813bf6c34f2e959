#pragma once

#include "detection.hpp"

#include <cstddef>
#include <vector>

namespace faceverify {

// Index of the detection with the largest box area. When several share the
// maximum, the earliest one wins. Throws VerificationError(NO_FACE) when
// detections is empty.
std::size_t primaryFaceIndex(const std::vector<Detection> &detections);

inline const Detection &selectPrimary(const std::vector<Detection> &detections) {
  return detections[primaryFaceIndex(detections)];
}

} // namespace faceverify
