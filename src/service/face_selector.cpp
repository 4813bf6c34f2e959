#include "face_selector.hpp"

#include "errors.hpp"

namespace faceverify {

std::size_t primaryFaceIndex(const std::vector<Detection> &detections) {
  if (detections.empty()) {
    throw VerificationError(ErrorKind::NO_FACE, "no face detected");
  }

  std::size_t best = 0;
  double best_area = detections[0].box.area();
  for (std::size_t i = 1; i < detections.size(); i++) {
    double a = detections[i].box.area();
    // Strict comparison keeps the earliest detection on ties
    if (a > best_area) {
      best_area = a;
      best = i;
    }
  }
  return best;
}

} // namespace faceverify
