#include "matcher.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace faceverify {

double cosine_distance(const Embedding &a, const Embedding &b) {
  if (a.size() != b.size()) {
    throw VerificationError(ErrorKind::CODEC,
                            "embedding length mismatch: " +
                                std::to_string(a.size()) + " vs " +
                                std::to_string(b.size()));
  }
  double dot = 0.0;
  for (std::size_t i = 0; i < a.size(); i++) {
    dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
  }
  if (!std::isfinite(dot)) {
    throw VerificationError(ErrorKind::CODEC, "embedding is not finite");
  }
  // Rounding can push |dot| of unit vectors slightly past 1
  dot = std::clamp(dot, -1.0, 1.0);
  return 1.0 - dot;
}

MatchResult bestMatch(const Embedding &probe,
                      const std::vector<Embedding> &templates) {
  if (templates.empty()) {
    throw VerificationError(ErrorKind::NO_TEMPLATES, "no templates");
  }

  MatchResult result;
  result.best_index = 0;
  result.best_distance = cosine_distance(probe, templates[0]);
  for (std::size_t i = 1; i < templates.size(); i++) {
    double d = cosine_distance(probe, templates[i]);
    if (d < result.best_distance) {
      result.best_distance = d;
      result.best_index = i;
    }
  }
  return result;
}

} // namespace faceverify
