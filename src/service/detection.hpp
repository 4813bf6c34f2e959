#pragma once

#include "embedding.hpp"

namespace faceverify {

struct BoundingBox {
  float x1 = 0.0f;
  float y1 = 0.0f;
  float x2 = 0.0f;
  float y2 = 0.0f;

  double area() const {
    return (static_cast<double>(x2) - x1) * (static_cast<double>(y2) - y1);
  }
};

// One face found by the embedder. raw_embedding is not normalized.
struct Detection {
  BoundingBox box;
  Embedding raw_embedding;
};

} // namespace faceverify
