#pragma once

#include "detection.hpp"

#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace faceverify {

// Detection + embedding model. Built once at startup and shared by
// reference with the service; implementations that are not reentrant
// serialize detect() themselves.
class FaceEmbedder {
public:
  virtual ~FaceEmbedder() = default;

  // All faces in a BGR image, each with its raw (unnormalized) embedding.
  // Backend failures are reported as VerificationError(MODEL).
  virtual std::vector<Detection> detect(const cv::Mat &image) = 0;

  // Identifier reported alongside every embedding, e.g. "opencv/sface_2021dec"
  virtual std::string modelId() const = 0;
};

} // namespace faceverify
