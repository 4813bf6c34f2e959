#pragma once

#include <stdexcept>
#include <string>

namespace faceverify {

// Closed set of failure kinds reported by the embed/verify pipeline.
enum class ErrorKind {
  NONE,
  DECODE,          // Image payload missing, malformed or not an image
  NO_FACE,         // Embedder returned zero detections
  EMPTY_EMBEDDING, // Selected detection carries no embedding
  CODEC,           // Template is not a whole number of float32 values
  NO_TEMPLATES,    // Verify called with an empty template list
  BAD_REQUEST,     // Transport: unparsable request or wrong field types
  MODEL            // Embedder backend failure
};

// Wire name of an error kind, e.g. "no_face".
inline const char *errorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::NONE:
    return "none";
  case ErrorKind::DECODE:
    return "decode_error";
  case ErrorKind::NO_FACE:
    return "no_face";
  case ErrorKind::EMPTY_EMBEDDING:
    return "empty_embedding";
  case ErrorKind::CODEC:
    return "codec_error";
  case ErrorKind::NO_TEMPLATES:
    return "no_templates";
  case ErrorKind::BAD_REQUEST:
    return "bad_request";
  case ErrorKind::MODEL:
    return "model_error";
  }
  return "unknown";
}

// Client-class kinds are the caller's fault; MODEL is ours.
inline bool isClientError(ErrorKind kind) {
  return kind != ErrorKind::NONE && kind != ErrorKind::MODEL;
}

class VerificationError : public std::runtime_error {
public:
  VerificationError(ErrorKind kind, const std::string &what)
      : std::runtime_error(what), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace faceverify
