#pragma once

#include "constants.hpp"
#include "embedding.hpp"
#include "errors.hpp"
#include "face_embedder.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace faceverify {

struct VerificationOutcome {
  bool match = false;
  double best_distance = 0.0;
  double threshold_used = 0.0;
  std::size_t best_index = 0; // Template that produced best_distance
};

// Result of an embed request. On failure error/reason describe why and the
// remaining fields are empty.
struct EmbedResult {
  bool success = false;
  ErrorKind error = ErrorKind::NONE;
  std::string reason;
  std::string model_id;
  std::string embedding_b64;
};

struct VerifyResult {
  bool success = false;
  ErrorKind error = ErrorKind::NONE;
  std::string reason;
  std::string model_id;
  VerificationOutcome outcome;
};

// Request-scoped embed/verify pipeline. Holds no state between calls apart
// from the shared embedder handle and the configured defaults.
class VerificationService {
public:
  explicit VerificationService(FaceEmbedder &embedder,
                               double default_threshold = DEFAULT_THRESHOLD,
                               double epsilon = DEFAULT_EPSILON);

  [[nodiscard]] EmbedResult embed(const std::string &image_b64);

  // threshold falls back to the configured default when absent
  [[nodiscard]] VerifyResult
  verify(const std::string &image_b64,
         const std::vector<std::string> &templates_b64,
         std::optional<double> threshold = std::nullopt);

  std::string modelId() const { return embedder_.modelId(); }

private:
  // decode -> detect -> select primary -> normalize
  Embedding probeEmbedding(const std::string &image_b64);

  FaceEmbedder &embedder_;
  double default_threshold_;
  double epsilon_;
};

} // namespace faceverify
