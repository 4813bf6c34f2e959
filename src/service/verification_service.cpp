#include "verification_service.hpp"

#include "codec.hpp"
#include "face_selector.hpp"
#include "image_payload.hpp"
#include "logger.hpp"
#include "matcher.hpp"

namespace faceverify {

namespace {
void logFailure(const char *op, const VerificationError &e) {
  LogLevel level = isClientError(e.kind()) ? LogLevel::WARN : LogLevel::ERROR;
  Logger::log(level, std::string(op) + " failed (" +
                         errorKindName(e.kind()) + "): " + e.what());
}
} // namespace

VerificationService::VerificationService(FaceEmbedder &embedder,
                                         double default_threshold,
                                         double epsilon)
    : embedder_(embedder), default_threshold_(default_threshold),
      epsilon_(epsilon) {}

Embedding VerificationService::probeEmbedding(const std::string &image_b64) {
  cv::Mat img = decodeImagePayload(image_b64);

  std::vector<Detection> detections = embedder_.detect(img);
  if (detections.size() > 1) {
    Logger::log(LogLevel::DEBUG,
                std::to_string(detections.size()) +
                    " faces in image, using the largest.");
  }
  const Detection &primary = selectPrimary(detections);
  if (primary.raw_embedding.empty()) {
    throw VerificationError(ErrorKind::EMPTY_EMBEDDING, "embedding empty");
  }
  return normalize(primary.raw_embedding, epsilon_);
}

EmbedResult VerificationService::embed(const std::string &image_b64) {
  EmbedResult result;
  try {
    Embedding probe = probeEmbedding(image_b64);
    result.embedding_b64 = encodeEmbedding(probe);
    result.model_id = embedder_.modelId();
    result.success = true;
    Logger::log(LogLevel::INFO, "Embed OK (" + std::to_string(probe.size()) +
                                    " dims, " + result.model_id + ")");
  } catch (const VerificationError &e) {
    logFailure("Embed", e);
    result.error = e.kind();
    result.reason = e.what();
  }
  return result;
}

VerifyResult
VerificationService::verify(const std::string &image_b64,
                            const std::vector<std::string> &templates_b64,
                            std::optional<double> threshold) {
  VerifyResult result;
  try {
    // Checked before touching the image or the model
    if (templates_b64.empty()) {
      throw VerificationError(ErrorKind::NO_TEMPLATES, "no templates");
    }
    const double thr = threshold.value_or(default_threshold_);

    Embedding probe = probeEmbedding(image_b64);

    std::vector<Embedding> templates;
    templates.reserve(templates_b64.size());
    for (std::size_t i = 0; i < templates_b64.size(); i++) {
      try {
        templates.push_back(decodeEmbedding(templates_b64[i], epsilon_));
      } catch (const VerificationError &e) {
        throw VerificationError(e.kind(), "template " + std::to_string(i) +
                                              ": " + e.what());
      }
      if (templates.back().size() != probe.size()) {
        throw VerificationError(
            ErrorKind::CODEC,
            "template " + std::to_string(i) + " has " +
                std::to_string(templates.back().size()) +
                " components, probe has " + std::to_string(probe.size()));
      }
    }

    MatchResult best = bestMatch(probe, templates);

    result.outcome.match = decide(best.best_distance, thr);
    result.outcome.best_distance = best.best_distance;
    result.outcome.threshold_used = thr;
    result.outcome.best_index = best.best_index;
    result.model_id = embedder_.modelId();
    result.success = true;

    Logger::log(LogLevel::INFO,
                std::string(result.outcome.match ? "MATCH" : "MISMATCH") +
                    " distance: " + std::to_string(best.best_distance) +
                    " (threshold: " + std::to_string(thr) +
                    ", templates: " + std::to_string(templates.size()) + ")");
  } catch (const VerificationError &e) {
    logFailure("Verify", e);
    result.error = e.kind();
    result.reason = e.what();
  }
  return result;
}

} // namespace faceverify
