#pragma once

#include "constants.hpp"
#include "logger.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace faceverify {

enum class RecognizerKind {
  SFACE,  // cv::FaceRecognizerSF, 128-d
  ARCFACE // ONNX ArcFace through cv::dnn, 512-d
};

struct ServiceConfig {
  // Verify
  double threshold = DEFAULT_THRESHOLD;
  double epsilon = DEFAULT_EPSILON;

  // Model
  RecognizerKind recognizer = RecognizerKind::SFACE;
  std::string models_dir = MODELS_DIR;
  std::string detection_model = DETECTION_MODEL;
  std::string recognition_model = RECOGNITION_MODEL;
  float detection_threshold = 0.6f;
  std::string model_id; // Empty = derive from recognition_model
  std::vector<std::string> provider_priority = {"OpenCL", "CPU"};

  // Service
  std::string socket_path = SOCKET_PATH;
  std::size_t max_request_bytes = MAX_REQUEST_BYTES;
  int read_timeout_ms = READ_TIMEOUT_MS;

  // Log
  LogLevel log_level = LogLevel::INFO;
  std::string log_file;

  std::string detectionModelPath() const;
  std::string recognitionModelPath() const;
};

// Flattens an INI file into "Section.key" -> value. Missing file yields an
// empty map.
std::unordered_map<std::string, std::string>
parse_ini(const std::string &path);

// Extract version from model filename (e.g. sface_2021dec)
std::string getModelVersion(const std::string &model_path);

// Applies INI values over the defaults in out. Returns false (and logs why)
// on unparsable or out-of-range values.
[[nodiscard]] bool
applyConfig(const std::unordered_map<std::string, std::string> &ini,
            ServiceConfig &out);

[[nodiscard]] bool loadConfig(const std::string &path, ServiceConfig &out);

} // namespace faceverify
