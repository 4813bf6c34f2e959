#pragma once

#include <cstddef>

// Shared constants for faceverify
namespace faceverify {
constexpr const char *SOCKET_PATH = "/run/faceverify/socket";
constexpr const char *CONFIG_PATH = "/etc/faceverify/config.ini";
constexpr const char *MODELS_DIR = "/etc/faceverify/models";

constexpr const char *DETECTION_MODEL = "face_detection_yunet_2022mar.onnx";
constexpr const char *RECOGNITION_MODEL = "face_recognition_sface_2021dec.onnx";

// Tuning defaults, both overridable from config.ini
constexpr double DEFAULT_THRESHOLD = 0.45;
constexpr double DEFAULT_EPSILON = 1e-9;

constexpr int READ_TIMEOUT_MS = 5000;
constexpr std::size_t MAX_REQUEST_BYTES = 16 * 1024 * 1024;
} // namespace faceverify
