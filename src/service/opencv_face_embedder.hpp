#pragma once

#include "config.hpp"
#include "face_embedder.hpp"

#include <mutex>
#include <opencv2/dnn.hpp>
#include <opencv2/objdetect.hpp>
#include <string>
#include <vector>

namespace faceverify {

// YuNet detector followed by either SFace (cv::FaceRecognizerSF) or an
// ArcFace ONNX network on the aligned 112x112 crop.
class OpenCVFaceEmbedder : public FaceEmbedder {
public:
  explicit OpenCVFaceEmbedder(const ServiceConfig &config);
  ~OpenCVFaceEmbedder() override;

  [[nodiscard]] bool init();

  std::vector<Detection> detect(const cv::Mat &image) override;
  std::string modelId() const override { return model_id_; }

private:
  Embedding extract(const cv::Mat &image, const cv::Mat &face_row);
  cv::Mat alignArcFace(const cv::Mat &image, const cv::Mat &face_row) const;

  void selectBackend(int &backend_id, int &target_id) const;
  [[nodiscard]] bool loadModels(int backend_id, int target_id);
  [[nodiscard]] bool fallbackToCPU();

  ServiceConfig config_;
  std::string model_id_;

  cv::Ptr<cv::FaceDetectorYN> detector_;
  cv::Ptr<cv::FaceRecognizerSF> recognizer_; // SFACE
  cv::dnn::Net arcface_;                     // ARCFACE

  // YuNet keeps per-call input size state
  std::mutex mutex_;
};

} // namespace faceverify
