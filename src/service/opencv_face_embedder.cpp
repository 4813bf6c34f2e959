#include "opencv_face_embedder.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <opencv2/calib3d.hpp>
#include <opencv2/core/cuda.hpp>
#include <opencv2/core/ocl.hpp>
#include <opencv2/imgproc.hpp>

namespace faceverify {

namespace {
constexpr int ARCFACE_SIZE = 112;

// ArcFace 112x112 reference landmarks, in YuNet landmark order
const std::vector<cv::Point2f> ARCFACE_REFERENCE = {
    {38.2946f, 51.6963f},
    {73.5318f, 51.5014f},
    {56.0252f, 71.7366f},
    {41.5493f, 92.3655f},
    {70.7299f, 92.2041f}};
} // namespace

OpenCVFaceEmbedder::OpenCVFaceEmbedder(const ServiceConfig &config)
    : config_(config) {
  model_id_ = config_.model_id.empty()
                  ? "opencv/" + getModelVersion(config_.recognition_model)
                  : config_.model_id;
}

OpenCVFaceEmbedder::~OpenCVFaceEmbedder() {}

bool OpenCVFaceEmbedder::init() {
  int backend_id = cv::dnn::DNN_BACKEND_OPENCV;
  int target_id = cv::dnn::DNN_TARGET_CPU;
  selectBackend(backend_id, target_id);

  if (loadModels(backend_id, target_id))
    return true;
  if (target_id == cv::dnn::DNN_TARGET_CPU &&
      backend_id == cv::dnn::DNN_BACKEND_OPENCV)
    return false;
  return fallbackToCPU();
}

void OpenCVFaceEmbedder::selectBackend(int &backend_id, int &target_id) const {
  for (const auto &prov : config_.provider_priority) {
    if (prov == "CUDA") {
      if (cv::cuda::getCudaEnabledDeviceCount() > 0) {
        backend_id = cv::dnn::DNN_BACKEND_CUDA;
        target_id = cv::dnn::DNN_TARGET_CUDA;
        Logger::log(LogLevel::INFO, "Selecting CUDA backend.");
        return;
      }
    } else if (prov == "OpenVINO") {
      backend_id = cv::dnn::DNN_BACKEND_INFERENCE_ENGINE;
      target_id = cv::dnn::DNN_TARGET_CPU;
      Logger::log(LogLevel::INFO, "Selecting OpenVINO backend.");
      return;
    } else if (prov == "OpenCL") {
      if (cv::ocl::haveOpenCL()) {
        cv::ocl::setUseOpenCL(true);
        backend_id = cv::dnn::DNN_BACKEND_OPENCV;
        target_id = cv::dnn::DNN_TARGET_OPENCL;
        cv::ocl::Device dev = cv::ocl::Device::getDefault();
        Logger::log(LogLevel::INFO, "Selecting OpenCL backend on " +
                                        dev.name() + " " + dev.version());
        return;
      }
      Logger::log(LogLevel::WARN,
                  "OpenCL requested but not detected, trying next provider.");
    } else if (prov == "CPU") {
      backend_id = cv::dnn::DNN_BACKEND_OPENCV;
      target_id = cv::dnn::DNN_TARGET_CPU;
      Logger::log(LogLevel::INFO, "Selecting CPU backend.");
      return;
    } else {
      Logger::log(LogLevel::WARN, "Unknown provider '" + prov + "', skipped.");
    }
  }
}

bool OpenCVFaceEmbedder::loadModels(int backend_id, int target_id) {
  const std::string det_path = config_.detectionModelPath();
  const std::string rec_path = config_.recognitionModelPath();

  try {
    Logger::log(LogLevel::INFO, "Loading Detector: " + det_path);
    detector_ = cv::FaceDetectorYN::create(
        det_path, "", cv::Size(320, 320), config_.detection_threshold, 0.3f,
        5000, backend_id, target_id);

    Logger::log(LogLevel::INFO, "Loading Recognizer: " + rec_path);
    if (config_.recognizer == RecognizerKind::SFACE) {
      recognizer_ =
          cv::FaceRecognizerSF::create(rec_path, "", backend_id, target_id);
    } else {
      arcface_ = cv::dnn::readNetFromONNX(rec_path);
      arcface_.setPreferableBackend(backend_id);
      arcface_.setPreferableTarget(target_id);
    }
  } catch (const cv::Exception &e) {
    Logger::log(LogLevel::ERROR,
                "Error loading models: " + std::string(e.what()));
    detector_.release();
    recognizer_.release();
    arcface_ = cv::dnn::Net();
    return false;
  }

  Logger::log(LogLevel::INFO, "Model ready: " + model_id_);
  return true;
}

bool OpenCVFaceEmbedder::fallbackToCPU() {
  Logger::log(LogLevel::WARN, "Attempting fallback to CPU backend...");
  if (loadModels(cv::dnn::DNN_BACKEND_OPENCV, cv::dnn::DNN_TARGET_CPU)) {
    Logger::log(LogLevel::INFO, "Successfully switched to CPU backend.");
    return true;
  }
  return false;
}

cv::Mat OpenCVFaceEmbedder::alignArcFace(const cv::Mat &image,
                                         const cv::Mat &face_row) const {
  std::vector<cv::Point2f> landmarks;
  for (int k = 0; k < 5; k++) {
    landmarks.emplace_back(face_row.at<float>(0, 4 + 2 * k),
                           face_row.at<float>(0, 5 + 2 * k));
  }
  cv::Mat tform = cv::estimateAffinePartial2D(landmarks, ARCFACE_REFERENCE);
  cv::Mat aligned;
  if (tform.empty()) {
    // Degenerate landmarks: fall back to the plain box crop
    cv::Rect box(cv::Point(static_cast<int>(face_row.at<float>(0, 0)),
                           static_cast<int>(face_row.at<float>(0, 1))),
                 cv::Size(static_cast<int>(face_row.at<float>(0, 2)),
                          static_cast<int>(face_row.at<float>(0, 3))));
    box &= cv::Rect(0, 0, image.cols, image.rows);
    if (box.empty())
      return aligned;
    cv::resize(image(box), aligned, cv::Size(ARCFACE_SIZE, ARCFACE_SIZE));
    return aligned;
  }
  cv::warpAffine(image, aligned, tform, cv::Size(ARCFACE_SIZE, ARCFACE_SIZE));
  return aligned;
}

Embedding OpenCVFaceEmbedder::extract(const cv::Mat &image,
                                      const cv::Mat &face_row) {
  cv::Mat feature;
  if (config_.recognizer == RecognizerKind::SFACE) {
    cv::Mat aligned;
    recognizer_->alignCrop(image, face_row, aligned);
    recognizer_->feature(aligned, feature);
  } else {
    cv::Mat aligned = alignArcFace(image, face_row);
    if (aligned.empty())
      return {};
    cv::Mat rgb;
    cv::cvtColor(aligned, rgb, cv::COLOR_BGR2RGB);
    // (pixel - 127.5) / 128
    cv::Mat blob =
        cv::dnn::blobFromImage(rgb, 1.0 / 128.0, cv::Size(),
                               cv::Scalar(127.5, 127.5, 127.5), false, false,
                               CV_32F);
    arcface_.setInput(blob);
    feature = arcface_.forward();
  }

  if (feature.empty())
    return {};
  cv::Mat flat = feature.clone().reshape(1, 1);
  if (flat.type() != CV_32F)
    flat.convertTo(flat, CV_32F);
  return Embedding(flat.begin<float>(), flat.end<float>());
}

std::vector<Detection> OpenCVFaceEmbedder::detect(const cv::Mat &image) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!detector_) {
    throw VerificationError(ErrorKind::MODEL, "models not loaded");
  }

  std::vector<Detection> detections;
  try {
    cv::Mat faces;
    detector_->setInputSize(image.size());
    detector_->detect(image, faces);

    for (int i = 0; i < faces.rows; i++) {
      cv::Mat row = faces.row(i);
      Detection d;
      d.box.x1 = row.at<float>(0, 0);
      d.box.y1 = row.at<float>(0, 1);
      d.box.x2 = d.box.x1 + row.at<float>(0, 2);
      d.box.y2 = d.box.y1 + row.at<float>(0, 3);
      d.raw_embedding = extract(image, row);
      detections.push_back(std::move(d));
    }
  } catch (const cv::Exception &e) {
    throw VerificationError(ErrorKind::MODEL,
                            "inference failed: " + std::string(e.what()));
  }

  Logger::log(LogLevel::DEBUG,
              "Faces detected: " + std::to_string(detections.size()));
  return detections;
}

} // namespace faceverify
