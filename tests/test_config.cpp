#include "config.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace faceverify;

namespace {
// Writes contents to a per-process temp file and removes it afterwards.
class IniFile {
public:
  explicit IniFile(const std::string &contents) {
    path_ = (fs::temp_directory_path() /
             ("faceverify_test_" + std::to_string(getpid()) + ".ini"))
                .string();
    std::ofstream out(path_);
    out << contents;
  }
  ~IniFile() {
    std::error_code ec;
    fs::remove(path_, ec);
  }
  const std::string &path() const { return path_; }

private:
  std::string path_;
};
} // namespace

TEST(ConfigTest, ParseIniSectionsAndComments) {
  IniFile ini("; comment\n"
              "[Verify]\n"
              "  threshold = 0.5  \n"
              "# another comment\n"
              "[Model]\n"
              "recognizer=arcface\r\n");
  auto values = parse_ini(ini.path());
  EXPECT_EQ(values["Verify.threshold"], "0.5");
  EXPECT_EQ(values["Model.recognizer"], "arcface");
  EXPECT_EQ(values.count("comment"), 0u);
}

TEST(ConfigTest, MissingFileGivesDefaults) {
  ServiceConfig cfg;
  ASSERT_TRUE(loadConfig("/nonexistent/faceverify.ini", cfg));
  EXPECT_DOUBLE_EQ(cfg.threshold, 0.45);
  EXPECT_DOUBLE_EQ(cfg.epsilon, 1e-9);
  EXPECT_EQ(cfg.recognizer, RecognizerKind::SFACE);
  EXPECT_EQ(cfg.socket_path, SOCKET_PATH);
  EXPECT_EQ(cfg.max_request_bytes, MAX_REQUEST_BYTES);
  EXPECT_EQ(cfg.read_timeout_ms, READ_TIMEOUT_MS);
}

TEST(ConfigTest, OverridesApplied) {
  IniFile ini("[Verify]\nthreshold = 0.3\nepsilon = 1e-6\n"
              "[Model]\nrecognizer = ArcFace\nmodels_dir = /opt/models\n"
              "recognition_model = w600k_r50.onnx\n"
              "[Hardware]\nprovider_priority = CUDA , CPU\n"
              "[Service]\nsocket_path = /tmp/fv.sock\nread_timeout_ms = 250\n"
              "[Log]\nlevel = debug\n");
  ServiceConfig cfg;
  ASSERT_TRUE(loadConfig(ini.path(), cfg));
  EXPECT_DOUBLE_EQ(cfg.threshold, 0.3);
  EXPECT_DOUBLE_EQ(cfg.epsilon, 1e-6);
  EXPECT_EQ(cfg.recognizer, RecognizerKind::ARCFACE);
  EXPECT_EQ(cfg.recognitionModelPath(), "/opt/models/w600k_r50.onnx");
  EXPECT_EQ(cfg.detectionModelPath(),
            "/opt/models/face_detection_yunet_2022mar.onnx");
  ASSERT_EQ(cfg.provider_priority.size(), 2u);
  EXPECT_EQ(cfg.provider_priority[0], "CUDA");
  EXPECT_EQ(cfg.provider_priority[1], "CPU");
  EXPECT_EQ(cfg.socket_path, "/tmp/fv.sock");
  EXPECT_EQ(cfg.read_timeout_ms, 250);
  EXPECT_EQ(cfg.log_level, LogLevel::DEBUG);
}

TEST(ConfigTest, AbsoluteModelPathKept) {
  ServiceConfig cfg;
  cfg.recognition_model = "/srv/arcface.onnx";
  EXPECT_EQ(cfg.recognitionModelPath(), "/srv/arcface.onnx");
}

TEST(ConfigTest, RejectsInvalidValues) {
  auto accepts = [](const std::string &key, const std::string &value) {
    ServiceConfig cfg;
    return applyConfig({{key, value}}, cfg);
  };
  EXPECT_FALSE(accepts("Verify.threshold", "abc"));
  EXPECT_FALSE(accepts("Verify.threshold", "2.5"));
  EXPECT_FALSE(accepts("Verify.threshold", "-0.1"));
  EXPECT_FALSE(accepts("Verify.epsilon", "0"));
  EXPECT_FALSE(accepts("Model.detection_threshold", "1.5"));
  EXPECT_FALSE(accepts("Model.recognizer", "facenet"));
  EXPECT_FALSE(accepts("Service.max_request_bytes", "0"));
  EXPECT_FALSE(accepts("Service.read_timeout_ms", "-5"));
  EXPECT_FALSE(accepts("Service.read_timeout_ms", "soon"));
  EXPECT_TRUE(accepts("Verify.threshold", "0.6"));
}

TEST(ConfigTest, BoundaryThresholdsAccepted) {
  ServiceConfig cfg;
  EXPECT_TRUE(applyConfig({{"Verify.threshold", "0"}}, cfg));
  EXPECT_TRUE(applyConfig({{"Verify.threshold", "2"}}, cfg));
  EXPECT_DOUBLE_EQ(cfg.threshold, 2.0);
}

TEST(ConfigTest, LogLevelNames) {
  EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::DEBUG);
  EXPECT_EQ(parseLogLevel("warning"), LogLevel::WARN);
  EXPECT_EQ(parseLogLevel("error"), LogLevel::ERROR);
  EXPECT_EQ(parseLogLevel("verbose"), LogLevel::INFO);
}
