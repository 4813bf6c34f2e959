#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace faceverify {

std::string ServiceConfig::detectionModelPath() const {
  if (!detection_model.empty() && detection_model[0] == '/')
    return detection_model;
  return models_dir + "/" + detection_model;
}

std::string ServiceConfig::recognitionModelPath() const {
  if (!recognition_model.empty() && recognition_model[0] == '/')
    return recognition_model;
  return models_dir + "/" + recognition_model;
}

std::unordered_map<std::string, std::string>
parse_ini(const std::string &path) {
  std::unordered_map<std::string, std::string> result;
  std::ifstream file(path);
  if (!file.is_open())
    return result;

  std::string line, current_section;
  while (std::getline(file, line)) {
    // Trim
    line.erase(0, line.find_first_not_of(" \t\r"));
    if (line.empty() || line[0] == ';' || line[0] == '#')
      continue;
    auto last = line.find_last_not_of(" \t\r");
    if (last != std::string::npos)
      line.erase(last + 1);

    if (line[0] == '[' && line.back() == ']') {
      current_section = line.substr(1, line.size() - 2);
    } else {
      size_t eq = line.find('=');
      if (eq != std::string::npos) {
        std::string key = line.substr(0, eq);
        key.erase(key.find_last_not_of(" \t") + 1);
        std::string val = line.substr(eq + 1);
        val.erase(0, val.find_first_not_of(" \t"));
        result[current_section + "." + key] = val;
      }
    }
  }
  return result;
}

std::string getModelVersion(const std::string &model_path) {
  fs::path p(model_path);
  std::string filename = p.stem().string();
  const std::string prefix = "face_recognition_";
  if (filename.rfind(prefix, 0) == 0) {
    return filename.substr(prefix.length());
  }
  return filename;
}

bool applyConfig(const std::unordered_map<std::string, std::string> &ini,
                 ServiceConfig &out) {
  auto get = [&ini](const std::string &key,
                    const std::string &def = "") -> std::string {
    auto it = ini.find(key);
    return it != ini.end() ? it->second : def;
  };

  std::string current_key;
  try {
    current_key = "Verify.threshold";
    std::string thr = get(current_key);
    if (!thr.empty())
      out.threshold = std::stod(thr);

    current_key = "Verify.epsilon";
    std::string eps = get(current_key);
    if (!eps.empty())
      out.epsilon = std::stod(eps);

    current_key = "Model.detection_threshold";
    std::string det = get(current_key);
    if (!det.empty())
      out.detection_threshold = std::stof(det);

    current_key = "Service.max_request_bytes";
    std::string max_bytes = get(current_key);
    if (!max_bytes.empty())
      out.max_request_bytes = std::stoul(max_bytes);

    current_key = "Service.read_timeout_ms";
    std::string timeout = get(current_key);
    if (!timeout.empty())
      out.read_timeout_ms = std::stoi(timeout);
  } catch (const std::logic_error &) {
    // std::invalid_argument and std::out_of_range
    Logger::log(LogLevel::ERROR, "Config: invalid value for " + current_key);
    return false;
  }

  if (!(out.threshold >= 0.0 && out.threshold <= 2.0)) {
    Logger::log(LogLevel::ERROR, "Config: Verify.threshold must be in [0, 2]");
    return false;
  }
  if (!(out.epsilon > 0.0)) {
    Logger::log(LogLevel::ERROR, "Config: Verify.epsilon must be positive");
    return false;
  }
  if (!(out.detection_threshold > 0.0f && out.detection_threshold < 1.0f)) {
    Logger::log(LogLevel::ERROR,
                "Config: Model.detection_threshold must be in (0, 1)");
    return false;
  }
  if (out.max_request_bytes == 0) {
    Logger::log(LogLevel::ERROR,
                "Config: Service.max_request_bytes must be positive");
    return false;
  }
  if (out.read_timeout_ms <= 0) {
    Logger::log(LogLevel::ERROR,
                "Config: Service.read_timeout_ms must be positive");
    return false;
  }

  std::string recognizer = get("Model.recognizer", "sface");
  std::transform(recognizer.begin(), recognizer.end(), recognizer.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (recognizer == "sface") {
    out.recognizer = RecognizerKind::SFACE;
  } else if (recognizer == "arcface") {
    out.recognizer = RecognizerKind::ARCFACE;
  } else {
    Logger::log(LogLevel::ERROR, "Config: unknown Model.recognizer '" +
                                     recognizer + "'");
    return false;
  }

  out.models_dir = get("Model.models_dir", out.models_dir);
  out.detection_model = get("Model.detection_model", out.detection_model);
  out.recognition_model =
      get("Model.recognition_model", out.recognition_model);
  out.model_id = get("Model.model_id", out.model_id);

  std::string priority_str = get("Hardware.provider_priority", "");
  if (!priority_str.empty()) {
    out.provider_priority.clear();
    std::stringstream ss(priority_str);
    std::string segment;
    while (std::getline(ss, segment, ',')) {
      segment.erase(0, segment.find_first_not_of(" \t"));
      segment.erase(segment.find_last_not_of(" \t") + 1);
      if (!segment.empty())
        out.provider_priority.push_back(segment);
    }
  }
  if (out.provider_priority.empty())
    out.provider_priority = {"CPU"};

  out.socket_path = get("Service.socket_path", out.socket_path);
  out.log_level = parseLogLevel(get("Log.level", "info"));
  out.log_file = get("Log.file", out.log_file);
  return true;
}

bool loadConfig(const std::string &path, ServiceConfig &out) {
  if (!fs::exists(path)) {
    Logger::log(LogLevel::WARN,
                "Config " + path + " not found, using built-in defaults.");
  }
  return applyConfig(parse_ini(path), out);
}

} // namespace faceverify
