#include "protocol.hpp"

#include "logger.hpp"

#include <optional>
#include <vector>

using json = nlohmann::json;

namespace faceverify {

json errorResponse(ErrorKind kind, const std::string &detail) {
  json j;
  j["error"] = errorKindName(kind);
  j["detail"] = detail;
  return j;
}

namespace {

// Missing image is reported like an empty one
std::string imageField(const json &request) {
  if (!request.contains("image_base64") || request["image_base64"].is_null())
    return "";
  if (!request["image_base64"].is_string())
    throw VerificationError(ErrorKind::BAD_REQUEST,
                            "image_base64 must be a string");
  return request["image_base64"].get<std::string>();
}

json handleEmbed(VerificationService &service, const json &request) {
  EmbedResult r = service.embed(imageField(request));
  if (!r.success)
    return errorResponse(r.error, r.reason);

  json j;
  j["model"] = r.model_id;
  j["embedding_b64"] = r.embedding_b64;
  return j;
}

json handleVerify(VerificationService &service, const json &request) {
  std::vector<std::string> templates;
  if (request.contains("templates_b64") && !request["templates_b64"].is_null()) {
    const json &arr = request["templates_b64"];
    if (!arr.is_array())
      throw VerificationError(ErrorKind::BAD_REQUEST,
                              "templates_b64 must be an array");
    for (const auto &t : arr) {
      if (!t.is_string())
        throw VerificationError(ErrorKind::BAD_REQUEST,
                                "templates_b64 entries must be strings");
      templates.push_back(t.get<std::string>());
    }
  }

  std::optional<double> threshold;
  if (request.contains("threshold") && !request["threshold"].is_null()) {
    if (!request["threshold"].is_number())
      throw VerificationError(ErrorKind::BAD_REQUEST,
                              "threshold must be a number");
    threshold = request["threshold"].get<double>();
  }

  // An empty template list wins over any image problem
  std::string image = templates.empty() ? std::string() : imageField(request);
  VerifyResult r = service.verify(image, templates, threshold);
  if (!r.success)
    return errorResponse(r.error, r.reason);

  json j;
  j["match"] = r.outcome.match;
  j["best_distance"] = r.outcome.best_distance;
  j["threshold"] = r.outcome.threshold_used;
  j["best_index"] = r.outcome.best_index;
  j["model"] = r.model_id;
  return j;
}

} // namespace

json handleRequest(VerificationService &service, const json &request) {
  try {
    if (!request.is_object())
      throw VerificationError(ErrorKind::BAD_REQUEST,
                              "request must be a JSON object");
    if (!request.contains("op") || !request["op"].is_string())
      throw VerificationError(ErrorKind::BAD_REQUEST, "missing op");

    const std::string op = request["op"].get<std::string>();
    Logger::log(LogLevel::DEBUG, "Request: " + op);

    if (op == "embed")
      return handleEmbed(service, request);
    if (op == "verify")
      return handleVerify(service, request);
    if (op == "health")
      return json{{"status", "OK"}};
    if (op == "version") {
#ifdef FACEVERIFY_VERSION
      return json{{"version", FACEVERIFY_VERSION}};
#else
      return json{{"version", "Unknown"}};
#endif
    }
    throw VerificationError(ErrorKind::BAD_REQUEST, "unknown op '" + op + "'");
  } catch (const VerificationError &e) {
    Logger::log(LogLevel::WARN, std::string("Rejected request: ") + e.what());
    return errorResponse(e.kind(), e.what());
  }
}

std::string handleRequestText(VerificationService &service,
                              const std::string &raw) {
  json request;
  try {
    request = json::parse(raw);
  } catch (const json::parse_error &e) {
    Logger::log(LogLevel::WARN,
                std::string("Malformed request JSON: ") + e.what());
    return errorResponse(ErrorKind::BAD_REQUEST, "request is not valid JSON")
        .dump();
  }
  return handleRequest(service, request)
      .dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace faceverify
