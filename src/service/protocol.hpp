#pragma once

#include "verification_service.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace faceverify {

// One JSON request per connection:
//   {"op": "embed",  "image_base64": "..."}
//   {"op": "verify", "image_base64": "...", "templates_b64": [...],
//    "threshold": 0.45}
//   {"op": "health"} / {"op": "version"}
// Failures answer {"error": "<kind>", "detail": "<message>"}.
nlohmann::json handleRequest(VerificationService &service,
                             const nlohmann::json &request);

// Parses raw, dispatches, and serializes the reply. Never throws on bad
// input: unparsable requests get a bad_request reply.
std::string handleRequestText(VerificationService &service,
                              const std::string &raw);

nlohmann::json errorResponse(ErrorKind kind, const std::string &detail);

} // namespace faceverify
