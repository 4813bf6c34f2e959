#pragma once

#include <opencv2/core.hpp>
#include <string>

namespace faceverify {

// Trims whitespace and drops a "data:<mime>;base64," prefix if present.
// Throws VerificationError(DECODE) for a data URI with no comma.
std::string stripDataUriPrefix(const std::string &payload);

// base64 (optionally data-URI prefixed) encoded image -> BGR pixels.
// Throws VerificationError(DECODE) when the payload is empty, not base64 or
// not an image cv::imdecode understands.
cv::Mat decodeImagePayload(const std::string &payload);

} // namespace faceverify
