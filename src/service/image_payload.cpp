#include "image_payload.hpp"

#include "codec.hpp"
#include "errors.hpp"

#include <cstdint>
#include <opencv2/imgcodecs.hpp>
#include <vector>

namespace faceverify {

std::string stripDataUriPrefix(const std::string &payload) {
  auto first = payload.find_first_not_of(" \t\r\n");
  if (first == std::string::npos)
    return "";
  auto last = payload.find_last_not_of(" \t\r\n");
  std::string s = payload.substr(first, last - first + 1);

  // data:image/jpeg;base64,....
  if (s.rfind("data:", 0) == 0) {
    auto comma = s.find(',');
    if (comma == std::string::npos) {
      throw VerificationError(ErrorKind::DECODE,
                              "data URI without payload separator");
    }
    s = s.substr(comma + 1);
  }
  return s;
}

cv::Mat decodeImagePayload(const std::string &payload) {
  std::string b64 = stripDataUriPrefix(payload);
  if (b64.empty()) {
    throw VerificationError(ErrorKind::DECODE, "empty image");
  }

  std::vector<std::uint8_t> bytes;
  if (!base64Decode(b64, bytes)) {
    throw VerificationError(ErrorKind::DECODE, "image is not valid base64");
  }
  if (bytes.empty()) {
    throw VerificationError(ErrorKind::DECODE, "empty image");
  }

  cv::Mat img;
  try {
    img = cv::imdecode(bytes, cv::IMREAD_COLOR);
  } catch (const cv::Exception &e) {
    throw VerificationError(ErrorKind::DECODE,
                            "invalid image bytes: " + std::string(e.what()));
  }
  if (img.empty()) {
    throw VerificationError(ErrorKind::DECODE, "invalid image bytes");
  }
  return img;
}

} // namespace faceverify
