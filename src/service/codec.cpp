#include "codec.hpp"

#include "errors.hpp"

#include <cmath>
#include <cstring>

namespace faceverify {

namespace {
const std::string kBase64Chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

bool isSpace(char c) { return c == ' ' || c == '\n' || c == '\r' || c == '\t'; }
} // namespace

std::string base64Encode(const std::vector<std::uint8_t> &data) {
  std::string encoded;
  encoded.reserve(((data.size() + 2) / 3) * 4);
  std::uint32_t val = 0;
  int valb = -6;

  for (std::uint8_t c : data) {
    val = ((val << 8) | c) & 0xFFFFFF;
    valb += 8;
    while (valb >= 0) {
      encoded.push_back(kBase64Chars[(val >> valb) & 0x3F]);
      valb -= 6;
    }
  }
  if (valb > -6) {
    encoded.push_back(kBase64Chars[((val << 8) >> (valb + 8)) & 0x3F]);
  }
  while (encoded.size() % 4) {
    encoded.push_back('=');
  }
  return encoded;
}

bool base64Decode(const std::string &text, std::vector<std::uint8_t> &out) {
  out.clear();
  out.reserve(text.size() * 3 / 4);

  std::uint32_t val = 0;
  int valb = -8;
  std::size_t symbols = 0;
  bool padding = false;

  for (char c : text) {
    if (isSpace(c))
      continue;
    if (c == '=') {
      padding = true;
      continue;
    }
    if (padding)
      return false; // Data after padding

    auto pos = kBase64Chars.find(c);
    if (pos == std::string::npos)
      return false;

    symbols++;
    val = ((val << 6) | static_cast<std::uint32_t>(pos)) & 0xFFFFFF;
    valb += 6;
    if (valb >= 0) {
      out.push_back(static_cast<std::uint8_t>((val >> valb) & 0xFF));
      valb -= 8;
    }
  }

  // A lone 6-bit symbol cannot encode a byte
  return symbols % 4 != 1;
}

std::string encodeEmbedding(const Embedding &normalized) {
  std::vector<std::uint8_t> bytes;
  bytes.reserve(normalized.size() * 4);
  for (float f : normalized) {
    std::uint32_t bits;
    std::memcpy(&bits, &f, sizeof(bits));
    bytes.push_back(static_cast<std::uint8_t>(bits & 0xFF));
    bytes.push_back(static_cast<std::uint8_t>((bits >> 8) & 0xFF));
    bytes.push_back(static_cast<std::uint8_t>((bits >> 16) & 0xFF));
    bytes.push_back(static_cast<std::uint8_t>((bits >> 24) & 0xFF));
  }
  return base64Encode(bytes);
}

Embedding decodeEmbedding(const std::string &text, double eps) {
  std::vector<std::uint8_t> bytes;
  if (!base64Decode(text, bytes)) {
    throw VerificationError(ErrorKind::CODEC, "template is not valid base64");
  }
  if (bytes.size() % 4 != 0) {
    throw VerificationError(ErrorKind::CODEC,
                            "template byte length " +
                                std::to_string(bytes.size()) +
                                " is not a multiple of 4");
  }

  Embedding raw;
  raw.reserve(bytes.size() / 4);
  for (std::size_t i = 0; i < bytes.size(); i += 4) {
    std::uint32_t bits = static_cast<std::uint32_t>(bytes[i]) |
                         (static_cast<std::uint32_t>(bytes[i + 1]) << 8) |
                         (static_cast<std::uint32_t>(bytes[i + 2]) << 16) |
                         (static_cast<std::uint32_t>(bytes[i + 3]) << 24);
    float f;
    std::memcpy(&f, &bits, sizeof(f));
    if (!std::isfinite(f)) {
      throw VerificationError(ErrorKind::CODEC,
                              "template value " + std::to_string(i / 4) +
                                  " is not finite");
    }
    raw.push_back(f);
  }
  return normalize(raw, eps);
}

} // namespace faceverify
