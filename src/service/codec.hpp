#pragma once

#include "constants.hpp"
#include "embedding.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace faceverify {

// Standard alphabet, '=' padded.
std::string base64Encode(const std::vector<std::uint8_t> &data);

// Whitespace is skipped. Returns false on characters outside the alphabet,
// data after padding, or a truncated final quantum.
[[nodiscard]] bool base64Decode(const std::string &text,
                                std::vector<std::uint8_t> &out);

// Template transport format: base64 of little-endian float32 values.
std::string encodeEmbedding(const Embedding &normalized);

// Inverse of encodeEmbedding. The result is re-normalized since stored
// templates are not trusted to be unit length. Throws
// VerificationError(CODEC) on malformed input.
Embedding decodeEmbedding(const std::string &text,
                          double eps = DEFAULT_EPSILON);

} // namespace faceverify
