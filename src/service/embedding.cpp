#include "embedding.hpp"

#include <cmath>

namespace faceverify {

double l2Norm(const Embedding &v) {
  double sum = 0.0;
  for (float x : v) {
    sum += static_cast<double>(x) * static_cast<double>(x);
  }
  return std::sqrt(sum);
}

Embedding normalize(const Embedding &v, double eps) {
  const double denom = l2Norm(v) + eps;
  Embedding out;
  out.reserve(v.size());
  for (float x : v) {
    out.push_back(static_cast<float>(static_cast<double>(x) / denom));
  }
  return out;
}

} // namespace faceverify
