#include "artmatch_core/types/embedding.hpp"

#include <cmath>
#include <numeric>

#include "artmatch_core/types/errors.hpp"

namespace artmatch_core {

float l2_norm(const std::vector<float> &vector) {
  return std::sqrt(std::inner_product(vector.begin(), vector.end(), vector.begin(), 0.0f));
}

void l2_normalize(std::vector<float> &vector) {
  float norm = l2_norm(vector);
  if (norm <= 0.0f) {
    return;
  }
  for (float &value : vector) {
    value /= norm;
  }
}

bool is_unit_norm(const std::vector<float> &vector, float tolerance) {
  return std::fabs(l2_norm(vector) - 1.0f) <= tolerance;
}

std::vector<float> uniform_unit_vector(size_t dimension) {
  if (dimension == 0) {
    return {};
  }
  return std::vector<float>(dimension, 1.0f / std::sqrt(static_cast<float>(dimension)));
}

void validate_embedding(const std::vector<float> &vector, size_t expected_dimension,
                        const std::string &what) {
  if (vector.size() != expected_dimension) {
    throw DimensionMismatch(what + " dimension mismatch. Expected " +
                            std::to_string(expected_dimension) + ", got " +
                            std::to_string(vector.size()));
  }
  if (!is_unit_norm(vector)) {
    throw DimensionMismatch(what + " is not L2-normalized (norm " +
                            std::to_string(l2_norm(vector)) + ")");
  }
}

}  // namespace artmatch_core
