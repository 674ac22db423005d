#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace artmatch_core {

// Tolerance used when checking that a vector is L2-normalized.
constexpr float UNIT_NORM_TOLERANCE = 1e-3f;

float l2_norm(const std::vector<float> &vector);

// Scales the vector to unit length in place. A zero vector is left untouched.
void l2_normalize(std::vector<float> &vector);

bool is_unit_norm(const std::vector<float> &vector, float tolerance = UNIT_NORM_TOLERANCE);

// Deterministic stand-in embedding used when no encoder output is available.
std::vector<float> uniform_unit_vector(size_t dimension);

// Throws DimensionMismatch unless the vector has the expected width and unit length.
void validate_embedding(const std::vector<float> &vector, size_t expected_dimension,
                        const std::string &what);

}  // namespace artmatch_core
