/**
 * @file vector_math.h
 * @brief Small dense-vector helpers
 */

#ifndef DOCINDEX_VECTOR_MATH_H
#define DOCINDEX_VECTOR_MATH_H

#include <cmath>
#include <cstddef>
#include <vector>

namespace docindex {
namespace rag {

/**
 * @brief Normalize vector to unit length (L2 normalization)
 *
 * @return false if the vector has no direction (norm ~ 0 or not finite)
 */
inline bool normalize_vector(std::vector<float>& vec) {
    float sum_squared = 0.0f;
    for (float val : vec) {
        sum_squared += val * val;
    }

    float norm = std::sqrt(sum_squared);
    if (!(norm > 1e-8f) || !std::isfinite(norm)) {
        return false;
    }
    for (float& val : vec) {
        val /= norm;
    }
    return true;
}

inline float dot_product(const float* a, const float* b, size_t dimension) {
    float sum = 0.0f;
    for (size_t i = 0; i < dimension; ++i) {
        sum += a[i] * b[i];
    }
    return sum;
}

} // namespace rag
} // namespace docindex

#endif // DOCINDEX_VECTOR_MATH_H
