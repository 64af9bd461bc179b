#pragma once

#include <cstddef>

namespace ctxdb {
namespace storage {

// Squared Euclidean distance, accumulated in double.
// Not finite when any component of either input is NaN or infinite.
double L2Squared(const float* a, const float* b, size_t dim) noexcept;

// Euclidean (L2) distance.
double L2Distance(const float* a, const float* b, size_t dim) noexcept;

} // namespace storage
} // namespace ctxdb
