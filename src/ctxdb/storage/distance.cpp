#include "ctxdb/storage/distance.h"
#include <cmath>

namespace ctxdb {
namespace storage {

double L2Squared(const float* a, const float* b, size_t dim) noexcept {
    double sum = 0.0;
    size_t i = 0;
    for (; i + 4 <= dim; i += 4) {
        const double d0 = static_cast<double>(a[i + 0]) - b[i + 0];
        const double d1 = static_cast<double>(a[i + 1]) - b[i + 1];
        const double d2 = static_cast<double>(a[i + 2]) - b[i + 2];
        const double d3 = static_cast<double>(a[i + 3]) - b[i + 3];
        sum += d0 * d0 + d1 * d1 + d2 * d2 + d3 * d3;
    }
    for (; i < dim; ++i) {
        const double d = static_cast<double>(a[i]) - b[i];
        sum += d * d;
    }
    return sum;
}

double L2Distance(const float* a, const float* b, size_t dim) noexcept {
    return std::sqrt(L2Squared(a, b, dim));
}

} // namespace storage
} // namespace ctxdb
