#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <vector>
#include "ctxdb/storage/distance.h"

namespace ctxdb {
namespace storage {
namespace {

TEST(DistanceTest, Basic) {
    std::vector<float> a{0.0f, 0.0f};
    std::vector<float> b{3.0f, 4.0f};
    EXPECT_DOUBLE_EQ(L2Squared(a.data(), b.data(), 2), 25.0);
    EXPECT_DOUBLE_EQ(L2Distance(a.data(), b.data(), 2), 5.0);
    EXPECT_DOUBLE_EQ(L2Distance(b.data(), b.data(), 2), 0.0);
}

TEST(DistanceTest, Symmetric) {
    std::vector<float> a{1.5f, -2.0f, 7.25f};
    std::vector<float> b{-3.0f, 0.5f, 1.0f};
    EXPECT_DOUBLE_EQ(L2Distance(a.data(), b.data(), 3), L2Distance(b.data(), a.data(), 3));
}

TEST(DistanceTest, LongVectorsUseEveryComponent) {
    // Odd length covers the tail of any unrolled loop
    std::vector<float> a(1001, 0.0f);
    std::vector<float> b(1001, 1.0f);
    EXPECT_DOUBLE_EQ(L2Squared(a.data(), b.data(), a.size()), 1001.0);
    b.back() = 2.0f;
    EXPECT_DOUBLE_EQ(L2Squared(a.data(), b.data(), a.size()), 1004.0);
}

TEST(DistanceTest, NonFiniteInputs) {
    std::vector<float> a{0.0f, std::numeric_limits<float>::quiet_NaN()};
    std::vector<float> b{1.0f, 1.0f};
    std::vector<float> c{std::numeric_limits<float>::infinity(), 0.0f};
    EXPECT_FALSE(std::isfinite(L2Distance(a.data(), b.data(), 2)));
    EXPECT_FALSE(std::isfinite(L2Distance(c.data(), b.data(), 2)));
}

TEST(DistanceTest, ZeroDimension) {
    float unused = 0.0f;
    EXPECT_DOUBLE_EQ(L2Distance(&unused, &unused, 0), 0.0);
}

} // namespace
} // namespace storage
} // namespace ctxdb
