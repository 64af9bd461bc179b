#include <gtest/gtest.h>
#include "ctxdb/core/result.h"
#include "ctxdb/core/error.h"
#include <memory>
#include <string>
#include <vector>

namespace ctxdb {
namespace core {
namespace {

TEST(ResultTest, SuccessConstruction) {
    Result<int> result(42);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorConstruction) {
    auto result = Result<int>::error(Error::Code::NOT_FOUND, "no such model");
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.code(), Error::Code::NOT_FOUND);
    EXPECT_EQ(result.error(), "no such model");
}

TEST(ResultTest, ErrorWithoutCodeIsUnknown) {
    auto result = Result<std::string>::error("Resource not found");
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.code(), Error::Code::UNKNOWN);
}

TEST(ResultTest, FromError) {
    Result<int> result(SchemaConflictError("incompatible"));
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.code(), Error::Code::SCHEMA_CONFLICT);
    EXPECT_EQ(result.error(), "incompatible");
}

TEST(ResultTest, AccessingErrorOfOkResultThrows) {
    Result<int> result(1);
    EXPECT_THROW(result.error(), std::runtime_error);
}

TEST(ResultTest, VectorResult) {
    std::vector<int> vec = {1, 2, 3, 4, 5};
    Result<std::vector<int>> result(vec);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.value().size(), 5u);
    EXPECT_EQ(result.value()[0], 1);
}

TEST(ResultTest, MoveConstruction) {
    Result<std::string> original("moved string");
    Result<std::string> moved(std::move(original));

    EXPECT_TRUE(moved.ok());
    EXPECT_EQ(moved.value(), "moved string");
}

TEST(ResultTest, TakeValueMovesOut) {
    Result<std::unique_ptr<int>> result(std::make_unique<int>(7));
    std::unique_ptr<int> owned = result.take_value();
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 7);
}

TEST(ResultTest, PropagateKeepsCodeAndMessage) {
    auto inner = Result<int>::error(Error::Code::DIMENSION_MISMATCH, "3 != 4");
    auto outer = Result<std::string>::propagate(inner);
    EXPECT_FALSE(outer.ok());
    EXPECT_EQ(outer.code(), Error::Code::DIMENSION_MISMATCH);
    EXPECT_EQ(outer.error(), "3 != 4");
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    EXPECT_TRUE(ok.ok());

    auto failed = Result<void>::error(Error::Code::ALREADY_EXISTS, "exists");
    EXPECT_FALSE(failed.ok());
    EXPECT_EQ(failed.code(), Error::Code::ALREADY_EXISTS);

    auto retyped = Result<int>::propagate(failed);
    EXPECT_EQ(retyped.code(), Error::Code::ALREADY_EXISTS);
}

} // namespace
} // namespace core
} // namespace ctxdb
