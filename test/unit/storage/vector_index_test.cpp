#include <gtest/gtest.h>
#include <atomic>
#include <cmath>
#include <algorithm>
#include <limits>
#include <random>
#include <thread>
#include <vector>
#include "ctxdb/schema/type_materializer.h"
#include "ctxdb/storage/distance.h"
#include "ctxdb/storage/vector_index.h"
#include "test_util/schemas.h"

namespace ctxdb {
namespace storage {
namespace {

using core::Error;
using core::Record;
using core::Vector;

class VectorIndexTest : public ::testing::Test {
protected:
    schema::TypeDescriptorPtr Type(const std::string& schema_text,
                                   const std::string& shape = "generic_document") {
        auto result = materializer_.materialize(schema_text, shape);
        EXPECT_TRUE(result.ok()) << result.error();
        return result.ok() ? result.value() : nullptr;
    }

    static Record Point(const std::string& label, Vector vec) {
        Record record;
        record.set("label", label);
        record.set("vec", std::move(vec));
        return record;
    }

    static Record Query(Vector vec) {
        Record record;
        record.set("vec", std::move(vec));
        return record;
    }

    static std::string Label(const ScoredRecord& hit) {
        const core::FieldValue* label = hit.record.get("label");
        const std::string* text = label ? std::get_if<std::string>(label) : nullptr;
        return text ? *text : std::string();
    }

    schema::TypeMaterializer materializer_;
};

TEST_F(VectorIndexTest, NearestNeighbors) {
    VectorIndex index(Type(testutil::PointSchema()));
    ASSERT_TRUE(index.insert(Point("origin", {0, 0})).ok());
    ASSERT_TRUE(index.insert(Point("unit", {1, 0})).ok());
    ASSERT_TRUE(index.insert(Point("far", {5, 5})).ok());
    EXPECT_EQ(index.size(), 3u);
    EXPECT_EQ(index.dimension("vec"), std::optional<size_t>(2));

    auto hits = index.find(Query({0.9f, 0}), "vec", 2);
    ASSERT_TRUE(hits.ok()) << hits.error();
    ASSERT_EQ(hits.value().size(), 2u);
    EXPECT_EQ(Label(hits.value()[0]), "unit");
    EXPECT_NEAR(hits.value()[0].distance, 0.1, 1e-6);
    EXPECT_EQ(Label(hits.value()[1]), "origin");
    EXPECT_NEAR(hits.value()[1].distance, 0.9, 1e-6);
}

TEST_F(VectorIndexTest, ExactMatchRanksFirst) {
    VectorIndex index(Type(testutil::PointSchema()));
    ASSERT_TRUE(index.insert(Point("origin", {0, 0})).ok());
    ASSERT_TRUE(index.insert(Point("unit", {1, 0})).ok());
    ASSERT_TRUE(index.insert(Point("far", {5, 5})).ok());

    auto hits = index.find(Query({0, 0}), "vec", 2);
    ASSERT_TRUE(hits.ok()) << hits.error();
    ASSERT_EQ(hits.value().size(), 2u);
    EXPECT_EQ(Label(hits.value()[0]), "origin");
    EXPECT_DOUBLE_EQ(hits.value()[0].distance, 0.0);
    EXPECT_EQ(Label(hits.value()[1]), "unit");
    EXPECT_DOUBLE_EQ(hits.value()[1].distance, 1.0);
}

TEST_F(VectorIndexTest, MatchesExhaustiveSort) {
    std::mt19937 rng(20240517);
    // Small integer grid so distance ties are common
    std::uniform_int_distribution<int> coord(-3, 3);
    std::uniform_int_distribution<size_t> count(1, 6);

    for (int trial = 0; trial < 200; ++trial) {
        VectorIndex index(Type(testutil::PointSchema()));
        std::vector<Vector> points(count(rng));
        for (size_t i = 0; i < points.size(); ++i) {
            points[i] = {static_cast<float>(coord(rng)), static_cast<float>(coord(rng))};
            ASSERT_TRUE(index.insert(Point("p" + std::to_string(i), points[i])).ok());
        }
        Vector query{static_cast<float>(coord(rng)), static_cast<float>(coord(rng))};

        std::vector<std::pair<double, size_t>> expected;
        for (size_t i = 0; i < points.size(); ++i) {
            expected.emplace_back(L2Distance(query.data(), points[i].data(), query.size()), i);
        }
        std::sort(expected.begin(), expected.end());

        for (size_t k = 1; k <= points.size() + 1; ++k) {
            auto hits = index.find(Query(query), "vec", k);
            ASSERT_TRUE(hits.ok()) << hits.error();
            ASSERT_EQ(hits.value().size(), std::min(k, points.size())) << "trial " << trial << " k " << k;
            for (size_t r = 0; r < hits.value().size(); ++r) {
                EXPECT_EQ(Label(hits.value()[r]), "p" + std::to_string(expected[r].second))
                    << "trial " << trial << " k " << k << " rank " << r;
                EXPECT_DOUBLE_EQ(hits.value()[r].distance, expected[r].first);
                if (r > 0) {
                    EXPECT_LE(hits.value()[r - 1].distance, hits.value()[r].distance);
                }
            }
        }
    }
}

TEST_F(VectorIndexTest, LimitLargerThanIndex) {
    VectorIndex index(Type(testutil::PointSchema()));
    ASSERT_TRUE(index.insert(Point("a", {3, 4})).ok());
    ASSERT_TRUE(index.insert(Point("b", {0, 1})).ok());

    auto hits = index.find(Query({0, 0}), "vec", 10);
    ASSERT_TRUE(hits.ok());
    ASSERT_EQ(hits.value().size(), 2u);
    EXPECT_EQ(Label(hits.value()[0]), "b");
    EXPECT_DOUBLE_EQ(hits.value()[1].distance, 5.0);
}

TEST_F(VectorIndexTest, TiesKeepInsertionOrder) {
    VectorIndex index(Type(testutil::PointSchema()));
    ASSERT_TRUE(index.insert(Point("first", {1, 0})).ok());
    ASSERT_TRUE(index.insert(Point("second", {0, 1})).ok());
    ASSERT_TRUE(index.insert(Point("third", {-1, 0})).ok());

    auto hits = index.find(Query({0, 0}), "vec", 2);
    ASSERT_TRUE(hits.ok());
    ASSERT_EQ(hits.value().size(), 2u);
    EXPECT_EQ(Label(hits.value()[0]), "first");
    EXPECT_EQ(Label(hits.value()[1]), "second");
}

TEST_F(VectorIndexTest, DimensionMismatchLeavesIndexUnchanged) {
    VectorIndex index(Type(testutil::PointSchema()));
    ASSERT_TRUE(index.insert(Point("a", {1, 2, 3})).ok());

    auto rejected = index.insert(Point("b", {1, 2, 3, 4}));
    EXPECT_FALSE(rejected.ok());
    EXPECT_EQ(rejected.code(), Error::Code::DIMENSION_MISMATCH);
    EXPECT_EQ(index.size(), 1u);
    EXPECT_EQ(index.get_metrics().rejected_count.load(), 1u);

    auto query = index.find(Query({1, 2}), "vec", 1);
    EXPECT_EQ(query.code(), Error::Code::DIMENSION_MISMATCH);
}

TEST_F(VectorIndexTest, DeclaredDimensionIsEnforcedFromTheStart) {
    VectorIndex index(Type(testutil::FixedDimensionSchema(3)));
    EXPECT_EQ(index.dimension("vec"), std::optional<size_t>(3));

    auto rejected = index.insert(Point("a", {1, 2}));
    EXPECT_EQ(rejected.code(), Error::Code::DIMENSION_MISMATCH);
    EXPECT_TRUE(index.empty());
}

TEST_F(VectorIndexTest, MissingPrimaryVector) {
    VectorIndex index(Type(testutil::PointSchema()));
    Record record;
    record.set("label", std::string("no vector"));
    auto rejected = index.insert(record);
    EXPECT_EQ(rejected.code(), Error::Code::EMPTY_VECTOR_FIELD);
    EXPECT_TRUE(index.empty());
}

TEST_F(VectorIndexTest, UndeclaredFieldIsTypeMismatch) {
    VectorIndex index(Type(testutil::PointSchema()));
    Record record = Point("a", {1, 1});
    record.set("color", std::string("red"));
    EXPECT_EQ(index.insert(record).code(), Error::Code::TYPE_MISMATCH);
}

TEST_F(VectorIndexTest, RecordOfIncompatibleTypeIsRejected) {
    auto other = Type(R"({"title": "Other", "properties": {"vec": {"type": "array", "items": {"type": "number"}}}})");
    VectorIndex index(Type(testutil::PointSchema()));

    Record record(other);
    record.set("vec", Vector{1, 1});
    EXPECT_EQ(index.insert(record).code(), Error::Code::TYPE_MISMATCH);
}

TEST_F(VectorIndexTest, EmptyIndexSearch) {
    VectorIndex index(Type(testutil::PointSchema()));
    auto hits = index.find(Query({1, 1}), "vec", 5);
    ASSERT_TRUE(hits.ok());
    EXPECT_TRUE(hits.value().empty());
}

TEST_F(VectorIndexTest, SearchArgumentErrors) {
    VectorIndex index(Type(testutil::PointSchema()));
    ASSERT_TRUE(index.insert(Point("a", {1, 1})).ok());

    EXPECT_EQ(index.find(Query({1, 1}), "vec", 0).code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(index.find(Query({1, 1}), "label", 1).code(), Error::Code::FIELD_NOT_FOUND);
    EXPECT_EQ(index.find(Query({1, 1}), "nope", 1).code(), Error::Code::FIELD_NOT_FOUND);
    EXPECT_EQ(index.find(Record(), "vec", 1).code(), Error::Code::EMPTY_VECTOR_FIELD);
}

TEST_F(VectorIndexTest, NonFiniteVectorsAreSkipped) {
    VectorIndex index(Type(testutil::PointSchema()));
    ASSERT_TRUE(index.insert(Point("nan", {std::numeric_limits<float>::quiet_NaN(), 0})).ok());
    ASSERT_TRUE(index.insert(Point("ok", {2, 0})).ok());

    auto hits = index.find(Query({0, 0}), "vec", 5);
    ASSERT_TRUE(hits.ok());
    ASSERT_EQ(hits.value().size(), 1u);
    EXPECT_EQ(Label(hits.value()[0]), "ok");
    EXPECT_EQ(index.get_metrics().skipped_count.load(), 1u);
}

TEST_F(VectorIndexTest, BatchIsAllOrNothing) {
    VectorIndex index(Type(testutil::PointSchema()));
    std::vector<Record> batch;
    batch.push_back(Point("a", {1, 1}));
    batch.push_back(Point("b", {2, 2}));
    batch.push_back(Point("c", {3, 3, 3}));

    auto rejected = index.insert_batch(std::move(batch));
    EXPECT_EQ(rejected.code(), Error::Code::DIMENSION_MISMATCH);
    EXPECT_NE(rejected.error().find("record 2"), std::string::npos);
    EXPECT_TRUE(index.empty());
    EXPECT_FALSE(index.dimension("vec").has_value());

    std::vector<Record> good;
    good.push_back(Point("a", {1, 1}));
    good.push_back(Point("b", {2, 2}));
    ASSERT_TRUE(index.insert_batch(std::move(good)).ok());
    EXPECT_EQ(index.size(), 2u);
}

TEST_F(VectorIndexTest, IdentifiersAndLookup) {
    VectorIndex index(Type(testutil::PointSchema()));
    Record named(core::RecordID("p-1"));
    named.set("vec", Vector{1, 1});
    ASSERT_TRUE(index.insert(named).ok());
    ASSERT_TRUE(index.insert(Point("anon", {2, 2})).ok());

    auto found = index.get("p-1");
    ASSERT_TRUE(found.ok());
    EXPECT_EQ(found.value().descriptor(), index.descriptor());
    EXPECT_EQ(index.get("missing").code(), Error::Code::NOT_FOUND);

    auto hits = index.find(Query({2, 2}), "vec", 1);
    ASSERT_TRUE(hits.ok());
    ASSERT_EQ(hits.value().size(), 1u);
    EXPECT_FALSE(hits.value()[0].record.id().empty());
    EXPECT_NE(hits.value()[0].record.id(), "p-1");
}

TEST_F(VectorIndexTest, TextDocumentIndexesEmbedding) {
    VectorIndex index(Type(testutil::TextModelSchema(), "text_document"));
    EXPECT_EQ(index.primary_field(), "embedding");

    Record doc;
    doc.set("text", std::string("hello"));
    doc.set("embedding", Vector{0.1f, 0.2f});
    ASSERT_TRUE(index.insert(doc).ok());

    Record query;
    query.set("embedding", Vector{0.1f, 0.2f});
    auto hits = index.find(query, index.primary_field(), 1);
    ASSERT_TRUE(hits.ok());
    ASSERT_EQ(hits.value().size(), 1u);
    EXPECT_DOUBLE_EQ(hits.value()[0].distance, 0.0);
}

TEST_F(VectorIndexTest, ClearResetsDimensions) {
    VectorIndex index(Type(testutil::PointSchema()));
    ASSERT_TRUE(index.insert(Point("a", {1, 1})).ok());
    index.clear();
    EXPECT_TRUE(index.empty());
    EXPECT_FALSE(index.dimension("vec").has_value());
    EXPECT_TRUE(index.insert(Point("b", {1, 1, 1})).ok());
}

TEST_F(VectorIndexTest, ParallelSearchesDuringInserts) {
    VectorIndex index(Type(testutil::PointSchema()));
    ASSERT_TRUE(index.insert(Point("seed", {0, 0})).ok());

    std::atomic<bool> failed{false};
    std::thread writer([&]() {
        for (int i = 1; i <= 500; ++i) {
            if (!index.insert(Point("p", {static_cast<float>(i), 0})).ok()) {
                failed = true;
            }
        }
    });
    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&]() {
            for (int i = 0; i < 200; ++i) {
                auto hits = index.find(Query({0, 0}), "vec", 3);
                if (!hits.ok() || hits.value().empty() || Label(hits.value()[0]) != "seed") {
                    failed = true;
                }
            }
        });
    }
    writer.join();
    for (auto& reader : readers) {
        reader.join();
    }
    EXPECT_FALSE(failed.load());
    EXPECT_EQ(index.size(), 501u);
}

} // namespace
} // namespace storage
} // namespace ctxdb
