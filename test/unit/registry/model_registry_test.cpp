#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "ctxdb/registry/model_registry.h"
#include "test_util/schemas.h"

namespace ctxdb {
namespace registry {
namespace {

using core::Error;

class ModelRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        materializer_ = std::make_shared<schema::TypeMaterializer>();
        core::RegistryConfig config;
        config.num_shards = 4;
        registry_ = std::make_unique<ModelRegistry>(materializer_, config);
    }

    static ModelKey Key(const std::string& model, const std::string& repository = "main",
                        const std::string& workspace = "default", const std::string& ns = "root") {
        return ModelKey{ns, workspace, repository, model};
    }

    static SchemaSubmission Text() {
        return SchemaSubmission{testutil::TextModelSchema(), "text_document"};
    }

    static SchemaSubmission Point() {
        return SchemaSubmission{testutil::PointSchema(), "generic_document"};
    }

    std::shared_ptr<schema::TypeMaterializer> materializer_;
    std::unique_ptr<ModelRegistry> registry_;
};

TEST_F(ModelRegistryTest, ResolveCreatesOnFirstUse) {
    EXPECT_EQ(registry_->resolve(Key("docs")).code(), Error::Code::NOT_FOUND);

    auto created = registry_->resolve(Key("docs"), Text());
    ASSERT_TRUE(created.ok()) << created.error();
    EXPECT_TRUE(created.value().index->empty());
    EXPECT_EQ(registry_->size(), 1u);
    EXPECT_TRUE(registry_->contains(Key("docs")));

    auto again = registry_->resolve(Key("docs"));
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(again.value().index, created.value().index);
    EXPECT_EQ(again.value().descriptor, created.value().descriptor);
}

TEST_F(ModelRegistryTest, CompatibleSubmissionReturnsExistingPair) {
    auto created = registry_->resolve(Key("docs"), Text());
    ASSERT_TRUE(created.ok());
    ASSERT_TRUE(created.value().index->insert([] {
        core::Record record;
        record.set("embedding", core::Vector{1, 2});
        return record;
    }()).ok());

    auto again = registry_->resolve(Key("docs"), Text());
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(again.value().index, created.value().index);
    EXPECT_EQ(again.value().index->size(), 1u);
}

TEST_F(ModelRegistryTest, IncompatibleSubmissionConflicts) {
    ASSERT_TRUE(registry_->resolve(Key("docs"), Text()).ok());
    auto conflict = registry_->resolve(Key("docs"), Point());
    EXPECT_EQ(conflict.code(), Error::Code::SCHEMA_CONFLICT);
    EXPECT_EQ(registry_->size(), 1u);
}

TEST_F(ModelRegistryTest, MaterializationErrorsCreateNothing) {
    auto bad = registry_->resolve(Key("docs"), SchemaSubmission{testutil::PointSchema(), "unknown_shape"});
    EXPECT_EQ(bad.code(), Error::Code::UNKNOWN_BASE_SHAPE);
    EXPECT_FALSE(registry_->contains(Key("docs")));
    EXPECT_EQ(registry_->size(), 0u);
}

TEST_F(ModelRegistryTest, ConcurrentFirstResolutionCreatesOneIndex) {
    constexpr int kThreads = 8;
    std::vector<std::shared_ptr<storage::VectorIndex>> indexes(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([this, &indexes, i]() {
            auto handle = registry_->resolve(Key("shared"), Text());
            if (handle.ok()) {
                indexes[i] = handle.value().index;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    for (const auto& index : indexes) {
        ASSERT_NE(index, nullptr);
        EXPECT_EQ(index, indexes[0]);
    }
    EXPECT_EQ(registry_->size(), 1u);
}

TEST_F(ModelRegistryTest, RemoveKeepsHeldHandlesAlive) {
    auto created = registry_->resolve(Key("docs"), Text());
    ASSERT_TRUE(created.ok());
    std::shared_ptr<storage::VectorIndex> held = created.value().index;

    ASSERT_TRUE(registry_->remove(Key("docs")).ok());
    EXPECT_FALSE(registry_->contains(Key("docs")));
    EXPECT_EQ(registry_->remove(Key("docs")).code(), Error::Code::NOT_FOUND);
    EXPECT_EQ(registry_->size(), 0u);
    EXPECT_TRUE(held->empty());

    auto recreated = registry_->resolve(Key("docs"), Point());
    ASSERT_TRUE(recreated.ok());
    EXPECT_NE(recreated.value().index, held);
}

TEST_F(ModelRegistryTest, ListAndRemoveScope) {
    ASSERT_TRUE(registry_->resolve(Key("b"), Text()).ok());
    ASSERT_TRUE(registry_->resolve(Key("a"), Text()).ok());
    ASSERT_TRUE(registry_->resolve(Key("c", "other"), Text()).ok());
    ASSERT_TRUE(registry_->resolve(Key("d", "main", "ws2"), Text()).ok());

    auto in_main = registry_->list(Scope{"root", "default", "main"});
    ASSERT_EQ(in_main.size(), 2u);
    EXPECT_EQ(in_main[0].model, "a");
    EXPECT_EQ(in_main[1].model, "b");
    EXPECT_EQ(registry_->list(Scope{"root", "", ""}).size(), 4u);
    EXPECT_EQ(registry_->list(Scope{}).size(), 4u);

    EXPECT_EQ(registry_->remove_scope(Scope{"root", "default", ""}), 3u);
    EXPECT_EQ(registry_->size(), 1u);
    EXPECT_TRUE(registry_->contains(Key("d", "main", "ws2")));
}

TEST_F(ModelRegistryTest, RenameScopeMovesEntries) {
    auto created = registry_->resolve(Key("docs"), Text());
    ASSERT_TRUE(created.ok());
    ASSERT_TRUE(registry_->resolve(Key("kept", "main", "ws2"), Text()).ok());

    auto moved = registry_->rename_scope(Scope{"root", "default", ""}, Scope{"root", "renamed", ""});
    ASSERT_TRUE(moved.ok()) << moved.error();
    EXPECT_EQ(moved.value(), 1u);
    EXPECT_FALSE(registry_->contains(Key("docs")));

    auto found = registry_->lookup(Key("docs", "main", "renamed"));
    ASSERT_TRUE(found.ok());
    EXPECT_EQ(found.value().index, created.value().index);
    EXPECT_TRUE(registry_->contains(Key("kept", "main", "ws2")));
    EXPECT_EQ(registry_->size(), 2u);
}

TEST_F(ModelRegistryTest, RenameScopeRejectsCollisionsAndBadScopes) {
    ASSERT_TRUE(registry_->resolve(Key("docs", "a"), Text()).ok());
    ASSERT_TRUE(registry_->resolve(Key("docs", "b"), Text()).ok());

    auto collision = registry_->rename_scope(Scope{"root", "default", "a"}, Scope{"root", "default", "b"});
    EXPECT_EQ(collision.code(), Error::Code::ALREADY_EXISTS);
    EXPECT_TRUE(registry_->contains(Key("docs", "a")));

    EXPECT_EQ(registry_->rename_scope(Scope{"root", "", ""}, Scope{"x", "y", ""}).code(),
              Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(registry_->rename_scope(Scope{}, Scope{}).code(), Error::Code::INVALID_ARGUMENT);
}

TEST(ModelKeyTest, ToStringAndHash) {
    ModelKey a{"ns", "ws", "repo", "model"};
    ModelKey b{"ns", "ws", "repo", "model"};
    EXPECT_EQ(a.to_string(), "ns/ws/repo/model");
    EXPECT_EQ(ModelKeyHash{}(a), ModelKeyHash{}(b));
    EXPECT_TRUE((Scope{"ns", "", ""}.contains(a)));
    EXPECT_FALSE((Scope{"ns", "other", ""}.contains(a)));
}

} // namespace
} // namespace registry
} // namespace ctxdb
