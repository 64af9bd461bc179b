#ifndef CTXDB_REGISTRY_MODEL_REGISTRY_H_
#define CTXDB_REGISTRY_MODEL_REGISTRY_H_

#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "ctxdb/core/config.h"
#include "ctxdb/core/result.h"
#include "ctxdb/schema/type_materializer.h"
#include "ctxdb/storage/vector_index.h"

namespace ctxdb {
namespace registry {

/**
 * @brief Fully qualified model name
 */
struct ModelKey {
    std::string namespace_name;
    std::string workspace;
    std::string repository;
    std::string model;

    bool operator==(const ModelKey& other) const {
        return namespace_name == other.namespace_name && workspace == other.workspace &&
               repository == other.repository && model == other.model;
    }
    bool operator!=(const ModelKey& other) const { return !(*this == other); }

    // "namespace/workspace/repository/model"
    std::string to_string() const;
};

struct ModelKeyHash {
    size_t operator()(const ModelKey& key) const;
};

/**
 * @brief A prefix of the model hierarchy; empty trailing parts match everything
 *
 * {"root", "", ""} covers every model of namespace "root";
 * {"root", "default", "main"} every model of one repository.
 */
struct Scope {
    std::string namespace_name;
    std::string workspace;
    std::string repository;

    bool contains(const ModelKey& key) const;
};

/**
 * @brief Schema text plus base shape name, as submitted by a caller
 */
struct SchemaSubmission {
    std::string schema_text;
    std::string base_shape;
};

/**
 * @brief The pair bound to a model key
 */
struct ModelHandle {
    schema::TypeDescriptorPtr descriptor;
    std::shared_ptr<storage::VectorIndex> index;
};

/**
 * @brief Maps model keys to their descriptor and vector index
 *
 * Entries are created lazily on the first resolution that supplies a schema
 * and live until removed. Concurrent first resolutions of one key create a
 * single index; every caller receives it.
 */
class ModelRegistry {
public:
    ModelRegistry(std::shared_ptr<schema::TypeMaterializer> materializer,
                  const core::RegistryConfig& registry_config = core::RegistryConfig::Default(),
                  const core::IndexConfig& index_config = core::IndexConfig::Default());

    ModelRegistry(const ModelRegistry&) = delete;
    ModelRegistry& operator=(const ModelRegistry&) = delete;

    /**
     * @brief Returns the pair bound to @p key, creating it on first use
     *
     * - known key, no submission: the stored pair
     * - known key with submission: the stored pair when the submitted schema
     *   materializes to a compatible descriptor, SCHEMA_CONFLICT otherwise
     * - unknown key without submission: NOT_FOUND
     * - unknown key with submission: materialization errors, or a new pair
     *   with an empty index
     */
    core::Result<ModelHandle> resolve(const ModelKey& key,
                                      const std::optional<SchemaSubmission>& submission = std::nullopt);

    // Stored pair without creating anything
    core::Result<ModelHandle> lookup(const ModelKey& key) const;

    bool contains(const ModelKey& key) const;

    // Discards the descriptor binding and the index contents
    core::Result<void> remove(const ModelKey& key);

    // Removes every entry under the scope; returns the number removed
    size_t remove_scope(const Scope& scope);

    // Moves every entry under @p from to the same position under @p to;
    // returns the number moved. Both scopes must have the same depth.
    core::Result<size_t> rename_scope(const Scope& from, const Scope& to);

    // Keys under the scope, sorted
    std::vector<ModelKey> list(const Scope& scope) const;

    size_t size() const;

private:
    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<ModelKey, ModelHandle, ModelKeyHash> entries;
    };

    std::shared_ptr<schema::TypeMaterializer> materializer_;
    const core::IndexConfig index_config_;
    const size_t num_shards_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<uint64_t> total_models_{0};

    size_t get_shard_index(const ModelKey& key) const;
    Shard& shard_for(const ModelKey& key) const;

    core::Result<ModelHandle> check_submission(const ModelKey& key, const ModelHandle& existing,
                                               const SchemaSubmission& submission);
};

} // namespace registry
} // namespace ctxdb

#endif // CTXDB_REGISTRY_MODEL_REGISTRY_H_
