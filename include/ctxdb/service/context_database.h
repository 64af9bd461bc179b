#pragma once

#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "ctxdb/catalog/catalog.h"
#include "ctxdb/core/config.h"
#include "ctxdb/core/record.h"
#include "ctxdb/core/result.h"
#include "ctxdb/registry/model_registry.h"
#include "ctxdb/schema/type_materializer.h"
#include "ctxdb/storage/vector_index.h"

namespace ctxdb {
namespace service {

/**
 * @brief What describe_model reports about a model
 */
struct ModelInfo {
    registry::ModelKey key;
    schema::TypeDescriptorPtr descriptor;
    catalog::ModelDefinition definition;
    size_t record_count = 0;
};

/**
 * @brief The context database: catalog, registry and codec behind one API
 *
 * Hierarchy changes and model lifecycle operations are serialized against
 * each other; index, search and lookup requests run concurrently and only
 * contend on the index they touch.
 *
 * When a snapshot path is configured, the catalog (names and model schemas)
 * is written after every successful mutation and reloaded by Open(). Index
 * contents are never persisted: a reopened model starts empty.
 */
class ContextDatabase {
public:
    static constexpr const char* kDefaultNamespace = "root";
    static constexpr const char* kDefaultWorkspace = "default";
    static constexpr const char* kDefaultRepository = "main";

    explicit ContextDatabase(const core::Config& config = core::Config::Default());

    ContextDatabase(const ContextDatabase&) = delete;
    ContextDatabase& operator=(const ContextDatabase&) = delete;

    /**
     * @brief Restores the catalog snapshot and re-creates its models
     *
     * A missing snapshot file starts an empty catalog. An empty catalog gets
     * root/default/main when bootstrap_default is set.
     */
    core::Result<void> Open();

    // Namespaces
    core::Result<void> create_namespace(const std::string& ns);
    core::Result<void> rename_namespace(const std::string& from, const std::string& to);
    core::Result<void> delete_namespace(const std::string& ns);
    std::vector<std::string> list_namespaces() const;

    // Workspaces
    core::Result<void> create_workspace(const std::string& ns, const std::string& ws);
    core::Result<void> rename_workspace(const std::string& ns, const std::string& from, const std::string& to);
    core::Result<void> delete_workspace(const std::string& ns, const std::string& ws);
    core::Result<std::vector<std::string>> list_workspaces(const std::string& ns) const;

    // Repositories; deleting one discards its models and their indexes
    core::Result<void> create_repository(const std::string& ns, const std::string& ws, const std::string& repo);
    core::Result<void> rename_repository(const std::string& ns, const std::string& ws,
                                         const std::string& from, const std::string& to);
    core::Result<void> delete_repository(const std::string& ns, const std::string& ws, const std::string& repo);
    core::Result<std::vector<std::string>> list_repositories(const std::string& ns, const std::string& ws) const;

    /**
     * @brief Creates a model in an existing repository
     *
     * Creating a model that exists with an equivalent schema returns the
     * existing descriptor; an incompatible schema fails with SCHEMA_CONFLICT.
     */
    core::Result<schema::TypeDescriptorPtr> create_model(const registry::ModelKey& key,
                                                         const std::string& schema_text,
                                                         const std::string& base_shape);

    /**
     * @brief Replaces a model's schema
     *
     * The new schema is materialized first; on success the old descriptor
     * and every indexed record are discarded and an empty index takes their
     * place.
     */
    core::Result<schema::TypeDescriptorPtr> update_model(const registry::ModelKey& key,
                                                         const std::string& schema_text,
                                                         const std::string& base_shape);

    core::Result<void> delete_model(const registry::ModelKey& key);
    core::Result<std::vector<std::string>> list_models(const std::string& ns, const std::string& ws,
                                                       const std::string& repo) const;
    core::Result<ModelInfo> describe_model(const registry::ModelKey& key) const;

    // Inserts all records or none; returns the number inserted
    core::Result<size_t> index(const registry::ModelKey& key, std::vector<core::Record> records);

    // @p json is one record object or an array of them
    core::Result<size_t> index_json(const registry::ModelKey& key, const std::string& json);

    /**
     * @brief Nearest records to @p query
     * @param field Vector field to search; empty selects the model's primary
     *        vector field
     */
    core::Result<std::vector<storage::ScoredRecord>> search(const registry::ModelKey& key,
                                                            const core::Record& query,
                                                            const std::string& field,
                                                            size_t limit) const;

    // @p query_json is a record object; required fields may be left out
    core::Result<std::vector<storage::ScoredRecord>> search_json(const registry::ModelKey& key,
                                                                 const std::string& query_json,
                                                                 const std::string& field,
                                                                 size_t limit) const;

    core::Result<core::Record> get_record(const registry::ModelKey& key, const core::RecordID& id) const;

    const catalog::Catalog& catalog() const { return catalog_; }
    const registry::ModelRegistry& registry() const { return registry_; }
    schema::TypeMaterializer& materializer() { return *materializer_; }

private:
    const core::Config config_;
    std::shared_ptr<schema::TypeMaterializer> materializer_;
    registry::ModelRegistry registry_;
    catalog::Catalog catalog_;

    // Exclusive for hierarchy and model lifecycle changes, shared for data access
    mutable std::shared_mutex structure_mutex_;

    // Writes the catalog snapshot when one is configured
    core::Result<void> persist() const;

    // Runs persist() after a successful mutation
    core::Result<void> commit(core::Result<void> mutation) const;

    core::Result<registry::ModelHandle> handle_for(const registry::ModelKey& key) const;

    // Renames in the catalog, then moves the registry entries. A registry
    // failure renames the catalog back (rename_in_catalog(true)).
    core::Result<void> rename_scope(const registry::Scope& from, const registry::Scope& to,
                                    const std::function<core::Result<void>(bool undo)>& rename_in_catalog);
};

} // namespace service
} // namespace ctxdb
