#ifndef CTXDB_CATALOG_CATALOG_H_
#define CTXDB_CATALOG_CATALOG_H_

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "ctxdb/core/result.h"

namespace ctxdb {
namespace catalog {

/**
 * @brief Schema a model was created with
 */
struct ModelDefinition {
    std::string schema_text;
    std::string base_shape;

    bool operator==(const ModelDefinition& other) const {
        return schema_text == other.schema_text && base_shape == other.base_shape;
    }
};

/**
 * @brief A model entry together with its position in the tree
 */
struct CatalogModel {
    std::string namespace_name;
    std::string workspace;
    std::string repository;
    std::string model;
    ModelDefinition definition;
};

/**
 * @brief Ownership tree: namespace -> workspace -> repository -> model
 *
 * Creating a node requires its parent (NOT_FOUND otherwise). Namespaces and
 * workspaces can only be deleted when empty (FAILED_PRECONDITION); deleting a
 * repository deletes its models with it. Listings are sorted by name.
 *
 * The tree can be snapshotted to JSON. Only names and model definitions are
 * written, never index contents:
 * ```
 * {"namespaces": {"root": {"default": {"main": {
 *     "DataModel": {"json_schema": "...", "base_class": "TextDoc"}}}}}}
 * ```
 *
 * Thread-safe; a single mutex guards the tree.
 */
class Catalog {
public:
    Catalog() = default;

    Catalog(const Catalog&) = delete;
    Catalog& operator=(const Catalog&) = delete;

    // Names must be non-empty, without '/', and not "." or ".."
    static core::Result<void> ValidateName(const std::string& kind, const std::string& name);

    // Namespaces
    core::Result<void> create_namespace(const std::string& ns);
    core::Result<void> rename_namespace(const std::string& from, const std::string& to);
    core::Result<void> delete_namespace(const std::string& ns);
    std::vector<std::string> list_namespaces() const;
    bool has_namespace(const std::string& ns) const;

    // Workspaces
    core::Result<void> create_workspace(const std::string& ns, const std::string& ws);
    core::Result<void> rename_workspace(const std::string& ns, const std::string& from, const std::string& to);
    core::Result<void> delete_workspace(const std::string& ns, const std::string& ws);
    core::Result<std::vector<std::string>> list_workspaces(const std::string& ns) const;
    bool has_workspace(const std::string& ns, const std::string& ws) const;

    // Repositories
    core::Result<void> create_repository(const std::string& ns, const std::string& ws, const std::string& repo);
    core::Result<void> rename_repository(const std::string& ns, const std::string& ws,
                                         const std::string& from, const std::string& to);
    core::Result<void> delete_repository(const std::string& ns, const std::string& ws, const std::string& repo);
    core::Result<std::vector<std::string>> list_repositories(const std::string& ns, const std::string& ws) const;
    bool has_repository(const std::string& ns, const std::string& ws, const std::string& repo) const;

    // Models
    core::Result<void> add_model(const std::string& ns, const std::string& ws, const std::string& repo,
                                 const std::string& model, ModelDefinition definition);
    core::Result<void> update_model(const std::string& ns, const std::string& ws, const std::string& repo,
                                    const std::string& model, ModelDefinition definition);
    core::Result<void> remove_model(const std::string& ns, const std::string& ws, const std::string& repo,
                                    const std::string& model);
    core::Result<ModelDefinition> get_model(const std::string& ns, const std::string& ws,
                                            const std::string& repo, const std::string& model) const;
    core::Result<std::vector<std::string>> list_models(const std::string& ns, const std::string& ws,
                                                       const std::string& repo) const;
    bool has_model(const std::string& ns, const std::string& ws, const std::string& repo,
                   const std::string& model) const;

    // Every model in tree order
    std::vector<CatalogModel> all_models() const;

    // Snapshot
    std::string ToJson() const;
    core::Result<void> LoadJson(const std::string& text);
    core::Result<void> Save(const std::string& path) const;
    core::Result<void> Load(const std::string& path);

private:
    using Repository = std::map<std::string, ModelDefinition>;
    using Workspace = std::map<std::string, Repository>;
    using Namespace = std::map<std::string, Workspace>;
    using Tree = std::map<std::string, Namespace>;

    Tree namespaces_;
    mutable std::mutex mutex_;
};

} // namespace catalog
} // namespace ctxdb

#endif // CTXDB_CATALOG_CATALOG_H_
