#include "ctxdb/service/context_database.h"
#include "ctxdb/codec/record_codec.h"
#include "ctxdb/common/logger.h"
#include <mutex>

namespace ctxdb {
namespace service {

namespace {

using core::Error;
using core::Result;
using registry::ModelKey;
using registry::Scope;

std::string RepositoryPath(const ModelKey& key) {
    return key.namespace_name + "/" + key.workspace + "/" + key.repository;
}

} // namespace

ContextDatabase::ContextDatabase(const core::Config& config)
    : config_(config),
      materializer_(std::make_shared<schema::TypeMaterializer>()),
      registry_(materializer_, config.registry, config.index) {}

Result<void> ContextDatabase::Open() {
    std::unique_lock<std::shared_mutex> lock(structure_mutex_);

    const std::string& path = config_.catalog.snapshot_path;
    if (!path.empty()) {
        auto loaded = catalog_.Load(path);
        if (!loaded.ok() && loaded.code() != Error::Code::NOT_FOUND) {
            CTXDB_ERROR("cannot load catalog snapshot {}: {}", path, loaded.error());
            return loaded;
        }
        if (!loaded.ok()) {
            CTXDB_INFO("no catalog snapshot at {}, starting empty", path);
        }
    }

    for (const auto& model : catalog_.all_models()) {
        ModelKey key{model.namespace_name, model.workspace, model.repository, model.model};
        auto handle = registry_.resolve(key, registry::SchemaSubmission{model.definition.schema_text,
                                                                        model.definition.base_shape});
        if (!handle.ok()) {
            CTXDB_ERROR("cannot restore model {}: {}", key.to_string(), handle.error());
            return Result<void>::propagate(handle);
        }
    }

    if (config_.catalog.bootstrap_default && catalog_.list_namespaces().empty()) {
        auto created = catalog_.create_namespace(kDefaultNamespace);
        if (created.ok()) created = catalog_.create_workspace(kDefaultNamespace, kDefaultWorkspace);
        if (created.ok()) {
            created = catalog_.create_repository(kDefaultNamespace, kDefaultWorkspace, kDefaultRepository);
        }
        if (!created.ok()) {
            return created;
        }
        auto saved = persist();
        if (!saved.ok()) {
            return saved;
        }
    }

    CTXDB_INFO("context database open: {} namespaces, {} models",
               catalog_.list_namespaces().size(), registry_.size());
    return Result<void>();
}

Result<void> ContextDatabase::persist() const {
    const std::string& path = config_.catalog.snapshot_path;
    if (path.empty()) {
        return Result<void>();
    }
    auto saved = catalog_.Save(path);
    if (!saved.ok()) {
        CTXDB_ERROR("catalog snapshot failed: {}", saved.error());
    }
    return saved;
}

Result<void> ContextDatabase::commit(Result<void> mutation) const {
    if (!mutation.ok()) {
        return mutation;
    }
    return persist();
}

// Namespaces

Result<void> ContextDatabase::create_namespace(const std::string& ns) {
    std::unique_lock<std::shared_mutex> lock(structure_mutex_);
    return commit(catalog_.create_namespace(ns));
}

Result<void> ContextDatabase::rename_namespace(const std::string& from, const std::string& to) {
    std::unique_lock<std::shared_mutex> lock(structure_mutex_);
    return rename_scope(Scope{from, "", ""}, Scope{to, "", ""},
                        [&](bool undo) {
                            return undo ? catalog_.rename_namespace(to, from)
                                        : catalog_.rename_namespace(from, to);
                        });
}

Result<void> ContextDatabase::delete_namespace(const std::string& ns) {
    std::unique_lock<std::shared_mutex> lock(structure_mutex_);
    return commit(catalog_.delete_namespace(ns));
}

std::vector<std::string> ContextDatabase::list_namespaces() const {
    return catalog_.list_namespaces();
}

// Workspaces

Result<void> ContextDatabase::create_workspace(const std::string& ns, const std::string& ws) {
    std::unique_lock<std::shared_mutex> lock(structure_mutex_);
    return commit(catalog_.create_workspace(ns, ws));
}

Result<void> ContextDatabase::rename_workspace(const std::string& ns, const std::string& from,
                                               const std::string& to) {
    std::unique_lock<std::shared_mutex> lock(structure_mutex_);
    return rename_scope(Scope{ns, from, ""}, Scope{ns, to, ""},
                        [&](bool undo) {
                            return undo ? catalog_.rename_workspace(ns, to, from)
                                        : catalog_.rename_workspace(ns, from, to);
                        });
}

Result<void> ContextDatabase::delete_workspace(const std::string& ns, const std::string& ws) {
    std::unique_lock<std::shared_mutex> lock(structure_mutex_);
    return commit(catalog_.delete_workspace(ns, ws));
}

Result<std::vector<std::string>> ContextDatabase::list_workspaces(const std::string& ns) const {
    return catalog_.list_workspaces(ns);
}

// Repositories

Result<void> ContextDatabase::create_repository(const std::string& ns, const std::string& ws,
                                                const std::string& repo) {
    std::unique_lock<std::shared_mutex> lock(structure_mutex_);
    return commit(catalog_.create_repository(ns, ws, repo));
}

Result<void> ContextDatabase::rename_repository(const std::string& ns, const std::string& ws,
                                                const std::string& from, const std::string& to) {
    std::unique_lock<std::shared_mutex> lock(structure_mutex_);
    return rename_scope(Scope{ns, ws, from}, Scope{ns, ws, to},
                        [&](bool undo) {
                            return undo ? catalog_.rename_repository(ns, ws, to, from)
                                        : catalog_.rename_repository(ns, ws, from, to);
                        });
}

Result<void> ContextDatabase::rename_scope(const Scope& from, const Scope& to,
                                           const std::function<Result<void>(bool)>& rename_in_catalog) {
    auto renamed = rename_in_catalog(false);
    if (!renamed.ok()) {
        return renamed;
    }
    auto moved = registry_.rename_scope(from, to);
    if (!moved.ok()) {
        auto restored = rename_in_catalog(true);
        if (!restored.ok()) {
            CTXDB_ERROR("failed to restore catalog after rejected rename: {}", restored.error());
        }
        return Result<void>::propagate(moved);
    }
    return persist();
}

Result<void> ContextDatabase::delete_repository(const std::string& ns, const std::string& ws,
                                                const std::string& repo) {
    std::unique_lock<std::shared_mutex> lock(structure_mutex_);
    auto deleted = catalog_.delete_repository(ns, ws, repo);
    if (!deleted.ok()) {
        return deleted;
    }
    registry_.remove_scope(Scope{ns, ws, repo});
    return persist();
}

Result<std::vector<std::string>> ContextDatabase::list_repositories(const std::string& ns,
                                                                    const std::string& ws) const {
    return catalog_.list_repositories(ns, ws);
}

// Models

Result<schema::TypeDescriptorPtr> ContextDatabase::create_model(const ModelKey& key,
                                                                const std::string& schema_text,
                                                                const std::string& base_shape) {
    using DescriptorResult = Result<schema::TypeDescriptorPtr>;

    auto valid = catalog::Catalog::ValidateName("model", key.model);
    if (!valid.ok()) {
        return DescriptorResult::propagate(valid);
    }

    std::unique_lock<std::shared_mutex> lock(structure_mutex_);
    if (!catalog_.has_repository(key.namespace_name, key.workspace, key.repository)) {
        return DescriptorResult::error(Error::Code::NOT_FOUND,
            "repository '" + RepositoryPath(key) + "' does not exist");
    }

    auto handle = registry_.resolve(key, registry::SchemaSubmission{schema_text, base_shape});
    if (!handle.ok()) {
        return DescriptorResult::propagate(handle);
    }

    if (!catalog_.has_model(key.namespace_name, key.workspace, key.repository, key.model)) {
        auto added = catalog_.add_model(key.namespace_name, key.workspace, key.repository, key.model,
                                        catalog::ModelDefinition{schema_text, base_shape});
        if (!added.ok()) {
            return DescriptorResult::propagate(added);
        }
        auto saved = persist();
        if (!saved.ok()) {
            return DescriptorResult::propagate(saved);
        }
    }
    return DescriptorResult(handle.value().descriptor);
}

Result<schema::TypeDescriptorPtr> ContextDatabase::update_model(const ModelKey& key,
                                                                const std::string& schema_text,
                                                                const std::string& base_shape) {
    using DescriptorResult = Result<schema::TypeDescriptorPtr>;

    std::unique_lock<std::shared_mutex> lock(structure_mutex_);
    auto existing = catalog_.get_model(key.namespace_name, key.workspace, key.repository, key.model);
    if (!existing.ok()) {
        return DescriptorResult::propagate(existing);
    }

    // Reject a bad schema before anything is discarded
    auto descriptor = materializer_->materialize(schema_text, base_shape);
    if (!descriptor.ok()) {
        return DescriptorResult::propagate(descriptor);
    }

    auto removed = registry_.remove(key);
    if (!removed.ok()) {
        CTXDB_WARN("model {} was missing from the registry on update", key.to_string());
    }
    auto handle = registry_.resolve(key, registry::SchemaSubmission{schema_text, base_shape});
    if (!handle.ok()) {
        return DescriptorResult::propagate(handle);
    }

    auto updated = catalog_.update_model(key.namespace_name, key.workspace, key.repository, key.model,
                                         catalog::ModelDefinition{schema_text, base_shape});
    if (!updated.ok()) {
        return DescriptorResult::propagate(updated);
    }
    auto saved = persist();
    if (!saved.ok()) {
        return DescriptorResult::propagate(saved);
    }
    CTXDB_INFO("model {} replaced with type {}", key.to_string(), handle.value().descriptor->to_string());
    return DescriptorResult(handle.value().descriptor);
}

Result<void> ContextDatabase::delete_model(const ModelKey& key) {
    std::unique_lock<std::shared_mutex> lock(structure_mutex_);
    auto removed = catalog_.remove_model(key.namespace_name, key.workspace, key.repository, key.model);
    if (!removed.ok()) {
        return removed;
    }
    auto dropped = registry_.remove(key);
    if (!dropped.ok()) {
        CTXDB_WARN("model {} was missing from the registry on delete", key.to_string());
    }
    return persist();
}

Result<std::vector<std::string>> ContextDatabase::list_models(const std::string& ns, const std::string& ws,
                                                              const std::string& repo) const {
    return catalog_.list_models(ns, ws, repo);
}

Result<ModelInfo> ContextDatabase::describe_model(const ModelKey& key) const {
    std::shared_lock<std::shared_mutex> lock(structure_mutex_);
    auto definition = catalog_.get_model(key.namespace_name, key.workspace, key.repository, key.model);
    if (!definition.ok()) {
        return Result<ModelInfo>::propagate(definition);
    }
    auto handle = registry_.lookup(key);
    if (!handle.ok()) {
        return Result<ModelInfo>::propagate(handle);
    }
    ModelInfo info;
    info.key = key;
    info.descriptor = handle.value().descriptor;
    info.definition = definition.value();
    info.record_count = handle.value().index->size();
    return Result<ModelInfo>(std::move(info));
}

Result<registry::ModelHandle> ContextDatabase::handle_for(const ModelKey& key) const {
    return registry_.lookup(key);
}

// Data

Result<size_t> ContextDatabase::index(const ModelKey& key, std::vector<core::Record> records) {
    std::shared_lock<std::shared_mutex> lock(structure_mutex_);
    auto handle = handle_for(key);
    if (!handle.ok()) {
        return Result<size_t>::propagate(handle);
    }
    const size_t count = records.size();
    auto inserted = handle.value().index->insert_batch(std::move(records));
    if (!inserted.ok()) {
        return Result<size_t>::propagate(inserted);
    }
    CTXDB_DEBUG("indexed {} records into {}", count, key.to_string());
    return Result<size_t>(count);
}

Result<size_t> ContextDatabase::index_json(const ModelKey& key, const std::string& json) {
    schema::TypeDescriptorPtr descriptor;
    {
        std::shared_lock<std::shared_mutex> lock(structure_mutex_);
        auto handle = handle_for(key);
        if (!handle.ok()) {
            return Result<size_t>::propagate(handle);
        }
        descriptor = handle.value().descriptor;
    }
    auto records = codec::DecodeRecords(descriptor, json);
    if (!records.ok()) {
        return Result<size_t>::propagate(records);
    }
    // A model replaced in between rejects the records with TYPE_MISMATCH
    return index(key, records.take_value());
}

Result<std::vector<storage::ScoredRecord>> ContextDatabase::search(const ModelKey& key,
                                                                   const core::Record& query,
                                                                   const std::string& field,
                                                                   size_t limit) const {
    using Hits = std::vector<storage::ScoredRecord>;
    std::shared_lock<std::shared_mutex> lock(structure_mutex_);
    auto handle = handle_for(key);
    if (!handle.ok()) {
        return Result<Hits>::propagate(handle);
    }
    const auto& index = handle.value().index;
    const std::string& search_field = field.empty() ? index->primary_field() : field;
    if (search_field.empty()) {
        return Result<Hits>::error(Error::Code::FIELD_NOT_FOUND,
            "model " + key.to_string() + " has no vector field to search");
    }
    return index->find(query, search_field, limit);
}

Result<std::vector<storage::ScoredRecord>> ContextDatabase::search_json(const ModelKey& key,
                                                                        const std::string& query_json,
                                                                        const std::string& field,
                                                                        size_t limit) const {
    using Hits = std::vector<storage::ScoredRecord>;
    schema::TypeDescriptorPtr descriptor;
    {
        std::shared_lock<std::shared_mutex> lock(structure_mutex_);
        auto handle = handle_for(key);
        if (!handle.ok()) {
            return Result<Hits>::propagate(handle);
        }
        descriptor = handle.value().descriptor;
    }

    rapidjson::Document doc;
    doc.Parse<codec::kParseFlags>(query_json.c_str(), query_json.size());
    if (doc.HasParseError()) {
        return Result<Hits>::error(Error::Code::INVALID_ARGUMENT, "malformed query JSON");
    }
    auto query = codec::DecodeQuery(descriptor, doc);
    if (!query.ok()) {
        return Result<Hits>::propagate(query);
    }
    return search(key, query.value(), field, limit);
}

Result<core::Record> ContextDatabase::get_record(const ModelKey& key, const core::RecordID& id) const {
    std::shared_lock<std::shared_mutex> lock(structure_mutex_);
    auto handle = handle_for(key);
    if (!handle.ok()) {
        return Result<core::Record>::propagate(handle);
    }
    return handle.value().index->get(id);
}

} // namespace service
} // namespace ctxdb
