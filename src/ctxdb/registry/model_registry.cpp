#include "ctxdb/registry/model_registry.h"
#include "ctxdb/common/logger.h"
#include <algorithm>
#include <functional>
#include <mutex>
#include <tuple>

namespace ctxdb {
namespace registry {

namespace {

using core::Error;

// Number of leading non-empty parts; -1 when a part follows an empty one
int ScopeDepth(const Scope& scope) {
    const std::string* parts[] = {&scope.namespace_name, &scope.workspace, &scope.repository};
    int depth = 0;
    bool gap = false;
    for (const auto* part : parts) {
        if (part->empty()) {
            gap = true;
        } else if (gap) {
            return -1;
        } else {
            ++depth;
        }
    }
    return depth;
}

ModelKey Rebase(const ModelKey& key, const Scope& to, int depth) {
    ModelKey moved = key;
    if (depth >= 1) moved.namespace_name = to.namespace_name;
    if (depth >= 2) moved.workspace = to.workspace;
    if (depth >= 3) moved.repository = to.repository;
    return moved;
}

bool KeyLess(const ModelKey& a, const ModelKey& b) {
    return std::tie(a.namespace_name, a.workspace, a.repository, a.model) <
           std::tie(b.namespace_name, b.workspace, b.repository, b.model);
}

bool Compatible(const schema::TypeDescriptorPtr& a, const schema::TypeDescriptorPtr& b) {
    return a == b || a->compatible_with(*b);
}

} // namespace

std::string ModelKey::to_string() const {
    return namespace_name + "/" + workspace + "/" + repository + "/" + model;
}

size_t ModelKeyHash::operator()(const ModelKey& key) const {
    std::hash<std::string> h;
    size_t seed = h(key.namespace_name);
    for (const auto* part : {&key.workspace, &key.repository, &key.model}) {
        seed ^= h(*part) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
    return seed;
}

bool Scope::contains(const ModelKey& key) const {
    return (namespace_name.empty() || namespace_name == key.namespace_name) &&
           (workspace.empty() || workspace == key.workspace) &&
           (repository.empty() || repository == key.repository);
}

ModelRegistry::ModelRegistry(std::shared_ptr<schema::TypeMaterializer> materializer,
                             const core::RegistryConfig& registry_config,
                             const core::IndexConfig& index_config)
    : materializer_(std::move(materializer)),
      index_config_(index_config),
      num_shards_(std::max<size_t>(1, registry_config.num_shards)) {
    if (!materializer_) {
        throw core::InvalidArgumentError("ModelRegistry requires a materializer");
    }
    shards_.reserve(num_shards_);
    for (size_t i = 0; i < num_shards_; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

size_t ModelRegistry::get_shard_index(const ModelKey& key) const {
    return ModelKeyHash{}(key) % num_shards_;
}

ModelRegistry::Shard& ModelRegistry::shard_for(const ModelKey& key) const {
    return *shards_[get_shard_index(key)];
}

core::Result<ModelHandle> ModelRegistry::check_submission(const ModelKey& key, const ModelHandle& existing,
                                                          const SchemaSubmission& submission) {
    auto descriptor = materializer_->materialize(submission.schema_text, submission.base_shape);
    if (!descriptor.ok()) {
        return core::Result<ModelHandle>::propagate(descriptor);
    }
    if (!Compatible(descriptor.value(), existing.descriptor)) {
        CTXDB_WARN("schema conflict on model {}: bound to {}, submitted {}", key.to_string(),
                   existing.descriptor->to_string(), descriptor.value()->to_string());
        return core::Result<ModelHandle>::error(Error::Code::SCHEMA_CONFLICT,
            "model " + key.to_string() + " is bound to an incompatible schema");
    }
    return core::Result<ModelHandle>(existing);
}

core::Result<ModelHandle> ModelRegistry::resolve(const ModelKey& key,
                                                 const std::optional<SchemaSubmission>& submission) {
    Shard& shard = shard_for(key);

    std::optional<ModelHandle> existing;
    {
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        auto it = shard.entries.find(key);
        if (it != shard.entries.end()) {
            existing = it->second;
        }
    }
    if (existing) {
        if (!submission) {
            return core::Result<ModelHandle>(std::move(*existing));
        }
        return check_submission(key, *existing, *submission);
    }

    if (!submission) {
        return core::Result<ModelHandle>::error(Error::Code::NOT_FOUND,
            "model " + key.to_string() + " does not exist");
    }

    auto descriptor = materializer_->materialize(submission->schema_text, submission->base_shape);
    if (!descriptor.ok()) {
        return core::Result<ModelHandle>::propagate(descriptor);
    }

    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.entries.find(key);
    if (it != shard.entries.end()) {
        // Lost the creation race: the winner's pair is authoritative
        if (!Compatible(descriptor.value(), it->second.descriptor)) {
            return core::Result<ModelHandle>::error(Error::Code::SCHEMA_CONFLICT,
                "model " + key.to_string() + " is bound to an incompatible schema");
        }
        return core::Result<ModelHandle>(it->second);
    }

    ModelHandle handle;
    handle.descriptor = descriptor.value();
    handle.index = std::make_shared<storage::VectorIndex>(handle.descriptor, index_config_);
    shard.entries.emplace(key, handle);
    total_models_.fetch_add(1, std::memory_order_relaxed);
    lock.unlock();

    CTXDB_INFO("created model {} of type {}", key.to_string(), handle.descriptor->to_string());
    return core::Result<ModelHandle>(std::move(handle));
}

core::Result<ModelHandle> ModelRegistry::lookup(const ModelKey& key) const {
    Shard& shard = shard_for(key);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.entries.find(key);
    if (it == shard.entries.end()) {
        return core::Result<ModelHandle>::error(Error::Code::NOT_FOUND,
            "model " + key.to_string() + " does not exist");
    }
    return core::Result<ModelHandle>(it->second);
}

bool ModelRegistry::contains(const ModelKey& key) const {
    Shard& shard = shard_for(key);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    return shard.entries.count(key) > 0;
}

core::Result<void> ModelRegistry::remove(const ModelKey& key) {
    Shard& shard = shard_for(key);
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.entries.find(key);
    if (it == shard.entries.end()) {
        return core::Result<void>::error(Error::Code::NOT_FOUND,
            "model " + key.to_string() + " does not exist");
    }
    // Handles held by in-flight requests keep the index alive until they finish
    shard.entries.erase(it);
    total_models_.fetch_sub(1, std::memory_order_relaxed);
    lock.unlock();

    CTXDB_INFO("removed model {}", key.to_string());
    return core::Result<void>();
}

size_t ModelRegistry::remove_scope(const Scope& scope) {
    size_t removed = 0;
    for (auto& shard : shards_) {
        std::unique_lock<std::shared_mutex> lock(shard->mutex);
        for (auto it = shard->entries.begin(); it != shard->entries.end();) {
            if (scope.contains(it->first)) {
                it = shard->entries.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    total_models_.fetch_sub(removed, std::memory_order_relaxed);
    if (removed > 0) {
        CTXDB_INFO("removed {} models under {}/{}/{}", removed, scope.namespace_name,
                   scope.workspace, scope.repository);
    }
    return removed;
}

core::Result<size_t> ModelRegistry::rename_scope(const Scope& from, const Scope& to) {
    const int depth = ScopeDepth(from);
    if (depth <= 0 || depth != ScopeDepth(to)) {
        return core::Result<size_t>::error(Error::Code::INVALID_ARGUMENT,
            "rename scopes must be non-empty prefixes of equal depth");
    }

    // Entries move between shards: hold every shard, always in index order
    std::vector<std::unique_lock<std::shared_mutex>> locks;
    locks.reserve(num_shards_);
    for (auto& shard : shards_) {
        locks.emplace_back(shard->mutex);
    }

    std::vector<std::pair<ModelKey, ModelHandle>> moving;
    for (auto& shard : shards_) {
        for (const auto& [key, handle] : shard->entries) {
            if (from.contains(key)) {
                moving.emplace_back(key, handle);
            }
        }
    }

    for (const auto& [key, handle] : moving) {
        ModelKey target = Rebase(key, to, depth);
        if (from.contains(target)) {
            continue;
        }
        if (shard_for(target).entries.count(target) > 0) {
            return core::Result<size_t>::error(Error::Code::ALREADY_EXISTS,
                "model " + target.to_string() + " already exists");
        }
    }

    for (const auto& [key, handle] : moving) {
        shard_for(key).entries.erase(key);
    }
    for (auto& [key, handle] : moving) {
        ModelKey target = Rebase(key, to, depth);
        shard_for(target).entries.emplace(std::move(target), std::move(handle));
    }
    return core::Result<size_t>(moving.size());
}

std::vector<ModelKey> ModelRegistry::list(const Scope& scope) const {
    std::vector<ModelKey> keys;
    for (const auto& shard : shards_) {
        std::shared_lock<std::shared_mutex> lock(shard->mutex);
        for (const auto& [key, handle] : shard->entries) {
            if (scope.contains(key)) {
                keys.push_back(key);
            }
        }
    }
    std::sort(keys.begin(), keys.end(), KeyLess);
    return keys;
}

size_t ModelRegistry::size() const {
    return static_cast<size_t>(total_models_.load(std::memory_order_relaxed));
}

} // namespace registry
} // namespace ctxdb
