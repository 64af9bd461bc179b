#include "ctxdb/catalog/catalog.h"
#include "ctxdb/common/logger.h"
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace ctxdb {
namespace catalog {

namespace {

using core::Error;
using core::Result;

template <typename Map>
auto Locate(Map& map, const std::string& key) -> decltype(&map.begin()->second) {
    auto it = map.find(key);
    return it == map.end() ? nullptr : &it->second;
}

Result<void> Missing(const std::string& kind, const std::string& path) {
    return Result<void>::error(Error::Code::NOT_FOUND, kind + " '" + path + "' does not exist");
}

Result<void> Exists(const std::string& kind, const std::string& path) {
    return Result<void>::error(Error::Code::ALREADY_EXISTS, kind + " '" + path + "' already exists");
}

std::string Join(const std::string& a, const std::string& b) { return a + "/" + b; }

template <typename Map>
std::vector<std::string> SortedKeys(const Map& map) {
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& entry : map) {
        keys.push_back(entry.first);
    }
    return keys;
}

// Moves map[from] to map[to]; caller checked from exists and to does not
template <typename Map>
void Rekey(Map& map, const std::string& from, const std::string& to) {
    auto node = map.extract(from);
    node.key() = to;
    map.insert(std::move(node));
}

} // namespace

Result<void> Catalog::ValidateName(const std::string& kind, const std::string& name) {
    if (name.empty()) {
        return Result<void>::error(Error::Code::INVALID_ARGUMENT, kind + " name must not be empty");
    }
    if (name == "." || name == ".." || name.find('/') != std::string::npos) {
        return Result<void>::error(Error::Code::INVALID_ARGUMENT,
            "invalid " + kind + " name '" + name + "'");
    }
    return Result<void>();
}

// Namespaces

Result<void> Catalog::create_namespace(const std::string& ns) {
    auto valid = ValidateName("namespace", ns);
    if (!valid.ok()) return valid;

    std::lock_guard<std::mutex> lock(mutex_);
    if (namespaces_.count(ns) > 0) {
        return Exists("namespace", ns);
    }
    namespaces_.emplace(ns, Namespace{});
    return Result<void>();
}

Result<void> Catalog::rename_namespace(const std::string& from, const std::string& to) {
    auto valid = ValidateName("namespace", to);
    if (!valid.ok()) return valid;

    std::lock_guard<std::mutex> lock(mutex_);
    if (namespaces_.count(from) == 0) {
        return Missing("namespace", from);
    }
    if (namespaces_.count(to) > 0) {
        return Exists("namespace", to);
    }
    Rekey(namespaces_, from, to);
    return Result<void>();
}

Result<void> Catalog::delete_namespace(const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = namespaces_.find(ns);
    if (it == namespaces_.end()) {
        return Missing("namespace", ns);
    }
    if (!it->second.empty()) {
        return Result<void>::error(Error::Code::FAILED_PRECONDITION,
            "namespace '" + ns + "' is not empty");
    }
    namespaces_.erase(it);
    return Result<void>();
}

std::vector<std::string> Catalog::list_namespaces() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return SortedKeys(namespaces_);
}

bool Catalog::has_namespace(const std::string& ns) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return namespaces_.count(ns) > 0;
}

// Workspaces

Result<void> Catalog::create_workspace(const std::string& ns, const std::string& ws) {
    auto valid = ValidateName("workspace", ws);
    if (!valid.ok()) return valid;

    std::lock_guard<std::mutex> lock(mutex_);
    auto* n = Locate(namespaces_, ns);
    if (!n) return Missing("namespace", ns);
    if (n->count(ws) > 0) {
        return Exists("workspace", Join(ns, ws));
    }
    n->emplace(ws, Workspace{});
    return Result<void>();
}

Result<void> Catalog::rename_workspace(const std::string& ns, const std::string& from, const std::string& to) {
    auto valid = ValidateName("workspace", to);
    if (!valid.ok()) return valid;

    std::lock_guard<std::mutex> lock(mutex_);
    auto* n = Locate(namespaces_, ns);
    if (!n) return Missing("namespace", ns);
    if (n->count(from) == 0) return Missing("workspace", Join(ns, from));
    if (n->count(to) > 0) return Exists("workspace", Join(ns, to));
    Rekey(*n, from, to);
    return Result<void>();
}

Result<void> Catalog::delete_workspace(const std::string& ns, const std::string& ws) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* n = Locate(namespaces_, ns);
    if (!n) return Missing("namespace", ns);
    auto it = n->find(ws);
    if (it == n->end()) return Missing("workspace", Join(ns, ws));
    if (!it->second.empty()) {
        return Result<void>::error(Error::Code::FAILED_PRECONDITION,
            "workspace '" + Join(ns, ws) + "' is not empty");
    }
    n->erase(it);
    return Result<void>();
}

Result<std::vector<std::string>> Catalog::list_workspaces(const std::string& ns) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* n = Locate(namespaces_, ns);
    if (!n) {
        return Result<std::vector<std::string>>::propagate(Missing("namespace", ns));
    }
    return Result<std::vector<std::string>>(SortedKeys(*n));
}

bool Catalog::has_workspace(const std::string& ns, const std::string& ws) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* n = Locate(namespaces_, ns);
    return n && n->count(ws) > 0;
}

// Repositories

Result<void> Catalog::create_repository(const std::string& ns, const std::string& ws, const std::string& repo) {
    auto valid = ValidateName("repository", repo);
    if (!valid.ok()) return valid;

    std::lock_guard<std::mutex> lock(mutex_);
    auto* n = Locate(namespaces_, ns);
    if (!n) return Missing("namespace", ns);
    auto* w = Locate(*n, ws);
    if (!w) return Missing("workspace", Join(ns, ws));
    if (w->count(repo) > 0) {
        return Exists("repository", Join(Join(ns, ws), repo));
    }
    w->emplace(repo, Repository{});
    return Result<void>();
}

Result<void> Catalog::rename_repository(const std::string& ns, const std::string& ws,
                                        const std::string& from, const std::string& to) {
    auto valid = ValidateName("repository", to);
    if (!valid.ok()) return valid;

    std::lock_guard<std::mutex> lock(mutex_);
    auto* n = Locate(namespaces_, ns);
    if (!n) return Missing("namespace", ns);
    auto* w = Locate(*n, ws);
    if (!w) return Missing("workspace", Join(ns, ws));
    if (w->count(from) == 0) return Missing("repository", Join(Join(ns, ws), from));
    if (w->count(to) > 0) return Exists("repository", Join(Join(ns, ws), to));
    Rekey(*w, from, to);
    return Result<void>();
}

Result<void> Catalog::delete_repository(const std::string& ns, const std::string& ws, const std::string& repo) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* n = Locate(namespaces_, ns);
    if (!n) return Missing("namespace", ns);
    auto* w = Locate(*n, ws);
    if (!w) return Missing("workspace", Join(ns, ws));
    if (w->erase(repo) == 0) {
        return Missing("repository", Join(Join(ns, ws), repo));
    }
    return Result<void>();
}

Result<std::vector<std::string>> Catalog::list_repositories(const std::string& ns, const std::string& ws) const {
    using Names = std::vector<std::string>;
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* n = Locate(namespaces_, ns);
    if (!n) return Result<Names>::propagate(Missing("namespace", ns));
    const auto* w = Locate(*n, ws);
    if (!w) return Result<Names>::propagate(Missing("workspace", Join(ns, ws)));
    return Result<Names>(SortedKeys(*w));
}

bool Catalog::has_repository(const std::string& ns, const std::string& ws, const std::string& repo) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* n = Locate(namespaces_, ns);
    if (!n) return false;
    const auto* w = Locate(*n, ws);
    return w && w->count(repo) > 0;
}

// Models

Result<void> Catalog::add_model(const std::string& ns, const std::string& ws, const std::string& repo,
                                const std::string& model, ModelDefinition definition) {
    auto valid = ValidateName("model", model);
    if (!valid.ok()) return valid;

    std::lock_guard<std::mutex> lock(mutex_);
    auto* n = Locate(namespaces_, ns);
    if (!n) return Missing("namespace", ns);
    auto* w = Locate(*n, ws);
    if (!w) return Missing("workspace", Join(ns, ws));
    auto* r = Locate(*w, repo);
    if (!r) return Missing("repository", Join(Join(ns, ws), repo));
    if (r->count(model) > 0) {
        return Exists("model", Join(Join(Join(ns, ws), repo), model));
    }
    r->emplace(model, std::move(definition));
    return Result<void>();
}

Result<void> Catalog::update_model(const std::string& ns, const std::string& ws, const std::string& repo,
                                   const std::string& model, ModelDefinition definition) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* n = Locate(namespaces_, ns);
    if (!n) return Missing("namespace", ns);
    auto* w = Locate(*n, ws);
    if (!w) return Missing("workspace", Join(ns, ws));
    auto* r = Locate(*w, repo);
    if (!r) return Missing("repository", Join(Join(ns, ws), repo));
    auto* m = Locate(*r, model);
    if (!m) return Missing("model", Join(Join(Join(ns, ws), repo), model));
    *m = std::move(definition);
    return Result<void>();
}

Result<void> Catalog::remove_model(const std::string& ns, const std::string& ws, const std::string& repo,
                                   const std::string& model) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* n = Locate(namespaces_, ns);
    if (!n) return Missing("namespace", ns);
    auto* w = Locate(*n, ws);
    if (!w) return Missing("workspace", Join(ns, ws));
    auto* r = Locate(*w, repo);
    if (!r) return Missing("repository", Join(Join(ns, ws), repo));
    if (r->erase(model) == 0) {
        return Missing("model", Join(Join(Join(ns, ws), repo), model));
    }
    return Result<void>();
}

Result<ModelDefinition> Catalog::get_model(const std::string& ns, const std::string& ws,
                                           const std::string& repo, const std::string& model) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* n = Locate(namespaces_, ns);
    if (!n) return Result<ModelDefinition>::propagate(Missing("namespace", ns));
    const auto* w = Locate(*n, ws);
    if (!w) return Result<ModelDefinition>::propagate(Missing("workspace", Join(ns, ws)));
    const auto* r = Locate(*w, repo);
    if (!r) return Result<ModelDefinition>::propagate(Missing("repository", Join(Join(ns, ws), repo)));
    const auto* m = Locate(*r, model);
    if (!m) {
        return Result<ModelDefinition>::propagate(Missing("model", Join(Join(Join(ns, ws), repo), model)));
    }
    return Result<ModelDefinition>(*m);
}

Result<std::vector<std::string>> Catalog::list_models(const std::string& ns, const std::string& ws,
                                                      const std::string& repo) const {
    using Names = std::vector<std::string>;
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* n = Locate(namespaces_, ns);
    if (!n) return Result<Names>::propagate(Missing("namespace", ns));
    const auto* w = Locate(*n, ws);
    if (!w) return Result<Names>::propagate(Missing("workspace", Join(ns, ws)));
    const auto* r = Locate(*w, repo);
    if (!r) return Result<Names>::propagate(Missing("repository", Join(Join(ns, ws), repo)));
    return Result<Names>(SortedKeys(*r));
}

bool Catalog::has_model(const std::string& ns, const std::string& ws, const std::string& repo,
                        const std::string& model) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* n = Locate(namespaces_, ns);
    if (!n) return false;
    const auto* w = Locate(*n, ws);
    if (!w) return false;
    const auto* r = Locate(*w, repo);
    return r && r->count(model) > 0;
}

std::vector<CatalogModel> Catalog::all_models() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CatalogModel> models;
    for (const auto& [ns, workspaces] : namespaces_) {
        for (const auto& [ws, repositories] : workspaces) {
            for (const auto& [repo, entries] : repositories) {
                for (const auto& [model, definition] : entries) {
                    models.push_back(CatalogModel{ns, ws, repo, model, definition});
                }
            }
        }
    }
    return models;
}

// Snapshot

std::string Catalog::ToJson() const {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);

    std::lock_guard<std::mutex> lock(mutex_);
    writer.StartObject();
    writer.Key("namespaces");
    writer.StartObject();
    for (const auto& [ns, workspaces] : namespaces_) {
        writer.Key(ns.c_str(), static_cast<rapidjson::SizeType>(ns.size()));
        writer.StartObject();
        for (const auto& [ws, repositories] : workspaces) {
            writer.Key(ws.c_str(), static_cast<rapidjson::SizeType>(ws.size()));
            writer.StartObject();
            for (const auto& [repo, entries] : repositories) {
                writer.Key(repo.c_str(), static_cast<rapidjson::SizeType>(repo.size()));
                writer.StartObject();
                for (const auto& [model, definition] : entries) {
                    writer.Key(model.c_str(), static_cast<rapidjson::SizeType>(model.size()));
                    writer.StartObject();
                    writer.Key("json_schema");
                    writer.String(definition.schema_text.c_str(),
                                  static_cast<rapidjson::SizeType>(definition.schema_text.size()));
                    writer.Key("base_class");
                    writer.String(definition.base_shape.c_str(),
                                  static_cast<rapidjson::SizeType>(definition.base_shape.size()));
                    writer.EndObject();
                }
                writer.EndObject();
            }
            writer.EndObject();
        }
        writer.EndObject();
    }
    writer.EndObject();
    writer.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

namespace {

using rapidjson::Value;

std::string Str(const Value& v) {
    return std::string(v.GetString(), v.GetStringLength());
}

const Value& RequireObject(const Value& value, const std::string& what) {
    if (!value.IsObject()) {
        throw core::InvalidArgumentError("catalog snapshot: " + what + " must be an object");
    }
    return value;
}

std::string RequireName(const Value& key, const std::string& kind) {
    std::string name = Str(key);
    auto valid = Catalog::ValidateName(kind, name);
    if (!valid.ok()) {
        throw core::InvalidArgumentError("catalog snapshot: " + valid.error());
    }
    return name;
}

std::string RequireString(const Value& object, const char* key, const std::string& where) {
    auto it = object.FindMember(key);
    if (it == object.MemberEnd() || !it->value.IsString()) {
        throw core::InvalidArgumentError("catalog snapshot: " + where + " needs string '" + key + "'");
    }
    return Str(it->value);
}

} // namespace

Result<void> Catalog::LoadJson(const std::string& text) {
    rapidjson::Document doc;
    doc.Parse(text.c_str(), text.size());
    if (doc.HasParseError()) {
        std::ostringstream msg;
        msg << "catalog snapshot parse error at offset " << doc.GetErrorOffset() << ": "
            << rapidjson::GetParseError_En(doc.GetParseError());
        return Result<void>::error(Error::Code::INVALID_ARGUMENT, msg.str());
    }

    Tree tree;
    try {
        const Value& root = RequireObject(doc, "root");
        auto top = root.FindMember("namespaces");
        if (top != root.MemberEnd()) {
            for (const auto& ns : RequireObject(top->value, "namespaces").GetObject()) {
                Namespace& n = tree[RequireName(ns.name, "namespace")];
                for (const auto& ws : RequireObject(ns.value, "namespace").GetObject()) {
                    Workspace& w = n[RequireName(ws.name, "workspace")];
                    for (const auto& repo : RequireObject(ws.value, "workspace").GetObject()) {
                        Repository& r = w[RequireName(repo.name, "repository")];
                        for (const auto& model : RequireObject(repo.value, "repository").GetObject()) {
                            std::string name = RequireName(model.name, "model");
                            const Value& entry = RequireObject(model.value, "model " + name);
                            r[name] = ModelDefinition{RequireString(entry, "json_schema", "model " + name),
                                                      RequireString(entry, "base_class", "model " + name)};
                        }
                    }
                }
            }
        }
    } catch (const Error& e) {
        return Result<void>(e);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    namespaces_.swap(tree);
    return Result<void>();
}

Result<void> Catalog::Save(const std::string& path) const {
    const std::string json = ToJson();
    const std::string tmp_path = path + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            return Result<void>::error(Error::Code::INTERNAL, "cannot write catalog snapshot: " + tmp_path);
        }
        out << json;
        if (!out.good()) {
            return Result<void>::error(Error::Code::INTERNAL, "short write of catalog snapshot: " + tmp_path);
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        return Result<void>::error(Error::Code::INTERNAL,
            "cannot replace catalog snapshot " + path + ": " + ec.message());
    }
    CTXDB_DEBUG("catalog snapshot written to {}", path);
    return Result<void>();
}

Result<void> Catalog::Load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<void>::error(Error::Code::NOT_FOUND, "cannot open catalog snapshot: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    auto loaded = LoadJson(buffer.str());
    if (loaded.ok()) {
        CTXDB_INFO("catalog loaded from {}", path);
    }
    return loaded;
}

} // namespace catalog
} // namespace ctxdb
