#include "ctxdb/core/config.h"
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <fstream>
#include <limits>
#include <sstream>

namespace ctxdb {
namespace core {

namespace {

using rapidjson::Value;

const Value* Section(const Value& root, const char* name) {
    auto it = root.FindMember(name);
    if (it == root.MemberEnd()) {
        return nullptr;
    }
    if (!it->value.IsObject()) {
        throw InvalidArgumentError(std::string("config section '") + name + "' must be an object");
    }
    return &it->value;
}

void ReadSize(const Value& section, const char* key, size_t& out) {
    auto it = section.FindMember(key);
    if (it == section.MemberEnd()) return;
    if (!it->value.IsUint64()) {
        throw InvalidArgumentError(std::string("config key '") + key + "' must be a non-negative integer");
    }
    out = static_cast<size_t>(it->value.GetUint64());
}

void ReadInt(const Value& section, const char* key, int& out) {
    auto it = section.FindMember(key);
    if (it == section.MemberEnd()) return;
    if (!it->value.IsInt()) {
        throw InvalidArgumentError(std::string("config key '") + key + "' must be an integer");
    }
    out = it->value.GetInt();
}

void ReadBool(const Value& section, const char* key, bool& out) {
    auto it = section.FindMember(key);
    if (it == section.MemberEnd()) return;
    if (!it->value.IsBool()) {
        throw InvalidArgumentError(std::string("config key '") + key + "' must be a boolean");
    }
    out = it->value.GetBool();
}

void ReadString(const Value& section, const char* key, std::string& out) {
    auto it = section.FindMember(key);
    if (it == section.MemberEnd()) return;
    if (!it->value.IsString()) {
        throw InvalidArgumentError(std::string("config key '") + key + "' must be a string");
    }
    out.assign(it->value.GetString(), it->value.GetStringLength());
}

} // namespace

Result<Config> Config::FromJson(const std::string& text) {
    rapidjson::Document doc;
    doc.Parse(text.c_str(), text.size());
    if (doc.HasParseError()) {
        std::ostringstream msg;
        msg << "config parse error at offset " << doc.GetErrorOffset() << ": "
            << rapidjson::GetParseError_En(doc.GetParseError());
        return Result<Config>::error(Error::Code::INVALID_ARGUMENT, msg.str());
    }
    if (!doc.IsObject()) {
        return Result<Config>::error(Error::Code::INVALID_ARGUMENT, "config root must be an object");
    }

    Config config;
    try {
        if (const Value* index = Section(doc, "index")) {
            ReadSize(*index, "initial_capacity", config.index.initial_capacity);
        }
        if (const Value* registry = Section(doc, "registry")) {
            ReadSize(*registry, "num_shards", config.registry.num_shards);
            if (config.registry.num_shards == 0) {
                throw InvalidArgumentError("registry.num_shards must be >= 1");
            }
        }
        if (const Value* catalog = Section(doc, "catalog")) {
            ReadString(*catalog, "snapshot_path", config.catalog.snapshot_path);
            ReadBool(*catalog, "bootstrap_default", config.catalog.bootstrap_default);
        }
        if (const Value* logging = Section(doc, "logging")) {
            ReadString(*logging, "level", config.logging.level);
        }
        if (const Value* server = Section(doc, "server")) {
            ReadString(*server, "listen_address", config.server.listen_address);
            size_t port = config.server.port;
            ReadSize(*server, "port", port);
            if (port > std::numeric_limits<uint16_t>::max()) {
                throw InvalidArgumentError("server.port out of range");
            }
            config.server.port = static_cast<uint16_t>(port);
            ReadSize(*server, "num_threads", config.server.num_threads);
            ReadInt(*server, "timeout_seconds", config.server.timeout_seconds);
            ReadSize(*server, "max_connections", config.server.max_connections);
        }
    } catch (const Error& e) {
        return Result<Config>(e);
    }
    return Result<Config>(std::move(config));
}

Result<Config> Config::FromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::error(Error::Code::NOT_FOUND, "cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return FromJson(buffer.str());
}

} // namespace core
} // namespace ctxdb
