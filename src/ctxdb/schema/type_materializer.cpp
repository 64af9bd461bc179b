#include "ctxdb/schema/type_materializer.h"
#include "ctxdb/schema/fingerprint.h"
#include "ctxdb/common/logger.h"
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <algorithm>
#include <cstring>
#include <mutex>
#include <set>

namespace ctxdb {
namespace schema {

namespace {

using rapidjson::Value;
using core::FieldType;
using core::InvalidSchemaError;

const char kDefaultTypeName[] = "DataModel";

struct ParsedType {
    FieldType type = FieldType::STRING;
    bool nullable = false;
    std::optional<size_t> dimension;
};

std::string AsString(const Value& v) {
    return std::string(v.GetString(), v.GetStringLength());
}

void WriteCanonical(const Value& value, rapidjson::Writer<rapidjson::StringBuffer>& writer) {
    if (value.IsObject()) {
        std::vector<const Value::Member*> members;
        members.reserve(value.MemberCount());
        for (auto it = value.MemberBegin(); it != value.MemberEnd(); ++it) {
            members.push_back(&*it);
        }
        std::stable_sort(members.begin(), members.end(), [](const Value::Member* a, const Value::Member* b) {
            return AsString(a->name) < AsString(b->name);
        });
        writer.StartObject();
        for (const auto* member : members) {
            writer.Key(member->name.GetString(), member->name.GetStringLength());
            WriteCanonical(member->value, writer);
        }
        writer.EndObject();
    } else if (value.IsArray()) {
        writer.StartArray();
        for (const auto& element : value.GetArray()) {
            WriteCanonical(element, writer);
        }
        writer.EndArray();
    } else {
        value.Accept(writer);
    }
}

std::string CanonicalJson(const Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    WriteCanonical(value, writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

bool IsNullSchema(const Value& schema) {
    if (!schema.IsObject()) return false;
    auto it = schema.FindMember("type");
    return it != schema.MemberEnd() && it->value.IsString() && AsString(it->value) == "null";
}

std::optional<size_t> ReadSizeKeyword(const std::string& field, const Value& schema, const char* key) {
    auto it = schema.FindMember(key);
    if (it == schema.MemberEnd()) {
        return std::nullopt;
    }
    if (!it->value.IsUint64()) {
        throw InvalidSchemaError("field '" + field + "': " + key + " must be a non-negative integer");
    }
    return static_cast<size_t>(it->value.GetUint64());
}

ParsedType ParseFieldType(const std::string& field, const Value& schema);

ParsedType ParseUnion(const std::string& field, const Value& branches) {
    if (!branches.IsArray()) {
        throw InvalidSchemaError("field '" + field + "': anyOf/oneOf must be an array");
    }
    bool nullable = false;
    const Value* chosen = nullptr;
    for (const auto& branch : branches.GetArray()) {
        if (IsNullSchema(branch)) {
            nullable = true;
            continue;
        }
        if (chosen) {
            throw InvalidSchemaError("field '" + field + "': unions of several types are not supported");
        }
        chosen = &branch;
    }
    if (!chosen) {
        throw InvalidSchemaError("field '" + field + "': union has no non-null branch");
    }
    ParsedType parsed = ParseFieldType(field, *chosen);
    parsed.nullable = parsed.nullable || nullable;
    return parsed;
}

ParsedType ParseFieldType(const std::string& field, const Value& schema) {
    if (!schema.IsObject()) {
        throw InvalidSchemaError("field '" + field + "': property schema must be an object");
    }
    if (schema.HasMember("$ref")) {
        throw InvalidSchemaError("field '" + field + "': schema references are not supported");
    }
    for (const char* keyword : {"anyOf", "oneOf"}) {
        auto it = schema.FindMember(keyword);
        if (it != schema.MemberEnd()) {
            return ParseUnion(field, it->value);
        }
    }

    auto type_it = schema.FindMember("type");
    if (type_it == schema.MemberEnd()) {
        throw InvalidSchemaError("field '" + field + "': missing type");
    }

    ParsedType parsed;
    std::string type_name;
    if (type_it->value.IsString()) {
        type_name = AsString(type_it->value);
    } else if (type_it->value.IsArray()) {
        for (const auto& t : type_it->value.GetArray()) {
            if (!t.IsString()) {
                throw InvalidSchemaError("field '" + field + "': type array must contain strings");
            }
            std::string name = AsString(t);
            if (name == "null") {
                parsed.nullable = true;
            } else if (type_name.empty()) {
                type_name = name;
            } else {
                throw InvalidSchemaError("field '" + field + "': unions of several types are not supported");
            }
        }
    } else {
        throw InvalidSchemaError("field '" + field + "': type must be a string or an array");
    }

    if (type_name == "string") {
        parsed.type = FieldType::STRING;
        auto format_it = schema.FindMember("format");
        if (format_it != schema.MemberEnd() && format_it->value.IsString()) {
            std::string format = AsString(format_it->value);
            if (format == "uri" || format == "url") {
                parsed.type = FieldType::URL;
            } else if (format == "binary" || format == "byte") {
                parsed.type = FieldType::BYTES;
            }
        }
    } else if (type_name == "integer") {
        parsed.type = FieldType::INTEGER;
    } else if (type_name == "number") {
        parsed.type = FieldType::NUMBER;
    } else if (type_name == "boolean") {
        parsed.type = FieldType::BOOLEAN;
    } else if (type_name == "array") {
        auto items_it = schema.FindMember("items");
        if (items_it == schema.MemberEnd() || !items_it->value.IsObject()) {
            throw InvalidSchemaError("field '" + field + "': array fields need an items schema");
        }
        auto item_type = items_it->value.FindMember("type");
        std::string item_name = (item_type != items_it->value.MemberEnd() && item_type->value.IsString())
                                    ? AsString(item_type->value) : std::string();
        if (item_name != "number" && item_name != "integer") {
            throw InvalidSchemaError("field '" + field + "': only numeric arrays are supported");
        }
        parsed.type = FieldType::VECTOR;
        auto min_items = ReadSizeKeyword(field, schema, "minItems");
        auto max_items = ReadSizeKeyword(field, schema, "maxItems");
        if (min_items && max_items && *min_items == *max_items) {
            if (*min_items == 0) {
                throw InvalidSchemaError("field '" + field + "': vector dimension must be > 0");
            }
            parsed.dimension = *min_items;
        }
    } else if (type_name.empty()) {
        throw InvalidSchemaError("field '" + field + "': missing type");
    } else {
        throw InvalidSchemaError("field '" + field + "': unsupported type '" + type_name + "'");
    }
    return parsed;
}

// Builds the descriptor of a parsed schema document. Throws InvalidSchemaError.
TypeDescriptorPtr BuildDescriptor(const Value& root, BaseShape shape,
                                  uint64_t fingerprint, std::string canonical_key) {
    if (!root.IsObject()) {
        throw InvalidSchemaError("schema root must be an object");
    }
    auto root_type = root.FindMember("type");
    if (root_type != root.MemberEnd() &&
        !(root_type->value.IsString() && AsString(root_type->value) == "object")) {
        throw InvalidSchemaError("schema root type must be \"object\"");
    }

    std::string name = kDefaultTypeName;
    auto title = root.FindMember("title");
    if (title != root.MemberEnd() && title->value.IsString() && title->value.GetStringLength() > 0) {
        name = AsString(title->value);
    }

    const BaseShapeContract& contract = ContractOf(shape);
    std::vector<FieldSpec> fields;
    for (const auto& implied : contract.implied_fields) {
        FieldSpec spec;
        spec.name = implied.name;
        spec.type = implied.type;
        spec.optional = true;
        fields.push_back(std::move(spec));
    }
    const size_t implied_count = fields.size();

    std::set<std::string> required;
    auto required_it = root.FindMember("required");
    if (required_it != root.MemberEnd()) {
        if (!required_it->value.IsArray()) {
            throw InvalidSchemaError("\"required\" must be an array");
        }
        for (const auto& entry : required_it->value.GetArray()) {
            if (!entry.IsString()) {
                throw InvalidSchemaError("\"required\" entries must be strings");
            }
            required.insert(AsString(entry));
        }
    }

    auto properties = root.FindMember("properties");
    if (properties != root.MemberEnd()) {
        if (!properties->value.IsObject()) {
            throw InvalidSchemaError("\"properties\" must be an object");
        }
        std::set<std::string> seen;
        for (auto it = properties->value.MemberBegin(); it != properties->value.MemberEnd(); ++it) {
            std::string field = AsString(it->name);
            if (field.empty()) {
                throw InvalidSchemaError("property names must not be empty");
            }
            if (!seen.insert(field).second) {
                throw InvalidSchemaError("property '" + field + "' is declared twice");
            }

            ParsedType parsed = ParseFieldType(field, it->value);
            FieldSpec spec;
            spec.name = field;
            spec.type = parsed.type;
            spec.dimension = parsed.dimension;
            spec.optional = field == "id" || parsed.nullable || required.count(field) == 0;

            auto existing = std::find_if(fields.begin(), fields.begin() + implied_count,
                                         [&](const FieldSpec& f) { return f.name == field; });
            if (existing != fields.begin() + implied_count) {
                if (existing->type != spec.type) {
                    throw InvalidSchemaError("property '" + field + "' redeclares a " +
                        std::string(contract.canonical_name) + " field as " + core::FieldTypeName(spec.type));
                }
                *existing = std::move(spec);
            } else {
                fields.push_back(std::move(spec));
            }
        }
    }

    for (const auto& field : required) {
        bool declared = std::any_of(fields.begin(), fields.end(),
                                    [&](const FieldSpec& f) { return f.name == field; });
        if (!declared) {
            throw InvalidSchemaError("required field '" + field + "' is not declared");
        }
    }

    return std::make_shared<const TypeDescriptor>(std::move(name), shape, std::move(fields),
                                                  fingerprint, std::move(canonical_key));
}

} // namespace

TypeDescriptorPtr TypeMaterializer::find_cached(uint64_t fingerprint, const std::string& canonical_key) const {
    auto it = cache_.find(fingerprint);
    if (it == cache_.end()) {
        return nullptr;
    }
    for (const auto& entry : it->second) {
        if (entry.canonical_key == canonical_key) {
            return entry.descriptor;
        }
    }
    return nullptr;
}

core::Result<TypeDescriptorPtr> TypeMaterializer::materialize(const std::string& schema_text,
                                                              const std::string& base_shape_name) {
    auto shape = ParseBaseShape(base_shape_name);
    if (!shape.ok()) {
        metrics_.failure_count.fetch_add(1, std::memory_order_relaxed);
        CTXDB_DEBUG("materialize rejected: {}", shape.error());
        return core::Result<TypeDescriptorPtr>::propagate(shape);
    }

    rapidjson::Document doc;
    doc.Parse(schema_text.c_str(), schema_text.size());
    if (doc.HasParseError()) {
        metrics_.failure_count.fetch_add(1, std::memory_order_relaxed);
        std::string message = "schema is not valid JSON at offset " + std::to_string(doc.GetErrorOffset()) +
                              ": " + rapidjson::GetParseError_En(doc.GetParseError());
        CTXDB_DEBUG("materialize rejected: {}", message);
        return core::Result<TypeDescriptorPtr>::error(core::Error::Code::INVALID_SCHEMA, message);
    }

    std::string canonical_key = CanonicalJson(doc);
    canonical_key.push_back('\n');
    canonical_key.append(BaseShapeName(shape.value()));
    const uint64_t fingerprint = SchemaFingerprint(canonical_key);

    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (auto cached = find_cached(fingerprint, canonical_key)) {
            metrics_.hit_count.fetch_add(1, std::memory_order_relaxed);
            return core::Result<TypeDescriptorPtr>(std::move(cached));
        }
    }

    TypeDescriptorPtr descriptor;
    try {
        descriptor = BuildDescriptor(doc, shape.value(), fingerprint, canonical_key);
    } catch (const core::Error& e) {
        metrics_.failure_count.fetch_add(1, std::memory_order_relaxed);
        CTXDB_DEBUG("materialize rejected: {}", e.what());
        return core::Result<TypeDescriptorPtr>(e);
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    // Another thread may have materialized the same content meanwhile
    if (auto cached = find_cached(fingerprint, canonical_key)) {
        metrics_.hit_count.fetch_add(1, std::memory_order_relaxed);
        return core::Result<TypeDescriptorPtr>(std::move(cached));
    }
    cache_[fingerprint].push_back(CacheEntry{canonical_key, descriptor});
    metrics_.miss_count.fetch_add(1, std::memory_order_relaxed);
    CTXDB_DEBUG("materialized type {} (fingerprint {:016x})", descriptor->to_string(), fingerprint);
    return core::Result<TypeDescriptorPtr>(std::move(descriptor));
}

size_t TypeMaterializer::cache_size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& [fingerprint, entries] : cache_) {
        total += entries.size();
    }
    return total;
}

void TypeMaterializer::clear_cache() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    cache_.clear();
}

} // namespace schema
} // namespace ctxdb
