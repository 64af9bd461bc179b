#include "ctxdb/server/api_handler.h"
#include "ctxdb/codec/record_codec.h"
#include "ctxdb/common/logger.h"
#include <rapidjson/error/en.h>
#include <sstream>

namespace ctxdb {
namespace server {

namespace {

using core::Error;
using rapidjson::Value;

std::vector<std::string> SplitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (c == '/') {
            if (!current.empty()) {
                parts.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        parts.push_back(std::move(current));
    }
    return parts;
}

Response JsonResponse(const Value& value, int status = 200) {
    Response response;
    response.status = status;
    response.body = codec::ToString(value);
    return response;
}

Response Success() {
    Response response;
    response.body = "{\"success\":true}";
    return response;
}

Response NoRoute(const Request& request) {
    return ApiHandler::ErrorResponse(Error::Code::NOT_FOUND,
        "no route for " + request.method + " " + request.path);
}

Response MethodNotAllowed(const Request& request) {
    Response response = ApiHandler::ErrorResponse(Error::Code::INVALID_ARGUMENT,
        "method " + request.method + " not allowed on " + request.path);
    response.status = 405;
    return response;
}

Response FromResult(const core::Result<void>& result) {
    if (!result.ok()) {
        return ApiHandler::ErrorResponse(result.code(), result.error());
    }
    return Success();
}

template <typename T>
Response ErrorOf(const core::Result<T>& result) {
    return ApiHandler::ErrorResponse(result.code(), result.error());
}

Response NameList(const char* key, const std::vector<std::string>& names) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& allocator = doc.GetAllocator();
    Value list(rapidjson::kArrayType);
    for (const auto& name : names) {
        list.PushBack(Value(name.c_str(), static_cast<rapidjson::SizeType>(name.size()), allocator), allocator);
    }
    doc.AddMember(rapidjson::StringRef(key), list, allocator);
    return JsonResponse(doc);
}

core::Result<rapidjson::Document> ParseJson(const std::string& text, const char* what) {
    rapidjson::Document doc;
    if (text.empty()) {
        doc.SetObject();
        return core::Result<rapidjson::Document>(std::move(doc));
    }
    doc.Parse<codec::kParseFlags>(text.c_str(), text.size());
    if (doc.HasParseError()) {
        std::ostringstream msg;
        msg << "malformed " << what << " at offset " << doc.GetErrorOffset() << ": "
            << rapidjson::GetParseError_En(doc.GetParseError());
        return core::Result<rapidjson::Document>::error(Error::Code::INVALID_ARGUMENT, msg.str());
    }
    return core::Result<rapidjson::Document>(std::move(doc));
}

core::Result<rapidjson::Document> ParseBody(const Request& request) {
    auto doc = ParseJson(request.body, "request body");
    if (doc.ok() && !doc.value().IsObject()) {
        return core::Result<rapidjson::Document>::error(Error::Code::INVALID_ARGUMENT,
            "request body must be a JSON object");
    }
    return doc;
}

// Optional string member; nullptr when absent
const Value* StringMember(const Value& object, const char* key, std::string& error) {
    auto it = object.FindMember(key);
    if (it == object.MemberEnd() || it->value.IsNull()) {
        return nullptr;
    }
    if (!it->value.IsString()) {
        error = std::string("'") + key + "' must be a string";
        return nullptr;
    }
    return &it->value;
}

std::string Str(const Value& v) {
    return std::string(v.GetString(), v.GetStringLength());
}

} // namespace

ApiHandler::ApiHandler(std::shared_ptr<service::ContextDatabase> db) : db_(std::move(db)) {
    if (!db_) {
        throw core::InvalidArgumentError("ApiHandler requires a database");
    }
}

int ApiHandler::StatusFor(Error::Code code) {
    switch (code) {
        case Error::Code::INVALID_ARGUMENT:
        case Error::Code::INVALID_SCHEMA:
        case Error::Code::UNKNOWN_BASE_SHAPE:
            return 400;
        case Error::Code::NOT_FOUND:
            return 404;
        case Error::Code::ALREADY_EXISTS:
        case Error::Code::SCHEMA_CONFLICT:
        case Error::Code::FAILED_PRECONDITION:
            return 409;
        case Error::Code::TYPE_MISMATCH:
        case Error::Code::DIMENSION_MISMATCH:
        case Error::Code::EMPTY_VECTOR_FIELD:
        case Error::Code::FIELD_NOT_FOUND:
            return 422;
        case Error::Code::UNKNOWN:
        case Error::Code::INTERNAL:
            return 500;
    }
    return 500;
}

Response ApiHandler::ErrorResponse(Error::Code code, const std::string& message) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& allocator = doc.GetAllocator();
    doc.AddMember("error", Value(message.c_str(), static_cast<rapidjson::SizeType>(message.size()), allocator),
                  allocator);
    doc.AddMember("errorType", rapidjson::StringRef(core::CodeName(code)), allocator);
    return JsonResponse(doc, StatusFor(code));
}

Response ApiHandler::Handle(const Request& request) const {
    const auto parts = SplitPath(request.path);
    Response response;
    try {
        if (parts.empty() || parts[0] != "namespaces") {
            response = NoRoute(request);
        } else {
            response = handle_namespaces(request, parts);
        }
    } catch (const Error& e) {
        response = ErrorResponse(e.code(), e.what());
    }

    if (response.status >= 500) {
        CTXDB_WARN("{} {} -> {}: {}", request.method, request.path, response.status, response.body);
    } else {
        CTXDB_DEBUG("{} {} -> {}", request.method, request.path, response.status);
    }
    return response;
}

// /namespaces[/{ns}[/{new}]]
Response ApiHandler::handle_namespaces(const Request& request, const std::vector<std::string>& parts) const {
    const std::string& method = request.method;
    switch (parts.size()) {
        case 1:
            if (method == "GET") return NameList("namespaces", db_->list_namespaces());
            return MethodNotAllowed(request);
        case 2:
            if (method == "POST") return FromResult(db_->create_namespace(parts[1]));
            if (method == "DELETE") return FromResult(db_->delete_namespace(parts[1]));
            if (method == "GET") {
                auto workspaces = db_->list_workspaces(parts[1]);
                if (!workspaces.ok()) return ErrorOf(workspaces);
                return NameList("workspaces", workspaces.value());
            }
            return MethodNotAllowed(request);
        case 3:
            if (method == "PUT") return FromResult(db_->rename_namespace(parts[1], parts[2]));
            break;
        default:
            break;
    }
    if (parts[2] != "workspaces") {
        return NoRoute(request);
    }
    return handle_workspaces(request, parts);
}

// /namespaces/{ns}/workspaces[/{ws}[/{new}]]
Response ApiHandler::handle_workspaces(const Request& request, const std::vector<std::string>& parts) const {
    const std::string& method = request.method;
    const std::string& ns = parts[1];
    switch (parts.size()) {
        case 3: {
            if (method != "GET") return MethodNotAllowed(request);
            auto workspaces = db_->list_workspaces(ns);
            if (!workspaces.ok()) return ErrorOf(workspaces);
            return NameList("workspaces", workspaces.value());
        }
        case 4:
            if (method == "POST") return FromResult(db_->create_workspace(ns, parts[3]));
            if (method == "DELETE") return FromResult(db_->delete_workspace(ns, parts[3]));
            if (method == "GET") {
                auto repositories = db_->list_repositories(ns, parts[3]);
                if (!repositories.ok()) return ErrorOf(repositories);
                return NameList("repositories", repositories.value());
            }
            return MethodNotAllowed(request);
        case 5:
            if (method == "PUT") return FromResult(db_->rename_workspace(ns, parts[3], parts[4]));
            break;
        default:
            break;
    }
    if (parts[4] != "repositories") {
        return NoRoute(request);
    }
    return handle_repositories(request, parts);
}

// /namespaces/{ns}/workspaces/{ws}/repositories[/{repo}[/{new}]]
Response ApiHandler::handle_repositories(const Request& request, const std::vector<std::string>& parts) const {
    const std::string& method = request.method;
    const std::string& ns = parts[1];
    const std::string& ws = parts[3];
    switch (parts.size()) {
        case 5: {
            if (method != "GET") return MethodNotAllowed(request);
            auto repositories = db_->list_repositories(ns, ws);
            if (!repositories.ok()) return ErrorOf(repositories);
            return NameList("repositories", repositories.value());
        }
        case 6:
            if (method == "POST") return FromResult(db_->create_repository(ns, ws, parts[5]));
            if (method == "DELETE") return FromResult(db_->delete_repository(ns, ws, parts[5]));
            if (method == "GET") {
                auto models = db_->list_models(ns, ws, parts[5]);
                if (!models.ok()) return ErrorOf(models);
                return NameList("models", models.value());
            }
            return MethodNotAllowed(request);
        case 7:
            if (method == "PUT") return FromResult(db_->rename_repository(ns, ws, parts[5], parts[6]));
            break;
        default:
            break;
    }
    if (parts[6] != "models") {
        return NoRoute(request);
    }
    return handle_models(request, parts);
}

// /namespaces/{ns}/workspaces/{ws}/repositories/{repo}/models[/{model}[/{action}]]
Response ApiHandler::handle_models(const Request& request, const std::vector<std::string>& parts) const {
    const std::string& method = request.method;
    if (parts.size() == 7) {
        if (method != "GET") return MethodNotAllowed(request);
        auto models = db_->list_models(parts[1], parts[3], parts[5]);
        if (!models.ok()) return ErrorOf(models);
        return NameList("models", models.value());
    }
    if (parts.size() > 9) {
        return NoRoute(request);
    }

    registry::ModelKey key{parts[1], parts[3], parts[5], parts[7]};
    if (parts.size() == 9) {
        return handle_model_action(request, key, parts[8]);
    }

    if (method == "POST") return create_or_update_model(request, key, false);
    if (method == "PUT") return create_or_update_model(request, key, true);
    if (method == "GET") return describe_model(key);
    if (method == "DELETE") return FromResult(db_->delete_model(key));
    return MethodNotAllowed(request);
}

Response ApiHandler::handle_model_action(const Request& request, const registry::ModelKey& key,
                                         const std::string& action) const {
    if (action == "index") {
        return request.method == "POST" ? index_data(request, key) : MethodNotAllowed(request);
    }
    if (action == "search") {
        return request.method == "POST" ? search(request, key) : MethodNotAllowed(request);
    }
    if (action == "data") {
        return request.method == "GET" ? get_data(request, key) : MethodNotAllowed(request);
    }
    return NoRoute(request);
}

Response ApiHandler::create_or_update_model(const Request& request, const registry::ModelKey& key,
                                            bool replace) const {
    auto body = ParseBody(request);
    if (!body.ok()) return ErrorOf(body);
    const Value& doc = body.value();

    std::string error;
    const Value* schema = StringMember(doc, "json_schema", error);
    const Value* base = StringMember(doc, "base_class", error);
    if (!error.empty()) {
        return ErrorResponse(Error::Code::INVALID_ARGUMENT, error);
    }
    if (!schema || !base) {
        return ErrorResponse(Error::Code::INVALID_ARGUMENT, "'json_schema' and 'base_class' are required");
    }

    auto descriptor = replace ? db_->update_model(key, Str(*schema), Str(*base))
                              : db_->create_model(key, Str(*schema), Str(*base));
    if (!descriptor.ok()) return ErrorOf(descriptor);

    rapidjson::Document out;
    out.SetObject();
    auto& allocator = out.GetAllocator();
    out.AddMember("model", Value(key.model.c_str(), allocator), allocator);
    out.AddMember("type", codec::DescriptorToValue(*descriptor.value(), allocator), allocator);
    return JsonResponse(out);
}

Response ApiHandler::describe_model(const registry::ModelKey& key) const {
    auto info = db_->describe_model(key);
    if (!info.ok()) return ErrorOf(info);
    const auto& model = info.value();

    rapidjson::Document out;
    out.SetObject();
    auto& allocator = out.GetAllocator();
    out.AddMember("model", Value(key.model.c_str(), allocator), allocator);
    out.AddMember("json_schema", Value(model.definition.schema_text.c_str(), allocator), allocator);
    out.AddMember("base_class", Value(model.definition.base_shape.c_str(), allocator), allocator);
    out.AddMember("type", codec::DescriptorToValue(*model.descriptor, allocator), allocator);
    out.AddMember("record_count", static_cast<uint64_t>(model.record_count), allocator);
    return JsonResponse(out);
}

Response ApiHandler::index_data(const Request& request, const registry::ModelKey& key) const {
    auto body = ParseBody(request);
    if (!body.ok()) return ErrorOf(body);
    const Value& doc = body.value();

    // A body carrying the schema creates the model on first use
    std::string error;
    const Value* schema = StringMember(doc, "json_schema", error);
    const Value* base = StringMember(doc, "base_class", error);
    if (!error.empty()) {
        return ErrorResponse(Error::Code::INVALID_ARGUMENT, error);
    }
    if (schema && base) {
        auto created = db_->create_model(key, Str(*schema), Str(*base));
        if (!created.ok()) return ErrorOf(created);
    }

    auto data = doc.FindMember("data");
    if (data == doc.MemberEnd()) {
        return ErrorResponse(Error::Code::INVALID_ARGUMENT, "'data' is required");
    }

    // "data" may hold the records themselves or their JSON text
    rapidjson::Document nested;
    const Value* records_value = &data->value;
    if (data->value.IsString()) {
        auto parsed = ParseJson(Str(data->value), "data");
        if (!parsed.ok()) return ErrorOf(parsed);
        nested = parsed.take_value();
        records_value = &nested;
    }

    auto info = db_->describe_model(key);
    if (!info.ok()) return ErrorOf(info);
    auto records = codec::DecodeRecords(info.value().descriptor, *records_value);
    if (!records.ok()) return ErrorOf(records);

    auto inserted = db_->index(key, records.take_value());
    if (!inserted.ok()) return ErrorOf(inserted);

    rapidjson::Document out;
    out.SetObject();
    auto& allocator = out.GetAllocator();
    out.AddMember("success", true, allocator);
    out.AddMember("indexed", static_cast<uint64_t>(inserted.value()), allocator);
    return JsonResponse(out);
}

Response ApiHandler::search(const Request& request, const registry::ModelKey& key) const {
    auto body = ParseBody(request);
    if (!body.ok()) return ErrorOf(body);
    const Value& doc = body.value();

    std::string error;
    const Value* field = StringMember(doc, "field", error);
    if (!error.empty()) {
        return ErrorResponse(Error::Code::INVALID_ARGUMENT, error);
    }

    size_t limit = kDefaultSearchLimit;
    auto limit_it = doc.FindMember("limit");
    if (limit_it == doc.MemberEnd()) {
        limit_it = doc.FindMember("top_k");
    }
    if (limit_it != doc.MemberEnd()) {
        if (!limit_it->value.IsUint64()) {
            return ErrorResponse(Error::Code::INVALID_ARGUMENT, "'limit' must be a non-negative integer");
        }
        limit = static_cast<size_t>(limit_it->value.GetUint64());
    }

    auto query_it = doc.FindMember("query");
    if (query_it == doc.MemberEnd()) {
        return ErrorResponse(Error::Code::INVALID_ARGUMENT, "'query' is required");
    }
    rapidjson::Document nested;
    const Value* query_value = &query_it->value;
    if (query_it->value.IsString()) {
        auto parsed = ParseJson(Str(query_it->value), "query");
        if (!parsed.ok()) {
            return ErrorResponse(Error::Code::INVALID_ARGUMENT,
                "'query' must be a record object carrying the query vector");
        }
        nested = parsed.take_value();
        query_value = &nested;
    }

    auto info = db_->describe_model(key);
    if (!info.ok()) return ErrorOf(info);
    auto query = codec::DecodeQuery(info.value().descriptor, *query_value);
    if (!query.ok()) return ErrorOf(query);

    auto hits = db_->search(key, query.value(), field ? Str(*field) : std::string(), limit);
    if (!hits.ok()) return ErrorOf(hits);

    rapidjson::Document out;
    out.SetObject();
    auto& allocator = out.GetAllocator();
    Value results(rapidjson::kArrayType);
    for (const auto& hit : hits.value()) {
        Value entry(rapidjson::kObjectType);
        entry.AddMember("record", codec::RecordToValue(hit.record, allocator), allocator);
        entry.AddMember("distance", hit.distance, allocator);
        results.PushBack(entry, allocator);
    }
    out.AddMember("results", results, allocator);
    return JsonResponse(out);
}

Response ApiHandler::get_data(const Request& request, const registry::ModelKey& key) const {
    if (!request.HasParam("data_id")) {
        return ErrorResponse(Error::Code::INVALID_ARGUMENT, "query parameter 'data_id' is required");
    }
    auto record = db_->get_record(key, request.GetParam("data_id"));
    if (!record.ok()) return ErrorOf(record);

    Response response;
    response.body = codec::EncodeRecord(record.value());
    return response;
}

void ApiHandler::AppendMetrics(rapidjson::Document& doc) const {
    auto& allocator = doc.GetAllocator();
    const auto& metrics = db_->materializer().get_metrics();

    Value cache(rapidjson::kObjectType);
    cache.AddMember("size", static_cast<uint64_t>(db_->materializer().cache_size()), allocator);
    cache.AddMember("hits", metrics.hit_count.load(), allocator);
    cache.AddMember("misses", metrics.miss_count.load(), allocator);
    cache.AddMember("failures", metrics.failure_count.load(), allocator);

    doc.AddMember("namespaces", static_cast<uint64_t>(db_->list_namespaces().size()), allocator);
    doc.AddMember("models", static_cast<uint64_t>(db_->registry().size()), allocator);
    doc.AddMember("schema_cache", cache, allocator);
}

} // namespace server
} // namespace ctxdb
