#pragma once

#include <memory>
#include <string>
#include <vector>

#include <rapidjson/document.h>

#include "ctxdb/core/error.h"
#include "ctxdb/server/request.h"
#include "ctxdb/service/context_database.h"

namespace ctxdb {
namespace server {

/**
 * @brief Maps REST requests onto the context database
 *
 * Routes (all under /namespaces):
 * ```
 * GET    /namespaces
 * POST   /namespaces/{ns}                      DELETE /namespaces/{ns}
 * PUT    /namespaces/{old}/{new}
 * GET    /namespaces/{ns}/workspaces
 * POST   /namespaces/{ns}/workspaces/{ws}      DELETE ...   PUT .../{old}/{new}
 * GET    .../workspaces/{ws}/repositories
 * POST   .../repositories/{repo}               DELETE ...   PUT .../{old}/{new}
 * GET    .../repositories/{repo}/models
 * POST   .../models/{model}   {"json_schema": "...", "base_class": "..."}
 * PUT    .../models/{model}   same body, replaces the model
 * GET    .../models/{model}                    DELETE .../models/{model}
 * POST   .../models/{model}/index   {"data": object | array | string}
 * POST   .../models/{model}/search  {"query": object, "field": "...", "limit": 10}
 * GET    .../models/{model}/data?data_id=...
 * ```
 * Failures are answered with {"error": message, "errorType": code name}.
 *
 * Transport independent: the HTTP server hands over parsed requests.
 */
class ApiHandler {
public:
    static constexpr size_t kDefaultSearchLimit = 10;

    explicit ApiHandler(std::shared_ptr<service::ContextDatabase> db);

    Response Handle(const Request& request) const;

    // Adds model registry and materializer counters to a metrics document
    void AppendMetrics(rapidjson::Document& doc) const;

    // HTTP status answering an error of the given kind
    static int StatusFor(core::Error::Code code);

    static Response ErrorResponse(core::Error::Code code, const std::string& message);

private:
    std::shared_ptr<service::ContextDatabase> db_;

    Response handle_namespaces(const Request& request, const std::vector<std::string>& parts) const;
    Response handle_workspaces(const Request& request, const std::vector<std::string>& parts) const;
    Response handle_repositories(const Request& request, const std::vector<std::string>& parts) const;
    Response handle_models(const Request& request, const std::vector<std::string>& parts) const;
    Response handle_model_action(const Request& request, const registry::ModelKey& key,
                                 const std::string& action) const;

    Response create_or_update_model(const Request& request, const registry::ModelKey& key, bool replace) const;
    Response describe_model(const registry::ModelKey& key) const;
    Response index_data(const Request& request, const registry::ModelKey& key) const;
    Response search(const Request& request, const registry::ModelKey& key) const;
    Response get_data(const Request& request, const registry::ModelKey& key) const;
};

} // namespace server
} // namespace ctxdb
