#pragma once

#include <map>
#include <string>

namespace ctxdb {
namespace server {

struct Request {
    std::string method;
    std::string path;
    std::multimap<std::string, std::string> params;
    std::string body;
    std::map<std::string, std::string> headers;

    std::string GetParam(const std::string& key) const {
        auto it = params.find(key);
        if (it != params.end()) {
            return it->second;
        }
        return "";
    }

    bool HasParam(const std::string& key) const {
        return params.find(key) != params.end();
    }
};

struct Response {
    int status = 200;
    std::string body;
    std::string content_type = "application/json";
};

} // namespace server
} // namespace ctxdb
