#include "ctxdb/core/types.h"

namespace ctxdb {
namespace core {

const char* FieldTypeName(FieldType type) {
    switch (type) {
        case FieldType::STRING: return "string";
        case FieldType::INTEGER: return "integer";
        case FieldType::NUMBER: return "number";
        case FieldType::BOOLEAN: return "boolean";
        case FieldType::URL: return "url";
        case FieldType::BYTES: return "bytes";
        case FieldType::VECTOR: return "vector";
    }
    return "unknown";
}

bool ValueMatchesType(const FieldValue& value, FieldType type) {
    switch (type) {
        case FieldType::STRING:
        case FieldType::URL:
        case FieldType::BYTES:
            return std::holds_alternative<std::string>(value);
        case FieldType::INTEGER:
            return std::holds_alternative<int64_t>(value);
        case FieldType::NUMBER:
            return std::holds_alternative<double>(value);
        case FieldType::BOOLEAN:
            return std::holds_alternative<bool>(value);
        case FieldType::VECTOR:
            return std::holds_alternative<Vector>(value);
    }
    return false;
}

} // namespace core
} // namespace ctxdb
