#include "ctxdb/core/error.h"

namespace ctxdb {
namespace core {

const char* CodeName(Error::Code code) {
    switch (code) {
        case Error::Code::UNKNOWN: return "UNKNOWN";
        case Error::Code::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case Error::Code::NOT_FOUND: return "NOT_FOUND";
        case Error::Code::ALREADY_EXISTS: return "ALREADY_EXISTS";
        case Error::Code::FAILED_PRECONDITION: return "FAILED_PRECONDITION";
        case Error::Code::INTERNAL: return "INTERNAL";
        case Error::Code::INVALID_SCHEMA: return "INVALID_SCHEMA";
        case Error::Code::UNKNOWN_BASE_SHAPE: return "UNKNOWN_BASE_SHAPE";
        case Error::Code::SCHEMA_CONFLICT: return "SCHEMA_CONFLICT";
        case Error::Code::TYPE_MISMATCH: return "TYPE_MISMATCH";
        case Error::Code::DIMENSION_MISMATCH: return "DIMENSION_MISMATCH";
        case Error::Code::EMPTY_VECTOR_FIELD: return "EMPTY_VECTOR_FIELD";
        case Error::Code::FIELD_NOT_FOUND: return "FIELD_NOT_FOUND";
    }
    return "UNKNOWN";
}

} // namespace core
} // namespace ctxdb
