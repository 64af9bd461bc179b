#ifndef CTXDB_CORE_TYPES_H_
#define CTXDB_CORE_TYPES_H_

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace ctxdb {
namespace core {

/**
 * @brief Unique identifier of a record (32 hex digits when generated)
 */
using RecordID = std::string;

/**
 * @brief Fixed-length numeric array held by an embedding field
 */
using Vector = std::vector<float>;

/**
 * @brief Semantic type of a record field
 */
enum class FieldType : uint8_t {
    STRING,
    INTEGER,
    NUMBER,
    BOOLEAN,
    URL,
    BYTES,
    VECTOR
};

const char* FieldTypeName(FieldType type);

/**
 * @brief Value of a single record field
 *
 * std::monostate is an explicit null. STRING, URL and BYTES fields all hold
 * std::string.
 */
using FieldValue = std::variant<std::monostate, std::string, int64_t, double, bool, Vector>;

// Whether the value alternative is the one the field type stores
bool ValueMatchesType(const FieldValue& value, FieldType type);

inline bool IsNull(const FieldValue& value) {
    return std::holds_alternative<std::monostate>(value);
}

} // namespace core
} // namespace ctxdb

#endif // CTXDB_CORE_TYPES_H_
