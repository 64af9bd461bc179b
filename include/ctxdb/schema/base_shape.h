#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "ctxdb/core/result.h"
#include "ctxdb/core/types.h"

namespace ctxdb {
namespace schema {

/**
 * @brief Recognized abstract record kinds a schema specializes
 */
enum class BaseShape : uint8_t {
    GENERIC_DOCUMENT,
    TEXT_DOCUMENT
};

/**
 * @brief A field every schema of a base shape carries implicitly
 */
struct ImpliedField {
    const char* name;
    core::FieldType type;
};

/**
 * @brief Fixed contract of a base shape
 */
struct BaseShapeContract {
    BaseShape shape;
    const char* canonical_name;
    std::vector<ImpliedField> implied_fields;  // In declaration order, all optional
    const char* primary_text_field;            // nullptr when the shape has none
    const char* embedding_field;               // nullptr when the shape has none
};

const BaseShapeContract& ContractOf(BaseShape shape);

inline const char* BaseShapeName(BaseShape shape) {
    return ContractOf(shape).canonical_name;
}

/**
 * @brief Resolves a base shape reference
 *
 * Accepts canonical names ("text_document"), their spaced or hyphenated
 * spellings ("Text Document"), and document class names optionally module
 * qualified ("TextDoc", "docarray.documents.text.TextDoc"). Fails with
 * UNKNOWN_BASE_SHAPE otherwise.
 */
core::Result<BaseShape> ParseBaseShape(const std::string& name);

std::vector<BaseShape> AllBaseShapes();

} // namespace schema
} // namespace ctxdb
