#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ctxdb/core/record.h"
#include "ctxdb/core/result.h"
#include "ctxdb/core/types.h"
#include "ctxdb/schema/base_shape.h"

namespace ctxdb {
namespace schema {

/**
 * @brief Metadata of one declared field
 */
struct FieldSpec {
    std::string name;
    core::FieldType type = core::FieldType::STRING;
    bool optional = true;
    std::optional<size_t> dimension;  // Only for vector fields with a fixed length

    bool operator==(const FieldSpec& other) const {
        return name == other.name && type == other.type &&
               optional == other.optional && dimension == other.dimension;
    }
    bool operator!=(const FieldSpec& other) const { return !(*this == other); }
};

/**
 * @brief Materialized, validated representation of a schema definition
 *
 * Instances are created by the TypeMaterializer, shared read-only between
 * every record and index of the type, and never mutated.
 */
class TypeDescriptor {
public:
    TypeDescriptor(std::string name, BaseShape base_shape, std::vector<FieldSpec> fields,
                   uint64_t fingerprint, std::string canonical_key);

    const std::string& name() const { return name_; }
    BaseShape base_shape() const { return base_shape_; }
    const std::vector<FieldSpec>& fields() const { return fields_; }
    uint64_t fingerprint() const { return fingerprint_; }
    const std::string& canonical_key() const { return canonical_key_; }

    // nullptr when the field is not declared
    const FieldSpec* find_field(const std::string& name) const;

    std::vector<std::string> vector_fields() const;
    bool has_vector_field() const;

    /**
     * @brief Field searched by default and required on every indexed record
     *
     * The base shape's embedding field when it is a vector field, otherwise
     * the first vector field in declaration order; empty when the type has
     * no vector field.
     */
    const std::string& primary_vector_field() const { return primary_vector_field_; }

    // Same base shape and the same field list, field for field
    bool compatible_with(const TypeDescriptor& other) const;

    /**
     * @brief Checks that a record conforms to this type
     *
     * TYPE_MISMATCH for undeclared fields, wrongly typed values, or missing
     * required fields; DIMENSION_MISMATCH for vectors whose length differs
     * from a declared dimension.
     */
    core::Result<void> validate(const core::Record& record) const;

    std::string to_string() const;

private:
    std::string name_;
    BaseShape base_shape_;
    std::vector<FieldSpec> fields_;
    uint64_t fingerprint_;
    std::string canonical_key_;
    std::string primary_vector_field_;
};

using TypeDescriptorPtr = std::shared_ptr<const TypeDescriptor>;

} // namespace schema
} // namespace ctxdb
