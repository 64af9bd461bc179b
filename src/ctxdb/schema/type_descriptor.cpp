#include "ctxdb/schema/type_descriptor.h"
#include <sstream>

namespace ctxdb {
namespace schema {

TypeDescriptor::TypeDescriptor(std::string name, BaseShape base_shape, std::vector<FieldSpec> fields,
                               uint64_t fingerprint, std::string canonical_key)
    : name_(std::move(name)),
      base_shape_(base_shape),
      fields_(std::move(fields)),
      fingerprint_(fingerprint),
      canonical_key_(std::move(canonical_key)) {
    const char* embedding = ContractOf(base_shape_).embedding_field;
    if (embedding) {
        const FieldSpec* spec = find_field(embedding);
        if (spec && spec->type == core::FieldType::VECTOR) {
            primary_vector_field_ = spec->name;
        }
    }
    if (primary_vector_field_.empty()) {
        for (const auto& field : fields_) {
            if (field.type == core::FieldType::VECTOR) {
                primary_vector_field_ = field.name;
                break;
            }
        }
    }
}

const FieldSpec* TypeDescriptor::find_field(const std::string& name) const {
    for (const auto& field : fields_) {
        if (field.name == name) {
            return &field;
        }
    }
    return nullptr;
}

std::vector<std::string> TypeDescriptor::vector_fields() const {
    std::vector<std::string> names;
    for (const auto& field : fields_) {
        if (field.type == core::FieldType::VECTOR) {
            names.push_back(field.name);
        }
    }
    return names;
}

bool TypeDescriptor::has_vector_field() const {
    return !primary_vector_field_.empty();
}

bool TypeDescriptor::compatible_with(const TypeDescriptor& other) const {
    if (this == &other) {
        return true;
    }
    return base_shape_ == other.base_shape_ && fields_ == other.fields_;
}

core::Result<void> TypeDescriptor::validate(const core::Record& record) const {
    using core::Error;

    for (const auto& [name, value] : record.fields()) {
        const FieldSpec* spec = find_field(name);
        if (!spec) {
            return core::Result<void>::error(Error::Code::TYPE_MISMATCH,
                "field '" + name + "' is not declared by type " + name_);
        }
        if (core::IsNull(value)) {
            continue;
        }
        if (!core::ValueMatchesType(value, spec->type)) {
            return core::Result<void>::error(Error::Code::TYPE_MISMATCH,
                "field '" + name + "' expects a value of type " + core::FieldTypeName(spec->type));
        }
        if (spec->type == core::FieldType::VECTOR && spec->dimension) {
            const auto& vec = std::get<core::Vector>(value);
            if (vec.size() != *spec->dimension) {
                return core::Result<void>::error(Error::Code::DIMENSION_MISMATCH,
                    "field '" + name + "' expects " + std::to_string(*spec->dimension) +
                    " components, got " + std::to_string(vec.size()));
            }
        }
    }

    for (const auto& spec : fields_) {
        if (spec.optional || spec.name == "id") {
            continue;
        }
        const core::FieldValue* value = record.get(spec.name);
        if (!value || core::IsNull(*value)) {
            return core::Result<void>::error(Error::Code::TYPE_MISMATCH,
                "required field '" + spec.name + "' is missing");
        }
    }
    return core::Result<void>();
}

std::string TypeDescriptor::to_string() const {
    std::ostringstream out;
    out << name_ << "<" << BaseShapeName(base_shape_) << ">{";
    bool first = true;
    for (const auto& field : fields_) {
        if (!first) out << ", ";
        first = false;
        out << field.name << ": " << core::FieldTypeName(field.type);
        if (field.dimension) out << "[" << *field.dimension << "]";
        if (field.optional) out << "?";
    }
    out << "}";
    return out.str();
}

} // namespace schema
} // namespace ctxdb
