#include "ctxdb/schema/base_shape.h"
#include <algorithm>
#include <cctype>

namespace ctxdb {
namespace schema {

namespace {

const BaseShapeContract kGenericDocument{
    BaseShape::GENERIC_DOCUMENT,
    "generic_document",
    {{"id", core::FieldType::STRING}},
    nullptr,
    nullptr,
};

const BaseShapeContract kTextDocument{
    BaseShape::TEXT_DOCUMENT,
    "text_document",
    {
        {"id", core::FieldType::STRING},
        {"text", core::FieldType::STRING},
        {"url", core::FieldType::URL},
        {"embedding", core::FieldType::VECTOR},
        {"bytes_", core::FieldType::BYTES},
    },
    "text",
    "embedding",
};

// Lower-cases and folds ' ' and '-' into '_'
std::string Normalize(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == ' ' || c == '-') {
            out.push_back('_');
        } else {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return out;
}

} // namespace

const BaseShapeContract& ContractOf(BaseShape shape) {
    switch (shape) {
        case BaseShape::GENERIC_DOCUMENT: return kGenericDocument;
        case BaseShape::TEXT_DOCUMENT: return kTextDocument;
    }
    return kGenericDocument;
}

core::Result<BaseShape> ParseBaseShape(const std::string& name) {
    std::string normalized = Normalize(name);

    // Module-qualified class names: only the class matters
    auto dot = normalized.rfind('.');
    if (dot != std::string::npos) {
        normalized = normalized.substr(dot + 1);
    }

    if (normalized == "generic_document" || normalized == "basedoc" || normalized == "document") {
        return core::Result<BaseShape>(BaseShape::GENERIC_DOCUMENT);
    }
    if (normalized == "text_document" || normalized == "textdoc") {
        return core::Result<BaseShape>(BaseShape::TEXT_DOCUMENT);
    }
    return core::Result<BaseShape>::error(core::Error::Code::UNKNOWN_BASE_SHAPE,
                                          "unknown base shape: '" + name + "'");
}

std::vector<BaseShape> AllBaseShapes() {
    return {BaseShape::GENERIC_DOCUMENT, BaseShape::TEXT_DOCUMENT};
}

} // namespace schema
} // namespace ctxdb
