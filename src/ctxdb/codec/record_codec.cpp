#include "ctxdb/codec/record_codec.h"
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace ctxdb {
namespace codec {

namespace {

using core::Error;
using core::Result;
using rapidjson::Value;

using Writer = rapidjson::Writer<rapidjson::StringBuffer, rapidjson::UTF8<>, rapidjson::UTF8<>,
                                 rapidjson::CrtAllocator, rapidjson::kWriteNanAndInfFlag>;

const char* JsonTypeName(const Value& v) {
    switch (v.GetType()) {
        case rapidjson::kNullType: return "null";
        case rapidjson::kFalseType:
        case rapidjson::kTrueType: return "boolean";
        case rapidjson::kObjectType: return "object";
        case rapidjson::kArrayType: return "array";
        case rapidjson::kStringType: return "string";
        case rapidjson::kNumberType: return "number";
    }
    return "unknown";
}

Result<core::FieldValue> Mismatch(const schema::FieldSpec& spec, const Value& v) {
    return Result<core::FieldValue>::error(Error::Code::TYPE_MISMATCH,
        "field '" + spec.name + "' expects " + core::FieldTypeName(spec.type) + ", got " + JsonTypeName(v));
}

Result<core::FieldValue> ConvertValue(const schema::FieldSpec& spec, const Value& v) {
    if (v.IsNull()) {
        return Result<core::FieldValue>(core::FieldValue{});
    }
    switch (spec.type) {
        case core::FieldType::STRING:
        case core::FieldType::URL:
        case core::FieldType::BYTES:
            if (!v.IsString()) return Mismatch(spec, v);
            return Result<core::FieldValue>(core::FieldValue{std::string(v.GetString(), v.GetStringLength())});
        case core::FieldType::INTEGER:
            if (!v.IsInt64()) return Mismatch(spec, v);
            return Result<core::FieldValue>(core::FieldValue{v.GetInt64()});
        case core::FieldType::NUMBER:
            if (!v.IsNumber()) return Mismatch(spec, v);
            return Result<core::FieldValue>(core::FieldValue{v.GetDouble()});
        case core::FieldType::BOOLEAN:
            if (!v.IsBool()) return Mismatch(spec, v);
            return Result<core::FieldValue>(core::FieldValue{v.GetBool()});
        case core::FieldType::VECTOR: {
            if (!v.IsArray()) return Mismatch(spec, v);
            core::Vector vec;
            vec.reserve(v.Size());
            for (const auto& component : v.GetArray()) {
                if (!component.IsNumber()) {
                    return Result<core::FieldValue>::error(Error::Code::TYPE_MISMATCH,
                        "field '" + spec.name + "' expects numeric components, got " + JsonTypeName(component));
                }
                double value = component.GetDouble();
                if (std::isfinite(value) && std::fabs(value) > std::numeric_limits<float>::max()) {
                    return Result<core::FieldValue>::error(Error::Code::TYPE_MISMATCH,
                        "field '" + spec.name + "' component out of range: " + std::to_string(value));
                }
                vec.push_back(static_cast<float>(value));
            }
            return Result<core::FieldValue>(core::FieldValue{std::move(vec)});
        }
    }
    return Mismatch(spec, v);
}

Result<core::Record> Convert(const schema::TypeDescriptorPtr& descriptor, const Value& object, bool complete) {
    if (!descriptor) {
        return Result<core::Record>::error(Error::Code::INVALID_ARGUMENT, "no type to decode with");
    }
    if (!object.IsObject()) {
        return Result<core::Record>::error(Error::Code::INVALID_ARGUMENT,
            std::string("expected a JSON object, got ") + JsonTypeName(object));
    }

    core::Record record(descriptor);
    for (const auto& member : object.GetObject()) {
        std::string name(member.name.GetString(), member.name.GetStringLength());
        if (name == "id") {
            if (member.value.IsString()) {
                record.set_id(std::string(member.value.GetString(), member.value.GetStringLength()));
                continue;
            }
            if (member.value.IsNull()) {
                continue;
            }
            return Result<core::Record>::error(Error::Code::TYPE_MISMATCH,
                std::string("field 'id' expects a string, got ") + JsonTypeName(member.value));
        }

        const schema::FieldSpec* spec = descriptor->find_field(name);
        if (!spec) {
            return Result<core::Record>::error(Error::Code::TYPE_MISMATCH,
                "field '" + name + "' is not declared by type " + descriptor->name());
        }
        auto value = ConvertValue(*spec, member.value);
        if (!value.ok()) {
            return Result<core::Record>::propagate(value);
        }
        record.set(name, value.take_value());
    }

    if (complete) {
        auto valid = descriptor->validate(record);
        if (!valid.ok()) {
            return Result<core::Record>::propagate(valid);
        }
    }
    return Result<core::Record>(std::move(record));
}

Result<rapidjson::Document> Parse(const std::string& json) {
    rapidjson::Document doc;
    doc.Parse<kParseFlags>(json.c_str(), json.size());
    if (doc.HasParseError()) {
        std::ostringstream msg;
        msg << "malformed JSON at offset " << doc.GetErrorOffset() << ": "
            << rapidjson::GetParseError_En(doc.GetParseError());
        return Result<rapidjson::Document>::error(Error::Code::INVALID_ARGUMENT, msg.str());
    }
    return Result<rapidjson::Document>(std::move(doc));
}

Value StringValue(const std::string& s, rapidjson::Document::AllocatorType& allocator) {
    return Value(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), allocator);
}

Value FieldToValue(const core::FieldValue& value, rapidjson::Document::AllocatorType& allocator) {
    Value out;
    if (auto* s = std::get_if<std::string>(&value)) {
        out = StringValue(*s, allocator);
    } else if (auto* i = std::get_if<int64_t>(&value)) {
        out.SetInt64(*i);
    } else if (auto* d = std::get_if<double>(&value)) {
        out.SetDouble(*d);
    } else if (auto* b = std::get_if<bool>(&value)) {
        out.SetBool(*b);
    } else if (auto* vec = std::get_if<core::Vector>(&value)) {
        out.SetArray();
        out.Reserve(static_cast<rapidjson::SizeType>(vec->size()), allocator);
        for (float component : *vec) {
            out.PushBack(Value(static_cast<double>(component)), allocator);
        }
    }
    return out;
}

} // namespace

Result<core::Record> DecodeRecord(const schema::TypeDescriptorPtr& descriptor, const Value& object) {
    return Convert(descriptor, object, true);
}

Result<core::Record> DecodeRecord(const schema::TypeDescriptorPtr& descriptor, const std::string& json) {
    auto doc = Parse(json);
    if (!doc.ok()) {
        return Result<core::Record>::propagate(doc);
    }
    return Convert(descriptor, doc.value(), true);
}

Result<std::vector<core::Record>> DecodeRecords(const schema::TypeDescriptorPtr& descriptor,
                                                const Value& value) {
    using Records = std::vector<core::Record>;
    Records records;
    if (value.IsObject()) {
        auto record = Convert(descriptor, value, true);
        if (!record.ok()) {
            return Result<Records>::propagate(record);
        }
        records.push_back(record.take_value());
        return Result<Records>(std::move(records));
    }
    if (!value.IsArray()) {
        return Result<Records>::error(Error::Code::INVALID_ARGUMENT,
            std::string("expected a JSON object or array, got ") + JsonTypeName(value));
    }
    records.reserve(value.Size());
    rapidjson::SizeType position = 0;
    for (const auto& element : value.GetArray()) {
        auto record = Convert(descriptor, element, true);
        if (!record.ok()) {
            return Result<Records>::error(record.code(),
                "record " + std::to_string(position) + ": " + record.error());
        }
        records.push_back(record.take_value());
        ++position;
    }
    return Result<Records>(std::move(records));
}

Result<std::vector<core::Record>> DecodeRecords(const schema::TypeDescriptorPtr& descriptor,
                                                const std::string& json) {
    auto doc = Parse(json);
    if (!doc.ok()) {
        return Result<std::vector<core::Record>>::propagate(doc);
    }
    return DecodeRecords(descriptor, doc.value());
}

Result<core::Record> DecodeQuery(const schema::TypeDescriptorPtr& descriptor, const Value& object) {
    return Convert(descriptor, object, false);
}

Value RecordToValue(const core::Record& record, rapidjson::Document::AllocatorType& allocator) {
    Value out(rapidjson::kObjectType);
    if (record.has_id()) {
        out.AddMember("id", StringValue(record.id(), allocator), allocator);
    } else {
        out.AddMember("id", Value(), allocator);
    }
    for (const auto& [name, value] : record.fields()) {
        out.AddMember(StringValue(name, allocator), FieldToValue(value, allocator), allocator);
    }
    return out;
}

Value DescriptorToValue(const schema::TypeDescriptor& descriptor, rapidjson::Document::AllocatorType& allocator) {
    Value out(rapidjson::kObjectType);
    out.AddMember("name", StringValue(descriptor.name(), allocator), allocator);
    out.AddMember("base_class", Value(schema::BaseShapeName(descriptor.base_shape()), allocator), allocator);

    Value fields(rapidjson::kArrayType);
    for (const auto& spec : descriptor.fields()) {
        Value field(rapidjson::kObjectType);
        field.AddMember("name", StringValue(spec.name, allocator), allocator);
        field.AddMember("type", Value(core::FieldTypeName(spec.type), allocator), allocator);
        field.AddMember("optional", spec.optional, allocator);
        if (spec.dimension) {
            field.AddMember("dimension", static_cast<uint64_t>(*spec.dimension), allocator);
        }
        fields.PushBack(field, allocator);
    }
    out.AddMember("fields", fields, allocator);

    if (descriptor.primary_vector_field().empty()) {
        out.AddMember("primary_vector_field", Value(), allocator);
    } else {
        out.AddMember("primary_vector_field", StringValue(descriptor.primary_vector_field(), allocator), allocator);
    }

    std::ostringstream fingerprint;
    fingerprint << std::hex << std::setw(16) << std::setfill('0') << descriptor.fingerprint();
    out.AddMember("fingerprint", StringValue(fingerprint.str(), allocator), allocator);
    return out;
}

std::string ToString(const Value& value) {
    rapidjson::StringBuffer buffer;
    Writer writer(buffer);
    value.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::string EncodeRecord(const core::Record& record) {
    rapidjson::Document doc;
    Value value = RecordToValue(record, doc.GetAllocator());
    return ToString(value);
}

std::string EncodeScoredRecords(const std::vector<storage::ScoredRecord>& hits) {
    rapidjson::Document doc;
    doc.SetArray();
    auto& allocator = doc.GetAllocator();
    for (const auto& hit : hits) {
        Value entry(rapidjson::kObjectType);
        entry.AddMember("record", RecordToValue(hit.record, allocator), allocator);
        entry.AddMember("distance", hit.distance, allocator);
        doc.PushBack(entry, allocator);
    }
    return ToString(doc);
}

std::string EncodeDescriptor(const schema::TypeDescriptor& descriptor) {
    rapidjson::Document doc;
    Value value = DescriptorToValue(descriptor, doc.GetAllocator());
    return ToString(value);
}

} // namespace codec
} // namespace ctxdb
