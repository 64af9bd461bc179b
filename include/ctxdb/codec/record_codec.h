#pragma once

#include <string>
#include <vector>

#include <rapidjson/document.h>

#include "ctxdb/core/record.h"
#include "ctxdb/core/result.h"
#include "ctxdb/schema/type_descriptor.h"
#include "ctxdb/storage/vector_index.h"

namespace ctxdb {
namespace codec {

/**
 * @brief Flags used for every document parsed at the boundary
 *
 * NaN, Infinity and -Infinity literals are accepted so that non-finite
 * vector components reach the index.
 */
constexpr unsigned kParseFlags = rapidjson::kParseNanAndInfFlag;

/**
 * @brief Converts a JSON object into a record of the given type
 *
 * "id" maps onto the record identifier (string or null). Every other key
 * must be a declared field (TYPE_MISMATCH otherwise); null stores an explicit
 * null, any other value is converted by the declared field type. An integral
 * number is accepted for a NUMBER field, an array of numbers for a VECTOR
 * field. The result is bound to @p descriptor and checked with validate().
 */
core::Result<core::Record> DecodeRecord(const schema::TypeDescriptorPtr& descriptor,
                                        const rapidjson::Value& object);

// Same, parsing @p json first; malformed text gives INVALID_ARGUMENT
core::Result<core::Record> DecodeRecord(const schema::TypeDescriptorPtr& descriptor,
                                        const std::string& json);

/**
 * @brief Decodes a single object or an array of objects
 *
 * A failing element reports its position: "record 2: ...".
 */
core::Result<std::vector<core::Record>> DecodeRecords(const schema::TypeDescriptorPtr& descriptor,
                                                      const rapidjson::Value& value);
core::Result<std::vector<core::Record>> DecodeRecords(const schema::TypeDescriptorPtr& descriptor,
                                                      const std::string& json);

/**
 * @brief Decodes a search query
 *
 * Like DecodeRecord but required fields may be left out; a query usually
 * carries nothing but the vector searched with.
 */
core::Result<core::Record> DecodeQuery(const schema::TypeDescriptorPtr& descriptor,
                                       const rapidjson::Value& object);

// Builders for composing larger documents
rapidjson::Value RecordToValue(const core::Record& record, rapidjson::Document::AllocatorType& allocator);
rapidjson::Value DescriptorToValue(const schema::TypeDescriptor& descriptor,
                                   rapidjson::Document::AllocatorType& allocator);

// {"id": ..., "<field>": ...}
std::string EncodeRecord(const core::Record& record);

// [{"record": {...}, "distance": 0.5}, ...]
std::string EncodeScoredRecords(const std::vector<storage::ScoredRecord>& hits);

// {"name": ..., "base_class": ..., "fields": [...], "primary_vector_field": ...}
std::string EncodeDescriptor(const schema::TypeDescriptor& descriptor);

// Serializes a value; non-finite numbers are written as NaN/Infinity
std::string ToString(const rapidjson::Value& value);

} // namespace codec
} // namespace ctxdb
