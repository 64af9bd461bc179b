#include <gtest/gtest.h>
#include <cmath>
#include <rapidjson/document.h>
#include "ctxdb/codec/record_codec.h"
#include "ctxdb/schema/type_materializer.h"
#include "test_util/schemas.h"

namespace ctxdb {
namespace codec {
namespace {

using core::Error;

class RecordCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto text = materializer_.materialize(testutil::TextModelSchema(), "text_document");
        ASSERT_TRUE(text.ok()) << text.error();
        text_type_ = text.value();

        const std::string typed = R"({"title": "Typed", "required": ["name"], "properties": {
            "name": {"type": "string"},
            "count": {"type": "integer"},
            "score": {"type": "number"},
            "flag": {"type": "boolean"},
            "vec": {"type": "array", "items": {"type": "number"}, "minItems": 2, "maxItems": 2}
        }})";
        auto result = materializer_.materialize(typed, "generic_document");
        ASSERT_TRUE(result.ok()) << result.error();
        typed_ = result.value();
    }

    static rapidjson::Document Parse(const std::string& json) {
        rapidjson::Document doc;
        doc.Parse<kParseFlags>(json.c_str(), json.size());
        EXPECT_FALSE(doc.HasParseError()) << json;
        return doc;
    }

    schema::TypeMaterializer materializer_;
    schema::TypeDescriptorPtr text_type_;
    schema::TypeDescriptorPtr typed_;
};

TEST_F(RecordCodecTest, DecodeTextDocument) {
    auto record = DecodeRecord(text_type_, R"({"id": "doc-1", "text": "hello", "embedding": [0.5, 1, -2]})");
    ASSERT_TRUE(record.ok()) << record.error();
    EXPECT_EQ(record.value().id(), "doc-1");
    EXPECT_EQ(record.value().descriptor(), text_type_);
    const core::Vector* embedding = record.value().get_vector("embedding");
    ASSERT_NE(embedding, nullptr);
    EXPECT_EQ(*embedding, (core::Vector{0.5f, 1.0f, -2.0f}));
}

TEST_F(RecordCodecTest, DecodeScalarTypes) {
    auto record = DecodeRecord(typed_, R"({"name": "n", "count": 3, "score": 2, "flag": true, "vec": null})");
    ASSERT_TRUE(record.ok()) << record.error();
    const core::Record& r = record.value();
    EXPECT_FALSE(r.has_id());
    EXPECT_EQ(std::get<int64_t>(*r.get("count")), 3);
    // Integral values are widened for number fields
    EXPECT_DOUBLE_EQ(std::get<double>(*r.get("score")), 2.0);
    EXPECT_TRUE(std::get<bool>(*r.get("flag")));
    EXPECT_TRUE(core::IsNull(*r.get("vec")));
}

TEST_F(RecordCodecTest, DecodeErrors) {
    struct Case {
        const char* json;
        Error::Code code;
    };
    const Case cases[] = {
        {R"({"name": "n", "color": "red"})", Error::Code::TYPE_MISMATCH},
        {R"({"name": 5})", Error::Code::TYPE_MISMATCH},
        {R"({"name": "n", "count": 1.5})", Error::Code::TYPE_MISMATCH},
        {R"({"name": "n", "vec": [1, "x"]})", Error::Code::TYPE_MISMATCH},
        {R"({"name": "n", "id": 7})", Error::Code::TYPE_MISMATCH},
        {R"({"count": 1})", Error::Code::TYPE_MISMATCH},
        {R"({"name": "n", "vec": [1, 2, 3]})", Error::Code::DIMENSION_MISMATCH},
        {R"({"name": "n", "vec": [1e39, 0]})", Error::Code::TYPE_MISMATCH},
        {R"({"name": "n", "vec": [0, -1e300]})", Error::Code::TYPE_MISMATCH},
        {R"([1, 2])", Error::Code::INVALID_ARGUMENT},
        {R"({"name": )", Error::Code::INVALID_ARGUMENT},
    };
    for (const auto& c : cases) {
        auto record = DecodeRecord(typed_, std::string(c.json));
        EXPECT_FALSE(record.ok()) << c.json;
        EXPECT_EQ(record.code(), c.code) << c.json;
    }
}

TEST_F(RecordCodecTest, OutOfRangeComponentIsNamed) {
    auto record = DecodeRecord(typed_, std::string(R"({"name": "n", "vec": [1e39, 0]})"));
    ASSERT_FALSE(record.ok());
    EXPECT_NE(record.error().find("component out of range"), std::string::npos) << record.error();

    auto largest = DecodeRecord(typed_, std::string(R"({"name": "n", "vec": [3.4e38, -3.4e38]})"));
    EXPECT_TRUE(largest.ok()) << largest.error();
}

TEST_F(RecordCodecTest, DecodeRecordsAcceptsObjectOrArray) {
    auto single = DecodeRecords(text_type_, std::string(R"({"text": "a", "embedding": [1]})"));
    ASSERT_TRUE(single.ok());
    EXPECT_EQ(single.value().size(), 1u);

    auto many = DecodeRecords(text_type_, std::string(R"([{"text": "a"}, {"text": "b"}])"));
    ASSERT_TRUE(many.ok());
    EXPECT_EQ(many.value().size(), 2u);

    auto bad = DecodeRecords(text_type_, std::string(R"([{"text": "a"}, {"text": 1}])"));
    EXPECT_EQ(bad.code(), Error::Code::TYPE_MISMATCH);
    EXPECT_EQ(bad.error().rfind("record 1: ", 0), 0u);

    EXPECT_EQ(DecodeRecords(text_type_, std::string("\"text\"")).code(), Error::Code::INVALID_ARGUMENT);
}

TEST_F(RecordCodecTest, DecodeQuerySkipsRequiredFields) {
    auto doc = Parse(R"({"vec": [1, 2]})");
    EXPECT_EQ(DecodeRecord(typed_, doc).code(), Error::Code::TYPE_MISMATCH);

    auto query = DecodeQuery(typed_, doc);
    ASSERT_TRUE(query.ok()) << query.error();
    ASSERT_NE(query.value().get_vector("vec"), nullptr);

    EXPECT_EQ(DecodeQuery(typed_, Parse(R"({"vec": "x"})")).code(), Error::Code::TYPE_MISMATCH);
}

TEST_F(RecordCodecTest, NonFiniteComponents) {
    auto record = DecodeRecord(text_type_, R"({"embedding": [NaN, Infinity, -Infinity]})");
    ASSERT_TRUE(record.ok()) << record.error();
    const core::Vector* v = record.value().get_vector("embedding");
    ASSERT_NE(v, nullptr);
    EXPECT_TRUE(std::isnan((*v)[0]));
    EXPECT_TRUE(std::isinf((*v)[1]));
}

TEST_F(RecordCodecTest, EncodeRecord) {
    core::Record record(core::RecordID("r1"));
    record.set("name", std::string("n"));
    record.set("count", int64_t{2});
    record.set("vec", core::Vector{1.5f, -1.0f});
    record.set_null("flag");

    auto doc = Parse(EncodeRecord(record));
    ASSERT_TRUE(doc.IsObject());
    EXPECT_STREQ(doc["id"].GetString(), "r1");
    EXPECT_EQ(doc["count"].GetInt64(), 2);
    EXPECT_TRUE(doc["flag"].IsNull());
    ASSERT_TRUE(doc["vec"].IsArray());
    EXPECT_DOUBLE_EQ(doc["vec"][0].GetDouble(), 1.5);

    auto decoded = DecodeRecord(typed_, EncodeRecord(record));
    ASSERT_TRUE(decoded.ok()) << decoded.error();
    EXPECT_EQ(decoded.value(), record);

    core::Record anonymous;
    EXPECT_EQ(EncodeRecord(anonymous), R"({"id":null})");
}

TEST_F(RecordCodecTest, EncodeScoredRecords) {
    core::Record record(core::RecordID("hit"));
    record.set("text", std::string("t"));
    std::vector<storage::ScoredRecord> hits{{record, 0.25}};

    auto doc = Parse(EncodeScoredRecords(hits));
    ASSERT_TRUE(doc.IsArray());
    ASSERT_EQ(doc.Size(), 1u);
    EXPECT_STREQ(doc[0]["record"]["id"].GetString(), "hit");
    EXPECT_DOUBLE_EQ(doc[0]["distance"].GetDouble(), 0.25);
    EXPECT_EQ(EncodeScoredRecords({}), "[]");
}

TEST_F(RecordCodecTest, EncodeDescriptor) {
    auto doc = Parse(EncodeDescriptor(*typed_));
    EXPECT_STREQ(doc["name"].GetString(), "Typed");
    EXPECT_STREQ(doc["base_class"].GetString(), "generic_document");
    EXPECT_STREQ(doc["primary_vector_field"].GetString(), "vec");
    EXPECT_EQ(doc["fingerprint"].GetStringLength(), 16u);

    const auto& fields = doc["fields"];
    ASSERT_TRUE(fields.IsArray());
    bool saw_vec = false;
    for (const auto& field : fields.GetArray()) {
        if (std::string(field["name"].GetString()) == "vec") {
            saw_vec = true;
            EXPECT_STREQ(field["type"].GetString(), "vector");
            EXPECT_EQ(field["dimension"].GetUint64(), 2u);
        }
        if (std::string(field["name"].GetString()) == "name") {
            EXPECT_FALSE(field["optional"].GetBool());
        }
    }
    EXPECT_TRUE(saw_vec);
}

} // namespace
} // namespace codec
} // namespace ctxdb
