#include <benchmark/benchmark.h>
#include <random>
#include "ctxdb/codec/record_codec.h"
#include "ctxdb/schema/type_materializer.h"
#include "ctxdb/storage/vector_index.h"

namespace ctxdb {
namespace bench {
namespace {

const char kSchema[] = R"({"title": "Doc", "properties": {
    "text": {"type": "string"},
    "embedding": {"type": "array", "items": {"type": "number"}}
}})";

schema::TypeDescriptorPtr DocType() {
    static schema::TypeMaterializer materializer;
    return materializer.materialize(kSchema, "text_document").take_value();
}

core::Record RandomRecord(std::mt19937& gen, size_t dim) {
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    core::Vector embedding(dim);
    for (auto& component : embedding) {
        component = dist(gen);
    }
    core::Record record;
    record.set("embedding", std::move(embedding));
    return record;
}

std::unique_ptr<storage::VectorIndex> FilledIndex(size_t count, size_t dim) {
    auto index = std::make_unique<storage::VectorIndex>(DocType());
    std::mt19937 gen(42);
    std::vector<core::Record> records;
    records.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        records.push_back(RandomRecord(gen, dim));
    }
    if (!index->insert_batch(std::move(records)).ok()) {
        return nullptr;
    }
    return index;
}

// Exact search over N records of dimension D
static void BM_VectorIndexFind(benchmark::State& state) {
    const size_t count = static_cast<size_t>(state.range(0));
    const size_t dim = static_cast<size_t>(state.range(1));
    auto index = FilledIndex(count, dim);
    if (!index) {
        state.SkipWithError("failed to fill index");
        return;
    }
    std::mt19937 gen(7);
    core::Record query = RandomRecord(gen, dim);

    for (auto _ : state) {
        auto hits = index->find(query, "embedding", 10);
        benchmark::DoNotOptimize(hits);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(count));
}

static void BM_VectorIndexInsert(benchmark::State& state) {
    const size_t dim = static_cast<size_t>(state.range(0));
    storage::VectorIndex index(DocType());
    std::mt19937 gen(11);

    for (auto _ : state) {
        state.PauseTiming();
        core::Record record = RandomRecord(gen, dim);
        state.ResumeTiming();
        auto inserted = index.insert(std::move(record));
        benchmark::DoNotOptimize(inserted);
    }
    state.SetItemsProcessed(state.iterations());
}

static void BM_DecodeRecords(benchmark::State& state) {
    auto type = DocType();
    std::string json = "[";
    for (int i = 0; i < 100; ++i) {
        if (i > 0) json += ",";
        json += R"({"text": "document text", "embedding": [0.1, 0.2, 0.3, 0.4, 0.5, 0.6, 0.7, 0.8]})";
    }
    json += "]";

    for (auto _ : state) {
        auto records = codec::DecodeRecords(type, json);
        benchmark::DoNotOptimize(records);
    }
    state.SetItemsProcessed(state.iterations() * 100);
}

BENCHMARK(BM_VectorIndexFind)->Args({1000, 128})->Args({10000, 128})->Args({10000, 768});
BENCHMARK(BM_VectorIndexInsert)->Arg(128)->Arg(768);
BENCHMARK(BM_DecodeRecords);

} // namespace
} // namespace bench
} // namespace ctxdb
