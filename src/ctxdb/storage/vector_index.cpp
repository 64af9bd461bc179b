#include "ctxdb/storage/vector_index.h"
#include "ctxdb/storage/distance.h"
#include "ctxdb/common/logger.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <mutex>
#include <queue>
#include <utility>

namespace ctxdb {
namespace storage {

namespace {

using core::Error;

std::map<std::string, size_t> DeclaredDimensions(const schema::TypeDescriptor& descriptor) {
    std::map<std::string, size_t> dimensions;
    for (const auto& field : descriptor.fields()) {
        if (field.type == core::FieldType::VECTOR && field.dimension) {
            dimensions[field.name] = *field.dimension;
        }
    }
    return dimensions;
}

const schema::TypeDescriptorPtr& RequireDescriptor(const schema::TypeDescriptorPtr& descriptor) {
    if (!descriptor) {
        throw core::InvalidArgumentError("VectorIndex requires a type descriptor");
    }
    return descriptor;
}

uint64_t ElapsedMicros(std::chrono::steady_clock::time_point start) {
    auto end = std::chrono::steady_clock::now();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(end - start).count());
}

} // namespace

VectorIndex::VectorIndex(schema::TypeDescriptorPtr descriptor, const core::IndexConfig& config)
    : descriptor_(RequireDescriptor(descriptor)),
      primary_field_(descriptor_->primary_vector_field()),
      dimensions_(DeclaredDimensions(*descriptor_)) {
    records_.reserve(config.initial_capacity);
    metrics_.reset();
}

core::Result<void> VectorIndex::check_record(const core::Record& record,
                                             std::map<std::string, size_t>& dimensions) const {
    const auto& bound = record.descriptor();
    if (bound && bound != descriptor_ && !bound->compatible_with(*descriptor_)) {
        return core::Result<void>::error(Error::Code::TYPE_MISMATCH,
            "record of type " + bound->name() + " does not conform to index type " + descriptor_->name());
    }

    auto valid = descriptor_->validate(record);
    if (!valid.ok()) {
        return valid;
    }

    if (!primary_field_.empty() && !record.get_vector(primary_field_)) {
        return core::Result<void>::error(Error::Code::EMPTY_VECTOR_FIELD,
            "record has no value in indexed vector field '" + primary_field_ + "'");
    }

    for (const auto& field : descriptor_->fields()) {
        if (field.type != core::FieldType::VECTOR) {
            continue;
        }
        const core::Vector* vec = record.get_vector(field.name);
        if (!vec) {
            continue;
        }
        if (vec->empty()) {
            return core::Result<void>::error(Error::Code::DIMENSION_MISMATCH,
                "vector field '" + field.name + "' must not be empty");
        }
        auto it = dimensions.find(field.name);
        if (it == dimensions.end()) {
            dimensions.emplace(field.name, vec->size());
        } else if (it->second != vec->size()) {
            return core::Result<void>::error(Error::Code::DIMENSION_MISMATCH,
                "vector field '" + field.name + "' has dimension " + std::to_string(it->second) +
                ", got " + std::to_string(vec->size()));
        }
    }
    return core::Result<void>();
}

core::Result<void> VectorIndex::insert(core::Record record) {
    auto start = std::chrono::steady_clock::now();

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto dimensions = dimensions_;
    auto checked = check_record(record, dimensions);
    if (!checked.ok()) {
        metrics_.rejected_count.fetch_add(1, std::memory_order_relaxed);
        CTXDB_DEBUG("insert into {} rejected: {}", descriptor_->name(), checked.error());
        return checked;
    }

    record.ensure_id();
    record.bind(descriptor_);
    records_.push_back(std::move(record));
    dimensions_ = std::move(dimensions);

    metrics_.insert_count.fetch_add(1, std::memory_order_relaxed);
    metrics_.insert_time_us.fetch_add(ElapsedMicros(start), std::memory_order_relaxed);
    return core::Result<void>();
}

core::Result<void> VectorIndex::insert_batch(std::vector<core::Record> records) {
    auto start = std::chrono::steady_clock::now();

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto dimensions = dimensions_;
    for (size_t i = 0; i < records.size(); ++i) {
        auto checked = check_record(records[i], dimensions);
        if (!checked.ok()) {
            metrics_.rejected_count.fetch_add(1, std::memory_order_relaxed);
            CTXDB_DEBUG("batch insert into {} rejected at record {}: {}",
                        descriptor_->name(), i, checked.error());
            return core::Result<void>::error(checked.code(),
                "record " + std::to_string(i) + ": " + checked.error());
        }
    }

    records_.reserve(records_.size() + records.size());
    for (auto& record : records) {
        record.ensure_id();
        record.bind(descriptor_);
        records_.push_back(std::move(record));
    }
    dimensions_ = std::move(dimensions);

    metrics_.insert_count.fetch_add(records.size(), std::memory_order_relaxed);
    metrics_.insert_time_us.fetch_add(ElapsedMicros(start), std::memory_order_relaxed);
    return core::Result<void>();
}

core::Result<std::vector<ScoredRecord>> VectorIndex::find(const core::Record& query,
                                                          const std::string& field,
                                                          size_t limit) const {
    using Hits = std::vector<ScoredRecord>;
    auto start = std::chrono::steady_clock::now();

    if (limit == 0) {
        return core::Result<Hits>::error(Error::Code::INVALID_ARGUMENT, "limit must be >= 1");
    }
    const schema::FieldSpec* spec = descriptor_->find_field(field);
    if (!spec || spec->type != core::FieldType::VECTOR) {
        return core::Result<Hits>::error(Error::Code::FIELD_NOT_FOUND,
            "'" + field + "' is not a vector field of type " + descriptor_->name());
    }
    const core::Vector* q = query.get_vector(field);
    if (!q || q->empty()) {
        return core::Result<Hits>::error(Error::Code::EMPTY_VECTOR_FIELD,
            "query has no value in vector field '" + field + "'");
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);

    if (records_.empty()) {
        return core::Result<Hits>(Hits{});
    }
    auto dim_it = dimensions_.find(field);
    if (dim_it != dimensions_.end() && dim_it->second != q->size()) {
        return core::Result<Hits>::error(Error::Code::DIMENSION_MISMATCH,
            "query vector has dimension " + std::to_string(q->size()) + ", field '" + field +
            "' has dimension " + std::to_string(dim_it->second));
    }

    // Max-heap of (distance, insertion position): top() is the worst kept
    // candidate. A later record never displaces an equally distant earlier one.
    using Candidate = std::pair<double, size_t>;
    std::priority_queue<Candidate> heap;
    uint64_t skipped = 0;

    for (size_t i = 0; i < records_.size(); ++i) {
        const core::Vector* v = records_[i].get_vector(field);
        if (!v || v->size() != q->size()) {
            continue;
        }
        const double d = L2Distance(q->data(), v->data(), q->size());
        if (!std::isfinite(d)) {
            ++skipped;
            continue;
        }
        Candidate candidate{d, i};
        if (heap.size() < limit) {
            heap.push(candidate);
        } else if (candidate < heap.top()) {
            heap.pop();
            heap.push(candidate);
        }
    }

    std::vector<Candidate> ordered;
    ordered.reserve(heap.size());
    while (!heap.empty()) {
        ordered.push_back(heap.top());
        heap.pop();
    }
    std::reverse(ordered.begin(), ordered.end());

    Hits hits;
    hits.reserve(ordered.size());
    for (const auto& [distance, position] : ordered) {
        hits.push_back(ScoredRecord{records_[position], distance});
    }
    lock.unlock();

    if (skipped > 0) {
        CTXDB_DEBUG("search on {}.{} left out {} records with non-finite distance",
                    descriptor_->name(), field, skipped);
    }
    metrics_.skipped_count.fetch_add(skipped, std::memory_order_relaxed);
    metrics_.search_count.fetch_add(1, std::memory_order_relaxed);
    metrics_.search_time_us.fetch_add(ElapsedMicros(start), std::memory_order_relaxed);
    return core::Result<Hits>(std::move(hits));
}

core::Result<core::Record> VectorIndex::get(const core::RecordID& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& record : records_) {
        if (record.id() == id) {
            return core::Result<core::Record>(record);
        }
    }
    return core::Result<core::Record>::error(Error::Code::NOT_FOUND, "no record with id '" + id + "'");
}

size_t VectorIndex::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return records_.size();
}

std::optional<size_t> VectorIndex::dimension(const std::string& field) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = dimensions_.find(field);
    if (it == dimensions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void VectorIndex::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    records_.clear();
    dimensions_ = DeclaredDimensions(*descriptor_);
}

} // namespace storage
} // namespace ctxdb
