#ifndef CTXDB_STORAGE_VECTOR_INDEX_H_
#define CTXDB_STORAGE_VECTOR_INDEX_H_

#include <atomic>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "ctxdb/core/config.h"
#include "ctxdb/core/record.h"
#include "ctxdb/core/result.h"
#include "ctxdb/schema/type_descriptor.h"

namespace ctxdb {
namespace storage {

/**
 * @brief A search hit: the stored record and its L2 distance to the query
 */
struct ScoredRecord {
    core::Record record;
    double distance = 0.0;
};

/**
 * @brief Per-index metrics for performance monitoring
 */
struct IndexMetrics {
    std::atomic<uint64_t> insert_count{0};
    std::atomic<uint64_t> rejected_count{0};
    std::atomic<uint64_t> search_count{0};
    std::atomic<uint64_t> skipped_count{0};   // Candidates without a finite distance
    std::atomic<uint64_t> insert_time_us{0};
    std::atomic<uint64_t> search_time_us{0};

    void reset() {
        insert_count = 0;
        rejected_count = 0;
        search_count = 0;
        skipped_count = 0;
        insert_time_us = 0;
        search_time_us = 0;
    }
};

/**
 * @brief In-memory exact nearest-neighbor index over the records of one model
 *
 * Records are kept in insertion order. Search compares the query against
 * every stored vector (no pruning) under the Euclidean distance and returns
 * the closest ones, ties broken by insertion order.
 *
 * The dimension of each vector field is fixed by the first stored record
 * carrying it (or declared by the descriptor). When the descriptor has a
 * vector field, its primary vector field must be set on every record.
 *
 * Thread-safety: inserts take an exclusive lock, searches a shared one;
 * searches run in parallel and never observe a partially appended record.
 */
class VectorIndex {
public:
    explicit VectorIndex(schema::TypeDescriptorPtr descriptor,
                         const core::IndexConfig& config = core::IndexConfig::Default());

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    /**
     * @brief Appends a record
     *
     * Fails with TYPE_MISMATCH, EMPTY_VECTOR_FIELD or DIMENSION_MISMATCH and
     * leaves the index unchanged. Records with an identifier already present
     * are stored again, not overwritten. Assigns an identifier when absent.
     */
    core::Result<void> insert(core::Record record);

    /**
     * @brief Appends several records atomically; all or nothing
     */
    core::Result<void> insert_batch(std::vector<core::Record> records);

    /**
     * @brief Exact top-k search over a vector field
     * @param query Record carrying the query vector in @p field
     * @param field Vector field to compare
     * @param limit Maximum number of hits, must be >= 1
     * @return Hits ascending by distance; records whose distance is not
     *         finite, or that lack @p field, are left out
     */
    core::Result<std::vector<ScoredRecord>> find(const core::Record& query,
                                                 const std::string& field,
                                                 size_t limit) const;

    // First record stored with the identifier
    core::Result<core::Record> get(const core::RecordID& id) const;

    size_t size() const;
    bool empty() const { return size() == 0; }

    // Established dimension of a vector field, if any record fixed it yet
    std::optional<size_t> dimension(const std::string& field) const;

    // Drops every record and established dimension
    void clear();

    const schema::TypeDescriptorPtr& descriptor() const { return descriptor_; }
    const std::string& primary_field() const { return primary_field_; }

    IndexMetrics& get_metrics() { return metrics_; }
    const IndexMetrics& get_metrics() const { return metrics_; }

private:
    const schema::TypeDescriptorPtr descriptor_;
    const std::string primary_field_;

    std::vector<core::Record> records_;
    std::map<std::string, size_t> dimensions_;

    mutable std::shared_mutex mutex_;
    mutable IndexMetrics metrics_;

    // Checks a record against the descriptor and the given dimensions.
    // Newly seen vector fields are added to @p dimensions.
    core::Result<void> check_record(const core::Record& record,
                                    std::map<std::string, size_t>& dimensions) const;
};

} // namespace storage
} // namespace ctxdb

#endif // CTXDB_STORAGE_VECTOR_INDEX_H_
