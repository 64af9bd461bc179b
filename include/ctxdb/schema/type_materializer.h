#pragma once

#include <atomic>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "ctxdb/core/result.h"
#include "ctxdb/schema/type_descriptor.h"

namespace ctxdb {
namespace schema {

/**
 * @brief Cache metrics for monitoring
 */
struct MaterializerMetrics {
    std::atomic<uint64_t> hit_count{0};
    std::atomic<uint64_t> miss_count{0};
    std::atomic<uint64_t> failure_count{0};

    void reset() {
        hit_count = 0;
        miss_count = 0;
        failure_count = 0;
    }
};

/**
 * @brief Compiles JSON Schema definitions into TypeDescriptors
 *
 * Supported property schemas:
 * - "string" (format "uri"/"url" -> URL, "binary"/"byte" -> BYTES)
 * - "integer", "number", "boolean"
 * - "array" of "number"/"integer" items -> VECTOR; minItems == maxItems
 *   fixes the dimension
 * - nullable variants: {"type": [T, "null"]} and anyOf/oneOf with a
 *   {"type": "null"} branch
 *
 * Successful results are cached by the fingerprint of the canonical
 * (key-sorted) schema plus base shape; equivalent submissions get the very
 * same descriptor instance. Thread-safe.
 */
class TypeMaterializer {
public:
    TypeMaterializer() = default;

    TypeMaterializer(const TypeMaterializer&) = delete;
    TypeMaterializer& operator=(const TypeMaterializer&) = delete;

    /**
     * @brief Materializes (or reuses) the descriptor of a schema
     * @return UNKNOWN_BASE_SHAPE or INVALID_SCHEMA on failure; nothing is
     *         cached for failed submissions
     */
    core::Result<TypeDescriptorPtr> materialize(const std::string& schema_text,
                                                const std::string& base_shape_name);

    size_t cache_size() const;
    void clear_cache();

    MaterializerMetrics& get_metrics() { return metrics_; }
    const MaterializerMetrics& get_metrics() const { return metrics_; }

private:
    struct CacheEntry {
        std::string canonical_key;
        TypeDescriptorPtr descriptor;
    };

    // Fingerprint -> entries sharing it (more than one only on collision)
    std::unordered_map<uint64_t, std::vector<CacheEntry>> cache_;
    mutable std::shared_mutex mutex_;
    MaterializerMetrics metrics_;

    TypeDescriptorPtr find_cached(uint64_t fingerprint, const std::string& canonical_key) const;
};

} // namespace schema
} // namespace ctxdb
