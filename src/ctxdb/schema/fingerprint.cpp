#include "ctxdb/schema/fingerprint.h"

#include <atomic>

namespace ctxdb {
namespace schema {
namespace {

constexpr uint64_t kFnvOffsetBasis = 0xcbf29ce484222325ULL;
constexpr uint64_t kFnvPrime = 0x100000001b3ULL;

std::atomic<FingerprintFn> g_hasher{&Fnv1a64};

} // namespace

uint64_t Fnv1a64(const std::string& bytes) {
    uint64_t hash = kFnvOffsetBasis;
    for (unsigned char c : bytes) {
        hash ^= c;
        hash *= kFnvPrime;
    }
    return hash;
}

uint64_t SchemaFingerprint(const std::string& canonical_key) {
    auto fn = g_hasher.load(std::memory_order_relaxed);
    return fn ? fn(canonical_key) : Fnv1a64(canonical_key);
}

void SetFingerprintHasherForTests(FingerprintFn fn) {
    g_hasher.store(fn ? fn : &Fnv1a64, std::memory_order_relaxed);
}

void ResetFingerprintHasherForTests() {
    g_hasher.store(&Fnv1a64, std::memory_order_relaxed);
}

} // namespace schema
} // namespace ctxdb
