#pragma once

#include <cstdint>
#include <string>

namespace ctxdb {
namespace schema {

// FNV-1a (64 bit) of a byte string.
uint64_t Fnv1a64(const std::string& bytes);

// Fingerprint of a canonical schema key. Default is Fnv1a64.
uint64_t SchemaFingerprint(const std::string& canonical_key);

// ---- Test seam ----
// Allows tests to force fingerprint collisions to validate the
// collision-defense logic of the materializer cache.
using FingerprintFn = uint64_t(*)(const std::string&);
void SetFingerprintHasherForTests(FingerprintFn fn);
void ResetFingerprintHasherForTests();

} // namespace schema
} // namespace ctxdb
