#pragma once
/*
================================================================================
Fragment 1.5 — Core: Run Fingerprint Hashing
FILE: cpp/engine/core/hashing.hpp

Purpose:
  - 64-bit FNV-1a accumulator used to fingerprint a run's inputs and its
    selected fleet, so two runs can be compared without diffing tables:
      * vessel table identity
      * scenario identity
      * fleet identity (parallel sweep vs sequential sweep)

Rules:
  - Integers are fed little-endian, byte by byte, independent of the host.
  - Doubles are canonicalized first: -0.0 hashes as 0.0, every NaN alike.
  - std::hash is never used (its values differ between processes).
  - Not a cryptographic hash.
================================================================================
*/

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

#include "engine/core/fuel_type.hpp"

namespace fleetopt {

struct Hash64 {
  uint64_t value = 0;

  constexpr bool operator==(const Hash64& o) const noexcept { return value == o.value; }
  constexpr bool operator!=(const Hash64& o) const noexcept { return value != o.value; }
};

class Fnv1a64 {
 public:
  static constexpr uint64_t kOffsetBasis = 0xcbf29ce484222325ull;
  static constexpr uint64_t kPrime = 0x100000001b3ull;

  Hash64 digest() const { return Hash64{h_}; }

  void update_bytes(const void* data, size_t n);

  void update_u8(uint8_t v) { update_bytes(&v, 1); }

  void update_u64(uint64_t v) {
    uint8_t b[8];
    for (int i = 0; i < 8; ++i) b[i] = static_cast<uint8_t>(v >> (8 * i));
    update_bytes(b, sizeof(b));
  }

  void update_i64(int64_t v) { update_u64(static_cast<uint64_t>(v)); }
  void update_bool(bool b) { update_u8(b ? 1 : 0); }

  void update_string(std::string_view s);
  void update_f64(double x);
  void update_fuel_set(const FuelSet& s);

  template <class E, std::enable_if_t<std::is_enum_v<E>, int> = 0>
  void update_enum(E e) {
    update_u64(static_cast<uint64_t>(static_cast<std::underlying_type_t<E>>(e)));
  }

  // Section marker between logical records.
  void update_tag(std::string_view tag) {
    update_string(tag);
    update_u8(0x1F);
  }

 private:
  uint64_t h_ = kOffsetBasis;
};

// Order-sensitive: hash_combine(a, b) != hash_combine(b, a) in general.
Hash64 hash_combine(Hash64 a, Hash64 b);

std::string hash_to_hex(Hash64 h);

}  // namespace fleetopt
