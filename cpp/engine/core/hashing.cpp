#include "engine/core/hashing.hpp"

#include <bit>
#include <cmath>

namespace fleetopt {

namespace {

// One bit pattern per class of doubles that compare equal for our purposes.
uint64_t canonical_bits(double v) {
  if (std::isnan(v)) return 0x7ff8000000000000ull;
  if (v == 0.0) return 0;
  return std::bit_cast<uint64_t>(v);
}

uint64_t splitmix64_mix(uint64_t z) {
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ull;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebull;
  return z ^ (z >> 31);
}

}  // namespace

void Fnv1a64::update_bytes(const void* data, size_t n) {
  if (data == nullptr) return;
  const auto* p = static_cast<const uint8_t*>(data);
  const auto* end = p + n;
  for (; p != end; ++p) h_ = (h_ ^ *p) * kPrime;
}

void Fnv1a64::update_string(std::string_view s) {
  // Length prefix keeps ("ab","c") and ("a","bc") apart.
  update_u64(s.size());
  update_bytes(s.data(), s.size());
}

void Fnv1a64::update_f64(double x) { update_u64(canonical_bits(x)); }

void Fnv1a64::update_fuel_set(const FuelSet& s) { update_u64(s.to_ullong()); }

Hash64 hash_combine(Hash64 a, Hash64 b) {
  return Hash64{splitmix64_mix(a.value * 31u + splitmix64_mix(b.value))};
}

std::string hash_to_hex(Hash64 h) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(16);
  for (int shift = 60; shift >= 0; shift -= 4) out.push_back(kDigits[(h.value >> shift) & 0xF]);
  return out;
}

}  // namespace fleetopt
