#include "dst/core/Hash.hpp"

namespace dst {

namespace {

constexpr std::uint64_t kFnvPrime = 0x100000001b3ULL;

} // namespace

std::uint64_t fnv1a(const void* data, std::size_t size, std::uint64_t state) {
  const auto* bytes = static_cast<const unsigned char*>(data);
  for (std::size_t i = 0; i < size; ++i) {
    state ^= static_cast<std::uint64_t>(bytes[i]);
    state *= kFnvPrime;
  }
  return state;
}

} // namespace dst
