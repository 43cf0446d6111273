#pragma once

#include <cstddef>
#include <cstdint>

namespace dst {

// FNV-1a over a raw byte range.
std::uint64_t fnv1a(const void* data, std::size_t size, std::uint64_t state = 0xcbf29ce484222325ULL);

} // namespace dst
