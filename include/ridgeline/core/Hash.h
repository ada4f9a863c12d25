#pragma once
#include "ridgeline/core/Types.h"
#include <string_view>

namespace ridgeline::core {

// 64-bit FNV-1a hash (stable, fast, good for seeds).
u64 fnv1a64(std::string_view text);

// Mix/combine two 64-bit hashes into one (order-sensitive).
u64 hashCombine(u64 a, u64 b);

} // namespace ridgeline::core
