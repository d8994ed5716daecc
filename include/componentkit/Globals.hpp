// componentkit-format

#ifndef COMPONENTKIT_GLOBALS_HPP_
#define COMPONENTKIT_GLOBALS_HPP_

#include <cstdint>
#include <limits>

namespace ComponentKit {

using index = uint64_t;    // more expressive name for an index into an array
using count = uint64_t;    // more expressive name for an integer quantity
using omp_index = int64_t; // signed index for OpenMP loops
using node = index;        // node identifier
using edgeid = index;      // edge identifier
using edgeweight = double; // edge weight type

constexpr index none = std::numeric_limits<index>::max(); // value for missing entries
constexpr edgeweight defaultEdgeWeight = 1.0;

} // namespace ComponentKit

#endif // COMPONENTKIT_GLOBALS_HPP_
