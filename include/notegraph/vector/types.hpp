#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace notegraph::vector {

/// Fixed-dimension embedding. Unit L2 norm is assumed by every scoring
/// function but never enforced.
using Vector = std::vector<float>;

/// Packed little-endian binary32 floats, 4 bytes per dimension.
using Blob = std::vector<std::uint8_t>;

struct KeyedVector {
  std::string key;
  Vector vector;
};

struct ScoredKey {
  std::string key;
  float score = 0.0F;
};

using TagSet = std::set<std::string>;
using TagVectors = std::map<std::string, std::vector<Vector>>;
using CentroidMap = std::map<std::string, Vector>;

} // namespace notegraph::vector
