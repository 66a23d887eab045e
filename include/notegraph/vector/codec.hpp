#pragma once

#include "notegraph/common/result.hpp"
#include "notegraph/vector/types.hpp"

#include <cstddef>

namespace notegraph::vector {

inline constexpr std::size_t kBytesPerComponent = 4;

/// Packs each component as IEEE-754 binary32, little-endian, in order.
/// NaN and infinities are copied bit-for-bit.
[[nodiscard]] Blob encode_blob(const Vector &values);

/// Inverse of encode_blob. Dimension is bytes / 4; any other length
/// fails with ErrorCode::MalformedBlob.
[[nodiscard]] common::Result<Vector> decode_blob(const Blob &blob);
[[nodiscard]] common::Result<Vector> decode_blob(const void *data, std::size_t bytes);

} // namespace notegraph::vector
