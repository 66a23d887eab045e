#include "notegraph/vector/codec.hpp"

#include <bit>

namespace notegraph::vector {

static_assert(sizeof(float) == kBytesPerComponent, "binary32 float required");

Blob encode_blob(const Vector &values) {
  Blob blob;
  blob.reserve(values.size() * kBytesPerComponent);
  for (const float value : values) {
    const auto bits = std::bit_cast<std::uint32_t>(value);
    blob.push_back(static_cast<std::uint8_t>(bits & 0xFFU));
    blob.push_back(static_cast<std::uint8_t>((bits >> 8U) & 0xFFU));
    blob.push_back(static_cast<std::uint8_t>((bits >> 16U) & 0xFFU));
    blob.push_back(static_cast<std::uint8_t>((bits >> 24U) & 0xFFU));
  }
  return blob;
}

common::Result<Vector> decode_blob(const void *data, const std::size_t bytes) {
  if (bytes % kBytesPerComponent != 0) {
    return common::Result<Vector>::failure("malformed blob: " + std::to_string(bytes) +
                                               " bytes is not a multiple of 4",
                                           common::ErrorCode::MalformedBlob);
  }
  if (bytes == 0) {
    return common::Result<Vector>::success({});
  }
  if (data == nullptr) {
    return common::Result<Vector>::failure("malformed blob: null data",
                                           common::ErrorCode::MalformedBlob);
  }

  const auto *raw = static_cast<const std::uint8_t *>(data);
  Vector values(bytes / kBytesPerComponent);
  for (std::size_t i = 0; i < values.size(); ++i) {
    const std::uint8_t *p = raw + i * kBytesPerComponent;
    const std::uint32_t bits = static_cast<std::uint32_t>(p[0]) |
                               (static_cast<std::uint32_t>(p[1]) << 8U) |
                               (static_cast<std::uint32_t>(p[2]) << 16U) |
                               (static_cast<std::uint32_t>(p[3]) << 24U);
    values[i] = std::bit_cast<float>(bits);
  }
  return common::Result<Vector>::success(std::move(values));
}

common::Result<Vector> decode_blob(const Blob &blob) {
  return decode_blob(blob.data(), blob.size());
}

} // namespace notegraph::vector
