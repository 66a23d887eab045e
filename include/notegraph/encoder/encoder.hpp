#pragma once

#include "notegraph/common/result.hpp"
#include "notegraph/config/schema.hpp"
#include "notegraph/vector/types.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace notegraph::encoder {

/// Maps text to a fixed-length, unit-normalized vector. Failures are
/// reported with ErrorCode::EncodingFailed and are never retried here.
class IEncoder {
public:
  virtual ~IEncoder() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<vector::Vector> encode(std::string_view text) = 0;
  [[nodiscard]] virtual common::Result<std::vector<vector::Vector>>
  encode_batch(const std::vector<std::string> &texts);
  [[nodiscard]] virtual std::size_t dimensions() const = 0;

  /// Names the embedding space for the embedding cache. Encoders sharing an
  /// id and a dimension must map equal text to equal vectors.
  [[nodiscard]] virtual std::string cache_id() const { return std::string(name()); }
};

[[nodiscard]] std::unique_ptr<IEncoder> create_encoder(const config::EncoderConfig &config);

} // namespace notegraph::encoder
