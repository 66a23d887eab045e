#pragma once

#include "notegraph/encoder/encoder.hpp"

namespace notegraph::encoder {

/// Offline feature-hashing encoder: word unigrams and character trigrams are
/// hashed into signed buckets and the result is L2-normalized. Deterministic
/// across runs, so texts sharing vocabulary score close together.
class HashEncoder final : public IEncoder {
public:
  explicit HashEncoder(std::size_t dimensions = 384);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<vector::Vector> encode(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override;

private:
  std::size_t dimensions_;
};

} // namespace notegraph::encoder
