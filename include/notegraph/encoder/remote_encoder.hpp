#pragma once

#include "notegraph/encoder/encoder.hpp"
#include "notegraph/encoder/http_client.hpp"

#include <cstdint>
#include <memory>

namespace notegraph::encoder {

/// Client for an OpenAI-compatible embeddings endpoint.
class RemoteEncoder final : public IEncoder {
public:
  RemoteEncoder(std::string endpoint, std::string api_key, std::string model,
                std::size_t dimensions, std::uint64_t timeout_ms,
                std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>());

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<vector::Vector> encode(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override;
  /// "remote:<model>@<endpoint>"
  [[nodiscard]] std::string cache_id() const override;

private:
  std::string endpoint_;
  std::string api_key_;
  std::string model_;
  std::size_t dimensions_;
  std::uint64_t timeout_ms_;
  std::shared_ptr<HttpClient> http_client_;
};

} // namespace notegraph::encoder
