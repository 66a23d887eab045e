#include "notegraph/encoder/encoder.hpp"

#include "notegraph/common/fs.hpp"
#include "notegraph/encoder/hash_encoder.hpp"
#include "notegraph/encoder/remote_encoder.hpp"

namespace notegraph::encoder {

common::Result<std::vector<vector::Vector>>
IEncoder::encode_batch(const std::vector<std::string> &texts) {
  std::vector<vector::Vector> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    auto encoded = encode(text);
    if (!encoded.ok()) {
      return common::Result<std::vector<vector::Vector>>::failure_from(encoded);
    }
    out.push_back(std::move(encoded.value()));
  }
  return common::Result<std::vector<vector::Vector>>::success(std::move(out));
}

std::unique_ptr<IEncoder> create_encoder(const config::EncoderConfig &config) {
  const std::string provider = common::to_lower(common::trim(config.provider));

  if (provider == "remote" || provider == "openai") {
    return std::make_unique<RemoteEncoder>(config.endpoint, config.api_key.value_or(""),
                                           config.model, config.dimensions, config.timeout_ms);
  }

  return std::make_unique<HashEncoder>(config.dimensions);
}

} // namespace notegraph::encoder
