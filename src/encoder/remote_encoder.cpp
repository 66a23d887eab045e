#include "notegraph/encoder/remote_encoder.hpp"

#include "notegraph/common/json_util.hpp"
#include "notegraph/vector/ranker.hpp"

#include <sstream>

namespace notegraph::encoder {

namespace {

common::Result<vector::Vector> failed(std::string message) {
  return common::Result<vector::Vector>::failure(std::move(message),
                                                 common::ErrorCode::EncodingFailed);
}

} // namespace

RemoteEncoder::RemoteEncoder(std::string endpoint, std::string api_key, std::string model,
                             const std::size_t dimensions, const std::uint64_t timeout_ms,
                             std::shared_ptr<HttpClient> http_client)
    : endpoint_(std::move(endpoint)), api_key_(std::move(api_key)), model_(std::move(model)),
      dimensions_(dimensions), timeout_ms_(timeout_ms), http_client_(std::move(http_client)) {}

std::string_view RemoteEncoder::name() const { return "remote"; }

std::string RemoteEncoder::cache_id() const { return "remote:" + model_ + "@" + endpoint_; }

common::Result<vector::Vector> RemoteEncoder::encode(const std::string_view text) {
  if (http_client_ == nullptr) {
    return failed("no HTTP client configured");
  }

  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(model_) << "\",";
  body << "\"input\":\"" << common::json_escape(std::string(text)) << "\"";
  body << "}";

  std::unordered_map<std::string, std::string> headers = {
      {"Content-Type", "application/json"},
  };
  if (!api_key_.empty()) {
    headers.emplace("Authorization", "Bearer " + api_key_);
  }

  const auto response = http_client_->post_json(endpoint_, headers, body.str(), timeout_ms_);
  if (response.timeout) {
    return failed("embedding request timed out");
  }
  if (response.network_error) {
    return failed("embedding request failed: " + response.network_error_message);
  }
  if (response.status < 200 || response.status >= 300) {
    std::string detail = common::json_get_string(response.body, "message");
    return failed("embedding endpoint returned HTTP " + std::to_string(response.status) +
                  (detail.empty() ? "" : ": " + detail));
  }

  const std::string array = common::json_get_array(response.body, "embedding");
  if (array.empty()) {
    return failed("embedding field missing from response");
  }
  auto numbers = common::json_parse_number_array(array);
  if (!numbers.ok()) {
    return failed(numbers.error());
  }
  if (numbers.value().size() != dimensions_) {
    return failed("embedding has " + std::to_string(numbers.value().size()) +
                  " dimensions, expected " + std::to_string(dimensions_));
  }

  // Stored precision is binary32; wider encoder output is narrowed here.
  vector::Vector values;
  values.reserve(numbers.value().size());
  for (const double number : numbers.value()) {
    values.push_back(static_cast<float>(number));
  }
  vector::normalize(values);
  return common::Result<vector::Vector>::success(std::move(values));
}

std::size_t RemoteEncoder::dimensions() const { return dimensions_; }

} // namespace notegraph::encoder
