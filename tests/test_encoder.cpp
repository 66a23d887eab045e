#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "notegraph/encoder/encoder.hpp"
#include "notegraph/encoder/hash_encoder.hpp"
#include "notegraph/common/json_util.hpp"
#include "notegraph/encoder/remote_encoder.hpp"
#include "notegraph/vector/ranker.hpp"

#include <cmath>
#include <memory>

namespace {

using notegraph::testing::ScriptedHttpClient;

notegraph::encoder::HttpResponse ok_response(const std::string &body) {
  notegraph::encoder::HttpResponse response;
  response.status = 200;
  response.body = body;
  return response;
}

} // namespace

void register_encoder_tests(std::vector<notegraph::tests::TestCase> &tests) {
  using notegraph::tests::require;
  namespace enc = notegraph::encoder;
  namespace vec = notegraph::vector;
  namespace common = notegraph::common;
  namespace cfg = notegraph::config;

  tests.push_back({"hash_encoder_is_deterministic_and_unit_length", [] {
                     enc::HashEncoder encoder(128);
                     auto a = encoder.encode("Rust borrow checker notes");
                     auto b = encoder.encode("Rust borrow checker notes");
                     require(a.ok() && b.ok(), "encoding should succeed");
                     require(a.value().size() == 128, "configured dimension");
                     require(a.value() == b.value(), "same text, same vector");
                     require(std::fabs(vec::l2_norm(a.value()) - 1.0) < 1e-5, "unit length");
                   }});

  tests.push_back({"hash_encoder_related_text_scores_higher", [] {
                     enc::HashEncoder encoder(384);
                     auto base = encoder.encode("sqlite database indexing");
                     auto related = encoder.encode("indexing a sqlite database table");
                     auto unrelated = encoder.encode("banana bread recipe with walnuts");
                     require(base.ok() && related.ok() && unrelated.ok(), "encoding should succeed");
                     require(vec::dot(base.value(), related.value()) >
                                 vec::dot(base.value(), unrelated.value()),
                             "shared vocabulary should score closer");
                   }});

  tests.push_back({"hash_encoder_rejects_text_without_words", [] {
                     enc::HashEncoder encoder;
                     auto empty = encoder.encode("");
                     require(!empty.ok(), "empty text cannot be encoded");
                     require(empty.code() == common::ErrorCode::EncodingFailed, "EncodingFailed");
                     auto punctuation = encoder.encode("?! -- ...");
                     require(!punctuation.ok(), "punctuation only cannot be encoded");

                     enc::HashEncoder zero(0);
                     require(zero.encode("hello").code() == common::ErrorCode::EncodingFailed,
                             "zero dimensions fails");
                   }});

  tests.push_back({"encode_batch_stops_at_first_failure", [] {
                     enc::HashEncoder encoder(16);
                     auto batch = encoder.encode_batch({"one", "two"});
                     require(batch.ok() && batch.value().size() == 2, "both encoded");
                     auto failed = encoder.encode_batch({"one", "", "three"});
                     require(!failed.ok(), "a failing item fails the batch");
                     require(failed.code() == common::ErrorCode::EncodingFailed, "code kept");
                   }});

  tests.push_back({"remote_encoder_parses_and_normalizes", [] {
                     auto http = std::make_shared<ScriptedHttpClient>(ok_response(
                         R"({"data":[{"object":"embedding","index":0,"embedding":[3.0, 4.0]}]})"));
                     enc::RemoteEncoder encoder("https://example.test/v1/embeddings", "sk-test",
                                                "tiny", 2, 1000, http);
                     auto result = encoder.encode("hello \"world\"");
                     require(result.ok(), result.error());
                     require(std::fabs(result.value()[0] - 0.6F) < 1e-6F &&
                                 std::fabs(result.value()[1] - 0.8F) < 1e-6F,
                             "response should be L2-normalized");
                     require(http->last_url == "https://example.test/v1/embeddings", "endpoint used");
                     require(http->last_headers.at("Authorization") == "Bearer sk-test",
                             "bearer token sent");
                     require(http->last_body.find("\"model\":\"tiny\"") != std::string::npos,
                             "model sent");
                     require(http->last_body.find("hello \\\"world\\\"") != std::string::npos,
                             "input is JSON-escaped");
                   }});

  tests.push_back({"remote_encoder_failures_are_encoding_failed", [] {
                     enc::HttpResponse server_error;
                     server_error.status = 401;
                     server_error.body = R"({"error":{"message":"bad key"}})";
                     enc::RemoteEncoder unauthorized("u", "k", "m", 2, 1000,
                                                     std::make_shared<ScriptedHttpClient>(server_error));
                     auto denied = unauthorized.encode("x");
                     require(!denied.ok(), "HTTP 401 should fail");
                     require(denied.code() == common::ErrorCode::EncodingFailed, "EncodingFailed");
                     require(denied.error().find("bad key") != std::string::npos,
                             "server message surfaced");

                     enc::HttpResponse timeout;
                     timeout.timeout = true;
                     enc::RemoteEncoder slow("u", "k", "m", 2, 1,
                                             std::make_shared<ScriptedHttpClient>(timeout));
                     require(slow.encode("x").code() == common::ErrorCode::EncodingFailed,
                             "timeout fails");

                     enc::RemoteEncoder wrong_size(
                         "u", "k", "m", 3, 1000,
                         std::make_shared<ScriptedHttpClient>(ok_response(R"({"embedding":[1.0, 0.0]})")));
                     auto mismatch = wrong_size.encode("x");
                     require(!mismatch.ok(), "dimension mismatch rejected");
                     require(mismatch.code() == common::ErrorCode::EncodingFailed, "EncodingFailed");

                     enc::RemoteEncoder missing("u", "k", "m", 2, 1000,
                                                std::make_shared<ScriptedHttpClient>(ok_response("{}")));
                     require(!missing.encode("x").ok(), "missing embedding field fails");
                   }});

  tests.push_back({"create_encoder_selects_by_provider", [] {
                     cfg::EncoderConfig config;
                     config.dimensions = 32;
                     auto hashed = enc::create_encoder(config);
                     require(hashed->name() == "hash", "hash is the default");
                     require(hashed->dimensions() == 32, "dimension passed through");

                     config.provider = "Remote";
                     auto remote = enc::create_encoder(config);
                     require(remote->name() == "remote", "provider match is case-insensitive");
                     require(remote->cache_id() == "remote:" + config.model + "@" + config.endpoint,
                             "cache id names model and endpoint");
                     require(hashed->cache_id() == "hash", "default cache id is the name");
                   }});

  tests.push_back({"json_field_lookup_handles_nesting_and_escapes", [] {
                     namespace common = notegraph::common;
                     const std::string json =
                         R"({"note":"has \"embedding\": [9]","embedding":[[1, 2], "]"],)"
                         R"( "message":"line\nnext \u00e9"})";
                     require(common::json_get_array(json, "embedding") == R"([[1, 2], "]"])",
                             "array ends at its matching bracket");
                     require(common::json_get_string(json, "message") == "line\nnext \xC3\xA9",
                             "escapes decoded");
                     require(common::json_get_string(json, "absent").empty(), "missing field");
                   }});
}
