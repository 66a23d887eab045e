#pragma once

#include "notegraph/config/schema.hpp"
#include "notegraph/encoder/encoder.hpp"
#include "notegraph/encoder/http_client.hpp"
#include "notegraph/observability/observer.hpp"

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace notegraph::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

/// Config rooted in the workspace, silent observer, hash encoder.
config::Config temp_config(const TempWorkspace &workspace);

/// Returns preset vectors for known texts; unknown texts fail with
/// EncodingFailed. Shares its call counter so tests can inspect it after the
/// encoder has been moved into a KnowledgeBase.
class FakeEncoder final : public encoder::IEncoder {
public:
  explicit FakeEncoder(std::size_t dimensions = 2);

  FakeEncoder &set(const std::string &text, vector::Vector values);
  [[nodiscard]] std::shared_ptr<std::atomic<std::size_t>> calls() const { return calls_; }

  [[nodiscard]] std::string_view name() const override { return "fake"; }
  [[nodiscard]] common::Result<vector::Vector> encode(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override { return dimensions_; }

private:
  std::size_t dimensions_;
  std::map<std::string, vector::Vector, std::less<>> vectors_;
  std::shared_ptr<std::atomic<std::size_t>> calls_;
};

class FailingEncoder final : public encoder::IEncoder {
public:
  [[nodiscard]] std::string_view name() const override { return "failing"; }
  [[nodiscard]] common::Result<vector::Vector> encode(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override { return 2; }
};

/// Replies with a fixed response and remembers the last request.
class ScriptedHttpClient final : public encoder::HttpClient {
public:
  explicit ScriptedHttpClient(encoder::HttpResponse response) : response_(std::move(response)) {}

  [[nodiscard]] encoder::HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) override;

  std::string last_url;
  std::unordered_map<std::string, std::string> last_headers;
  std::string last_body;
  std::size_t calls = 0;

private:
  encoder::HttpResponse response_;
};

class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::vector<observability::ObserverMetric> metrics() const;

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::vector<observability::ObserverMetric> metrics_;
};

} // namespace notegraph::testing
