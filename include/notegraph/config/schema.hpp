#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace notegraph::config {

struct EncoderConfig {
  std::string provider = "hash";
  std::string model = "all-MiniLM-L6-v2";
  std::size_t dimensions = 384;
  std::string endpoint = "https://api.openai.com/v1/embeddings";
  std::optional<std::string> api_key;
  std::uint64_t timeout_ms = 30'000;
  std::size_t cache_size = 10'000;
};

struct SearchConfig {
  std::size_t limit = 10;
};

struct AutoTagConfig {
  bool enabled = true;
  double threshold = 0.45;
  std::size_t max_tags = 5;
  std::vector<std::string> skip_tags = {"conversation", "context"};
  bool cache_centroids = true;
};

struct GraphConfig {
  std::size_t neighbors = 3;
  std::size_t snippet_chars = 140;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  std::string data_dir = "~/.notegraph/data";
  EncoderConfig encoder;
  SearchConfig search;
  AutoTagConfig autotag;
  GraphConfig graph;
  ObservabilityConfig observability;
};

} // namespace notegraph::config
