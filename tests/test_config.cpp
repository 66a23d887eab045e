#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "notegraph/config/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = notegraph::config::config_path_override();
    if (next.has_value()) {
      notegraph::config::set_config_path_override(*next);
    } else {
      notegraph::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      notegraph::config::set_config_path_override(*old_override);
    } else {
      notegraph::config::clear_config_path_override();
    }
  }
};

void write_file(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  out << content;
}

} // namespace

void register_config_tests(std::vector<notegraph::tests::TestCase> &tests) {
  using notegraph::tests::require;
  namespace cfg = notegraph::config;
  namespace common = notegraph::common;
  using notegraph::testing::TempWorkspace;

  tests.push_back({"config_defaults_from_empty_document", [] {
                     auto parsed = cfg::parse_config("");
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.encoder.provider == "hash", "hash encoder by default");
                     require(config.encoder.dimensions == 384, "384 dimensions by default");
                     require(config.autotag.threshold == 0.45, "default threshold");
                     require(config.autotag.max_tags == 5, "default max tags");
                     require(config.autotag.skip_tags ==
                                 std::vector<std::string>({"conversation", "context"}),
                             "default skip tags");
                     require(config.graph.neighbors == 3, "default k");
                     require(cfg::validate_config(config).empty(), "defaults are valid");
                   }});

  tests.push_back({"config_parses_sections", [] {
                     const std::string toml = R"(data_dir = "/tmp/notes"

[encoder]
provider = "remote"
model = "text-embedding-3-small"
dimensions = 1536
endpoint = "http://localhost:8080/v1/embeddings"
timeout_ms = 2500 # inline comment

[autotag]
enabled = false
threshold = 0.6
max_tags = 2
skip_tags = [
  "inbox",
  "draft",
]
cache_centroids = false

[graph]
neighbors = 5
snippet_chars = 80

[observability]
backend = "log,none"
)";
                     auto parsed = cfg::parse_config(toml);
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.data_dir == "/tmp/notes", "data_dir");
                     require(config.encoder.provider == "remote", "provider");
                     require(config.encoder.model == "text-embedding-3-small", "model");
                     require(config.encoder.dimensions == 1536, "dimensions");
                     require(config.encoder.timeout_ms == 2500, "timeout");
                     require(!config.autotag.enabled, "autotag disabled");
                     require(config.autotag.threshold == 0.6, "threshold");
                     require(config.autotag.max_tags == 2, "max tags");
                     require(config.autotag.skip_tags == std::vector<std::string>({"inbox", "draft"}),
                             "multi-line skip_tags array");
                     require(!config.autotag.cache_centroids, "cache off");
                     require(config.graph.neighbors == 5 && config.graph.snippet_chars == 80, "graph");
                     require(config.observability.backend == "log,none", "backend");
                   }});

  tests.push_back({"config_rejects_malformed_toml", [] {
                     auto parsed = cfg::parse_config("[encoder]\nprovider\n");
                     require(!parsed.ok(), "line without '=' is an error");
                     require(parsed.code() == common::ErrorCode::InvalidArgument, "InvalidArgument");
                   }});

  tests.push_back({"config_validate_reports_problems", [] {
                     cfg::Config config;
                     config.encoder.provider = "word2vec";
                     config.encoder.dimensions = 0;
                     config.autotag.threshold = 1.5;
                     config.autotag.max_tags = 0;
                     config.data_dir = " ";
                     const auto problems = cfg::validate_config(config);
                     require(problems.size() == 5, "five problems, got " +
                                                       std::to_string(problems.size()));

                     cfg::Config remote;
                     remote.encoder.provider = "Remote";
                     remote.encoder.endpoint.clear();
                     const auto remote_problems = cfg::validate_config(remote);
                     require(remote_problems.size() == 1 &&
                                 remote_problems[0].find("endpoint") != std::string::npos,
                             "remote needs an endpoint");
                   }});

  tests.push_back({"config_env_overrides_file_values", [] {
                     TempWorkspace workspace;
                     const auto path = workspace.path() / "config.toml";
                     write_file(path, "data_dir = \"/from/file\"\n[encoder]\nprovider = \"hash\"\n");
                     ConfigOverrideGuard override_guard(path);
                     EnvGuard data_dir("NOTEGRAPH_DATA_DIR", std::string("/from/env"));
                     EnvGuard encoder("NOTEGRAPH_ENCODER", std::string("remote"));
                     EnvGuard api_key("NOTEGRAPH_API_KEY", std::string("sk-test"));
                     EnvGuard log("NOTEGRAPH_LOG", std::nullopt);

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().data_dir == "/from/env", "env data_dir wins");
                     require(loaded.value().encoder.provider == "remote", "env encoder wins");
                     require(loaded.value().encoder.api_key == std::optional<std::string>("sk-test"),
                             "api key from env");
                     require(loaded.value().observability.backend == "log", "unset env keeps default");
                   }});

  tests.push_back({"config_missing_file_yields_defaults", [] {
                     TempWorkspace workspace;
                     ConfigOverrideGuard override_guard(workspace.path() / "absent.toml");
                     EnvGuard data_dir("NOTEGRAPH_DATA_DIR", std::nullopt);
                     EnvGuard encoder("NOTEGRAPH_ENCODER", std::nullopt);
                     require(!cfg::config_exists(), "no file yet");
                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().encoder.provider == "hash", "defaults used");
                   }});

  tests.push_back({"config_save_load_roundtrip", [] {
                     TempWorkspace workspace;
                     ConfigOverrideGuard override_guard(workspace.path() / "saved.toml");
                     EnvGuard data_dir("NOTEGRAPH_DATA_DIR", std::nullopt);
                     EnvGuard encoder("NOTEGRAPH_ENCODER", std::nullopt);
                     EnvGuard api_key("NOTEGRAPH_API_KEY", std::nullopt);
                     EnvGuard log("NOTEGRAPH_LOG", std::nullopt);

                     cfg::Config config;
                     config.data_dir = "/srv/notegraph";
                     config.encoder.dimensions = 128;
                     config.autotag.threshold = 0.5;
                     config.autotag.skip_tags = {"with \"quotes\"", "plain"};
                     config.graph.neighbors = 7;
                     config.observability.backend = "none";
                     auto saved = cfg::save_config(config);
                     require(saved.ok(), saved.error());
                     require(cfg::config_exists(), "file written");

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().data_dir == "/srv/notegraph", "data_dir");
                     require(loaded.value().encoder.dimensions == 128, "dimensions");
                     require(loaded.value().autotag.threshold == 0.5, "threshold");
                     require(loaded.value().autotag.skip_tags == config.autotag.skip_tags,
                             "skip tags with quotes");
                     require(loaded.value().graph.neighbors == 7, "neighbors");
                     require(loaded.value().observability.backend == "none", "backend");
                   }});

  tests.push_back({"config_data_dir_expands_variables", [] {
                     EnvGuard root("NOTEGRAPH_TEST_ROOT", std::string("/var/lib/ng"));
                     cfg::Config config;
                     config.data_dir = "${NOTEGRAPH_TEST_ROOT}/data";
                     require(cfg::data_dir(config) == std::filesystem::path("/var/lib/ng/data"),
                             "variable expanded");
                   }});
}
