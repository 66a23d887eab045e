#include "notegraph/config/config.hpp"

#include "notegraph/common/fs.hpp"
#include "notegraph/common/toml.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace notegraph::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".notegraph";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("NOTEGRAPH_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string strip_env_quotes(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = common::trim(trimmed.substr(0, eq));
    if (!common::starts_with(key, "NOTEGRAPH_")) {
      continue;
    }
    // Existing environment wins over the file.
    setenv(key.c_str(), strip_env_quotes(trimmed.substr(eq + 1)).c_str(), 0);
  }
}

void load_dotenv_files() {
  if (auto dir = config_dir(); dir.ok()) {
    load_dotenv_file(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    load_dotenv_file(cwd / ".env");
  }
}

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream stream;
  stream << '[';
  for (std::size_t index = 0; index < values.size(); ++index) {
    if (index > 0) {
      stream << ", ";
    }
    stream << common::quote_toml_string(values[index]);
  }
  stream << ']';
  return stream.str();
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::ensure_dir(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory", common::ErrorCode::Io);
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return home;
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

std::filesystem::path data_dir(const Config &config) {
  return std::filesystem::path(common::expand_path(config.data_dir));
}

void apply_env_overrides(Config &config) {
  if (const char *dir = std::getenv("NOTEGRAPH_DATA_DIR"); dir != nullptr && *dir) {
    config.data_dir = dir;
  }
  if (const char *provider = std::getenv("NOTEGRAPH_ENCODER"); provider != nullptr && *provider) {
    config.encoder.provider = provider;
  }
  if (const char *api_key = std::getenv("NOTEGRAPH_API_KEY"); api_key != nullptr && *api_key) {
    config.encoder.api_key = std::string(api_key);
  }
  if (const char *backend = std::getenv("NOTEGRAPH_LOG"); backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure_from(parsed);
  }
  const auto &doc = parsed.value();

  Config config;
  config.data_dir = doc.get_string("data_dir", config.data_dir);

  config.encoder.provider = doc.get_string("encoder.provider", config.encoder.provider);
  config.encoder.model = doc.get_string("encoder.model", config.encoder.model);
  config.encoder.dimensions = static_cast<std::size_t>(
      doc.get_u64("encoder.dimensions", config.encoder.dimensions));
  config.encoder.endpoint = doc.get_string("encoder.endpoint", config.encoder.endpoint);
  if (doc.has("encoder.api_key")) {
    config.encoder.api_key = common::expand_path(doc.get_string("encoder.api_key"));
  }
  config.encoder.timeout_ms = doc.get_u64("encoder.timeout_ms", config.encoder.timeout_ms);
  config.encoder.cache_size = static_cast<std::size_t>(
      doc.get_u64("encoder.cache_size", config.encoder.cache_size));

  config.search.limit =
      static_cast<std::size_t>(doc.get_u64("search.limit", config.search.limit));

  config.autotag.enabled = doc.get_bool("autotag.enabled", config.autotag.enabled);
  config.autotag.threshold = doc.get_double("autotag.threshold", config.autotag.threshold);
  config.autotag.max_tags =
      static_cast<std::size_t>(doc.get_u64("autotag.max_tags", config.autotag.max_tags));
  config.autotag.skip_tags = doc.get_string_array("autotag.skip_tags", config.autotag.skip_tags);
  config.autotag.cache_centroids =
      doc.get_bool("autotag.cache_centroids", config.autotag.cache_centroids);

  config.graph.neighbors =
      static_cast<std::size_t>(doc.get_u64("graph.neighbors", config.graph.neighbors));
  config.graph.snippet_chars =
      static_cast<std::size_t>(doc.get_u64("graph.snippet_chars", config.graph.snippet_chars));

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto path = config_path();
  if (!path.ok()) {
    return common::Result<Config>::failure_from(path);
  }

  Config config;
  std::error_code ec;
  if (std::filesystem::exists(path.value(), ec)) {
    std::ifstream file(path.value());
    if (!file) {
      return common::Result<Config>::failure("unable to open config file: " +
                                                 path.value().string(),
                                             common::ErrorCode::Io);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    auto parsed = parse_config(buffer.str());
    if (!parsed.ok()) {
      return common::Result<Config>::failure(path.value().string() + ": " + parsed.error(),
                                             parsed.code());
    }
    config = std::move(parsed.value());
  }

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto path = config_path();
  if (!path.ok()) {
    return path.status();
  }

  std::ostringstream out;
  out << "data_dir = " << common::quote_toml_string(config.data_dir) << "\n\n";
  out << "[encoder]\n";
  out << "provider = " << common::quote_toml_string(config.encoder.provider) << "\n";
  out << "model = " << common::quote_toml_string(config.encoder.model) << "\n";
  out << "dimensions = " << config.encoder.dimensions << "\n";
  out << "endpoint = " << common::quote_toml_string(config.encoder.endpoint) << "\n";
  out << "timeout_ms = " << config.encoder.timeout_ms << "\n";
  out << "cache_size = " << config.encoder.cache_size << "\n\n";
  out << "[search]\n";
  out << "limit = " << config.search.limit << "\n\n";
  out << "[autotag]\n";
  out << "enabled = " << (config.autotag.enabled ? "true" : "false") << "\n";
  out << "threshold = " << config.autotag.threshold << "\n";
  out << "max_tags = " << config.autotag.max_tags << "\n";
  out << "skip_tags = " << string_array_to_toml(config.autotag.skip_tags) << "\n";
  out << "cache_centroids = " << (config.autotag.cache_centroids ? "true" : "false") << "\n\n";
  out << "[graph]\n";
  out << "neighbors = " << config.graph.neighbors << "\n";
  out << "snippet_chars = " << config.graph.snippet_chars << "\n\n";
  out << "[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";

  std::ofstream file(path.value(), std::ios::trunc);
  if (!file) {
    return common::Status::error("unable to write config file: " + path.value().string(),
                                 common::ErrorCode::Io);
  }
  file << out.str();
  return file ? common::Status::success()
              : common::Status::error("failed writing config file", common::ErrorCode::Io);
}

std::vector<std::string> validate_config(const Config &config) {
  std::vector<std::string> problems;

  const std::string provider = common::to_lower(common::trim(config.encoder.provider));
  if (provider != "hash" && provider != "remote" && provider != "openai") {
    problems.push_back("encoder.provider must be one of: hash, remote");
  }
  if (config.encoder.dimensions == 0) {
    problems.push_back("encoder.dimensions must be greater than 0");
  }
  if ((provider == "remote" || provider == "openai") && config.encoder.endpoint.empty()) {
    problems.push_back("encoder.endpoint is required for the remote encoder");
  }
  if (config.search.limit == 0) {
    problems.push_back("search.limit must be greater than 0");
  }
  if (config.autotag.threshold < -1.0 || config.autotag.threshold > 1.0) {
    problems.push_back("autotag.threshold must be within [-1, 1]");
  }
  if (config.autotag.max_tags == 0) {
    problems.push_back("autotag.max_tags must be greater than 0");
  }
  if (common::trim(config.data_dir).empty()) {
    problems.push_back("data_dir must not be empty");
  }

  return problems;
}

} // namespace notegraph::config
