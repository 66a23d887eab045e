#include "notegraph/cli/commands.hpp"

#include "notegraph/common/fs.hpp"
#include "notegraph/config/config.hpp"
#include "notegraph/encoder/encoder.hpp"
#include "notegraph/knowledge/knowledge_base.hpp"
#include "notegraph/observability/factory.hpp"
#include "notegraph/observability/global.hpp"
#include "notegraph/store/tags.hpp"

#include <charconv>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace notegraph::cli {

namespace {

std::string version_string() {
#ifdef NOTEGRAPH_VERSION
  std::string version = NOTEGRAPH_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "notegraph " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

bool parse_count(const std::string &raw, std::size_t &out) {
  const char *first = raw.data();
  const char *last = raw.data() + raw.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last;
}

int report(const std::string &message) {
  std::cerr << "error: " << message << "\n";
  return 1;
}

std::string join_tags(const std::vector<std::string> &tags) {
  std::ostringstream out;
  for (std::size_t i = 0; i < tags.size(); ++i) {
    if (i > 0) {
      out << ", ";
    }
    out << tags[i];
  }
  return out.str();
}

/// Loads config, installs the configured observer and opens the knowledge
/// base. Prints the failure and returns null when anything is missing.
std::unique_ptr<knowledge::KnowledgeBase> open_knowledge_base() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    (void)report(cfg.error());
    return nullptr;
  }

  const auto problems = config::validate_config(cfg.value());
  if (!problems.empty()) {
    for (const auto &problem : problems) {
      std::cerr << "config: " << problem << "\n";
    }
    (void)report("invalid configuration");
    return nullptr;
  }

  observability::set_global_observer(observability::create_observer(cfg.value().observability));

  auto kb = knowledge::KnowledgeBase::open(cfg.value(), encoder::create_encoder(cfg.value().encoder));
  if (!kb.ok()) {
    (void)report(kb.error());
    return nullptr;
  }
  return std::move(kb.value());
}

void print_note(const store::Note &note) {
  std::cout << "key:     " << note.key << "\n";
  std::cout << "tags:    " << join_tags(note.tags) << "\n";
  std::cout << "created: " << note.created_at << "\n";
  std::cout << "updated: " << note.updated_at << "\n\n";
  std::cout << note.body;
  if (!note.body.empty() && note.body.back() != '\n') {
    std::cout << "\n";
  }
}

int run_note(std::vector<std::string> args) {
  if (args.empty()) {
    return report("usage: notegraph note <put|get|list|delete> ...");
  }
  const std::string action = args[0];
  args.erase(args.begin());

  auto kb = open_knowledge_base();
  if (kb == nullptr) {
    return 1;
  }

  if (action == "put") {
    std::string tags_raw;
    (void)take_option(args, "--tags", "-t", tags_raw);
    knowledge::NoteOptions options;
    options.autotag = !take_flag(args, "--no-autotag");
    if (args.empty()) {
      return report("usage: notegraph note put <key> [--tags a,b] [--no-autotag] [body]");
    }
    const std::string key = args[0];
    const std::string body = args.size() > 1 ? join_tokens(args, 1) : read_stdin_all();

    auto stored = kb->store_note(key, body, store::parse_tags(tags_raw), options);
    if (!stored.ok()) {
      return report(stored.error());
    }
    std::cout << "stored " << stored.value().note.key;
    if (!stored.value().note.tags.empty()) {
      std::cout << " [" << join_tags(stored.value().note.tags) << "]";
    }
    if (!stored.value().auto_tags.empty()) {
      std::cout << " (auto: " << join_tags(stored.value().auto_tags) << ")";
    }
    std::cout << "\n";
    return 0;
  }

  if (action == "get") {
    if (args.empty()) {
      return report("usage: notegraph note get <key>");
    }
    auto note = kb->get_note(args[0]);
    if (!note.ok()) {
      return report(note.error());
    }
    if (!note.value().has_value()) {
      return report("note not found: " + args[0]);
    }
    print_note(*note.value());
    return 0;
  }

  if (action == "list") {
    std::string tag;
    const bool filtered = take_option(args, "--tag", "", tag);
    auto notes = kb->list_notes(filtered ? std::optional<std::string>(tag) : std::nullopt);
    if (!notes.ok()) {
      return report(notes.error());
    }
    for (const auto &note : notes.value()) {
      std::cout << note.key;
      if (!note.tags.empty()) {
        std::cout << "\t[" << join_tags(note.tags) << "]";
      }
      std::cout << "\n";
    }
    return 0;
  }

  if (action == "delete") {
    if (args.empty()) {
      return report("usage: notegraph note delete <key>");
    }
    auto removed = kb->delete_note(args[0]);
    if (!removed.ok()) {
      return report(removed.error());
    }
    if (!removed.value()) {
      return report("note not found: " + args[0]);
    }
    std::cout << "deleted " << args[0] << "\n";
    return 0;
  }

  return report("unknown note command: " + action);
}

int run_search(std::vector<std::string> args) {
  std::string limit_raw;
  const bool keyword = take_flag(args, "--keyword");
  const bool has_limit = take_option(args, "--limit", "-n", limit_raw);
  const std::string query = join_tokens(args);
  if (common::trim(query).empty()) {
    return report("usage: notegraph search <query...> [--limit N] [--keyword]");
  }

  auto kb = open_knowledge_base();
  if (kb == nullptr) {
    return 1;
  }
  std::size_t limit = kb->config().search.limit;
  if (has_limit && !parse_count(limit_raw, limit)) {
    return report("invalid --limit: " + limit_raw);
  }

  if (keyword) {
    auto notes =
        kb->keyword_search(query, has_limit ? std::optional<std::size_t>(limit) : std::nullopt);
    if (!notes.ok()) {
      return report(notes.error());
    }
    for (const auto &note : notes.value()) {
      std::cout << note.key << "\t" << knowledge::extract_title(note.body) << "\n";
    }
    return 0;
  }

  auto hits = kb->search(query, limit);
  if (!hits.ok()) {
    return report(hits.error());
  }
  for (const auto &hit : hits.value()) {
    std::cout << std::fixed << std::setprecision(3) << hit.score << "\t" << hit.note.key << "\t"
              << knowledge::extract_title(hit.note.body) << "\n";
  }
  return 0;
}

int run_suggest(std::vector<std::string> args) {
  std::string text;
  const bool from_text = take_option(args, "--text", "", text);
  if (!from_text && args.empty()) {
    return report("usage: notegraph suggest <key> | --text <text>");
  }

  auto kb = open_knowledge_base();
  if (kb == nullptr) {
    return 1;
  }

  // Unquoted text after --text is folded back into the input.
  const std::string input = args.empty() ? text : text + " " + join_tokens(args);
  auto suggested = from_text ? kb->suggest_tags_for_text(input) : kb->suggest_tags_for(args[0]);
  if (!suggested.ok()) {
    return report(suggested.error());
  }
  for (const auto &entry : suggested.value()) {
    std::cout << entry.tag << "\t" << std::fixed << std::setprecision(3) << entry.score << "\n";
  }
  return 0;
}

int run_graph(std::vector<std::string> args) {
  auto kb = open_knowledge_base();
  if (kb == nullptr) {
    return 1;
  }

  std::size_t k = kb->config().graph.neighbors;
  std::string k_raw;
  if (take_option(args, "--k", "-k", k_raw) && !parse_count(k_raw, k)) {
    return report("invalid --k: " + k_raw);
  }

  auto view = kb->graph(k);
  if (!view.ok()) {
    return report(view.error());
  }
  std::cout << knowledge::graph_to_json(view.value()) << "\n";
  return 0;
}

int run_backfill() {
  auto kb = open_knowledge_base();
  if (kb == nullptr) {
    return 1;
  }
  auto added = kb->backfill();
  if (!added.ok()) {
    return report(added.error());
  }
  std::cout << "backfilled " << added.value() << " notes\n";
  return 0;
}

int run_file(std::vector<std::string> args) {
  if (args.empty()) {
    return report("usage: notegraph file <put|get|list|delete> ...");
  }
  const std::string action = args[0];
  args.erase(args.begin());

  auto kb = open_knowledge_base();
  if (kb == nullptr) {
    return 1;
  }
  auto &files = kb->files();

  if (action == "put") {
    std::string mime;
    std::string tags_raw;
    (void)take_option(args, "--mime", "", mime);
    (void)take_option(args, "--tags", "-t", tags_raw);
    if (args.size() < 2) {
      return report("usage: notegraph file put <name> <path> [--mime m] [--tags a,b]");
    }
    auto bytes = common::read_binary(common::expand_path(args[1]));
    if (!bytes.ok()) {
      return report(bytes.error());
    }
    auto saved = files.put(args[0], bytes.value(), mime, store::parse_tags(tags_raw));
    if (!saved.ok()) {
      return report(saved.error());
    }
    std::cout << "stored " << saved.value().name << " (" << saved.value().size_bytes
              << " bytes)\n";
    return 0;
  }

  if (action == "get") {
    std::string out_path;
    const bool to_file = take_option(args, "--out", "-o", out_path);
    if (args.empty()) {
      return report("usage: notegraph file get <name> [--out path]");
    }
    auto stored = files.get(args[0]);
    if (!stored.ok()) {
      return report(stored.error());
    }
    if (!stored.value().has_value()) {
      return report("file not found: " + args[0]);
    }
    const auto &bytes = stored.value()->bytes;
    if (to_file) {
      auto written = common::write_binary(common::expand_path(out_path), bytes);
      if (!written.ok()) {
        return report(written.error());
      }
      return 0;
    }
    std::cout.write(reinterpret_cast<const char *>(bytes.data()),
                    static_cast<std::streamsize>(bytes.size()));
    return 0;
  }

  if (action == "list") {
    std::string tag;
    const bool filtered = take_option(args, "--tag", "", tag);
    auto listed = files.list(filtered ? std::optional<std::string>(tag) : std::nullopt);
    if (!listed.ok()) {
      return report(listed.error());
    }
    for (const auto &meta : listed.value()) {
      std::cout << meta.name << "\t" << meta.mime_type << "\t" << meta.size_bytes;
      if (!meta.tags.empty()) {
        std::cout << "\t[" << join_tags(meta.tags) << "]";
      }
      std::cout << "\n";
    }
    return 0;
  }

  if (action == "delete") {
    if (args.empty()) {
      return report("usage: notegraph file delete <name>");
    }
    auto removed = files.remove(args[0]);
    if (!removed.ok()) {
      return report(removed.error());
    }
    if (!removed.value()) {
      return report("file not found: " + args[0]);
    }
    std::cout << "deleted " << args[0] << "\n";
    return 0;
  }

  return report("unknown file command: " + action);
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "usage: notegraph [--config PATH] <command> [options]\n\n";
  std::cout << "notes\n";
  std::cout << "  note put <key> [--tags a,b] [--no-autotag] [body]   store a note (body from stdin "
               "when omitted)\n";
  std::cout << "  note get <key>                                      show a note\n";
  std::cout << "  note list [--tag t]                                 list note keys\n";
  std::cout << "  note delete <key>                                   remove a note\n\n";
  std::cout << "retrieval\n";
  std::cout << "  search <query...> [--limit N] [--keyword]           semantic or keyword search\n";
  std::cout << "  suggest <key> | --text <text>                       suggest tags\n";
  std::cout << "  graph [--k N]                                       similarity graph as JSON\n";
  std::cout << "  backfill                                            embed notes missing a vector\n\n";
  std::cout << "files\n";
  std::cout << "  file put <name> <path> [--mime m] [--tags a,b]\n";
  std::cout << "  file get <name> [--out path]\n";
  std::cout << "  file list [--tag t]\n";
  std::cout << "  file delete <name>\n\n";
  std::cout << "other\n";
  std::cout << "  config-path                                         print the config file path\n";
  std::cout << "  version                                             print the version\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    return report(global_error);
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      return report(path_result.error());
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "note") {
    return run_note(std::move(args));
  }
  if (subcommand == "search") {
    return run_search(std::move(args));
  }
  if (subcommand == "suggest") {
    return run_suggest(std::move(args));
  }
  if (subcommand == "graph") {
    return run_graph(std::move(args));
  }
  if (subcommand == "backfill") {
    return run_backfill();
  }
  if (subcommand == "file") {
    return run_file(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace notegraph::cli
