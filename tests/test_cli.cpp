#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "notegraph/cli/commands.hpp"
#include "notegraph/config/config.hpp"
#include "notegraph/observability/global.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

/// Redirects std::cout and std::cerr for the lifetime of the guard.
struct OutputCapture {
  std::ostringstream out;
  std::ostringstream err;
  std::streambuf *old_out;
  std::streambuf *old_err;

  OutputCapture() : old_out(std::cout.rdbuf(out.rdbuf())), old_err(std::cerr.rdbuf(err.rdbuf())) {}
  ~OutputCapture() {
    std::cout.rdbuf(old_out);
    std::cerr.rdbuf(old_err);
  }
};

/// Writes a config rooted in the workspace and resets global CLI state on exit.
struct CliFixture {
  notegraph::testing::TempWorkspace workspace;
  std::filesystem::path config_file;

  CliFixture() {
    config_file = workspace.path() / "config.toml";
    std::ofstream out(config_file);
    out << "data_dir = \"" << (workspace.path() / "data").string() << "\"\n\n"
        << "[encoder]\nprovider = \"hash\"\ndimensions = 64\n\n"
        << "[observability]\nbackend = \"none\"\n";
  }

  ~CliFixture() {
    notegraph::config::clear_config_path_override();
    notegraph::observability::set_global_observer(nullptr);
  }

  int run(std::vector<std::string> args) const {
    args.insert(args.begin(), {"notegraph", "--config", config_file.string()});
    std::vector<char *> argv;
    argv.reserve(args.size());
    for (auto &arg : args) {
      argv.push_back(arg.data());
    }
    return notegraph::cli::run_cli(static_cast<int>(argv.size()), argv.data());
  }
};

} // namespace

void register_cli_tests(std::vector<notegraph::tests::TestCase> &tests) {
  using notegraph::tests::require;

  tests.push_back({"cli_version_and_unknown_command", [] {
                     CliFixture fixture;
                     {
                       OutputCapture capture;
                       require(fixture.run({"version"}) == 0, "version succeeds");
                       require(capture.out.str().rfind("notegraph ", 0) == 0,
                               "version line: " + capture.out.str());
                     }
                     {
                       OutputCapture capture;
                       require(fixture.run({"frobnicate"}) == 1, "unknown command fails");
                       require(capture.err.str().find("Unknown command: frobnicate") !=
                                   std::string::npos,
                               "unknown command reported");
                     }
                   }});

  tests.push_back({"cli_config_path_follows_override", [] {
                     CliFixture fixture;
                     OutputCapture capture;
                     require(fixture.run({"config-path"}) == 0, "config-path succeeds");
                     require(capture.out.str() == fixture.config_file.string() + "\n",
                             "prints the override: " + capture.out.str());
                   }});

  tests.push_back({"cli_note_lifecycle", [] {
                     CliFixture fixture;
                     {
                       OutputCapture capture;
                       require(fixture.run({"note", "put", "rust", "--tags", "lang,systems",
                                            "borrow", "checker", "and", "lifetimes"}) == 0,
                               "put succeeds: " + capture.err.str());
                       require(capture.out.str().rfind("stored rust [lang, systems]", 0) == 0,
                               "put output: " + capture.out.str());
                     }
                     {
                       OutputCapture capture;
                       require(fixture.run({"note", "put", "db", "--no-autotag",
                                            "sqlite", "write", "ahead", "log"}) == 0,
                               "second put succeeds");
                       require(capture.out.str() == "stored db\n", "no tags: " + capture.out.str());
                     }
                     {
                       OutputCapture capture;
                       require(fixture.run({"note", "get", "rust"}) == 0, "get succeeds");
                       require(capture.out.str().find("borrow checker and lifetimes\n") !=
                                   std::string::npos,
                               "body printed");
                     }
                     {
                       OutputCapture capture;
                       require(fixture.run({"note", "list", "--tag", "lang"}) == 0,
                               "list succeeds");
                       require(capture.out.str() == "rust\t[lang, systems]\n",
                               "filtered list: " + capture.out.str());
                     }
                     {
                       OutputCapture capture;
                       require(fixture.run({"search", "borrow", "checker", "-n", "1"}) == 0,
                               "search succeeds");
                       require(capture.out.str().find("\trust\tborrow checker and lifetimes\n") !=
                                   std::string::npos,
                               "best hit printed: " + capture.out.str());
                     }
                     {
                       OutputCapture capture;
                       require(fixture.run({"search", "--keyword", "SQLITE"}) == 0,
                               "keyword search succeeds");
                       require(capture.out.str() == "db\tsqlite write ahead log\n",
                               "keyword hit: " + capture.out.str());
                     }
                     {
                       OutputCapture capture;
                       require(fixture.run({"graph", "--k", "1"}) == 0, "graph succeeds");
                       require(capture.out.str().rfind("{\"nodes\":[{\"key\":\"db\"", 0) == 0,
                               "graph json: " + capture.out.str());
                       require(capture.out.str().find("\"links\":[{\"source\":0,\"target\":1,") !=
                                   std::string::npos,
                               "one link");
                     }
                     {
                       OutputCapture capture;
                       require(fixture.run({"note", "delete", "rust"}) == 0,
                               "delete succeeds");
                       require(fixture.run({"note", "get", "rust"}) == 1,
                               "deleted note is gone");
                       require(capture.err.str().find("note not found: rust") != std::string::npos,
                               "not found reported");
                     }
                   }});

  tests.push_back({"cli_rejects_bad_arguments", [] {
                     CliFixture fixture;
                     OutputCapture capture;
                     require(fixture.run({"search", "x", "--limit", "ten"}) == 1,
                             "non-numeric limit fails");
                     require(fixture.run({"note"}) == 1, "note without action fails");
                     require(fixture.run({"search"}) == 1, "search without query fails");
                     require(fixture.run({"suggest", "missing"}) == 1,
                             "suggest for unknown key fails");
                   }});

  tests.push_back({"cli_file_roundtrip", [] {
                     CliFixture fixture;
                     fixture.workspace.create_file("input.txt", "attachment bytes");
                     const auto out_path = fixture.workspace.path() / "copy.txt";
                     {
                       OutputCapture capture;
                       require(fixture.run({"file", "put", "docs/a.txt",
                                            (fixture.workspace.path() / "input.txt").string(),
                                            "--mime", "text/plain", "--tags", "docs"}) == 0,
                               "file put succeeds: " + capture.err.str());
                       require(capture.out.str() == "stored docs/a.txt (16 bytes)\n",
                               "put output: " + capture.out.str());
                     }
                     {
                       OutputCapture capture;
                       require(fixture.run({"file", "list"}) == 0, "file list succeeds");
                       require(capture.out.str() == "docs/a.txt\ttext/plain\t16\t[docs]\n",
                               "list output: " + capture.out.str());
                     }
                     {
                       OutputCapture capture;
                       require(fixture.run({"file", "get", "docs/a.txt", "-o", out_path.string()}) == 0,
                               "file get succeeds");
                     }
                     std::ifstream copy(out_path);
                     std::stringstream buffer;
                     buffer << copy.rdbuf();
                     require(buffer.str() == "attachment bytes", "bytes copied out");
                     {
                       OutputCapture capture;
                       require(fixture.run({"file", "put", "../escape.txt",
                                            (fixture.workspace.path() / "input.txt").string()}) == 1,
                               "escaping name rejected");
                     }
                   }});
}
