#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_codec_tests(std::vector<notegraph::tests::TestCase> &tests);
void register_ranker_tests(std::vector<notegraph::tests::TestCase> &tests);
void register_centroids_tests(std::vector<notegraph::tests::TestCase> &tests);
void register_graph_tests(std::vector<notegraph::tests::TestCase> &tests);
void register_encoder_tests(std::vector<notegraph::tests::TestCase> &tests);
void register_store_tests(std::vector<notegraph::tests::TestCase> &tests);
void register_knowledge_tests(std::vector<notegraph::tests::TestCase> &tests);
void register_config_tests(std::vector<notegraph::tests::TestCase> &tests);
void register_observability_tests(std::vector<notegraph::tests::TestCase> &tests);
void register_cli_tests(std::vector<notegraph::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<notegraph::tests::TestCase> tests;
  register_codec_tests(tests);
  register_ranker_tests(tests);
  register_centroids_tests(tests);
  register_graph_tests(tests);
  register_encoder_tests(tests);
  register_store_tests(tests);
  register_knowledge_tests(tests);
  register_config_tests(tests);
  register_observability_tests(tests);
  register_cli_tests(tests);

  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";

  return failed == 0 ? 0 : 1;
}
