#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<feedrank::tests::TestCase> &tests);
void register_config_tests(std::vector<feedrank::tests::TestCase> &tests);
void register_observability_tests(std::vector<feedrank::tests::TestCase> &tests);
void register_store_tests(std::vector<feedrank::tests::TestCase> &tests);
void register_sources_tests(std::vector<feedrank::tests::TestCase> &tests);
void register_filters_tests(std::vector<feedrank::tests::TestCase> &tests);
void register_scorer_tests(std::vector<feedrank::tests::TestCase> &tests);
void register_diversity_tests(std::vector<feedrank::tests::TestCase> &tests);
void register_home_mixer_tests(std::vector<feedrank::tests::TestCase> &tests);
void register_news_source_tests(std::vector<feedrank::tests::TestCase> &tests);
void register_cli_tests(std::vector<feedrank::tests::TestCase> &tests);
void register_feed_integration_tests(std::vector<feedrank::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<feedrank::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_observability_tests(tests);
  register_store_tests(tests);
  register_sources_tests(tests);
  register_filters_tests(tests);
  register_scorer_tests(tests);
  register_diversity_tests(tests);
  register_home_mixer_tests(tests);
  register_news_source_tests(tests);
  register_cli_tests(tests);
  register_feed_integration_tests(tests);

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
