#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_config_tests(std::vector<talekeeper::tests::TestCase> &tests);
void register_dice_tests(std::vector<talekeeper::tests::TestCase> &tests);
void register_sessions_tests(std::vector<talekeeper::tests::TestCase> &tests);
void register_context_tests(std::vector<talekeeper::tests::TestCase> &tests);
void register_persistence_tests(std::vector<talekeeper::tests::TestCase> &tests);
void register_observability_tests(std::vector<talekeeper::tests::TestCase> &tests);
void register_generation_tests(std::vector<talekeeper::tests::TestCase> &tests);
void register_cli_tests(std::vector<talekeeper::tests::TestCase> &tests);
void register_session_flow_integration_tests(std::vector<talekeeper::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<talekeeper::tests::TestCase> tests;
  register_config_tests(tests);
  register_dice_tests(tests);
  register_sessions_tests(tests);
  register_context_tests(tests);
  register_persistence_tests(tests);
  register_observability_tests(tests);
  register_generation_tests(tests);
  register_cli_tests(tests);
  register_session_flow_integration_tests(tests);

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
