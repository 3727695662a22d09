#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<toolexec::tests::TestCase> &tests);
void register_config_tests(std::vector<toolexec::tests::TestCase> &tests);
void register_observability_health_tests(std::vector<toolexec::tests::TestCase> &tests);
void register_sandbox_tests(std::vector<toolexec::tests::TestCase> &tests);
void register_store_tests(std::vector<toolexec::tests::TestCase> &tests);
void register_orchestrator_tests(std::vector<toolexec::tests::TestCase> &tests);
void register_services_tests(std::vector<toolexec::tests::TestCase> &tests);
void register_cli_tests(std::vector<toolexec::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<toolexec::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_observability_health_tests(tests);
  register_sandbox_tests(tests);
  register_store_tests(tests);
  register_orchestrator_tests(tests);
  register_services_tests(tests);
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
