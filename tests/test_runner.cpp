#include "test_runner_utils.hpp"
#include "log.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace specsync::test;

int main(int argc, char** argv) {
  bool verbose = (std::getenv("SPECSYNC_TEST_VERBOSE") != nullptr);
  std::string filter;
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    } else {
      filter = arg;
    }
  }

  bool show_logs = (std::getenv("SPECSYNC_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  LogCapture logs;
  TestContext ctx{logs, verbose};

  std::vector<TestCase> all;
  register_protocol_tests(all);
  register_registry_tests(all);
  register_spec_file_tests(all);
  register_bridge_tests(all);
  register_wire_tests(all);
  register_end_to_end_tests(all);

  std::vector<TestCase> tests;
  for(auto& test : all) {
    if(filter.empty() || std::string(test.name).find(filter) != std::string::npos) {
      tests.push_back(std::move(test));
    }
  }

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " specsync tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    logs.detach_all();
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " specsync tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}
