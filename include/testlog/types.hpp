#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace testlog {

// One observed console message (one JSON line)
struct LogRecord {
  std::string kind;       // "log", "warning", "error", ... kept verbatim
  std::string text;
  std::string location;   // empty when the harness gave none
};

enum class TestStatus {
  Passed,
  Failed,
};

enum class SuiteStatus {
  Running,
  Passed,
  Failed,
  Incomplete,
};

const char* to_string(TestStatus s);
const char* to_string(SuiteStatus s);

struct SuiteOutcome {
  std::string name;
  SuiteStatus status = SuiteStatus::Running;

  bool has_result = false;
  std::string result_summary;

  // Counts from "(passed/total)" in the end marker, -1 when unknown
  std::int32_t passed = -1;
  std::int32_t total = -1;

  std::map<std::string, TestStatus> individual_tests;
  std::vector<LogRecord> logs;
};

} // namespace testlog
