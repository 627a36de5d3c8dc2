#include "testlog/types.hpp"

namespace testlog {

const char* to_string(TestStatus s) {
  switch (s) {
    case TestStatus::Passed: return "Passed";
    case TestStatus::Failed: return "Failed";
  }
  return "Unknown";
}

const char* to_string(SuiteStatus s) {
  switch (s) {
    case SuiteStatus::Running: return "Running";
    case SuiteStatus::Passed: return "Passed";
    case SuiteStatus::Failed: return "Failed";
    case SuiteStatus::Incomplete: return "Incomplete";
  }
  return "Unknown";
}

} // namespace testlog
