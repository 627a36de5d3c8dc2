#pragma once

#include <cstdint>
#include <string>

#include "testlog/types.hpp"

namespace testlog {

// Marker phrases the browser harness prints (case-sensitive)
extern const char* const kSuiteStartMarker;  // "Starting test suite:"
extern const char* const kSuiteEndMarker;    // "Finished test suite:"
extern const char* const kExpectMarker;      // "Expect Test:"

enum class MarkerKind {
  Plain,
  SuiteStart,
  SuiteEnd,
  ExpectResult,
};

struct Marker {
  MarkerKind kind = MarkerKind::Plain;

  // SuiteStart / SuiteEnd: suite name. ExpectResult: test name.
  std::string name;

  // SuiteEnd only
  std::string result_text;   // "Passed (3/3)!"
  std::string status_word;   // "Passed"
  std::int32_t passed = 0;
  std::int32_t total = 0;

  // ExpectResult only
  TestStatus test_status = TestStatus::Passed;
};

// Removes "%c" directives and "color: ..." CSS arguments that the console
// capture leaves in the message text.
std::string strip_console_styling(const std::string& text);

// Classifies one record by its text alone. Never fails: text that does not
// fit a marker's expected shape is Plain.
Marker classify(const LogRecord& r);
Marker classify_text(const std::string& text);

} // namespace testlog
