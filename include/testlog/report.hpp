#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "testlog/diagnostics.hpp"
#include "testlog/types.hpp"

namespace testlog {

// One named value for the CI key/value sink
struct OutputEntry {
  std::string name;
  std::string value;
};

// "<name>: <status>[ (<result>)]"
std::string summary_line(const SuiteOutcome& s);

// All summary lines joined by '\n'
std::string summary_text(const std::vector<SuiteOutcome>& suites);

// Replaces every character outside [A-Za-z0-9_] with '_'.
// Distinct names may collide.
std::string sanitize_key(const std::string& name);

// "Type: <KIND> | Location: <location-or-N/A> | Text: <text>"
// Line breaks inside the text become spaces.
std::string render_log_line(const LogRecord& r);
std::string render_logs(const std::vector<LogRecord>& logs);

// "name: status" per individual test, sorted by name
std::string render_tests(const SuiteOutcome& s);

// True iff there is at least one suite and every suite Passed.
bool overall_success(const std::vector<SuiteOutcome>& suites);
int exit_code(const std::vector<SuiteOutcome>& suites);

// summary, success, then <key>_status/_result/_tests/_logs for each
// suite that did not pass
std::vector<OutputEntry> ci_outputs(const std::vector<SuiteOutcome>& suites);

// GitHub Actions "::group::" block for the job log
void write_text_report(std::ostream& os, const std::vector<SuiteOutcome>& suites);

void write_json_report(std::ostream& os,
                       const std::vector<SuiteOutcome>& suites,
                       const Diagnostics& diag,
                       const std::string& version);

} // namespace testlog
