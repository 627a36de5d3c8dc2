#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "testlog/classifier.hpp"
#include "testlog/diagnostics.hpp"
#include "testlog/types.hpp"

namespace testlog {

// Folds classified records into suites. At most one suite is open at a
// time; every record seen while it is open lands in its logs.
class SuiteAggregator {
public:
  explicit SuiteAggregator(Diagnostics* diag = nullptr) : diag_(diag) {}

  void add(const LogRecord& r);
  void add(const LogRecord& r, const Marker& m);

  // End of input: an open suite becomes Incomplete.
  void finish();

  bool in_suite() const { return open_; }

  // The suite being accumulated, nullptr when idle.
  const SuiteOutcome* current() const { return open_ ? &current_ : nullptr; }

  // Finalized suites in first-seen order.
  const std::vector<SuiteOutcome>& suites() const { return suites_; }

  // Records dropped because no suite was open
  std::int64_t discarded() const { return discarded_; }

private:
  void open_suite(const std::string& name, const LogRecord& r);
  void finalize(SuiteStatus status);
  void warn(const std::string& msg);

  Diagnostics* diag_;

  bool open_ = false;
  SuiteOutcome current_;

  std::vector<SuiteOutcome> suites_;
  std::unordered_map<std::string, size_t> index_by_name_;

  std::int64_t discarded_ = 0;
};

// Matched-end verdict: Failed when the result text names a failure or
// error, or when any individual test failed.
SuiteStatus final_status(const SuiteOutcome& s, const std::string& result_text);

// Convenience: classify and aggregate a whole sequence, then finish().
std::vector<SuiteOutcome> aggregate(const std::vector<LogRecord>& records,
                                    Diagnostics* diag = nullptr);

} // namespace testlog
