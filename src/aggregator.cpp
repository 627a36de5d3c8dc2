#include "testlog/aggregator.hpp"

#include <algorithm>
#include <cctype>

namespace testlog {

static bool has_failure_word(const std::string& text) {
  std::string lower;
  lower.reserve(text.size());
  for (char c : text) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

  static const char* const kWords[] = {"fail", "error"};
  for (const char* w : kWords) {
    const std::string word(w);
    size_t pos = lower.find(word);
    while (pos != std::string::npos) {
      // must start a word: "Failed", "errors" count, "terror" does not
      if (pos == 0 || !std::isalnum(static_cast<unsigned char>(lower[pos - 1]))) return true;
      pos = lower.find(word, pos + 1);
    }
  }
  return false;
}

SuiteStatus final_status(const SuiteOutcome& s, const std::string& result_text) {
  if (has_failure_word(result_text)) return SuiteStatus::Failed;

  const bool child_failed =
      std::any_of(s.individual_tests.begin(), s.individual_tests.end(),
                  [](const std::pair<const std::string, TestStatus>& kv) {
                    return kv.second == TestStatus::Failed;
                  });
  return child_failed ? SuiteStatus::Failed : SuiteStatus::Passed;
}

void SuiteAggregator::warn(const std::string& msg) {
  if (diag_) diag_->add(DiagnosticKind::StructuralAnomaly, msg);
}

void SuiteAggregator::open_suite(const std::string& name, const LogRecord& r) {
  current_ = SuiteOutcome{};
  current_.name = name;
  current_.status = SuiteStatus::Running;
  current_.logs.push_back(r);
  open_ = true;
}

// The only place a suite leaves Running
void SuiteAggregator::finalize(SuiteStatus status) {
  if (!open_) return;

  current_.status = status;
  open_ = false;

  auto it = index_by_name_.find(current_.name);
  if (it != index_by_name_.end()) {
    warn("Suite '" + current_.name + "' started more than once; keeping the latest run.");
    suites_[it->second] = std::move(current_);
  } else {
    index_by_name_.emplace(current_.name, suites_.size());
    suites_.push_back(std::move(current_));
  }
  current_ = SuiteOutcome{};
}

void SuiteAggregator::add(const LogRecord& r) {
  add(r, classify(r));
}

void SuiteAggregator::add(const LogRecord& r, const Marker& m) {
  if (!open_) {
    switch (m.kind) {
      case MarkerKind::SuiteStart:
        open_suite(m.name, r);
        return;
      case MarkerKind::SuiteEnd:
        warn("End of suite '" + m.name + "' without a matching start; ignored.");
        break;
      case MarkerKind::ExpectResult:
      case MarkerKind::Plain:
        break;
    }
    ++discarded_;
    return;
  }

  switch (m.kind) {
    case MarkerKind::SuiteStart:
      warn("Suite '" + m.name + "' started while '" + current_.name +
           "' was still running; marking '" + current_.name + "' Incomplete.");
      finalize(SuiteStatus::Incomplete);
      open_suite(m.name, r);
      return;

    case MarkerKind::SuiteEnd:
      current_.logs.push_back(r);
      if (m.name != current_.name) {
        warn("End of suite '" + m.name + "' while '" + current_.name +
             "' is running; treated as a plain message.");
        return;
      }
      current_.has_result = true;
      current_.result_summary = m.result_text;
      current_.passed = m.passed;
      current_.total = m.total;
      finalize(final_status(current_, m.result_text));
      return;

    case MarkerKind::ExpectResult:
      current_.individual_tests[m.name] = m.test_status;
      current_.logs.push_back(r);
      return;

    case MarkerKind::Plain:
      current_.logs.push_back(r);
      return;
  }
}

void SuiteAggregator::finish() {
  if (open_) {
    warn("Input ended while suite '" + current_.name + "' was running; marking it Incomplete.");
    finalize(SuiteStatus::Incomplete);
  }
}

std::vector<SuiteOutcome> aggregate(const std::vector<LogRecord>& records, Diagnostics* diag) {
  SuiteAggregator agg(diag);
  for (const auto& r : records) agg.add(r);
  agg.finish();
  return agg.suites();
}

} // namespace testlog
