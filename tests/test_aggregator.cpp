#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "testlog/aggregator.hpp"

using namespace testlog;

static LogRecord rec(const std::string& text, const std::string& kind = "log") {
  LogRecord r;
  r.kind = kind;
  r.text = text;
  return r;
}

TEST(Aggregator, PassingSuite) {
  Diagnostics diag;
  auto suites = aggregate({rec("Starting test suite: Physics"),
                           rec("Expect Test: gravity Passed"),
                           rec("Finished test suite: Physics Passed (1/1)!")},
                          &diag);

  ASSERT_EQ(suites.size(), 1u);
  EXPECT_EQ(suites[0].name, "Physics");
  EXPECT_EQ(suites[0].status, SuiteStatus::Passed);
  EXPECT_TRUE(suites[0].has_result);
  EXPECT_EQ(suites[0].result_summary, "Passed (1/1)!");
  EXPECT_EQ(suites[0].passed, 1);
  EXPECT_EQ(suites[0].total, 1);
  EXPECT_EQ(suites[0].individual_tests.at("gravity"), TestStatus::Passed);
  EXPECT_EQ(suites[0].logs.size(), 3u);
  EXPECT_EQ(diag.total(), 0);
}

TEST(Aggregator, ChildFailureDominates) {
  auto suites = aggregate({rec("Starting test suite: Physics"),
                           rec("Expect Test: gravity Failed"),
                           rec("Finished test suite: Physics Passed (0/1)")});

  ASSERT_EQ(suites.size(), 1u);
  EXPECT_EQ(suites[0].status, SuiteStatus::Failed);
  EXPECT_EQ(suites[0].result_summary, "Passed (0/1)");
}

TEST(Aggregator, FailureWordInResult) {
  auto suites = aggregate({rec("Starting test suite: A"),
                           rec("Finished test suite: A Failed (0/2)")});
  ASSERT_EQ(suites.size(), 1u);
  EXPECT_EQ(suites[0].status, SuiteStatus::Failed);

  suites = aggregate({rec("Starting test suite: A"),
                      rec("Finished test suite: A Error (0/2)")});
  EXPECT_EQ(suites[0].status, SuiteStatus::Failed);
}

TEST(Aggregator, OverlappingStartMarksPreviousIncomplete) {
  Diagnostics diag;
  SuiteAggregator agg(&diag);
  agg.add(rec("Starting test suite: A"));
  agg.add(rec("a-1"));
  agg.add(rec("Starting test suite: B"));

  ASSERT_NE(agg.current(), nullptr);
  EXPECT_EQ(agg.current()->name, "B");
  EXPECT_EQ(agg.current()->status, SuiteStatus::Running);
  ASSERT_EQ(agg.suites().size(), 1u);
  EXPECT_EQ(agg.suites()[0].name, "A");
  EXPECT_EQ(agg.suites()[0].status, SuiteStatus::Incomplete);
  EXPECT_EQ(agg.suites()[0].logs.size(), 2u);

  agg.finish();
  ASSERT_EQ(agg.suites().size(), 2u);
  EXPECT_EQ(agg.suites()[1].name, "B");
  EXPECT_EQ(agg.suites()[1].status, SuiteStatus::Incomplete);
  EXPECT_EQ(agg.suites()[1].logs.size(), 1u);
  EXPECT_FALSE(agg.in_suite());
  EXPECT_EQ(diag.count(DiagnosticKind::StructuralAnomaly), 2);
}

TEST(Aggregator, MismatchedEndIsPlain) {
  Diagnostics diag;
  auto suites = aggregate({rec("Starting test suite: A"),
                           rec("Finished test suite: B Passed (1/1)"),
                           rec("Finished test suite: A Passed (1/1)")},
                          &diag);

  ASSERT_EQ(suites.size(), 1u);
  EXPECT_EQ(suites[0].status, SuiteStatus::Passed);
  EXPECT_EQ(suites[0].result_summary, "Passed (1/1)");
  EXPECT_EQ(suites[0].logs.size(), 3u);
  EXPECT_EQ(diag.count(DiagnosticKind::StructuralAnomaly), 1);
}

TEST(Aggregator, EndWithoutStartIsDiscarded) {
  Diagnostics diag;
  SuiteAggregator agg(&diag);
  agg.add(rec("Finished test suite: X Passed (1/1)"));
  agg.finish();

  EXPECT_TRUE(agg.suites().empty());
  EXPECT_EQ(agg.discarded(), 1);
  EXPECT_EQ(diag.count(DiagnosticKind::StructuralAnomaly), 1);
}

TEST(Aggregator, OrphanExpectResultsAreDropped) {
  auto suites = aggregate({rec("Expect Test: early Failed"),
                           rec("Starting test suite: A"),
                           rec("Finished test suite: A Passed (0/0)"),
                           rec("Expect Test: late Failed")});

  ASSERT_EQ(suites.size(), 1u);
  EXPECT_TRUE(suites[0].individual_tests.empty());
  EXPECT_EQ(suites[0].status, SuiteStatus::Passed);
}

TEST(Aggregator, LastExpectResultWins) {
  auto suites = aggregate({rec("Starting test suite: A"),
                           rec("Expect Test: t Failed"),
                           rec("Expect Test: t Passed"),
                           rec("Finished test suite: A Passed (1/1)")});
  ASSERT_EQ(suites.size(), 1u);
  EXPECT_EQ(suites[0].individual_tests.size(), 1u);
  EXPECT_EQ(suites[0].status, SuiteStatus::Passed);
}

TEST(Aggregator, DuplicateStartOverwritesSlot) {
  Diagnostics diag;
  auto suites = aggregate({rec("Starting test suite: A"),
                           rec("Finished test suite: A Failed (0/1)"),
                           rec("Starting test suite: B"),
                           rec("Finished test suite: B Passed (1/1)"),
                           rec("Starting test suite: A"),
                           rec("Finished test suite: A Passed (1/1)")},
                          &diag);

  ASSERT_EQ(suites.size(), 2u);
  EXPECT_EQ(suites[0].name, "A");
  EXPECT_EQ(suites[0].status, SuiteStatus::Passed);
  EXPECT_EQ(suites[0].logs.size(), 2u);
  EXPECT_EQ(suites[1].name, "B");
  EXPECT_EQ(diag.count(DiagnosticKind::StructuralAnomaly), 1);
}

TEST(Aggregator, LogsPreserveInputOrder) {
  std::vector<LogRecord> input = {rec("before"),
                                  rec("Starting test suite: A"),
                                  rec("one", "warning"),
                                  rec("two", "error"),
                                  rec("Expect Test: t Passed"),
                                  rec("three"),
                                  rec("Finished test suite: A Passed (1/1)"),
                                  rec("after")};
  auto suites = aggregate(input);

  ASSERT_EQ(suites.size(), 1u);
  const auto& logs = suites[0].logs;
  ASSERT_EQ(logs.size(), 6u);
  for (size_t i = 0; i < logs.size(); ++i) {
    EXPECT_EQ(logs[i].text, input[i + 1].text);
    EXPECT_EQ(logs[i].kind, input[i + 1].kind);
  }
}

TEST(Aggregator, AtMostOneSuiteRunning) {
  SuiteAggregator agg;
  const std::vector<std::string> texts = {
      "Starting test suite: A", "x", "Starting test suite: B", "Finished test suite: A Passed (1/1)",
      "Starting test suite: C", "Finished test suite: C Passed (1/1)", "y", "Starting test suite: D"};

  for (const auto& t : texts) {
    agg.add(rec(t));
    for (const auto& s : agg.suites()) {
      EXPECT_NE(s.status, SuiteStatus::Running);
    }
  }
  agg.finish();
  EXPECT_EQ(agg.current(), nullptr);
  for (const auto& s : agg.suites()) {
    EXPECT_NE(s.status, SuiteStatus::Running);
  }
}

TEST(Aggregator, FinalStatusWordBoundary) {
  SuiteOutcome s;
  EXPECT_EQ(final_status(s, "Passed (1/1)!"), SuiteStatus::Passed);
  EXPECT_EQ(final_status(s, "Failed (0/1)"), SuiteStatus::Failed);
  EXPECT_EQ(final_status(s, "passed with errors (1/1)"), SuiteStatus::Failed);
  EXPECT_EQ(final_status(s, "Terror (1/1)"), SuiteStatus::Passed);

  s.individual_tests["t"] = TestStatus::Failed;
  EXPECT_EQ(final_status(s, "Passed (1/1)"), SuiteStatus::Failed);
}
