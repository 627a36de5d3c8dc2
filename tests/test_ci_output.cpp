#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include "testlog/ci_output.hpp"

using namespace testlog;

static std::string slurp(const std::string& path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

TEST(CiOutput, EscapesValue) {
  EXPECT_EQ(escape_output_value("plain"), "plain");
  EXPECT_EQ(escape_output_value("100%"), "100%25");
  EXPECT_EQ(escape_output_value("a\nb\r\nc"), "a%0Ab%0D%0Ac");
  EXPECT_EQ(escape_output_value("%0A"), "%250A");
}

TEST(CiOutput, AppendsNameValueLines) {
  const std::string path = ::testing::TempDir() + "testlog_ci_output.txt";
  std::remove(path.c_str());
  {
    std::ofstream pre(path);
    pre << "existing=1\n";
  }

  Diagnostics diag;
  {
    CiOutputSink sink(path, &diag);
    EXPECT_TRUE(sink.write("summary", "A: Passed\nB: Failed"));
    EXPECT_TRUE(sink.write_all({{"success", "false"}, {"B_status", "Failed"}}));
  }

  EXPECT_EQ(slurp(path),
            "existing=1\n"
            "summary=A: Passed%0AB: Failed\n"
            "success=false\n"
            "B_status=Failed\n");
  EXPECT_EQ(diag.total(), 0);

  std::remove(path.c_str());
}

TEST(CiOutput, UnsetPathIsDiagnostic) {
  Diagnostics diag;
  CiOutputSink sink("", &diag);
  EXPECT_FALSE(sink.write("summary", "x"));
  EXPECT_FALSE(sink.write("success", "false"));
  EXPECT_TRUE(sink.failed());
  EXPECT_EQ(diag.count(DiagnosticKind::SinkWriteError), 1);
}

TEST(CiOutput, UnwritablePathIsDiagnostic) {
  Diagnostics diag;
  CiOutputSink sink("/nonexistent/testlog/dir/output.txt", &diag);
  EXPECT_FALSE(sink.write_all({{"summary", "x"}}));
  EXPECT_EQ(diag.count(DiagnosticKind::SinkWriteError), 1);
}

TEST(CiOutput, NoFileUntilFirstWrite) {
  const std::string path = ::testing::TempDir() + "testlog_ci_lazy.txt";
  std::remove(path.c_str());
  {
    CiOutputSink sink(path);
  }
  std::ifstream in(path);
  EXPECT_FALSE(in.good());
}

TEST(Diagnostics, EchoesWarnings) {
  std::ostringstream os;
  Diagnostics diag(&os);
  diag.add(DiagnosticKind::StructuralAnomaly, "odd");
  diag.add(DiagnosticKind::RecordParseError, "bad");

  EXPECT_EQ(os.str(), "Warning: odd\nWarning: bad\n");
  EXPECT_EQ(diag.total(), 2);
  EXPECT_EQ(diag.count(DiagnosticKind::StructuralAnomaly), 1);
  EXPECT_STREQ(to_string(DiagnosticKind::SinkWriteError), "SinkWriteError");
}
