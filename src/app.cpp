#include "testlog/app.hpp"

#include <fstream>
#include <utility>

#include "testlog/aggregator.hpp"
#include "testlog/ci_output.hpp"
#include "testlog/reader.hpp"
#include "testlog/report.hpp"

namespace testlog {

const char* const kVersion = "1.0";

int run(const Options& opt, std::ostream& out, std::ostream& err, Diagnostics* diag_out) {
  Diagnostics diag(opt.quiet ? nullptr : &err);

  // Read + classify + aggregate
  SuiteAggregator agg(&diag);
  const bool read_ok = read_records_file(
      opt.file_path,
      [&](const LogRecord& r) { agg.add(r); },
      &diag);
  agg.finish();

  const auto& suites = agg.suites();
  if (!read_ok || suites.empty()) {
    err << "Error: No results found in " << opt.file_path << "\n";
  }

  // Decide report stream
  std::ofstream fout;
  std::ostream* report = &out;

  if (!opt.report_path.empty()) {
    fout.open(opt.report_path, std::ios::out | std::ios::trunc);
    if (!fout) {
      err << "Error: Failed to open report file: " << opt.report_path << "\n";
    } else {
      report = &fout;
    }
  }

  if (opt.format == "json") {
    write_json_report(*report, suites, diag, kVersion);
  } else {
    write_text_report(*report, suites);
    *report << summary_text(suites) << (suites.empty() ? "" : "\n");
  }

  {
    CiOutputSink sink(opt.out_path, &diag);
    if (!sink.write_all(ci_outputs(suites)) && opt.quiet) {
      err << "Error: CI outputs were not written.\n";
    }
  }

  const int code = exit_code(suites);
  if (code != 0) {
    err << "Some tests failed!\n";
  }

  if (diag_out) *diag_out = std::move(diag);
  return code;
}

} // namespace testlog
