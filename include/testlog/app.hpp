#pragma once

#include <ostream>

#include "testlog/diagnostics.hpp"
#include "testlog/options.hpp"

namespace testlog {

extern const char* const kVersion;

// Runs "testlog analyze": reads opt.file_path, writes the report to out
// (or opt.report_path) and the CI outputs to opt.out_path. Problems go to
// err. Returns the process exit code, which depends on suite outcomes only.
// diag_out, when given, receives the diagnostics recorded during the run.
int run(const Options& opt, std::ostream& out, std::ostream& err, Diagnostics* diag_out = nullptr);

} // namespace testlog
