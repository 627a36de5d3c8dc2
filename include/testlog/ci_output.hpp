#pragma once

#include <fstream>
#include <string>
#include <vector>

#include "testlog/diagnostics.hpp"
#include "testlog/report.hpp"

namespace testlog {

// '%' -> "%25", '\n' -> "%0A", '\r' -> "%0D"
std::string escape_output_value(const std::string& value);

// Line-oriented "name=value" sink (GitHub Actions $GITHUB_OUTPUT).
// The file is opened for append on the first write and closed when the
// sink goes out of scope. Failures are diagnostics, never fatal.
class CiOutputSink {
public:
  explicit CiOutputSink(std::string path, Diagnostics* diag = nullptr);
  ~CiOutputSink();

  CiOutputSink(const CiOutputSink&) = delete;
  CiOutputSink& operator=(const CiOutputSink&) = delete;

  bool write(const std::string& name, const std::string& value);
  bool write_all(const std::vector<OutputEntry>& entries);

  // Flushes and releases the file. Safe to call more than once.
  void close();

  bool failed() const { return failed_; }

private:
  bool ensure_open();

  std::string path_;
  Diagnostics* diag_;
  std::ofstream out_;
  bool failed_ = false;
};

} // namespace testlog
