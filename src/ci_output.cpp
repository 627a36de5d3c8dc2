#include "testlog/ci_output.hpp"

#include <utility>

namespace testlog {

std::string escape_output_value(const std::string& value) {
  std::string out;
  out.reserve(value.size() + 8);
  for (char c : value) {
    switch (c) {
      case '%':  out += "%25"; break;
      case '\n': out += "%0A"; break;
      case '\r': out += "%0D"; break;
      default:   out += c;
    }
  }
  return out;
}

CiOutputSink::CiOutputSink(std::string path, Diagnostics* diag)
    : path_(std::move(path)), diag_(diag) {}

CiOutputSink::~CiOutputSink() {
  close();
}

bool CiOutputSink::ensure_open() {
  if (failed_) return false;
  if (out_.is_open()) return true;

  if (path_.empty()) {
    failed_ = true;
    if (diag_) diag_->add(DiagnosticKind::SinkWriteError, "No CI output path configured; outputs not written.");
    return false;
  }

  out_.open(path_, std::ios::out | std::ios::app);
  if (!out_) {
    failed_ = true;
    if (diag_) diag_->add(DiagnosticKind::SinkWriteError, "Failed to open CI output file: " + path_);
    return false;
  }
  return true;
}

bool CiOutputSink::write(const std::string& name, const std::string& value) {
  if (!ensure_open()) return false;

  out_ << name << "=" << escape_output_value(value) << "\n";
  if (!out_) {
    failed_ = true;
    if (diag_) diag_->add(DiagnosticKind::SinkWriteError, "Failed to write output '" + name + "' to " + path_);
    return false;
  }
  return true;
}

bool CiOutputSink::write_all(const std::vector<OutputEntry>& entries) {
  for (const auto& e : entries) {
    if (!write(e.name, e.value)) return false;
  }
  return true;
}

void CiOutputSink::close() {
  if (!out_.is_open()) return;
  out_.flush();
  if (!out_ && !failed_) {
    failed_ = true;
    if (diag_) diag_->add(DiagnosticKind::SinkWriteError, "Failed to flush CI output file: " + path_);
  }
  out_.close();
}

} // namespace testlog
