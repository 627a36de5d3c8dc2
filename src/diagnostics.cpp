#include "testlog/diagnostics.hpp"

#include <algorithm>

namespace testlog {

const char* to_string(DiagnosticKind k) {
  switch (k) {
    case DiagnosticKind::SourceNotFound: return "SourceNotFound";
    case DiagnosticKind::RecordParseError: return "RecordParseError";
    case DiagnosticKind::StructuralAnomaly: return "StructuralAnomaly";
    case DiagnosticKind::SinkWriteError: return "SinkWriteError";
  }
  return "Unknown";
}

void Diagnostics::add(DiagnosticKind kind, const std::string& message) {
  entries_.push_back({kind, message});
  if (echo_) {
    *echo_ << "Warning: " << message << "\n";
  }
}

std::int64_t Diagnostics::count(DiagnosticKind kind) const {
  return std::count_if(entries_.begin(), entries_.end(),
                       [kind](const Diagnostic& d) { return d.kind == kind; });
}

} // namespace testlog
