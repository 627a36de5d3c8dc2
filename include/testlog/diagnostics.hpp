#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace testlog {

enum class DiagnosticKind {
  SourceNotFound,
  RecordParseError,
  StructuralAnomaly,
  SinkWriteError,
};

const char* to_string(DiagnosticKind k);

struct Diagnostic {
  DiagnosticKind kind;
  std::string message;
};

// Collects recoverable problems from every stage. Nothing here is fatal:
// the exit code is decided from suite outcomes alone.
class Diagnostics {
public:
  Diagnostics() = default;
  explicit Diagnostics(std::ostream* echo) : echo_(echo) {}

  void add(DiagnosticKind kind, const std::string& message);

  std::int64_t count(DiagnosticKind kind) const;
  std::int64_t total() const { return static_cast<std::int64_t>(entries_.size()); }
  const std::vector<Diagnostic>& entries() const { return entries_; }

private:
  std::vector<Diagnostic> entries_;
  std::ostream* echo_ = nullptr;
};

} // namespace testlog
