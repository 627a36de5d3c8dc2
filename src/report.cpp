#include "testlog/report.hpp"

#include <algorithm>
#include <cctype>

#include <nlohmann/json.hpp>

namespace testlog {

std::string summary_line(const SuiteOutcome& s) {
  std::string out = s.name + ": " + to_string(s.status);
  if (s.has_result) out += " (" + s.result_summary + ")";
  return out;
}

std::string summary_text(const std::vector<SuiteOutcome>& suites) {
  std::string out;
  for (size_t i = 0; i < suites.size(); ++i) {
    if (i > 0) out += "\n";
    out += summary_line(suites[i]);
  }
  return out;
}

std::string sanitize_key(const std::string& name) {
  std::string out = name;
  for (char& c : out) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') c = '_';
  }
  return out;
}

static std::string to_upper(const std::string& s) {
  std::string out = s;
  for (char& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return out;
}

// Stack traces and the like span several lines; keep one line per record
static std::string join_lines(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\r' && i + 1 < s.size() && s[i + 1] == '\n') continue;
    out.push_back(s[i] == '\n' || s[i] == '\r' ? ' ' : s[i]);
  }
  return out;
}

std::string render_log_line(const LogRecord& r) {
  std::string line = "Type: " + (r.kind.empty() ? std::string("UNKNOWN") : to_upper(r.kind)) +
                     " | Location: " + (r.location.empty() ? std::string("N/A") : join_lines(r.location)) +
                     " | Text: " + join_lines(r.text);

  size_t end = line.size();
  while (end > 0 && (line[end - 1] == '|' ||
                     std::isspace(static_cast<unsigned char>(line[end - 1])))) {
    --end;
  }
  line.resize(end);
  return line;
}

std::string render_logs(const std::vector<LogRecord>& logs) {
  std::string out;
  for (size_t i = 0; i < logs.size(); ++i) {
    if (i > 0) out += "\n";
    out += render_log_line(logs[i]);
  }
  return out;
}

std::string render_tests(const SuiteOutcome& s) {
  // std::map keeps names sorted
  std::string out;
  for (const auto& kv : s.individual_tests) {
    if (!out.empty()) out += "\n";
    out += kv.first + ": " + to_string(kv.second);
  }
  return out;
}

bool overall_success(const std::vector<SuiteOutcome>& suites) {
  if (suites.empty()) return false;
  return std::all_of(suites.begin(), suites.end(),
                     [](const SuiteOutcome& s) { return s.status == SuiteStatus::Passed; });
}

int exit_code(const std::vector<SuiteOutcome>& suites) {
  return overall_success(suites) ? 0 : 1;
}

std::vector<OutputEntry> ci_outputs(const std::vector<SuiteOutcome>& suites) {
  std::vector<OutputEntry> out;
  out.push_back({"summary", summary_text(suites)});
  out.push_back({"success", overall_success(suites) ? "true" : "false"});

  for (const auto& s : suites) {
    if (s.status == SuiteStatus::Passed) continue;

    const std::string key = sanitize_key(s.name);
    out.push_back({key + "_status", to_string(s.status)});
    out.push_back({key + "_result", s.has_result ? s.result_summary : std::string()});
    out.push_back({key + "_tests", render_tests(s)});
    out.push_back({key + "_logs", render_logs(s.logs)});
  }
  return out;
}

void write_text_report(std::ostream& os, const std::vector<SuiteOutcome>& suites) {
  os << "::group::Test Suite Results\n";

  if (suites.empty()) {
    os << "No results found.\n";
  }

  for (const auto& s : suites) {
    os << "Suite: " << s.name << "\n";
    os << "Status: " << to_string(s.status) << "\n";
    if (s.total >= 0) {
      os << "Result: " << s.passed << "/" << s.total << "\n";
    } else {
      os << "Result: N/A\n";
    }

    if (s.status != SuiteStatus::Passed) {
      os << "Failed Tests:\n";
      for (const auto& kv : s.individual_tests) {
        if (kv.second == TestStatus::Failed) os << "- " << kv.first << "\n";
      }
      os << "Logs:\n";
      for (const auto& r : s.logs) {
        os << "  " << render_log_line(r) << "\n";
      }
    }

    os << std::string(30, '-') << "\n";
  }

  os << "::endgroup::\n";
}

void write_json_report(std::ostream& os,
                       const std::vector<SuiteOutcome>& suites,
                       const Diagnostics& diag,
                       const std::string& version) {
  nlohmann::json j;
  j["version"] = version;
  j["success"] = overall_success(suites);

  j["suites"] = nlohmann::json::array();
  for (const auto& s : suites) {
    nlohmann::json js;
    js["name"] = s.name;
    js["status"] = to_string(s.status);
    js["result"] = s.has_result ? nlohmann::json(s.result_summary) : nlohmann::json(nullptr);
    js["passed"] = s.total >= 0 ? nlohmann::json(s.passed) : nlohmann::json(nullptr);
    js["total"] = s.total >= 0 ? nlohmann::json(s.total) : nlohmann::json(nullptr);

    js["tests"] = nlohmann::json::object();
    for (const auto& kv : s.individual_tests) {
      js["tests"][kv.first] = to_string(kv.second);
    }
    js["log_count"] = s.logs.size();
    j["suites"].push_back(std::move(js));
  }

  static const DiagnosticKind kKinds[] = {
      DiagnosticKind::SourceNotFound, DiagnosticKind::RecordParseError,
      DiagnosticKind::StructuralAnomaly, DiagnosticKind::SinkWriteError};
  j["diagnostics"] = nlohmann::json::object();
  for (DiagnosticKind k : kKinds) {
    j["diagnostics"][to_string(k)] = diag.count(k);
  }

  os << j.dump(2) << "\n";
}

} // namespace testlog
