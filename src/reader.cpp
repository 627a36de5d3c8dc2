#include "testlog/reader.hpp"

#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "text.hpp"

namespace testlog {

using nlohmann::json;

static std::string short_line_preview(const std::string& line) {
  const size_t max_len = 160;
  if (line.size() <= max_len) return line;
  return line.substr(0, max_len) + "...";
}

// Playwright reports console locations as {url, lineNumber, columnNumber}
static std::string location_to_string(const json& loc) {
  if (loc.is_string()) return loc.get<std::string>();
  if (loc.is_object()) {
    auto url = loc.find("url");
    if (url != loc.end() && url->is_string()) {
      std::string out = url->get<std::string>();
      auto line = loc.find("lineNumber");
      auto col = loc.find("columnNumber");
      if (line != loc.end() && line->is_number_integer()) {
        out += ":" + std::to_string(line->get<std::int64_t>());
        if (col != loc.end() && col->is_number_integer()) {
          out += ":" + std::to_string(col->get<std::int64_t>());
        }
      }
      return out;
    }
  }
  if (loc.is_null()) return std::string();
  return loc.dump();
}

bool parse_record_line(const std::string& line, LogRecord& out, std::string* error_out) {
  json j = json::parse(line, nullptr, /*allow_exceptions=*/false);

  if (j.is_discarded()) {
    if (error_out) *error_out = "Not valid JSON.";
    return false;
  }
  if (!j.is_object()) {
    if (error_out) *error_out = "Expected a JSON object.";
    return false;
  }

  auto text = j.find("text");
  if (text == j.end() || !text->is_string()) {
    if (error_out) *error_out = "Missing string field \"text\".";
    return false;
  }

  LogRecord r;
  r.text = text->get<std::string>();

  auto type = j.find("type");
  if (type != j.end()) {
    if (type->is_string()) r.kind = type->get<std::string>();
    else if (!type->is_null()) r.kind = type->dump();
  }

  auto loc = j.find("location");
  if (loc != j.end()) r.location = location_to_string(*loc);

  out = std::move(r);
  return true;
}

std::int64_t read_records(std::istream& in,
                          const std::function<void(const LogRecord&)>& on_record,
                          Diagnostics* diag) {
  std::string line;
  std::string err;
  std::int64_t line_no = 0;
  std::int64_t delivered = 0;

  while (std::getline(in, line)) {
    ++line_no;

    // drop a UTF-8 byte order mark
    if (line_no == 1 && line.size() >= 3 &&
        line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
      line.erase(0, 3);
    }

    trim_inplace(line);
    if (line.empty()) continue;

    LogRecord r;
    if (!parse_record_line(line, r, &err)) {
      if (diag) {
        diag->add(DiagnosticKind::RecordParseError,
                  "Skipping line " + std::to_string(line_no) + ": " + err +
                      " Line: " + short_line_preview(line));
      }
      continue;
    }

    on_record(r);
    ++delivered;
  }

  return delivered;
}

bool read_records_file(const std::string& path,
                       const std::function<void(const LogRecord&)>& on_record,
                       Diagnostics* diag,
                       std::string* error_out) {
  std::ifstream in(path);
  if (!in) {
    const std::string msg = "Failed to open input file: " + path;
    if (diag) diag->add(DiagnosticKind::SourceNotFound, msg);
    if (error_out) *error_out = msg;
    return false;
  }

  read_records(in, on_record, diag);
  return true;
}

} // namespace testlog
