#pragma once

#include <cstdint>
#include <functional>
#include <istream>
#include <string>

#include "testlog/diagnostics.hpp"
#include "testlog/types.hpp"

namespace testlog {

// Parses one JSON line into a record. Returns false (and sets error_out)
// when the line is not an object with a string "text" field.
bool parse_record_line(const std::string& line, LogRecord& out, std::string* error_out = nullptr);

// Reads JSON-lines records in input order. Malformed lines are dropped and
// reported as RecordParseError; blank lines are skipped silently.
// Returns the number of records delivered.
std::int64_t read_records(std::istream& in,
                          const std::function<void(const LogRecord&)>& on_record,
                          Diagnostics* diag = nullptr);

// Same as read_records() on a file. A missing or unreadable file is reported
// as SourceNotFound and yields no records (returns false).
bool read_records_file(const std::string& path,
                       const std::function<void(const LogRecord&)>& on_record,
                       Diagnostics* diag = nullptr,
                       std::string* error_out = nullptr);

} // namespace testlog
