#include "testlog/classifier.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

#include "text.hpp"

namespace testlog {

const char* const kSuiteStartMarker = "Starting test suite:";
const char* const kSuiteEndMarker = "Finished test suite:";
const char* const kExpectMarker = "Expect Test:";

static const char* const kIgnoreDirective = "(.gitignore)";

static bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static bool is_word_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

static bool to_int32(const std::string& s, std::int32_t& out) {
  if (s.empty()) return false;
  std::int64_t v = 0;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    v = v * 10 + (c - '0');
    if (v > std::numeric_limits<std::int32_t>::max()) return false;
  }
  out = static_cast<std::int32_t>(v);
  return true;
}

// Text after the first occurrence of marker, or false if absent
static bool after_marker(const std::string& text, const char* marker, std::string& rest) {
  const std::string m(marker);
  size_t pos = text.find(m);
  if (pos == std::string::npos) return false;
  rest = text.substr(pos + m.size());
  return true;
}

std::string strip_console_styling(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '%' && i + 1 < text.size() && text[i + 1] == 'c') {
      ++i;
      continue;
    }
    out.push_back(text[i]);
  }

  // "color: cyan  Name": drop from "color:" through the last double-space
  // on the same line
  size_t from = 0;
  for (;;) {
    size_t pos = out.find("color:", from);
    if (pos == std::string::npos) break;

    const size_t body = pos + 6;
    if (body >= out.size() || !is_space(out[body])) {
      from = body;
      continue;
    }

    // the double-space may start at most at the end of the current line
    size_t line_end = out.find('\n', body + 1);
    if (line_end == std::string::npos) line_end = out.size();

    size_t cut = std::string::npos;
    for (size_t k = std::min(line_end, out.size() - 1); k > body; --k) {
      if (k + 1 < out.size() && is_space(out[k]) && is_space(out[k + 1])) {
        cut = k + 2;
        break;
      }
    }
    if (cut == std::string::npos) {
      from = body;
      continue;
    }
    out.erase(pos, cut - pos);
    from = pos;
  }

  return out;
}

static bool parse_suite_end(const std::string& rest_raw, Marker& m) {
  std::string rest = rest_raw;
  trim_inplace(rest);
  std::string body = rest;
  if (!body.empty() && body.back() == '!') body.pop_back();
  if (body.empty() || body.back() != ')') return false;

  size_t open = body.rfind('(');
  if (open == std::string::npos) return false;

  const std::string counts = body.substr(open + 1, body.size() - open - 2);
  size_t slash = counts.find('/');
  if (slash == std::string::npos) return false;

  std::int32_t passed = 0;
  std::int32_t total = 0;
  if (!to_int32(counts.substr(0, slash), passed)) return false;
  if (!to_int32(counts.substr(slash + 1), total)) return false;

  // status word immediately before "(", optionally separated by spaces
  size_t word_end = open;
  while (word_end > 0 && is_space(body[word_end - 1])) --word_end;
  size_t word_begin = word_end;
  while (word_begin > 0 && is_word_char(body[word_begin - 1])) --word_begin;
  if (word_begin == word_end) return false;

  std::string name = body.substr(0, word_begin);
  trim_inplace(name);
  if (name.empty()) return false;

  m.kind = MarkerKind::SuiteEnd;
  m.name = name;
  m.status_word = body.substr(word_begin, word_end - word_begin);
  m.result_text = rest.substr(word_begin);
  m.passed = passed;
  m.total = total;
  return true;
}

static bool parse_expect(const std::string& rest_raw, Marker& m) {
  std::string rest = rest_raw;
  trim_inplace(rest);

  size_t sep = rest.size();
  while (sep > 0 && !is_space(rest[sep - 1])) --sep;
  if (sep == 0) return false;

  const std::string word = rest.substr(sep);
  TestStatus status;
  if (word == "Passed") status = TestStatus::Passed;
  else if (word == "Failed" || word == "Error") status = TestStatus::Failed;
  else return false;

  std::string name = rest.substr(0, sep);
  trim_inplace(name);
  if (name.empty()) return false;

  m.kind = MarkerKind::ExpectResult;
  m.name = name;
  m.test_status = status;
  return true;
}

Marker classify_text(const std::string& raw) {
  Marker m;
  if (raw.find(kIgnoreDirective) != std::string::npos) return m;

  const std::string text = strip_console_styling(raw);
  std::string rest;

  if (after_marker(text, kSuiteStartMarker, rest)) {
    std::string name = rest;
    trim_inplace(name);
    if (!name.empty()) {
      m.kind = MarkerKind::SuiteStart;
      m.name = name;
      return m;
    }
  }

  if (after_marker(text, kSuiteEndMarker, rest)) {
    Marker end;
    if (parse_suite_end(rest, end)) return end;
  }

  if (after_marker(text, kExpectMarker, rest)) {
    Marker expect;
    if (parse_expect(rest, expect)) return expect;
  }

  return m;
}

Marker classify(const LogRecord& r) {
  return classify_text(r.text);
}

} // namespace testlog
