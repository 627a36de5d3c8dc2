#include "testlog/options.hpp"

namespace testlog {

void print_usage(std::ostream& os) {
  os << "Usage:\n"
     << "  testlog analyze [--file <path>] [--out <path>] [--format text|json] [--report <path>] [--quiet]\n"
     << "  testlog --help\n"
     << "  testlog --version\n"
     << "\n"
     << "Options:\n"
     << "  --file <path>           Input JSON-lines console log (default post_data.log).\n"
     << "  --out <path>            CI output file (default $GITHUB_OUTPUT).\n"
     << "  --format text|json      Report format (default text).\n"
     << "  --report <path>         Write the report to a file instead of stdout.\n"
     << "  --quiet                 Do not print warnings.\n"
     << "  --help                  Print this help.\n"
     << "  --version               Print version.\n"
     << "\n"
     << "Exit status is 0 when every suite passed, 1 otherwise.\n"
     << "\n"
     << "Examples:\n"
     << "  testlog analyze --file post_data.log\n"
     << "  testlog analyze --file post_data.log --format json --report results.json\n";
}

bool parse_options(const std::vector<std::string>& args,
                   const char* github_output,
                   Options& out,
                   std::string* error_out) {
  out = Options{};
  if (github_output) out.out_path = github_output;

  // Global flags
  for (const auto& a : args) {
    if (a == "--help" || a == "-h") {
      out.help = true;
      return true;
    }
    if (a == "--version") {
      out.version = true;
      return true;
    }
  }

  // Must have a command
  if (args.empty() || args[0] != "analyze") {
    if (error_out) *error_out = args.empty() ? "Missing command." : "Unknown command: " + args[0];
    return false;
  }

  for (size_t i = 1; i < args.size(); ++i) {
    const std::string& a = args[i];
    const bool has_value = i + 1 < args.size();

    if (a == "--file" && has_value) {
      out.file_path = args[++i];
      continue;
    }

    if (a == "--out" && has_value) {
      out.out_path = args[++i];
      continue;
    }

    if (a == "--format" && has_value) {
      out.format = args[++i];
      if (out.format != "text" && out.format != "json") {
        if (error_out) *error_out = "Invalid --format. Use: text or json";
        return false;
      }
      continue;
    }

    if (a == "--report" && has_value) {
      out.report_path = args[++i];
      continue;
    }

    if (a == "--quiet") {
      out.quiet = true;
      continue;
    }

    if (error_out) *error_out = "Unknown argument: " + a;
    return false;
  }

  if (out.file_path.empty()) {
    if (error_out) *error_out = "Missing --file <path>";
    return false;
  }

  return true;
}

} // namespace testlog
