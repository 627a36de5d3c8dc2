#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace testlog {

struct Options {
  bool help = false;
  bool version = false;

  std::string file_path = "post_data.log";
  std::string out_path;       // CI key/value sink; defaults to $GITHUB_OUTPUT
  std::string format = "text";
  std::string report_path;    // human report; stdout when empty
  bool quiet = false;
};

void print_usage(std::ostream& os);

// args excludes argv[0]. github_output may be nullptr (variable unset).
bool parse_options(const std::vector<std::string>& args,
                   const char* github_output,
                   Options& out,
                   std::string* error_out = nullptr);

} // namespace testlog
