#include "text.hpp"

#include <cctype>

namespace testlog {

void trim_inplace(std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  s = s.substr(start, end - start);
}

} // namespace testlog
