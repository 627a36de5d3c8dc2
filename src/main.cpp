#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "testlog/app.hpp"
#include "testlog/options.hpp"

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  testlog::Options opt;
  std::string err;
  if (!testlog::parse_options(args, std::getenv("GITHUB_OUTPUT"), opt, &err)) {
    std::cerr << "Error: " << err << "\n";
    testlog::print_usage(std::cerr);
    return 1;
  }

  if (opt.help) {
    testlog::print_usage(std::cout);
    return 0;
  }
  if (opt.version) {
    std::cout << "testlog v" << testlog::kVersion << "\n";
    return 0;
  }

  return testlog::run(opt, std::cout, std::cerr);
}
