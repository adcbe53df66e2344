#include <iostream>
#include "cli/cli.hpp"

int main(int argc, char* argv[]) {
  const auto options = rcopy::cli::parse_command_line(argc, argv);
  if (!options.valid) {
    std::cerr << "Error: " << options.error << '\n';
    rcopy::cli::print_usage(std::cerr, argc > 0 ? argv[0] : "rcopy");
    return 1;
  } else if (options.help) {
    rcopy::cli::print_usage(std::cout, argc > 0 ? argv[0] : "rcopy");
    return 0;
  }
  return rcopy::cli::run(options);
}
