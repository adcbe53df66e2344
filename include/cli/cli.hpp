#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace rcopy {
namespace cli {

struct ProgramOptions {
  std::string host = "localhost";
  uint16_t port = 8022;

  bool server = false;
  bool quiet = false;
  bool debug = false;
  bool kill = false;
  bool help = false;

  // TLS
  bool tls = false;
  std::string cert_file;
  std::string key_file;

  std::string log_file;

  // <src> <dest>
  std::vector<std::string> paths;

  bool valid = false;
  std::string error;
};


// ---- PARSING ----
// Arguments exclude the program name
ProgramOptions parse_arguments(const std::vector<std::string>& arguments);
ProgramOptions parse_command_line(int argc, char* argv[]);
void print_usage(std::ostream& out, const std::string& program_name);


// ---- EXECUTION ----
// Runs the server, the kill request or the copy. Returns the process exit status.
int run(const ProgramOptions& options);

} // namespace cli
} // namespace rcopy
