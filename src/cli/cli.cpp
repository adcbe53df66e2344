#include "cli/cli.hpp"
#include <boost/log/trivial.hpp>
#include <iostream>
#include <stdexcept>
#include <unordered_map>
#include "client/file_transfer_client.hpp"
#include "logger/logger.hpp"
#include "server/file_transfer_server.hpp"

namespace rcopy {
namespace cli {

namespace {

ProgramOptions invalid(ProgramOptions options, const std::string& error) {
  options.valid = false;
  options.error = error;
  return options;
}

bool parse_port(const std::string& value, uint16_t& port) {
  std::size_t consumed = 0;
  long parsed;
  try {
    parsed = std::stol(value, &consumed);
  } catch (const std::exception&) {
    return false;
  }
  if (consumed != value.size() || parsed < 0 || parsed > 65535) {
    return false;
  }
  port = static_cast<uint16_t>(parsed);
  return true;
}

} // namespace

//==============================================
// PARSING
//==============================================

ProgramOptions parse_arguments(const std::vector<std::string>& arguments) {
  enum class Flag { HOST, PORT, CERT, KEY, LOG_FILE, SERVER, QUIET, DEBUG, KILL, TLS, HELP };
  const std::unordered_map<std::string, Flag> flag_map = {
    {"-h", Flag::HOST},
    {"--host", Flag::HOST},
    {"-p", Flag::PORT},
    {"--port", Flag::PORT},
    {"--cert", Flag::CERT},
    {"--key", Flag::KEY},
    {"--log-file", Flag::LOG_FILE},
    {"-s", Flag::SERVER},
    {"--server", Flag::SERVER},
    {"-q", Flag::QUIET},
    {"--quiet", Flag::QUIET},
    {"-d", Flag::DEBUG},
    {"--debug", Flag::DEBUG},
    {"-k", Flag::KILL},
    {"--kill", Flag::KILL},
    {"--tls", Flag::TLS},
    {"--help", Flag::HELP}
  };

  ProgramOptions options;

  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const std::string& argument = arguments[i];

    if (argument.size() < 2 || argument[0] != '-') {
      options.paths.push_back(argument);
      continue;
    }

    auto it = flag_map.find(argument);
    if (it == flag_map.end()) {
      return invalid(options, "unknown argument: " + argument);
    }

    const Flag flag = it->second;
    const bool takes_value = flag == Flag::HOST || flag == Flag::PORT || flag == Flag::CERT ||
                             flag == Flag::KEY || flag == Flag::LOG_FILE;
    std::string value;
    if (takes_value) {
      if (i + 1 >= arguments.size()) {
        return invalid(options, "missing value for " + argument);
      }
      value = arguments[++i];
    }

    switch (flag) {
      case Flag::HOST:     options.host = value; break;
      case Flag::PORT:
        if (!parse_port(value, options.port)) {
          return invalid(options, "invalid port number: " + value);
        }
        break;
      case Flag::CERT:     options.cert_file = value; break;
      case Flag::KEY:      options.key_file = value; break;
      case Flag::LOG_FILE: options.log_file = value; break;
      case Flag::SERVER:   options.server = true; break;
      case Flag::QUIET:    options.quiet = true; break;
      case Flag::DEBUG:    options.debug = true; break;
      case Flag::KILL:     options.kill = true; break;
      case Flag::TLS:      options.tls = true; break;
      case Flag::HELP:     options.help = true; break;
    }
  }

  if (options.help) {
    options.valid = true;
    return options;
  }
  if (options.server && options.kill) {
    return invalid(options, "--server and --kill are mutually exclusive");
  }
  if ((options.server || options.kill) && !options.paths.empty()) {
    return invalid(options, "unexpected path arguments");
  }
  if (!options.server && !options.kill && options.paths.size() != 2) {
    return invalid(options, "expected: rcopy <src> <dest> or rcopy --server");
  }
  if ((!options.cert_file.empty() || !options.key_file.empty()) && !options.tls) {
    return invalid(options, "--cert and --key require --tls");
  }

  options.valid = true;
  return options;
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  std::vector<std::string> arguments;
  for (int i = 1; i < argc; ++i) {
    arguments.emplace_back(argv[i]);
  }
  return parse_arguments(arguments);
}

void print_usage(std::ostream& out, const std::string& program_name) {
  out << "Usage: " << program_name << " [options] <src> <dest>\n"
      << "       " << program_name << " --server [options]\n"
      << "       " << program_name << " --kill [options]\n"
      << "A path of the form host:path is on the server; exactly one side must be remote.\n"
      << "Options:\n"
      << "  -h, --host <host>   Host name (default localhost)\n"
      << "  -p, --port <port>   Port number (default 8022)\n"
      << "  -s, --server        Run as server\n"
      << "  -k, --kill          Ask the server to shut down\n"
      << "  -q, --quiet         Only log warnings and errors\n"
      << "  -d, --debug         Enable debug logging\n"
      << "      --tls           Use TLS\n"
      << "      --cert <file>   Server certificate (PEM); self-signed if omitted\n"
      << "      --key <file>    Server private key (PEM)\n"
      << "      --log-file <f>  Also log to file\n"
      << "Example: " << program_name << " ./report.pdf localhost:/tmp/report.pdf\n";
}

//==============================================
// EXECUTION
//==============================================

int run(const ProgramOptions& options) {
  try {
    logging::LogConfig log_config = logging::config_for_flags(options.quiet, options.debug);
    log_config.log_file = options.log_file;
    logging::init_logging(log_config);

    if (options.server) {
      server::ServerOptions server_options;
      server_options.host = options.host;
      server_options.port = options.port;
      server_options.tls.enabled = options.tls;
      server_options.tls.cert_file = options.cert_file;
      server_options.tls.key_file = options.key_file;
      server::run_server(server_options);
      return 0;
    }

    client::ClientOptions client_options;
    client_options.host = options.host;
    client_options.port = options.port;
    client_options.tls = options.tls;
    client::FileTransferClient client(client_options);

    if (options.kill) {
      client.shutdown();
      return 0;
    }

    int64_t bytes = client.copy(options.paths[0], options.paths[1]);
    if (!options.quiet) {
      std::cout << options.paths[0] << " -> " << options.paths[1] << ": " << bytes << " bytes" << std::endl;
    }
    return 0;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(debug) << "CLI: Command failed: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
}

} // namespace cli
} // namespace rcopy
