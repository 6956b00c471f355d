#include "config/server_config.hpp"
#include <charconv>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <unordered_map>

namespace cfs {
namespace config {

namespace {

enum class Flag {
  HOST,
  PORT,
  DATA_DIR,
  BASE_URI,
  MAX_RANGE,
  THREADS,
  TIMEOUT,
  LOG_FILE,
  LOG_LEVEL,
  NO_CLASSIFY,
  HELP
};

const std::unordered_map<std::string, Flag>& flag_map() {
  static const std::unordered_map<std::string, Flag> flags = {
    {"-h", Flag::HOST},
    {"--host", Flag::HOST},
    {"-p", Flag::PORT},
    {"--port", Flag::PORT},
    {"-d", Flag::DATA_DIR},
    {"--data-dir", Flag::DATA_DIR},
    {"-u", Flag::BASE_URI},
    {"--base-uri", Flag::BASE_URI},
    {"-r", Flag::MAX_RANGE},
    {"--max-range", Flag::MAX_RANGE},
    {"-t", Flag::THREADS},
    {"--threads", Flag::THREADS},
    {"-i", Flag::TIMEOUT},
    {"--io-timeout", Flag::TIMEOUT},
    {"-l", Flag::LOG_FILE},
    {"--log-file", Flag::LOG_FILE},
    {"-v", Flag::LOG_LEVEL},
    {"--log-level", Flag::LOG_LEVEL},
    {"--no-classify", Flag::NO_CLASSIFY},
    {"--help", Flag::HELP}
  };
  return flags;
}

template <typename T>
bool parse_number(const std::string& text, T& out) {
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  return !text.empty() && ec == std::errc() && end == text.data() + text.size();
}

bool parse_port(const std::string& text, uint16_t& port) {
  unsigned long value = 0;
  if (!parse_number(text, value) || value > std::numeric_limits<uint16_t>::max()) {
    return false;
  }
  port = static_cast<uint16_t>(value);
  return true;
}

ProgramOptions invalid(ProgramOptions options, const std::string& message) {
  options.valid = false;
  options.error = message;
  return options;
}

} // namespace

ProgramOptions parse_command_line(int argc, const char* const argv[]) {
  ProgramOptions options;
  ServerConfig& config = options.config;

  if (const char* port = std::getenv("APPSERVER_PORT")) {
    if (!parse_port(port, config.port)) {
      return invalid(options, std::string("Invalid APPSERVER_PORT: ") + port);
    }
  }
  bool base_uri_set = false;
  if (const char* base_uri = std::getenv("APPSERVER_BASEURI")) {
    config.base_uri = base_uri;
    base_uri_set = true;
  }

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);
    auto found = flag_map().find(flag);
    if (found == flag_map().end()) {
      return invalid(options, "Unknown argument: " + flag);
    }

    if (found->second == Flag::NO_CLASSIFY) {
      config.classify = false;
      continue;
    }
    if (found->second == Flag::HELP) {
      options.help = true;
      continue;
    }

    if (i + 1 >= argc) {
      return invalid(options, "Missing value for " + flag);
    }
    const std::string value(argv[++i]);

    switch (found->second) {
      case Flag::HOST:
        config.host = value;
        break;
      case Flag::PORT:
        if (!parse_port(value, config.port)) {
          return invalid(options, "Invalid port number: " + value);
        }
        break;
      case Flag::DATA_DIR:
        config.data_dir = value;
        break;
      case Flag::BASE_URI:
        config.base_uri = value;
        base_uri_set = true;
        break;
      case Flag::MAX_RANGE:
        if (!parse_number(value, config.max_range_bytes) || config.max_range_bytes == 0) {
          return invalid(options, "Invalid maximum range size: " + value);
        }
        break;
      case Flag::THREADS:
        if (!parse_number(value, config.worker_threads) || config.worker_threads == 0) {
          return invalid(options, "Invalid thread count: " + value);
        }
        break;
      case Flag::TIMEOUT:
        if (!parse_number(value, config.io_timeout_seconds) || config.io_timeout_seconds == 0) {
          return invalid(options, "Invalid I/O timeout: " + value);
        }
        break;
      case Flag::LOG_FILE:
        config.log_file = value;
        break;
      case Flag::LOG_LEVEL:
        config.log_level = value;
        break;
      default:
        break;
    }
  }

  if (config.host.empty() || config.data_dir.empty()) {
    return invalid(options, "Host and data directory must not be empty");
  }
  if (!base_uri_set) {
    config.base_uri = "http://localhost:" + std::to_string(config.port);
  }

  options.valid = true;
  return options;
}

std::string usage(const std::string& program_name) {
  std::ostringstream out;
  out << "Usage: " << program_name << " [options]\n"
      << "Options:\n"
      << "  -h, --host       Listen address (default 0.0.0.0)\n"
      << "  -p, --port       Port number (default $APPSERVER_PORT or " << DEFAULT_PORT << ")\n"
      << "  -d, --data-dir   Storage directory (default ./data)\n"
      << "  -u, --base-uri   Public base URI (default $APPSERVER_BASEURI or http://localhost:<port>)\n"
      << "  -r, --max-range  Largest range response in bytes (default " << DEFAULT_MAX_RANGE_BYTES << ")\n"
      << "  -t, --threads    Worker threads (default " << DEFAULT_WORKER_THREADS << ")\n"
      << "  -i, --io-timeout Seconds a read or write may stall (default " << DEFAULT_IO_TIMEOUT_SECONDS << ")\n"
      << "  -l, --log-file   Also log to this file\n"
      << "  -v, --log-level  trace|debug|info|warning|error|fatal (default info)\n"
      << "  --no-classify    Keep declared content types at finalization\n"
      << "Example: " << program_name << " -h 127.0.0.1 -p 3000 -d /var/lib/cfs\n";
  return out.str();
}

} // namespace config
} // namespace cfs
