#ifndef CFS_CONFIG_SERVER_CONFIG_HPP
#define CFS_CONFIG_SERVER_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace cfs {
namespace config {

inline constexpr uint16_t DEFAULT_PORT = 3000;
// Keeps a single range response cheap for the server
inline constexpr uint64_t DEFAULT_MAX_RANGE_BYTES = 1024 * 1024;
inline constexpr std::size_t DEFAULT_WORKER_THREADS = 16;
inline constexpr uint64_t DEFAULT_IO_TIMEOUT_SECONDS = 30;

struct ServerConfig {
  std::string host = "0.0.0.0";
  uint16_t port = DEFAULT_PORT;
  std::string data_dir = "data";
  // Prefix of the `uri` field in entry projections
  std::string base_uri;
  uint64_t max_range_bytes = DEFAULT_MAX_RANGE_BYTES;
  std::size_t worker_threads = DEFAULT_WORKER_THREADS;
  // Longest a single read or write may stall, idle keep-alive waits included
  uint64_t io_timeout_seconds = DEFAULT_IO_TIMEOUT_SECONDS;
  std::string log_file;
  std::string log_level = "info";
  bool classify = true;
};

struct ProgramOptions {
  ServerConfig config;
  bool valid{false};
  bool help{false};
  std::string error;
};

// Defaults come from APPSERVER_PORT and APPSERVER_BASEURI, flags override them
ProgramOptions parse_command_line(int argc, const char* const argv[]);

std::string usage(const std::string& program_name);

} // namespace config
} // namespace cfs

#endif // CFS_CONFIG_SERVER_CONFIG_HPP
