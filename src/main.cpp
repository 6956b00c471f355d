#include "config/server_config.hpp"
#include "logger/logger.hpp"
#include "store/store.hpp"
#include "upload/chunk_appender.hpp"
#include "upload/content_classifier.hpp"
#include "upload/keyed_mutex.hpp"
#include "range/range_reader.hpp"
#include "http/api_handler.hpp"
#include "http/http_server.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/log/trivial.hpp>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

namespace {

bool run_server(const cfs::config::ServerConfig& config) {
  try {
    cfs::store::Store store(config.data_dir);
    cfs::upload::KeyedMutex locks;
    std::shared_ptr<cfs::upload::ContentClassifier> classifier;
    if (config.classify) {
      classifier = std::make_shared<cfs::upload::FileCommandClassifier>();
    }
    cfs::upload::ChunkAppender appender(store, locks, classifier);
    cfs::range::RangeReader reader(store, config.max_range_bytes);
    cfs::http::ApiHandler handler(store, appender, reader, config.base_uri);

    cfs::http::HttpServer server(config.port, config.host, handler, config.worker_threads,
                                 std::chrono::seconds(config.io_timeout_seconds));
    if (!server.start_listener()) {
      std::cerr << "Error: Failed to start server on " << config.host << ":" << config.port << '\n';
      return false;
    }

    // Block until SIGINT or SIGTERM
    boost::asio::io_context signals_context;
    boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
      if (!ec) {
        BOOST_LOG_TRIVIAL(info) << "Main: Received signal " << signal_number << ", shutting down";
      }
    });
    signals_context.run();

    server.shutdown();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to run server: " << e.what() << '\n';
    return false;
  }
}

} // namespace

int main(int argc, char* argv[]) {
  const auto options = cfs::config::parse_command_line(argc, argv);
  if (options.help) {
    std::cout << cfs::config::usage(argv[0]);
    return 0;
  }
  if (!options.valid) {
    std::cerr << "Error: " << options.error << '\n' << cfs::config::usage(argv[0]);
    return 1;
  }

  try {
    cfs::logging::Logger::init(options.config.log_file,
                               cfs::logging::Logger::parse_level(options.config.log_level));
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n' << cfs::config::usage(argv[0]);
    return 1;
  }

  return run_server(options.config) ? 0 : 1;
}
