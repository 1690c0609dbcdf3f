#define DEEPRESEARCH_LOG_COMPONENT "main"

#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include "deepresearch/config/server_config.h"
#include "deepresearch/event/libevent_dispatcher.h"
#include "deepresearch/logging/log_macros.h"
#include "deepresearch/server/research_server.h"
#include "deepresearch/transport/stdio_transport.h"

using namespace deepresearch;

namespace {

struct CommandLine {
  std::string config_path;
  optional<logging::LogLevel> log_level;
  optional<logging::LogFormat> log_format;
  bool help = false;
};

void printUsage(const char* program) {
  std::cerr << "USAGE: " << program << " [options]\n\n";
  std::cerr << "Serves the deep research prompt and resources over stdio.\n\n";
  std::cerr << "OPTIONS:\n";
  std::cerr << "  --config <file>      JSON configuration file\n";
  std::cerr << "  --log-level <level>  debug, info, notice, warning, error, "
               "critical or off\n";
  std::cerr << "  --log-format <fmt>   text or json\n";
  std::cerr << "  --help               Show this help message\n";
}

// Returns false on a malformed command line
bool parseArguments(int argc, char* argv[], CommandLine& options) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      options.help = true;
    } else if (arg == "--config" && i + 1 < argc) {
      options.config_path = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      std::string value = argv[++i];
      options.log_level = logging::parseLogLevel(value);
      if (!options.log_level.has_value()) {
        std::cerr << "[ERROR] Unknown log level: " << value << std::endl;
        return false;
      }
    } else if (arg == "--log-format" && i + 1 < argc) {
      std::string value = argv[++i];
      options.log_format = logging::parseLogFormat(value);
      if (!options.log_format.has_value()) {
        std::cerr << "[ERROR] Unknown log format: " << value << std::endl;
        return false;
      }
    } else {
      std::cerr << "[ERROR] Unknown option: " << arg << std::endl;
      return false;
    }
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  CommandLine options;
  if (!parseArguments(argc, argv, options)) {
    printUsage(argv[0]);
    return 1;
  }
  if (options.help) {
    printUsage(argv[0]);
    return 0;
  }

  config::ServerConfig config;
  try {
    if (!options.config_path.empty()) {
      config = config::ServerConfig::loadFromFile(options.config_path);
    }
    if (options.log_level.has_value()) {
      config.log_level = options.log_level.value();
    }
    if (options.log_format.has_value()) {
      config.log_format = options.log_format.value();
    }
    config.validate();
  } catch (const config::ConfigParseError& e) {
    LOG_ERROR("{}", e.what());
    return 1;
  } catch (const config::ConfigValidationError& e) {
    LOG_ERROR("{}", e.what());
    return 1;
  }

  if (config.log_format != logging::LogFormat::Text) {
    logging::LoggerRegistry::instance().setDefaultFormat(config.log_format);
  }
  logging::LoggerRegistry::instance().setGlobalLevel(config.log_level);

  // A client that goes away mid-write must surface as EPIPE, not a signal
  std::signal(SIGPIPE, SIG_IGN);

  try {
    event::LibeventDispatcher dispatcher("main");
    server::ResearchServer server(
        config, dispatcher,
        std::make_unique<transport::StdioTransport>(dispatcher));

    auto sigint = dispatcher.listenForSignal(SIGINT, [&server]() {
      DEEPRESEARCH_LOG(Info, "Received SIGINT");
      server.shutdown();
    });
    auto sigterm = dispatcher.listenForSignal(SIGTERM, [&server]() {
      DEEPRESEARCH_LOG(Info, "Received SIGTERM");
      server.shutdown();
    });

    if (!server.run()) {
      return 1;
    }
  } catch (const std::exception& e) {
    DEEPRESEARCH_LOG(Critical, "Fatal: {}", e.what());
    return 1;
  }

  return 0;
}
