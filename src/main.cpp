/* @file main.cpp
 * @brief cuebridged: command bridge daemon (TCP request/response + UDP fire-and-forget)
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

// Linux headers
#include <signal.h>

// 3rd-party headers
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

// cuebridge headers
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/ServerConfig.hpp"
#include "core/SystemCoordinator.hpp"
#include "host/SessionModel.hpp"
#include "io/FileLogger.hpp"

using namespace cuebridge;

namespace {

  volatile sig_atomic_t g_signalled = 0;

  void onSignal(int) { g_signalled = 1; }

  struct CliOptions {
    std::string configPath;
    std::optional<std::string> host;
    std::optional<std::uint16_t> tcpPort;
    std::optional<std::uint16_t> udpPort;
    std::optional<std::string> logLevel;
    std::optional<std::string> logFile;
  };

  std::optional<std::string> envString(const char* name) {
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0')
      return std::nullopt;
    return std::string(v);
  }

  std::optional<std::uint16_t> envPort(const char* name) {
    auto text = envString(name);
    if (!text)
      return std::nullopt;
    std::size_t used = 0;
    unsigned long value = 0;
    try {
      value = std::stoul(*text, &used);
    } catch (const std::logic_error&) {
      throw std::invalid_argument(std::string(name) + ": not a port number");
    }
    if (used != text->size() || value > 65535)
      throw std::invalid_argument(std::string(name) + ": not a port number");
    return static_cast<std::uint16_t>(value);
  }

  /// file < environment < command line
  core::ServerConfig buildConfig(const CliOptions& cli) {
    nlohmann::json doc = nlohmann::json::object();
    if (!cli.configPath.empty())
      doc = core::ConfigLoader(cli.configPath).load();
    auto cfg = core::ServerConfig::fromJson(doc);
    const bool udpExplicit = doc.contains("udp_port");

    auto host = cli.host ? cli.host : envString("CUEBRIDGE_HOST");
    auto tcp = cli.tcpPort ? cli.tcpPort : envPort("CUEBRIDGE_TCP_PORT");
    auto udp = cli.udpPort ? cli.udpPort : envPort("CUEBRIDGE_UDP_PORT");

    if (host)
      cfg.host = *host;
    if (tcp) {
      cfg.tcpPort = *tcp;
      if (!udpExplicit && !udp)
        cfg.udpPort = *tcp == 0 ? 0 : static_cast<std::uint16_t>(*tcp + 1);
    }
    if (udp)
      cfg.udpPort = *udp;
    if (cli.logLevel)
      cfg.logLevel = *cli.logLevel;
    if (cli.logFile)
      cfg.logFile = *cli.logFile;

    cfg.validate();
    return cfg;
  }

  void installSignalHandlers() {
    struct sigaction sa {};
    sa.sa_handler = onSignal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
  }

} // namespace

int main(int argc, char** argv) {
  CLI::App app{ "cuebridged - serialized command bridge for a non-reentrant music host" };
  CliOptions cli;

  app.add_option("-c,--config", cli.configPath, "JSON config file")->check(CLI::ExistingFile);
  app.add_option("--host", cli.host, "Bind address (default 127.0.0.1)");
  app.add_option("--tcp-port", cli.tcpPort, "Request/response port (default 9877, 0 = any)");
  app.add_option("--udp-port", cli.udpPort, "Fire-and-forget port (default tcp-port + 1)");
  app.add_option("-l,--log-level", cli.logLevel, "Log level: trace | debug | info | warn | error")
      ->check(CLI::IsMember({ "trace", "debug", "info", "warn", "error" }));
  app.add_option("--log-file", cli.logFile, "Append log lines here instead of stderr");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  core::ServerConfig config;
  try {
    config = buildConfig(cli);
  } catch (const std::exception& e) {
    std::cerr << "cuebridged: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  auto logger = std::make_shared<core::Logger>();
  logger->setLevel(*core::logLevelFromString(config.logLevel));
  std::unique_ptr<io::FileLogger> sink;
  if (!config.logFile.empty()) {
    sink = std::make_unique<io::FileLogger>();
    if (!sink->open(config.logFile)) {
      std::cerr << "cuebridged: cannot open log file " << config.logFile << '\n';
      return EXIT_FAILURE;
    }
  }
  logger->start(std::move(sink));

  auto errorMonitor = std::make_shared<core::ErrorMonitor>();
  int exitCode = EXIT_SUCCESS;
  {
    core::SystemCoordinator coordinator(
        config, std::make_unique<host::SessionModel>(config.hostLatency), logger, errorMonitor);
    try {
      coordinator.initialize();
      coordinator.start();
    } catch (const std::exception& e) {
      std::cerr << "cuebridged: " << e.what() << '\n';
      coordinator.shutdown();
      logger->stop();
      return EXIT_FAILURE;
    }

    installSignalHandlers();
    while (g_signalled == 0 && !coordinator.waitForShutdownRequest(config.pollInterval)) {
    }
    if (g_signalled != 0)
      logger->info("main", "signal received, shutting down");

    coordinator.shutdown();
    if (!coordinator.healthy())
      exitCode = EXIT_FAILURE;
  }
  logger->stop();
  return exitCode;
}
