/* @file ConfigLoader.cpp
 * @brief JSON config file reading and ServerConfig validation
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <stdexcept>
#include <string>

// 3rd-party headers
#include <nlohmann/json.hpp>

// cuebridge headers
#include "core/ConfigLoader.hpp"
#include "core/Logger.hpp"
#include "core/ServerConfig.hpp"

namespace cuebridge::core {

  ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

  nlohmann::json ConfigLoader::load() const {
    std::ifstream in(path_);
    if (!in)
      throw std::runtime_error("[ConfigLoader] cannot open config file: " + path_);

    try {
      auto doc = nlohmann::json::parse(in, nullptr, true, /*ignore_comments=*/true);
      if (!doc.is_object())
        throw std::runtime_error("[ConfigLoader] top level of " + path_ + " must be an object");
      return doc;
    } catch (const nlohmann::json::parse_error& e) {
      throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
    }
  }

  namespace {
    std::uint16_t readPort(const nlohmann::json& doc, const char* key, std::uint16_t fallback) {
      auto it = doc.find(key);
      if (it == doc.end())
        return fallback;
      if (!it->is_number_integer())
        throw std::invalid_argument(std::string("config: '") + key + "' must be an integer");
      const auto value = it->get<std::int64_t>();
      if (value < 0 || value > 65535)
        throw std::invalid_argument(std::string("config: '") + key + "' out of range 0-65535");
      return static_cast<std::uint16_t>(value);
    }

    std::chrono::milliseconds readMillis(const nlohmann::json& doc, const char* key,
                                         std::chrono::milliseconds fallback) {
      auto it = doc.find(key);
      if (it == doc.end())
        return fallback;
      if (!it->is_number_integer())
        throw std::invalid_argument(std::string("config: '") + key + "' must be an integer");
      return std::chrono::milliseconds{ it->get<std::int64_t>() };
    }

    std::size_t readSize(const nlohmann::json& doc, const char* key, std::size_t fallback) {
      auto it = doc.find(key);
      if (it == doc.end())
        return fallback;
      if (!it->is_number_unsigned())
        throw std::invalid_argument(std::string("config: '") + key +
                                    "' must be a non-negative integer");
      return it->get<std::size_t>();
    }

    std::string readString(const nlohmann::json& doc, const char* key, std::string fallback) {
      auto it = doc.find(key);
      if (it == doc.end())
        return fallback;
      if (!it->is_string())
        throw std::invalid_argument(std::string("config: '") + key + "' must be a string");
      return it->get<std::string>();
    }
  } // namespace

  ServerConfig ServerConfig::fromJson(const nlohmann::json& doc) {
    if (!doc.is_object())
      throw std::invalid_argument("config: expected a JSON object");

    ServerConfig cfg;
    cfg.host = readString(doc, "host", cfg.host);
    cfg.tcpPort = readPort(doc, "tcp_port", cfg.tcpPort);
    const std::uint16_t udpDefault =
        cfg.tcpPort == 0 ? 0 : static_cast<std::uint16_t>(cfg.tcpPort + 1);
    cfg.udpPort = readPort(doc, "udp_port", udpDefault);
    cfg.requestTimeout = readMillis(doc, "request_timeout_ms", cfg.requestTimeout);
    cfg.shutdownGrace = readMillis(doc, "shutdown_grace_ms", cfg.shutdownGrace);
    cfg.pollInterval = readMillis(doc, "poll_interval_ms", cfg.pollInterval);
    cfg.maxMessageBytes = readSize(doc, "max_message_bytes", cfg.maxMessageBytes);
    cfg.maxDatagramBytes = readSize(doc, "max_datagram_bytes", cfg.maxDatagramBytes);
    cfg.logLevel = readString(doc, "log_level", cfg.logLevel);
    cfg.logFile = readString(doc, "log_file", cfg.logFile);
    cfg.hostLatency = readMillis(doc, "host_latency_ms", cfg.hostLatency);
    cfg.validate();
    return cfg;
  }

  namespace {
    void checkDuration(std::chrono::milliseconds value, const char* key, bool allowZero) {
      if (value.count() < 0 || (!allowZero && value.count() == 0))
        throw std::invalid_argument(std::string("config: '") + key + "' must be " +
                                    (allowZero ? "non-negative" : "positive"));
      if (value > ServerConfig::kMaxDuration)
        throw std::invalid_argument(std::string("config: '") + key + "' must not exceed " +
                                    std::to_string(ServerConfig::kMaxDuration.count()) + " ms");
    }
  } // namespace

  void ServerConfig::validate() const {
    if (host.empty())
      throw std::invalid_argument("config: 'host' must not be empty");
    if (tcpPort != 0 && tcpPort == udpPort)
      throw std::invalid_argument("config: tcp_port and udp_port must differ");
    checkDuration(requestTimeout, "request_timeout_ms", false);
    checkDuration(shutdownGrace, "shutdown_grace_ms", true);
    checkDuration(pollInterval, "poll_interval_ms", false);
    checkDuration(hostLatency, "host_latency_ms", true);
    if (maxMessageBytes < 2)
      throw std::invalid_argument("config: 'max_message_bytes' too small");
    if (maxDatagramBytes < 2 || maxDatagramBytes > 65507)
      throw std::invalid_argument("config: 'max_datagram_bytes' must be within 2-65507");
    if (!logLevelFromString(logLevel))
      throw std::invalid_argument("config: unknown log_level '" + logLevel + "'");
  }

} // namespace cuebridge::core
