#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Reads the daemon's JSON settings file (comments allowed).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace cuebridge::core {

  /**
 * @class ConfigLoader
 * @brief Lowest layer of the bridge configuration.
 *
 *  The parsed document is fed to ServerConfig::fromJson; cuebridged then
 *  overlays CUEBRIDGE_HOST / CUEBRIDGE_TCP_PORT / CUEBRIDGE_UDP_PORT and
 *  finally its command-line options, and validates the merged result.
 *  Nothing here knows the schema; unknown keys pass through untouched.
 */
  class ConfigLoader {
  public:
    explicit ConfigLoader(std::string configPath);

    /// @returns the top-level object; re-reads the file on every call.
    /// @throws std::runtime_error if it is unreadable, not JSON, or not an object.
    nlohmann::json load() const;

    const std::string& path() const noexcept { return path_; }

  private:
    std::string path_;
  };

} // namespace cuebridge::core
