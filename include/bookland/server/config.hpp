#pragma once

#include <bookland/catalog.hpp>

#include <cstdint>
#include <string>

namespace bookland::server {

/**
 * Listener and worker configuration.
 */
struct ServerConfig {
  std::string host = "0.0.0.0";
  uint16_t port = 8080;
  uint32_t threads = 0;  // 0 = auto-detect CPU cores
  std::string log_level = "info";
};

/**
 * UPC catalog configuration. An empty path runs the server without a
 * catalog: 17-character codes are then unsupported.
 */
struct CatalogConfig {
  std::string path;
  CatalogOptions options;
};

/**
 * Metrics configuration.
 */
struct MetricsConfig {
  bool enabled = true;
  std::string path = "/metrics";
};

/**
 * Complete server configuration.
 */
struct Config {
  ServerConfig server;
  CatalogConfig catalog;
  MetricsConfig metrics;

  /**
   * Load configuration from a YAML-like file.
   * @throws std::runtime_error if file cannot be read or a value is malformed.
   */
  static Config LoadFromFile(const std::string& path);

  /**
   * Parse configuration from command-line arguments. When --config is given
   * the file is loaded first and flags override it.
   * @throws std::runtime_error on invalid arguments.
   */
  static Config LoadFromArgs(int argc, char** argv);

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;
};

}  // namespace bookland::server
