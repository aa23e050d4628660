#pragma once

#include <bookland/catalog.hpp>
#include <bookland/server/config.hpp>

#include <memory>
#include <string>

namespace bookland::server {

/**
 * Bookland HTTP Server.
 *
 * Exposes the ISBN dispatcher over a REST API using Drogon. When a catalog
 * path is configured, a UpcCatalog is opened and used both to resolve
 * 17-character UPC scans and to serve the catalog administration routes.
 */
class Server {
 public:
  /**
   * Create a server with the given configuration.
   * @throws std::runtime_error if the configuration is invalid or the
   *         catalog cannot be opened.
   */
  explicit Server(const Config& config);

  ~Server();

  // Non-copyable, non-movable
  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  /**
   * Start the server (blocking).
   * Returns when the server shuts down.
   */
  void Run();

  /**
   * Request shutdown (async).
   * Stops the Drogon event loop; Run() closes the catalog before returning.
   */
  void Shutdown();

  /** Null when no catalog path is configured. */
  UpcCatalog* GetCatalog() { return catalog_.get(); }

 private:
  void SetupLogging();
  void SetupRoutes();
  void SetupShutdown();
  void CloseCatalog();

  Config config_;
  std::shared_ptr<UpcCatalog> catalog_;
  bool running_ = false;
};

}  // namespace bookland::server
