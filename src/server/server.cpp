#include <bookland/server/server.hpp>
#include <bookland/server/handlers.hpp>
#include <bookland/server/log_tracer.hpp>
#include <bookland/server/metrics.hpp>
#include <bookland/shutdown.hpp>
#include <bookland/version.hpp>

#include <drogon/drogon.h>

#include <thread>

namespace bookland::server {

namespace {

trantor::Logger::LogLevel ParseLogLevel(const std::string& level) {
  if (level == "debug") return trantor::Logger::kDebug;
  if (level == "warn") return trantor::Logger::kWarn;
  if (level == "error") return trantor::Logger::kError;
  return trantor::Logger::kInfo;
}

}  // namespace

Server::Server(const Config& config) : config_(config) {
  config_.Validate();
  SetupLogging();

  if (!config_.catalog.path.empty()) {
    std::unique_ptr<UpcCatalog> catalog;
    auto status = UpcCatalog::Open(config_.catalog.path, &catalog, config_.catalog.options);
    if (!status.ok()) {
      throw std::runtime_error("Failed to open catalog at " + config_.catalog.path +
                               ": " + status.ToString());
    }
    catalog_ = std::move(catalog);
  }
}

Server::~Server() {
  if (running_) {
    Shutdown();
  }
  CloseCatalog();
}

void Server::SetupLogging() {
  trantor::Logger::setLogLevel(ParseLogLevel(config_.server.log_level));
}

void Server::SetupRoutes() {
  std::shared_ptr<PrometheusMetrics> metrics;
  if (config_.metrics.enabled) {
    metrics = std::make_shared<PrometheusMetrics>();
  }

  // Dispatcher spans only reach the log at debug level
  std::shared_ptr<Tracer> tracer;
  if (config_.server.log_level == "debug") {
    tracer = std::make_shared<LogTracer>();
  }

  RegisterHandlers(catalog_, metrics, tracer);

  if (metrics) {
    RegisterMetricsHandler(metrics, catalog_.get(), config_.metrics.path);
  }
}

// The signal path only stops the event loops. The catalog is closed by
// Run() once app().run() has returned and no handler can still reach it.
void Server::SetupShutdown() {
  if (!GlobalShutdownHandler().InstallSignalHandlers()) {
    LOG_WARN << "Failed to install signal handlers; graceful shutdown disabled";
  }

  GlobalShutdownHandler().OnShutdown([]() {
    LOG_INFO << "Shutting down HTTP server...";
    drogon::app().quit();
  });
}

void Server::Run() {
  running_ = true;

  auto& app = drogon::app();
  app.addListener(config_.server.host, config_.server.port);

  uint32_t threads = config_.server.threads;
  if (threads == 0) {
    threads = std::thread::hardware_concurrency();
    if (threads == 0) threads = 4;  // Fallback
  }
  app.setThreadNum(threads);

  app.setMaxConnectionNum(10000);
  app.setMaxConnectionNumPerIP(100);
  app.setIdleConnectionTimeout(60);
  app.setKeepaliveRequestsNumber(100);
  app.disableSession();

  SetupRoutes();
  SetupShutdown();

  LOG_INFO << "Bookland server " << Version() << " starting on " << config_.server.host
           << ":" << config_.server.port << " with " << threads << " threads";
  if (catalog_) {
    LOG_INFO << "UPC catalog: " << config_.catalog.path;
  } else {
    LOG_INFO << "No UPC catalog configured; 17-digit scans are unsupported";
  }

  // Blocks until quit()
  app.run();

  running_ = false;
  CloseCatalog();
  LOG_INFO << "Server stopped.";
}

void Server::CloseCatalog() {
  if (catalog_ && catalog_->IsOpen()) {
    catalog_->Close();
    LOG_INFO << "UPC catalog closed";
  }
}

void Server::Shutdown() {
  if (running_) {
    GlobalShutdownHandler().Shutdown();
  }
}

}  // namespace bookland::server
