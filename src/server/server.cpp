#include <textscrub/server/server.hpp>
#include <textscrub/server/handlers.hpp>
#include <textscrub/shutdown.hpp>

#include <drogon/drogon.h>

#include <iostream>
#include <thread>

namespace textscrub::server {

namespace {

trantor::Logger::LogLevel ToLogLevel(const std::string& level) {
  if (level == "debug") return trantor::Logger::kDebug;
  if (level == "warn") return trantor::Logger::kWarn;
  if (level == "error") return trantor::Logger::kError;
  return trantor::Logger::kInfo;
}

// JSON escaping can expand a text up to six times. Config::Validate caps
// max_text_bytes, so this cannot overflow.
size_t MaxBodyBytes(uint64_t max_text_bytes) {
  return static_cast<size_t>(max_text_bytes) * 6 + 64 * 1024;
}

}  // namespace

Server::Server(const Config& config) : config_(config) {
  config_.Validate();

  if (config_.metrics.enabled) {
    metrics_ = std::make_shared<PrometheusMetrics>();
  }
  service_ = std::make_shared<const CleanService>(config_, metrics_);
}

Server::~Server() {
  if (running_) {
    Shutdown();
  }
}

void Server::SetupRoutes() {
  RegisterHandlers(service_, config_, metrics_);

  if (metrics_) {
    metrics_->Gauge("textscrub_rules_loaded",
                    static_cast<double>(service_->normalizer().rules().size()));
    RegisterMetricsHandler(metrics_, config_.metrics.path);
  }

  drogon::app().setCustom404Page(MakeErrorResponse("not_found", "No such route", 404));
}

void Server::SetupShutdown() {
  auto& handler = GlobalShutdownHandler();
  handler.OnShutdown([&handler]() {
    if (handler.signal_received() != 0) {
      LOG_INFO << "Received signal " << handler.signal_received();
    }
    std::cout << "Shutting down HTTP server..." << std::endl;
    drogon::app().quit();
  });

  if (handler.InstallSignalHandlers()) {
    drogon::app().disableSigtermHandling();
  } else {
    LOG_WARN << "Could not install signal handlers; relying on Drogon's SIGTERM handling";
  }
}

void Server::Run() {
  running_ = true;

  auto& app = drogon::app();

  app.setLogLevel(ToLogLevel(config_.server.log_level));
  app.addListener(config_.server.host, config_.server.port);

  uint32_t threads = config_.server.threads;
  if (threads == 0) {
    threads = std::thread::hardware_concurrency();
    if (threads == 0) threads = 4;  // Fallback
  }
  app.setThreadNum(threads);

  // Configure timeouts and limits
  app.setMaxConnectionNum(10000);
  app.setMaxConnectionNumPerIP(100);
  app.setIdleConnectionTimeout(60);
  app.setKeepaliveRequestsNumber(100);
  app.setClientMaxBodySize(MaxBodyBytes(config_.limits.max_text_bytes));

  app.disableSession();

  SetupRoutes();
  SetupShutdown();

  std::cout << "textscrub server starting on " << config_.server.host
            << ":" << config_.server.port << " with " << threads << " threads"
            << std::endl;
  LOG_INFO << "Diff budget " << config_.diff.max_alignment_cells << " cells, on_limit "
           << LimitPolicyName(config_.diff.on_limit) << ", max text "
           << config_.limits.max_text_bytes << " bytes";

  // Run Drogon (blocking)
  app.run();

  running_ = false;
  std::cout << "Server stopped." << std::endl;
}

void Server::Shutdown() {
  if (running_) {
    GlobalShutdownHandler().Shutdown();
  }
}

}  // namespace textscrub::server
