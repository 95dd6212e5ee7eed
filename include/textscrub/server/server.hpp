#pragma once

#include <textscrub/server/config.hpp>
#include <textscrub/server/metrics.hpp>
#include <textscrub/server/service.hpp>

#include <memory>
#include <string>

namespace textscrub::server {

/**
 * textscrub HTTP server.
 *
 * Serves the clean endpoint (normalize + diff) over Drogon, plus health
 * and Prometheus metrics.
 */
class Server {
 public:
  /**
   * Create a server with the given configuration.
   * @throws std::runtime_error if the configuration is invalid.
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
   */
  void Shutdown();

  const CleanService& service() const { return *service_; }

 private:
  void SetupRoutes();
  void SetupShutdown();

  Config config_;
  std::shared_ptr<PrometheusMetrics> metrics_;
  std::shared_ptr<const CleanService> service_;
  bool running_ = false;
};

}  // namespace textscrub::server
