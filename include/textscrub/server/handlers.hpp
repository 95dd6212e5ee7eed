#pragma once

#include <textscrub/server/config.hpp>
#include <textscrub/server/metrics.hpp>
#include <textscrub/server/service.hpp>

#include <drogon/HttpAppFramework.h>

#include <memory>
#include <string>

namespace textscrub::server {

/**
 * Create a JSON error response in the server's error shape.
 */
drogon::HttpResponsePtr MakeErrorResponse(const std::string& error,
                                          const std::string& message,
                                          int http_code);

/**
 * Turn a service answer into a Drogon response.
 */
drogon::HttpResponsePtr MakeJsonResponse(const CleanResponse& response);

/**
 * Register the clean and health handlers and the CORS advices with the
 * Drogon app. `metrics` may be null.
 */
void RegisterHandlers(std::shared_ptr<const CleanService> service,
                      const Config& config,
                      std::shared_ptr<PrometheusMetrics> metrics);

}  // namespace textscrub::server
