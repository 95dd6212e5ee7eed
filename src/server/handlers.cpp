#include <textscrub/server/handlers.hpp>
#include <textscrub/version.hpp>

#include <drogon/drogon.h>
#include <json/json.h>

namespace textscrub::server {

namespace {

constexpr const char* kAllowMethods = "GET, POST, OPTIONS";
constexpr const char* kAllowHeaders = "Content-Type, Authorization, Accept";

void AddCorsHeaders(const std::string& origin, const drogon::HttpResponsePtr& resp) {
  resp->addHeader("Access-Control-Allow-Origin", origin);
  resp->addHeader("Access-Control-Allow-Methods", kAllowMethods);
  resp->addHeader("Access-Control-Allow-Headers", kAllowHeaders);
}

}  // namespace

// --- Response Helpers ---

drogon::HttpResponsePtr MakeErrorResponse(const std::string& error,
                                          const std::string& message,
                                          int http_code) {
  return MakeJsonResponse({http_code, MakeErrorBody(error, message, http_code)});
}

drogon::HttpResponsePtr MakeJsonResponse(const CleanResponse& response) {
  auto resp = drogon::HttpResponse::newHttpJsonResponse(response.body);
  resp->setStatusCode(static_cast<drogon::HttpStatusCode>(response.status_code));
  return resp;
}

// --- Handler Registration ---

void RegisterHandlers(std::shared_ptr<const CleanService> service,
                      const Config& config,
                      std::shared_ptr<PrometheusMetrics> metrics) {
  auto& app = drogon::app();
  const std::string origin = config.server.cors_allow_origin;

  // ==========================================================================
  // CORS
  // ==========================================================================

  // Preflight requests never reach a handler
  app.registerPreRoutingAdvice(
      [origin](const drogon::HttpRequestPtr& req,
               drogon::AdviceCallback&& callback,
               drogon::AdviceChainCallback&& chain) {
        if (req->method() != drogon::Options) {
          chain();
          return;
        }
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setStatusCode(drogon::k204NoContent);
        AddCorsHeaders(origin, resp);
        callback(resp);
      });

  app.registerPostHandlingAdvice(
      [origin](const drogon::HttpRequestPtr&, const drogon::HttpResponsePtr& resp) {
        AddCorsHeaders(origin, resp);
      });

  // ==========================================================================
  // Clean Endpoints
  // ==========================================================================

  // POST / and POST /api/v1/clean - Normalize text and diff it
  for (const std::string path : {"/", "/api/v1/clean"}) {
    app.registerHandler(
        path,
        [service, metrics, path](const drogon::HttpRequestPtr& req,
                                 std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
          RequestTimer timer(metrics, "POST", path);

          CleanResponse response = service->HandleBody(req->body());
          if (response.status_code != 200) {
            LOG_DEBUG << "Clean request rejected with " << response.status_code << ": "
                      << response.body["message"].asString();
          }

          timer.SetStatusCode(response.status_code);
          callback(MakeJsonResponse(response));
        },
        {drogon::Post});
  }

  // ==========================================================================
  // Admin Endpoints
  // ==========================================================================

  // GET /health - Health check
  app.registerHandler(
      "/health",
      [](const drogon::HttpRequestPtr& req,
         std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
        Json::Value json;
        json["status"] = "healthy";
        json["version"] = Version();

        auto resp = drogon::HttpResponse::newHttpJsonResponse(json);
        resp->setStatusCode(drogon::k200OK);
        callback(resp);
      },
      {drogon::Get});
}

}  // namespace textscrub::server
