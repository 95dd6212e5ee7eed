#pragma once

#include <textscrub/diff.hpp>
#include <textscrub/normalize.hpp>
#include <textscrub/server/config.hpp>
#include <textscrub/server/metrics.hpp>

#include <json/json.h>

#include <memory>
#include <string>
#include <string_view>

namespace textscrub::server {

/**
 * An HTTP-shaped answer: status code plus JSON body.
 */
struct CleanResponse {
  int status_code = 200;
  Json::Value body;
};

/**
 * Error body in the server's error shape:
 * {"error": <error>, "message": <message>, "code": <http_code>}
 */
Json::Value MakeErrorBody(const std::string& error, const std::string& message, int http_code);

/**
 * [{"type": "equal|insert|delete", "text": "..."}, ...]
 */
Json::Value SegmentsToJson(const std::vector<DiffSegment>& segments);

/**
 * The clean endpoint without the transport: normalize a text, diff it
 * against its canonical form and apply the configured limit policy.
 *
 * Immutable after construction; shared by all request threads.
 */
class CleanService {
 public:
  /**
   * @throws std::runtime_error if the normalizer section is invalid.
   */
  explicit CleanService(const Config& config,
                        std::shared_ptr<PrometheusMetrics> metrics = nullptr);

  /**
   * Handle a raw request body of the form {"text": "..."}.
   */
  CleanResponse HandleBody(std::string_view body) const;

  /**
   * Handle an already extracted text.
   */
  CleanResponse Clean(const std::string& text) const;

  const Normalizer& normalizer() const { return normalizer_; }

 private:
  Normalizer normalizer_;
  DiffOptions diff_options_;
  LimitPolicy on_limit_;
  uint64_t max_text_bytes_;
  std::shared_ptr<PrometheusMetrics> metrics_;
};

}  // namespace textscrub::server
