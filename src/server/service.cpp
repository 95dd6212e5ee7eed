#include <textscrub/server/service.hpp>

#include <trantor/utils/Logger.h>

#include <memory>
#include <utility>

namespace textscrub::server {

Json::Value MakeErrorBody(const std::string& error, const std::string& message, int http_code) {
  Json::Value json;
  json["error"] = error;
  json["message"] = message;
  json["code"] = http_code;
  return json;
}

Json::Value SegmentsToJson(const std::vector<DiffSegment>& segments) {
  Json::Value json(Json::arrayValue);
  for (const auto& segment : segments) {
    Json::Value item;
    item["type"] = DiffKindName(segment.kind);
    item["text"] = segment.text;
    json.append(item);
  }
  return json;
}

CleanService::CleanService(const Config& config, std::shared_ptr<PrometheusMetrics> metrics)
    : normalizer_(config.BuildRuleSet()),
      on_limit_(config.diff.on_limit),
      max_text_bytes_(config.limits.max_text_bytes),
      metrics_(std::move(metrics)) {
  diff_options_.max_alignment_cells = config.diff.max_alignment_cells;
}

CleanResponse CleanService::HandleBody(std::string_view body) const {
  Json::Value parsed;
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  std::string errors;
  if (!reader->parse(body.data(), body.data() + body.size(), &parsed, &errors)) {
    return {400, MakeErrorBody("invalid_argument", "Request body is not valid JSON: " + errors, 400)};
  }
  if (!parsed.isObject() || !parsed.isMember("text")) {
    return {400, MakeErrorBody("invalid_argument", "JSON body must contain 'text' field", 400)};
  }
  if (!parsed["text"].isString()) {
    return {400, MakeErrorBody("invalid_argument", "'text' must be a string", 400)};
  }
  return Clean(parsed["text"].asString());
}

CleanResponse CleanService::Clean(const std::string& text) const {
  if (text.size() > max_text_bytes_) {
    return {413, MakeErrorBody("payload_too_large",
                               "Text is " + std::to_string(text.size()) +
                                   " bytes, limit is " + std::to_string(max_text_bytes_),
                               413)};
  }

  CleanResponse response;
  std::string cleaned = normalizer_.Normalize(text);
  const bool unchanged = cleaned == text;

  if (unchanged) {
    response.body["cleaned_text"] = cleaned;
    response.body["diff"] = Json::Value(Json::nullValue);
    if (metrics_) metrics_->RecordTextCleaned(text.size(), true);
    return response;
  }

  DiffResult diff = Diff(text, cleaned, diff_options_);
  if (!diff.success) {
    if (metrics_) metrics_->RecordDiffLimitExceeded();
    LOG_WARN << "Character diff over budget (" << diff.alignment_cells
             << " cells), policy " << LimitPolicyName(on_limit_);

    if (on_limit_ == LimitPolicy::kReject) {
      return {413, MakeErrorBody("resource_limit_exceeded", diff.error_message, 413)};
    }
    if (on_limit_ == LimitPolicy::kLines) {
      DiffOptions lines = diff_options_;
      lines.granularity = DiffGranularity::kLine;
      diff = Diff(text, cleaned, lines);
      if (diff.success) {
        if (metrics_) metrics_->RecordDiffFallbackLines();
        response.body["diff_granularity"] = "line";
      } else {
        LOG_WARN << "Line diff also over budget (" << diff.alignment_cells
                 << " cells), omitting diff";
      }
    }
  }

  response.body["cleaned_text"] = cleaned;
  if (diff.success) {
    response.body["diff"] = SegmentsToJson(diff.segments);
  } else {
    response.body["diff"] = Json::Value(Json::nullValue);
    response.body["diff_omitted"] = true;
  }
  if (metrics_) metrics_->RecordTextCleaned(text.size(), false);
  return response;
}

}  // namespace textscrub::server
