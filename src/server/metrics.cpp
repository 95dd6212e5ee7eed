#include <textscrub/server/metrics.hpp>

#include <drogon/drogon.h>

#include <iomanip>
#include <sstream>

namespace textscrub::server {

namespace {

// Histogram buckets for latency (in milliseconds)
const std::vector<double> kLatencyBuckets = {
    0.5, 1, 2.5, 5, 10, 25, 50, 100, 250, 500, 1000, 2500, 5000, 10000};

// Histogram buckets for text sizes (in bytes)
const std::vector<double> kSizeBuckets = {
    64, 256, 1024, 4096, 16384, 65536, 262144, 1048576, 4194304};

size_t FindBucket(double value, const std::vector<double>& buckets) {
  for (size_t i = 0; i < buckets.size(); ++i) {
    if (value <= buckets[i]) {
      return i;
    }
  }
  return buckets.size();  // +Inf bucket
}

void WriteHistogram(std::ostringstream& out, const std::string& name,
                    const std::vector<double>& bounds, const std::vector<uint64_t>& buckets,
                    double sum, uint64_t count) {
  out << "# TYPE " << name << " histogram\n";
  for (size_t i = 0; i < bounds.size(); ++i) {
    out << name << "_bucket{le=\"" << bounds[i] << "\"} " << buckets[i] << "\n";
  }
  out << name << "_bucket{le=\"+Inf\"} " << buckets.back() << "\n";
  out << name << "_sum " << sum << "\n";
  out << name << "_count " << count << "\n";
}

}  // namespace

// --- PrometheusMetrics ---

void PrometheusMetrics::Observe(HistogramData* h, const std::vector<double>& bounds,
                                double value) {
  if (h->buckets.empty()) {
    h->bounds = &bounds;
    h->buckets.resize(bounds.size() + 1, 0);
  }
  size_t bucket = FindBucket(value, *h->bounds);
  for (size_t i = bucket; i < h->buckets.size(); ++i) {
    h->buckets[i]++;
  }
  h->count++;
  h->sum += value;
}

void PrometheusMetrics::Counter(std::string_view name, uint64_t delta) {
  std::lock_guard<std::mutex> lock(mu_);
  counters_[std::string(name)] += delta;
}

void PrometheusMetrics::Histogram(std::string_view name, uint64_t value) {
  std::lock_guard<std::mutex> lock(mu_);
  Observe(&histograms_[std::string(name)], kLatencyBuckets, static_cast<double>(value));
}

void PrometheusMetrics::Gauge(std::string_view name, double value) {
  std::lock_guard<std::mutex> lock(mu_);
  gauges_[std::string(name)] = value;
}

void PrometheusMetrics::RecordHttpRequest(const std::string& method,
                                          const std::string& path,
                                          int status_code,
                                          double latency_ms) {
  std::lock_guard<std::mutex> lock(mu_);

  // Increment request counter with labels
  HttpMetricKey key{method, path, status_code};
  http_requests_[key]++;

  Observe(&http_latency_, kLatencyBuckets, latency_ms);
}

void PrometheusMetrics::RecordTextCleaned(uint64_t input_bytes, bool unchanged) {
  std::lock_guard<std::mutex> lock(mu_);
  counters_["textscrub_texts_cleaned_total"]++;
  if (unchanged) {
    counters_["textscrub_texts_unchanged_total"]++;
  }
  Observe(&histograms_["textscrub_input_bytes"], kSizeBuckets,
          static_cast<double>(input_bytes));
}

void PrometheusMetrics::RecordDiffLimitExceeded() {
  std::lock_guard<std::mutex> lock(mu_);
  counters_["textscrub_diff_limit_exceeded_total"]++;
}

void PrometheusMetrics::RecordDiffFallbackLines() {
  std::lock_guard<std::mutex> lock(mu_);
  counters_["textscrub_diff_fallback_lines_total"]++;
}

uint64_t PrometheusMetrics::GetCounter(std::string_view name) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = counters_.find(std::string(name));
  return it == counters_.end() ? 0 : it->second;
}

std::string PrometheusMetrics::Export() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::ostringstream out;
  out << std::fixed << std::setprecision(6);

  // Export counters
  for (const auto& [name, value] : counters_) {
    out << "# TYPE " << name << " counter\n";
    out << name << " " << value << "\n";
  }

  // Export gauges
  for (const auto& [name, value] : gauges_) {
    out << "# TYPE " << name << " gauge\n";
    out << name << " " << value << "\n";
  }

  // Export histograms
  for (const auto& [name, data] : histograms_) {
    WriteHistogram(out, name, *data.bounds, data.buckets, data.sum, data.count);
  }

  // Export HTTP request counters with labels
  if (!http_requests_.empty()) {
    out << "# TYPE textscrub_http_requests_total counter\n";
    for (const auto& [key, count] : http_requests_) {
      out << "textscrub_http_requests_total{method=\"" << key.method
          << "\",path=\"" << key.path << "\",status=\"" << key.status_code
          << "\"} " << count << "\n";
    }
  }

  // Export HTTP latency histogram
  if (http_latency_.count > 0) {
    WriteHistogram(out, "textscrub_http_request_duration_ms", kLatencyBuckets,
                   http_latency_.buckets, http_latency_.sum, http_latency_.count);
  }

  return out.str();
}

// --- Metrics Handler Registration ---

void RegisterMetricsHandler(std::shared_ptr<PrometheusMetrics> metrics,
                            const std::string& path) {
  drogon::app().registerHandler(
      path,
      [metrics](const drogon::HttpRequestPtr& req,
                std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setBody(metrics->Export());
        resp->setContentTypeString("text/plain; version=0.0.4; charset=utf-8");
        resp->setStatusCode(drogon::k200OK);
        callback(resp);
      },
      {drogon::Get});
}

// --- RequestTimer ---

RequestTimer::RequestTimer(std::shared_ptr<PrometheusMetrics> metrics,
                           std::string method,
                           std::string path)
    : metrics_(std::move(metrics)),
      method_(std::move(method)),
      path_(std::move(path)),
      start_(std::chrono::steady_clock::now()) {}

RequestTimer::~RequestTimer() {
  if (metrics_) {
    auto end = std::chrono::steady_clock::now();
    auto duration =
        std::chrono::duration_cast<std::chrono::microseconds>(end - start_);
    double latency_ms = static_cast<double>(duration.count()) / 1000.0;
    metrics_->RecordHttpRequest(method_, path_, status_code_, latency_ms);
  }
}

}  // namespace textscrub::server
