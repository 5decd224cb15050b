#include <peerrec/server/metrics.hpp>

#include <drogon/drogon.h>

#include <iomanip>
#include <sstream>

namespace peerrec::server {

namespace {

// Histogram buckets for HTTP latency (in milliseconds)
const std::vector<double> kLatencyBuckets = {
    0.5, 1, 2.5, 5, 10, 25, 50, 100, 250, 500, 1000, 2500, 5000, 10000};

// Histogram buckets for core values (microsecond latencies, pool sizes)
const std::vector<double> kValueBuckets = {
    1, 5, 10, 50, 100, 500, 1000, 5000, 10000, 50000, 100000, 500000, 1000000};

size_t FindBucket(double value, const std::vector<double>& buckets) {
  for (size_t i = 0; i < buckets.size(); ++i) {
    if (value <= buckets[i]) {
      return i;
    }
  }
  return buckets.size();  // +Inf bucket
}

void Observe(double value, const std::vector<double>& bounds,
             std::vector<uint64_t>* buckets, uint64_t* count, double* sum) {
  if (buckets->empty()) {
    buckets->resize(bounds.size() + 1, 0);
  }
  size_t bucket = FindBucket(value, bounds);
  for (size_t i = bucket; i < buckets->size(); ++i) {
    (*buckets)[i]++;
  }
  (*count)++;
  *sum += value;
}

}  // namespace

std::string PrometheusName(std::string_view name) {
  std::string out(name);
  for (char& c : out) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '_' || c == ':';
    if (!ok) c = '_';
  }
  return out;
}

// --- PrometheusMetrics ---

void PrometheusMetrics::Counter(std::string_view name, uint64_t delta) {
  std::lock_guard<std::mutex> lock(mu_);
  counters_[PrometheusName(name)] += delta;
}

void PrometheusMetrics::Histogram(std::string_view name, uint64_t value) {
  std::lock_guard<std::mutex> lock(mu_);
  auto& h = histograms_[PrometheusName(name)];
  Observe(static_cast<double>(value), kValueBuckets, &h.buckets, &h.count, &h.sum);
}

void PrometheusMetrics::Gauge(std::string_view name, double value) {
  std::lock_guard<std::mutex> lock(mu_);
  gauges_[PrometheusName(name)] = value;
}

void PrometheusMetrics::RecordHttpRequest(const std::string& method,
                                          const std::string& path,
                                          int status_code,
                                          double latency_ms) {
  std::lock_guard<std::mutex> lock(mu_);

  // Increment request counter with labels
  HttpMetricKey key{method, path, status_code};
  http_requests_[key]++;

  Observe(latency_ms, kLatencyBuckets, &http_latency_.buckets, &http_latency_.count,
          &http_latency_.sum);
}

void PrometheusMetrics::RecordRateLimited(const std::string& path) {
  std::lock_guard<std::mutex> lock(mu_);
  rate_limited_[path]++;
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
    out << "# TYPE " << name << " histogram\n";
    for (size_t i = 0; i < kValueBuckets.size(); ++i) {
      out << name << "_bucket{le=\"" << kValueBuckets[i] << "\"} "
          << data.buckets[i] << "\n";
    }
    out << name << "_bucket{le=\"+Inf\"} " << data.buckets.back() << "\n";
    out << name << "_sum " << data.sum << "\n";
    out << name << "_count " << data.count << "\n";
  }

  // Export HTTP request counters with labels
  if (!http_requests_.empty()) {
    out << "# TYPE peerrec_http_requests_total counter\n";
    for (const auto& [key, count] : http_requests_) {
      out << "peerrec_http_requests_total{method=\"" << key.method
          << "\",path=\"" << key.path << "\",status=\"" << key.status_code
          << "\"} " << count << "\n";
    }
  }

  if (!rate_limited_.empty()) {
    out << "# TYPE peerrec_http_rate_limited_total counter\n";
    for (const auto& [path, count] : rate_limited_) {
      out << "peerrec_http_rate_limited_total{path=\"" << path << "\"} " << count << "\n";
    }
  }

  // Export HTTP latency histogram
  if (http_latency_.count > 0) {
    out << "# TYPE peerrec_http_request_duration_ms histogram\n";
    for (size_t i = 0; i < kLatencyBuckets.size(); ++i) {
      out << "peerrec_http_request_duration_ms_bucket{le=\""
          << kLatencyBuckets[i] << "\"} " << http_latency_.buckets[i] << "\n";
    }
    out << "peerrec_http_request_duration_ms_bucket{le=\"+Inf\"} "
        << http_latency_.buckets.back() << "\n";
    out << "peerrec_http_request_duration_ms_sum " << http_latency_.sum << "\n";
    out << "peerrec_http_request_duration_ms_count " << http_latency_.count << "\n";
  }

  return out.str();
}

// --- Metrics Handler Registration ---

void RegisterMetricsHandler(std::shared_ptr<PrometheusMetrics> metrics,
                            Store* store,
                            const std::string& path) {
  drogon::app().registerHandler(
      path,
      [metrics, store](const drogon::HttpRequestPtr& req,
                       std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
        // Collect store metrics
        if (store) {
          store->EmitCacheMetrics();

          uint64_t embeddings = 0, random_cached = 0;
          uint32_t dim = 0;
          if (store->CountEmbeddingsApprox(&embeddings).ok()) {
            metrics->Gauge("peerrec_embeddings_total", static_cast<double>(embeddings));
          }
          if (store->RandomCacheSize(&random_cached).ok()) {
            metrics->Gauge("peerrec_random_cache_size", static_cast<double>(random_cached));
          }
          if (store->EmbeddingDimension(&dim).ok()) {
            metrics->Gauge("peerrec_embedding_dim", static_cast<double>(dim));
          }
        }

        // Export metrics
        std::string output = metrics->Export();

        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setBody(output);
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

}  // namespace peerrec::server
