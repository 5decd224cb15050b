#include <peerrec/server/server.hpp>
#include <peerrec/random.hpp>
#include <peerrec/server/handlers.hpp>
#include <peerrec/shutdown.hpp>
#include <peerrec/version.hpp>

#include <drogon/drogon.h>

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace peerrec::server {

namespace {

trantor::Logger::LogLevel ParseLogLevel(const std::string& level) {
  if (level == "trace") return trantor::Logger::kTrace;
  if (level == "debug") return trantor::Logger::kDebug;
  if (level == "warn") return trantor::Logger::kWarn;
  if (level == "error") return trantor::Logger::kError;
  return trantor::Logger::kInfo;
}

}  // namespace

Server::Server(const Config& config) : config_(config) {
  config_.Validate();

  // Metrics must be wired into the store options before Open
  if (config_.metrics.enabled) {
    metrics_ = std::make_shared<PrometheusMetrics>();
    config_.store.metrics = metrics_;
  }

  auto status = Store::Open(config_.db_path, &store_, config_.store);
  if (!status.ok()) {
    throw std::runtime_error("Failed to open store at " + config_.db_path +
                             ": " + status.ToString());
  }

  uint32_t dim = 0;
  status = store_->EmbeddingDimension(&dim);
  if (!status.ok() || dim == 0) {
    throw std::runtime_error("Store at " + config_.db_path +
                             " has no embeddings; import the catalog first");
  }

  index_ = internal::CreateHNSWIndex(dim);
  if (!index_->Load(config_.index.path)) {
    throw std::runtime_error("Failed to load ANN index from " + config_.index.path);
  }
  if (config_.index.ef_search > 0) {
    index_->SetSearchParam("ef", config_.index.ef_search);
  }
  ann_ = std::make_unique<AnnSimilaritySource>(store_.get(), index_.get(),
                                               config_.index.search);

  status = Recommender::Create(store_.get(), ann_.get(), config_.LoadProfiles(),
                               config_.recommender, &recommender_);
  if (!status.ok()) {
    throw std::runtime_error("Failed to build recommender: " + status.ToString());
  }

  if (config_.rate_limit.enabled) {
    rate_limiter_ = std::make_shared<RateLimiter>(config_.rate_limit.max_requests,
                                                  config_.rate_limit.window_seconds);
  }
}

Server::~Server() {
  if (running_) {
    Shutdown();
  }
}

void Server::WarmRandomCache() {
  if (!config_.random_cache.populate_on_start) {
    return;
  }
  Random rng = Random::FromEntropy();
  uint64_t inserted = 0;
  auto status = store_->PopulateRandomCache(config_.random_cache.settings, &rng, &inserted);
  if (!status.ok()) {
    // Random rows fall back to direct sampling without the cache
    LOG_WARN << "Random cache population failed: " << status.ToString();
    return;
  }
  LOG_INFO << "Random cache ready: " << inserted << " rows";
}

void Server::SetupRoutes() {
  Services services;
  services.store = store_.get();
  services.recommender = recommender_.get();
  services.rate_limiter = rate_limiter_;
  services.metrics = metrics_;

  RegisterHandlers(services, config_);

  if (metrics_) {
    RegisterMetricsHandler(metrics_, store_.get(), config_.metrics.path);
  }
}

void Server::SetupShutdown() {
  GlobalShutdownHandler().RegisterStore(store_.get());
  GlobalShutdownHandler().InstallSignalHandlers();

  GlobalShutdownHandler().OnShutdown("http", []() {
    std::cout << "Shutting down HTTP server..." << std::endl;
    drogon::app().quit();
  });
}

void Server::Run() {
  running_ = true;

  trantor::Logger::setLogLevel(ParseLogLevel(config_.server.log_level));

  WarmRandomCache();

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

  // Route handlers enforce the per-route body caps themselves
  app.setClientMaxBodySize(
      2 * std::max(config_.server.recommend_body_limit, config_.server.internal_body_limit));

  app.disableSession();

  SetupRoutes();
  SetupShutdown();

  std::cout << "peerrec " << Version() << " starting on " << config_.server.host << ":"
            << config_.server.port << " with " << threads << " threads" << std::endl;
  std::cout << "Catalog: " << config_.db_path << ", index: " << config_.index.path
            << " (" << index_->Size() << " vectors)" << std::endl;

  app.run();

  running_ = false;
  std::cout << "Server stopped." << std::endl;
}

void Server::Shutdown() {
  if (running_) {
    GlobalShutdownHandler().Shutdown();
  }
}

}  // namespace peerrec::server
