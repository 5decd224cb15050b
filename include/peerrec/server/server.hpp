#pragma once

#include <peerrec/ann_source.hpp>
#include <peerrec/rate_limiter.hpp>
#include <peerrec/recommender.hpp>
#include <peerrec/server/config.hpp>
#include <peerrec/server/metrics.hpp>
#include <peerrec/store.hpp>
#include <peerrec/vector_index.hpp>

#include <memory>
#include <string>

namespace peerrec::server {

/**
 * peerrec HTTP server.
 *
 * Owns the catalog store, the ANN index and the recommender, and serves them
 * through Drogon. Construction loads everything; a store or index that cannot
 * be opened is fatal.
 */
class Server {
 public:
  /**
   * Open the store, load the index and build the recommender.
   * @throws std::runtime_error on invalid configuration or startup failure.
   */
  explicit Server(const Config& config);

  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  /**
   * Start serving (blocking). Returns when the server shuts down.
   */
  void Run();

  /**
   * Request shutdown (async).
   */
  void Shutdown();

  Store* GetStore() { return store_.get(); }
  const Recommender* GetRecommender() const { return recommender_.get(); }

 private:
  void WarmRandomCache();
  void SetupRoutes();
  void SetupShutdown();

  Config config_;
  std::shared_ptr<PrometheusMetrics> metrics_;
  std::unique_ptr<Store> store_;
  std::unique_ptr<internal::VectorIndex> index_;
  std::unique_ptr<AnnSimilaritySource> ann_;
  std::unique_ptr<Recommender> recommender_;
  std::shared_ptr<RateLimiter> rate_limiter_;
  bool running_ = false;
};

}  // namespace peerrec::server
