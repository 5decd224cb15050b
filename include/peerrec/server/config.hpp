#pragma once

#include <peerrec/ann_source.hpp>
#include <peerrec/profile.hpp>
#include <peerrec/recommender.hpp>
#include <peerrec/store.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

#include <json/value.h>

namespace peerrec::server {

/**
 * HTTP listener and request surface configuration.
 */
struct ServerConfig {
  std::string host = "127.0.0.1";
  uint16_t port = 7070;
  uint32_t threads = 0;  // 0 = auto-detect CPU cores
  std::string log_level = "info";

  // Allow ?debug=1 on recommendation routes (403 otherwise).
  bool debug_enabled = true;

  // Accept {likes:[{uuid,host}]} in recommendation bodies.
  bool use_client_likes = true;
  size_t client_likes_max = 5;

  // Body caps in bytes.
  size_t recommend_body_limit = 65536;
  size_t internal_body_limit = 1000000;
};

/**
 * ANN index file and search tuning.
 */
struct IndexConfig {
  std::string path;
  int ef_search = 0;  // 0 = index default
  AnnSearchOptions search;
};

/**
 * Sliding-window limits on the recommendation routes.
 */
struct RateLimitConfig {
  bool enabled = true;
  int max_requests = 60;
  double window_seconds = 60.0;
};

/**
 * Random rowid cache built at startup.
 */
struct RandomCacheConfig {
  bool populate_on_start = true;
  RandomCacheSettings settings;
};

/**
 * Metrics configuration.
 */
struct MetricsConfig {
  bool enabled = true;
  std::string path = "/metrics";
};

/**
 * Complete server configuration.
 */
struct Config {
  ServerConfig server;
  std::string db_path;
  peerrec::Options store;
  IndexConfig index;

  // JSON file of recommendation profiles; empty = built-in profiles.
  std::string profiles_path;

  // recommendations, personalization and moderation sections.
  RecommenderOptions recommender;

  RateLimitConfig rate_limit;
  RandomCacheConfig random_cache;
  MetricsConfig metrics;

  /**
   * Load configuration from a YAML file.
   * @throws std::runtime_error if file cannot be read or parsed.
   */
  static Config LoadFromFile(const std::string& path);

  /**
   * Parse configuration from command-line arguments.
   * A --config file is loaded first; the other flags override it.
   * @throws std::runtime_error on invalid arguments.
   */
  static Config LoadFromArgs(int argc, char** argv);

  /**
   * Validate configuration.
   * @throws std::runtime_error if configuration is invalid.
   */
  void Validate() const;

  /**
   * Profiles from profiles_path, or DefaultRecommendationConfig() when unset.
   * @throws std::runtime_error if the file cannot be read or parsed.
   */
  RecommendationConfig LoadProfiles() const;
};

/**
 * Build a RecommendationConfig from its JSON form:
 *
 *   {"default_profile": "home",
 *    "profiles": {"home": {"batch_size": 48, "overfetch_factor": 1,
 *                          "generators": {"exploit": {...}, ...},
 *                          "mixing": {"order": [...]},
 *                          "scoring": {"weights": {...}, "layer_weights": {...},
 *                                      "freshness_half_life_days": 14,
 *                                      "popularity": {"views": 1, "likes": 2}},
 *                          "soft_caps": {"min": {...}, "max": {...}},
 *                          "diversity": {"max_per_author": 3, "max_per_instance": 0}}}}
 *
 * @throws std::runtime_error when the document is not shaped like this.
 */
RecommendationConfig ParseRecommendationConfig(const Json::Value& root);

/** Read and parse a profiles JSON file. @throws std::runtime_error */
RecommendationConfig LoadRecommendationConfigFile(const std::string& path);

}  // namespace peerrec::server
