#pragma once

#include <peerrec/rate_limiter.hpp>
#include <peerrec/recommender.hpp>
#include <peerrec/server/config.hpp>
#include <peerrec/server/metrics.hpp>
#include <peerrec/store.hpp>

#include <memory>
#include <string>

#include <drogon/HttpAppFramework.h>
#include <drogon/HttpResponse.h>

namespace peerrec::server {

/**
 * Components shared by all handlers. store and recommender are not owned and
 * must outlive the app; rate_limiter and metrics may be null.
 */
struct Services {
  Store* store = nullptr;
  const Recommender* recommender = nullptr;
  std::shared_ptr<RateLimiter> rate_limiter;
  std::shared_ptr<PrometheusMetrics> metrics;
};

/**
 * Create an error response from a RocksDB status.
 */
drogon::HttpResponsePtr MakeErrorResponse(const rocksdb::Status& status,
                                          const std::string& context);

/**
 * Error response for the /internal routes: NotFound and InvalidArgument map
 * as in MakeErrorResponse, every other failure is a plain 500.
 */
drogon::HttpResponsePtr MakeInternalRouteError(const rocksdb::Status& status,
                                               const std::string& context);

/**
 * Create an error response with an explicit HTTP status and client message.
 */
drogon::HttpResponsePtr MakeJsonError(drogon::HttpStatusCode code, const std::string& message);

/** Permissive CORS headers, added to every response. */
void AddCorsHeaders(const drogon::HttpResponsePtr& resp);

/**
 * Register the recommendation, internal, and health routes plus the CORS
 * advices (OPTIONS answered with 204 and a 600 s max-age).
 */
void RegisterHandlers(const Services& services, const Config& config);

}  // namespace peerrec::server
