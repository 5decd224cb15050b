#pragma once

#include <peerrec/events.hpp>
#include <peerrec/recommender.hpp>
#include <peerrec/store.hpp>
#include <peerrec/types.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <drogon/HttpRequest.h>
#include <json/value.h>
#include <rocksdb/status.h>

namespace peerrec::server {

// User id of requests that carry none.
constexpr const char* kDefaultUserId = "local-user";

/** Positive integer value of raw, or 0 for anything else. */
size_t ParseLimit(std::string_view raw);

/** "1", "true", "yes" or "on", trimmed and case-insensitive. */
bool ParseFlag(std::string_view raw);

/** Trimmed raw, or kDefaultUserId when empty. */
std::string ResolveUserId(std::string_view raw);

/**
 * Caller address for rate limiting: first X-Forwarded-For entry, then
 * X-Real-IP, then the peer address.
 */
std::string ClientIp(const drogon::HttpRequestPtr& req);

/**
 * Parse a request body capped at limit bytes. An empty or blank body yields
 * an empty object. Oversized, malformed and non-object bodies fail.
 */
bool ParseJsonBody(std::string_view body, size_t limit, Json::Value* out);

/** A like sent by the client, before it is resolved against the catalog. */
struct ClientLikeRef {
  std::string video_uuid;
  std::string instance_domain;
};

/** Why a client likes payload was rejected. */
struct ClientLikesError {
  std::string error;   // "Too many likes in request body" / "Invalid likes payload"
  std::string reason;  // item problem, empty for the count check
  int index = -1;      // offending item, -1 for the count check
  size_t received = 0;
};

/**
 * Validate body["likes"]: an array of at most max_items {uuid, host}
 * objects with non-empty strings. A missing or non-array "likes" yields no
 * refs. Values are trimmed.
 */
bool ParseClientLikes(const Json::Value& body,
                      size_t max_items,
                      std::vector<ClientLikeRef>* out,
                      ClientLikesError* error);

/**
 * Resolve refs to catalog likes through the uuid index, deduplicated by
 * (uuid, host) and in input order. Unknown videos are dropped.
 */
rocksdb::Status ResolveClientLikes(const Store& store,
                                   const std::vector<ClientLikeRef>& refs,
                                   std::vector<LikeEntry>* out);

/** Query parameters of a recommendation route, parsed. */
struct RecommendationParams {
  RecommendRequest request;
  bool debug = false;
};

/**
 * Read limit, id|video_id, host|instance_domain, uuid|video_uuid,
 * user_id|userId, mode, random and refresh_cache from the query string.
 * path_video_id, when non-empty, is used when the query carries no id.
 */
RecommendationParams ParseRecommendationParams(const drogon::HttpRequestPtr& req,
                                               const std::string& path_video_id);

/**
 * Event fields of one ingest item. Text fields accept strings and numbers;
 * published_at accepts a number or a numeric string.
 */
RawEventFields EventFieldsFromJson(const Json::Value& event);

// --- Response projection ---

/** Client-facing fields of a video row. */
Json::Value StableVideoJson(const VideoRecord& video);

/** Diagnostics of one row, as returned with ?debug=1. */
Json::Value DebugJson(const CandidateRow& row);

/** The "seed" object of a recommendation response. */
Json::Value SeedJson(const RecommendRequest& req, const RecommendResponse& resp);

/** {generatedAt, total, count, seed, rows} */
Json::Value RecommendationsJson(const RecommendRequest& req,
                                const RecommendResponse& resp,
                                uint64_t total,
                                bool include_debug,
                                int64_t generated_at_ms);

/** Full metadata row of a video (internal metadata route). */
Json::Value VideoMetadataJson(const VideoRecord& video);

/**
 * Catalog row of one import line: the VideoMetadataJson fields plus an
 * "embedding" array of numbers. video_id and instance_domain are required;
 * a missing embedding yields an empty one.
 */
bool VideoFromJson(const Json::Value& obj,
                   VideoRecord* video,
                   std::vector<float>* embedding,
                   std::string* error);

}  // namespace peerrec::server
