#include <peerrec/server/handlers.hpp>
#include <peerrec/server/request.hpp>

#include <peerrec/events.hpp>
#include <peerrec/internal.hpp>
#include <peerrec/random.hpp>
#include <peerrec/request_context.hpp>

#include <drogon/drogon.h>
#include <json/json.h>

#include <unordered_map>
#include <unordered_set>

namespace peerrec::server {

namespace {

using Callback = std::function<void(const drogon::HttpResponsePtr&)>;

drogon::HttpResponsePtr JsonResponse(const Json::Value& json,
                                     drogon::HttpStatusCode code = drogon::k200OK) {
  auto resp = drogon::HttpResponse::newHttpJsonResponse(json);
  resp->setStatusCode(code);
  return resp;
}

// Timed reply: records the final status on the route's RequestTimer.
class Reply {
 public:
  Reply(const Services& services, const drogon::HttpRequestPtr& req, std::string route,
        Callback&& callback)
      : timer_(services.metrics, req->methodString(), std::move(route)),
        callback_(std::move(callback)) {}

  void operator()(const drogon::HttpResponsePtr& resp) {
    timer_.SetStatusCode(static_cast<int>(resp->statusCode()));
    callback_(resp);
  }

 private:
  RequestTimer timer_;
  Callback callback_;
};

// Applies the ip:path sliding window. False when the caller is over it.
bool AllowRequest(const Services& services, const drogon::HttpRequestPtr& req) {
  if (!services.rate_limiter) return true;
  const std::string key = ClientIp(req) + ":" + req->path();
  if (services.rate_limiter->Allow(key)) return true;
  if (services.metrics) services.metrics->RecordRateLimited(req->path());
  LOG_WARN << "rate limit exceeded key=" << key;
  return false;
}

drogon::HttpResponsePtr ClientLikesErrorResponse(const ClientLikesError& error,
                                                 size_t max_allowed) {
  Json::Value json;
  json["error"] = "invalid_argument";
  json["code"] = 400;
  json["message"] = error.error;
  if (error.index >= 0) {
    json["reason"] = error.reason;
    json["index"] = error.index;
  } else {
    json["max_allowed"] = static_cast<Json::UInt64>(max_allowed);
    json["received"] = static_cast<Json::UInt64>(error.received);
  }
  return JsonResponse(json, drogon::k400BadRequest);
}

void ServeRecommendations(const Services& services,
                          const Config& config,
                          const drogon::HttpRequestPtr& req,
                          Reply& reply,
                          const std::string& path_video_id) {
  const uint64_t start_us = internal::NowMicros();

  if (!AllowRequest(services, req)) {
    reply(MakeJsonError(drogon::k429TooManyRequests, "Rate limit exceeded"));
    return;
  }

  RecommendationParams params = ParseRecommendationParams(req, path_video_id);
  if (params.debug && !config.server.debug_enabled) {
    reply(MakeJsonError(drogon::k403Forbidden, "Debug mode is disabled"));
    return;
  }

  Random rng = Random::FromEntropy();
  RequestContext ctx;
  ctx.request_id = rng.HexId(6);
  ctx.rng = &rng;

  if (req->method() == drogon::Post) {
    Json::Value body;
    if (!ParseJsonBody(req->body(), config.server.recommend_body_limit, &body)) {
      reply(MakeJsonError(drogon::k400BadRequest, "Invalid JSON body"));
      return;
    }

    std::vector<ClientLikeRef> refs;
    ClientLikesError likes_error;
    if (!ParseClientLikes(body, config.server.client_likes_max, &refs, &likes_error)) {
      reply(ClientLikesErrorResponse(likes_error, config.server.client_likes_max));
      return;
    }
    LOG_DEBUG << "[" << ctx.request_id << "] incoming likes=" << refs.size()
              << " user_id=" << params.request.user_id;

    if (config.server.use_client_likes && body.isMember("likes")) {
      rocksdb::Status s = ResolveClientLikes(*services.store, refs, &ctx.client_likes);
      if (!s.ok()) {
        reply(MakeErrorResponse(s, "Resolving client likes failed"));
        return;
      }
      ctx.use_client_likes = true;
    }
  }

  const RecommendRequest& request = params.request;
  LOG_INFO << "[" << ctx.request_id << "] start path=" << req->path()
           << " limit=" << request.limit << " id=" << request.video_id
           << " host=" << request.host << " uuid=" << request.video_uuid;

  RecommendResponse response;
  rocksdb::Status s = services.recommender->Recommend(ctx, request, &response);
  if (!s.ok()) {
    reply(MakeErrorResponse(s, "Recommendation failed"));
    return;
  }

  if (response.moderation.total_filtered() > 0) {
    LOG_INFO << "[" << ctx.request_id << "] moderation filtered_by_denylist="
             << response.moderation.filtered_by_denylist
             << " filtered_by_blocked_channel=" << response.moderation.filtered_by_blocked_channel
             << " total=" << response.moderation.total_filtered();
  }

  uint64_t total = 0;
  s = services.store->CountEmbeddingsApprox(&total);
  if (!s.ok()) {
    reply(MakeErrorResponse(s, "Counting embeddings failed"));
    return;
  }

  LOG_INFO << "[" << ctx.request_id << "] done profile=" << response.profile
           << " count=" << response.rows.size()
           << " duration_ms=" << (internal::NowMicros() - start_us) / 1000;

  reply(JsonResponse(RecommendationsJson(request, response, total, params.debug,
                                         internal::WallClockMillis())));
}

// Parses an internal route body or replies 400.
bool ReadInternalBody(const Config& config, const drogon::HttpRequestPtr& req, Reply& reply,
                      Json::Value* body) {
  if (!ParseJsonBody(req->body(), config.server.internal_body_limit, body)) {
    reply(MakeJsonError(drogon::k400BadRequest, "Invalid JSON body"));
    return false;
  }
  return true;
}

std::string TrimmedField(const Json::Value& obj, const char* key) {
  const Json::Value& v = obj[key];
  if (!v.isString()) return {};
  return internal::TrimWhitespace(v.asString());
}

}  // namespace

// --- Error Response Helper ---

drogon::HttpResponsePtr MakeErrorResponse(const rocksdb::Status& status,
                                          const std::string& context) {
  Json::Value json;
  int http_code = 500;

  if (status.IsNotFound()) {
    json["error"] = "not_found";
    json["code"] = 404;
    http_code = 404;
  } else if (status.IsInvalidArgument()) {
    json["error"] = "invalid_argument";
    json["code"] = 400;
    http_code = 400;
  } else if (status.IsTimedOut()) {
    json["error"] = "timeout";
    json["code"] = 504;
    http_code = 504;
  } else if (status.IsBusy() || status.IsTryAgain()) {
    json["error"] = "service_busy";
    json["code"] = 503;
    http_code = 503;
  } else {
    json["error"] = "internal_error";
    json["code"] = 500;
    http_code = 500;
    LOG_ERROR << context << ": " << status.ToString();
  }

  if (http_code == 500) {
    json["message"] = context;
  } else {
    json["message"] = context + ": " + status.ToString();
  }

  return JsonResponse(json, static_cast<drogon::HttpStatusCode>(http_code));
}

drogon::HttpResponsePtr MakeInternalRouteError(const rocksdb::Status& status,
                                               const std::string& context) {
  if (status.IsNotFound() || status.IsInvalidArgument()) {
    return MakeErrorResponse(status, context);
  }
  Json::Value json;
  json["error"] = "internal_error";
  json["code"] = 500;
  json["message"] = context;
  LOG_ERROR << context << ": " << status.ToString();
  return JsonResponse(json, drogon::k500InternalServerError);
}

drogon::HttpResponsePtr MakeJsonError(drogon::HttpStatusCode code, const std::string& message) {
  Json::Value json;
  switch (code) {
    case drogon::k400BadRequest:
      json["error"] = "invalid_argument";
      break;
    case drogon::k403Forbidden:
      json["error"] = "forbidden";
      break;
    case drogon::k404NotFound:
      json["error"] = "not_found";
      break;
    case drogon::k429TooManyRequests:
      json["error"] = "rate_limited";
      break;
    default:
      json["error"] = "internal_error";
      break;
  }
  json["code"] = static_cast<int>(code);
  json["message"] = message;
  return JsonResponse(json, code);
}

void AddCorsHeaders(const drogon::HttpResponsePtr& resp) {
  resp->addHeader("access-control-allow-origin", "*");
  resp->addHeader("access-control-allow-methods", "GET, POST, OPTIONS");
  resp->addHeader("access-control-allow-headers", "content-type");
}

// --- Handler Registration ---

void RegisterHandlers(const Services& services, const Config& config) {
  auto& app = drogon::app();

  // ==========================================================================
  // CORS
  // ==========================================================================

  app.registerPreRoutingAdvice([](const drogon::HttpRequestPtr& req,
                                  drogon::AdviceCallback&& acb,
                                  drogon::AdviceChainCallback&& accb) {
    if (req->method() == drogon::Options) {
      auto resp = drogon::HttpResponse::newHttpResponse();
      resp->setStatusCode(drogon::k204NoContent);
      AddCorsHeaders(resp);
      resp->addHeader("access-control-max-age", "600");
      acb(resp);
      return;
    }
    accb();
  });

  app.registerPostHandlingAdvice(
      [](const drogon::HttpRequestPtr&, const drogon::HttpResponsePtr& resp) {
        AddCorsHeaders(resp);
      });

  // ==========================================================================
  // Recommendation Endpoints
  // ==========================================================================

  // POST /recommendations - Home feed, related videos, or random rows
  app.registerHandler(
      "/recommendations",
      [services, config](const drogon::HttpRequestPtr& req, Callback&& callback) {
        Reply reply(services, req, "/recommendations", std::move(callback));
        ServeRecommendations(services, config, req, reply, "");
      },
      {drogon::Post});

  // POST /videos/similar - Same surface as /recommendations
  app.registerHandler(
      "/videos/similar",
      [services, config](const drogon::HttpRequestPtr& req, Callback&& callback) {
        Reply reply(services, req, "/videos/similar", std::move(callback));
        ServeRecommendations(services, config, req, reply, "");
      },
      {drogon::Post});

  // GET /videos/{id}/similar - Related videos of one seed
  app.registerHandler(
      "/videos/{id}/similar",
      [services, config](const drogon::HttpRequestPtr& req, Callback&& callback,
                         const std::string& id) {
        Reply reply(services, req, "/videos/{id}/similar", std::move(callback));
        ServeRecommendations(services, config, req, reply, id);
      },
      {drogon::Get});

  // ==========================================================================
  // Internal Endpoints
  // ==========================================================================

  // POST /internal/videos/resolve - Canonical identity by video_id or uuid (+host)
  app.registerHandler(
      "/internal/videos/resolve",
      [services, config](const drogon::HttpRequestPtr& req, Callback&& callback) {
        Reply reply(services, req, "/internal/videos/resolve", std::move(callback));
        Json::Value body;
        if (!ReadInternalBody(config, req, reply, &body)) return;

        const std::string video_id = TrimmedField(body, "video_id");
        const std::string uuid = TrimmedField(body, "uuid");
        const std::string host = TrimmedField(body, "host");
        if (video_id.empty() && uuid.empty()) {
          reply(MakeJsonError(drogon::k400BadRequest, "Missing video_id or uuid"));
          return;
        }

        VideoRecord record;
        rocksdb::Status s =
            services.store->FindVideo(video_id, uuid, host, LookupOrder::kUuidFirst, &record);
        if (s.IsNotFound()) {
          reply(MakeJsonError(drogon::k404NotFound, "Video not found"));
          return;
        }
        if (!s.ok()) {
          reply(MakeInternalRouteError(s, "Resolve failed"));
          return;
        }

        Json::Value video;
        video["video_id"] = record.video_id;
        video["video_uuid"] = record.video_uuid;
        video["instance_domain"] = record.instance_domain;
        video["channel_id"] = record.channel_id;
        video["title"] = record.title;

        Json::Value json;
        json["ok"] = true;
        json["video"] = video;
        reply(JsonResponse(json));
      },
      {drogon::Post});

  // POST /internal/videos/metadata - Metadata rows for (video_id, instance_domain) entries
  app.registerHandler(
      "/internal/videos/metadata",
      [services, config](const drogon::HttpRequestPtr& req, Callback&& callback) {
        Reply reply(services, req, "/internal/videos/metadata", std::move(callback));
        Json::Value body;
        if (!ReadInternalBody(config, req, reply, &body)) return;

        const Json::Value& raw_entries = body["entries"];
        if (!raw_entries.isArray()) {
          reply(MakeJsonError(drogon::k400BadRequest, "Missing entries"));
          return;
        }

        std::vector<VideoIdentity> entries;
        std::unordered_set<std::string> seen;
        for (const auto& raw : raw_entries) {
          if (!raw.isObject()) continue;
          VideoIdentity id{TrimmedField(raw, "video_id"), TrimmedField(raw, "instance_domain")};
          if (id.video_id.empty() || id.instance_domain.empty()) continue;
          if (!seen.insert(LikeKey(id)).second) continue;
          entries.push_back(std::move(id));
        }

        Json::Value rows(Json::arrayValue);
        if (!entries.empty()) {
          std::unordered_map<std::string, VideoRecord> metadata;
          rocksdb::Status s = services.store->GetVideosByKeys(entries, &metadata);
          if (!s.ok()) {
            reply(MakeInternalRouteError(s, "Metadata lookup failed"));
            return;
          }
          for (const auto& id : entries) {
            auto it = metadata.find(LikeKey(id));
            if (it != metadata.end()) rows.append(VideoMetadataJson(it->second));
          }
        }

        Json::Value json;
        json["ok"] = true;
        json["count"] = rows.size();
        json["rows"] = rows;
        reply(JsonResponse(json));
      },
      {drogon::Post});

  // POST /internal/events/ingest - Idempotent interaction events
  app.registerHandler(
      "/internal/events/ingest",
      [services, config](const drogon::HttpRequestPtr& req, Callback&& callback) {
        Reply reply(services, req, "/internal/events/ingest", std::move(callback));
        Json::Value body;
        if (!ReadInternalBody(config, req, reply, &body)) return;

        std::vector<const Json::Value*> items;
        if (body["events"].isArray()) {
          for (const auto& item : body["events"]) {
            if (item.isObject()) items.push_back(&item);
          }
        } else if (!body.empty()) {
          items.push_back(&body);
        }
        if (items.empty()) {
          reply(MakeJsonError(drogon::k400BadRequest, "Missing events"));
          return;
        }

        // The whole batch is validated before anything is stored.
        const int64_t now_ms = internal::WallClockMillis();
        std::vector<InteractionEvent> events(items.size());
        for (size_t i = 0; i < items.size(); ++i) {
          rocksdb::Status s = NormalizeEvent(EventFieldsFromJson(*items[i]), now_ms, &events[i]);
          if (!s.ok()) {
            reply(MakeJsonError(drogon::k400BadRequest, s.getState() ? s.getState() : s.ToString()));
            return;
          }
        }

        uint64_t ingested = 0;
        uint64_t duplicates = 0;
        Json::Value results(Json::arrayValue);
        for (const auto& event : events) {
          bool duplicate = false;
          rocksdb::Status s = services.store->IngestEvent(event, &duplicate);
          if (!s.ok()) {
            reply(MakeInternalRouteError(s, "Event ingest failed"));
            return;
          }
          duplicate ? ++duplicates : ++ingested;

          Json::Value result;
          result["ok"] = true;
          result["duplicate"] = duplicate;
          result["event_id"] = event.event_id;
          result["event_type"] = EventTypeName(event.type);
          results.append(result);
        }

        Json::Value json;
        json["ok"] = true;
        json["count"] = results.size();
        json["ingested"] = static_cast<Json::UInt64>(ingested);
        json["duplicates"] = static_cast<Json::UInt64>(duplicates);
        json["results"] = results;
        reply(JsonResponse(json));
      },
      {drogon::Post});

  // ==========================================================================
  // Health Endpoints
  // ==========================================================================

  // GET /api/health - Catalog size and embedding dimension
  app.registerHandler(
      "/api/health",
      [services](const drogon::HttpRequestPtr& req, Callback&& callback) {
        Reply reply(services, req, "/api/health", std::move(callback));
        if (!AllowRequest(services, req)) {
          reply(MakeJsonError(drogon::k429TooManyRequests, "Rate limit exceeded"));
          return;
        }

        uint64_t total = 0;
        uint32_t dim = 0;
        rocksdb::Status s = services.store->CountEmbeddingsApprox(&total);
        if (s.ok()) s = services.store->EmbeddingDimension(&dim);
        if (!s.ok()) {
          reply(MakeErrorResponse(s, "Health check failed"));
          return;
        }

        Json::Value json;
        json["ok"] = true;
        json["total"] = static_cast<Json::UInt64>(total);
        json["embeddingDim"] = dim;
        reply(JsonResponse(json));
      },
      {drogon::Get});

  // GET /health - Liveness check
  app.registerHandler(
      "/health",
      [](const drogon::HttpRequestPtr& req, Callback&& callback) {
        Json::Value json;
        json["status"] = "healthy";
        callback(JsonResponse(json));
      },
      {drogon::Get});
}

}  // namespace peerrec::server
