#include <peerrec/server/request.hpp>

#include <json/json.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <unordered_set>

namespace peerrec::server {

namespace {

std::string_view TrimView(std::string_view s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
  return s.substr(start, end - start);
}

// First present parameter among name and alias.
std::string Param(const drogon::HttpRequestPtr& req, const char* name, const char* alias) {
  const auto& params = req->getParameters();
  auto it = params.find(name);
  if (it != params.end()) return it->second;
  if (alias) {
    it = params.find(alias);
    if (it != params.end()) return it->second;
  }
  return {};
}

// Value of a string field, trimmed; empty when absent or not a string.
std::string TrimmedString(const Json::Value& obj, const char* key) {
  const Json::Value& v = obj[key];
  if (!v.isString()) return {};
  return std::string(TrimView(v.asString()));
}

// Text of a string or number field, trimmed.
std::string TextField(const Json::Value& obj, const char* key) {
  const Json::Value& v = obj[key];
  if (v.isString()) return std::string(TrimView(v.asString()));
  if (v.isIntegral()) return v.isUInt64() ? std::to_string(v.asUInt64()) : std::to_string(v.asInt64());
  return {};
}

Json::Value StringOrNull(const std::string& value) {
  if (value.empty()) return Json::Value(Json::nullValue);
  return Json::Value(value);
}

Json::Value TimestampOrNull(int64_t value) {
  if (value <= 0) return Json::Value(Json::nullValue);
  return Json::Value(static_cast<Json::Int64>(value));
}

}  // namespace

size_t ParseLimit(std::string_view raw) {
  raw = TrimView(raw);
  if (raw.empty()) return 0;
  size_t i = 0;
  bool negative = false;
  if (raw[0] == '+' || raw[0] == '-') {
    negative = raw[0] == '-';
    ++i;
  }
  if (i == raw.size()) return 0;
  size_t value = 0;
  for (; i < raw.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(raw[i]))) return 0;
    value = value * 10 + static_cast<size_t>(raw[i] - '0');
    if (value > 1000000000) value = 1000000000;
  }
  return negative ? 0 : value;
}

bool ParseFlag(std::string_view raw) {
  std::string value(TrimView(raw));
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value == "1" || value == "true" || value == "yes" || value == "on";
}

std::string ResolveUserId(std::string_view raw) {
  std::string_view value = TrimView(raw);
  if (value.empty()) return kDefaultUserId;
  return std::string(value);
}

std::string ClientIp(const drogon::HttpRequestPtr& req) {
  const std::string& forwarded = req->getHeader("x-forwarded-for");
  if (!forwarded.empty()) {
    std::string_view first = TrimView(std::string_view(forwarded).substr(0, forwarded.find(',')));
    if (!first.empty()) return std::string(first);
  }
  std::string_view real_ip = TrimView(req->getHeader("x-real-ip"));
  if (!real_ip.empty()) return std::string(real_ip);
  std::string peer = req->peerAddr().toIp();
  return peer.empty() ? "unknown" : peer;
}

bool ParseJsonBody(std::string_view body, size_t limit, Json::Value* out) {
  if (body.size() > limit) return false;
  if (TrimView(body).empty()) {
    *out = Json::Value(Json::objectValue);
    return true;
  }

  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value parsed;
  std::string errors;
  if (!reader->parse(body.data(), body.data() + body.size(), &parsed, &errors)) {
    return false;
  }
  if (!parsed.isObject()) return false;
  *out = std::move(parsed);
  return true;
}

bool ParseClientLikes(const Json::Value& body,
                      size_t max_items,
                      std::vector<ClientLikeRef>* out,
                      ClientLikesError* error) {
  out->clear();
  const Json::Value& likes = body["likes"];
  if (!likes.isArray()) return true;

  if (max_items > 0 && likes.size() > max_items) {
    error->error = "Too many likes in request body";
    error->received = likes.size();
    return false;
  }

  for (Json::ArrayIndex i = 0; i < likes.size(); ++i) {
    const Json::Value& entry = likes[i];
    const char* reason = nullptr;
    ClientLikeRef ref;
    if (!entry.isObject()) {
      reason = "likes item must be an object";
    } else {
      ref.video_uuid = TrimmedString(entry, "uuid");
      ref.instance_domain = TrimmedString(entry, "host");
      if (ref.video_uuid.empty()) {
        reason = "likes.uuid must be a non-empty string";
      } else if (ref.instance_domain.empty()) {
        reason = "likes.host must be a non-empty string";
      }
    }
    if (reason) {
      error->error = "Invalid likes payload";
      error->reason = reason;
      error->index = static_cast<int>(i);
      error->received = likes.size();
      return false;
    }
    out->push_back(std::move(ref));
  }
  return true;
}

rocksdb::Status ResolveClientLikes(const Store& store,
                                   const std::vector<ClientLikeRef>& refs,
                                   std::vector<LikeEntry>* out) {
  out->clear();
  std::unordered_set<std::string> seen;
  for (const auto& ref : refs) {
    if (!seen.insert(LikeKey(ref.video_uuid, ref.instance_domain)).second) continue;

    VideoRecord video;
    rocksdb::Status s =
        store.FindVideo("", ref.video_uuid, ref.instance_domain, LookupOrder::kUuidFirst, &video);
    if (s.IsNotFound()) continue;
    if (!s.ok()) return s;

    LikeEntry like;
    like.video_id = video.video_id;
    like.instance_domain = video.instance_domain;
    like.video_uuid = ref.video_uuid;
    out->push_back(std::move(like));
  }
  return rocksdb::Status::OK();
}

RecommendationParams ParseRecommendationParams(const drogon::HttpRequestPtr& req,
                                               const std::string& path_video_id) {
  RecommendationParams params;
  RecommendRequest& r = params.request;

  r.limit = ParseLimit(Param(req, "limit", nullptr));
  r.video_id = std::string(TrimView(Param(req, "id", "video_id")));
  if (r.video_id.empty()) r.video_id = path_video_id;
  r.host = std::string(TrimView(Param(req, "host", "instance_domain")));
  r.video_uuid = std::string(TrimView(Param(req, "uuid", "video_uuid")));
  r.user_id = ResolveUserId(Param(req, "user_id", "userId"));
  r.mode = std::string(TrimView(Param(req, "mode", nullptr)));

  const std::string random = Param(req, "random", nullptr);
  r.random = !random.empty() && random != "0";
  r.refresh_cache = ParseFlag(Param(req, "refresh_cache", nullptr));
  params.debug = ParseFlag(Param(req, "debug", nullptr));
  return params;
}

RawEventFields EventFieldsFromJson(const Json::Value& event) {
  RawEventFields raw;
  raw.event_id = TextField(event, "event_id");
  raw.event_type = TextField(event, "event_type");
  raw.actor_id = TextField(event, "actor_id");
  raw.source_instance = TextField(event, "source_instance");

  const Json::Value& object = event["object"];
  if (object.isObject()) {
    raw.has_object = true;
    raw.video_uuid = TextField(object, "video_uuid");
    raw.instance_domain = TextField(object, "instance_domain");
    raw.canonical_url = TextField(object, "canonical_url");
  }

  const Json::Value& published = event["published_at"];
  if (published.isNumeric()) {
    raw.has_published_at = true;
    raw.published_at = static_cast<int64_t>(published.asDouble());
  } else if (published.isString()) {
    const std::string text(TrimView(published.asString()));
    char* end = nullptr;
    const long long value = text.empty() ? 0 : std::strtoll(text.c_str(), &end, 10);
    if (!text.empty() && end && *end == '\0') {
      raw.has_published_at = true;
      raw.published_at = static_cast<int64_t>(value);
    }
  }

  const Json::Value& payload = event["raw_payload"];
  if (payload.isObject()) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    raw.raw_payload_json = Json::writeString(writer, payload);
  } else {
    raw.raw_payload_json = "{}";
  }
  return raw;
}

// --- Response projection ---

Json::Value StableVideoJson(const VideoRecord& video) {
  Json::Value row(Json::objectValue);
  row["video_id"] = video.video_id;
  row["video_uuid"] = StringOrNull(video.video_uuid);
  row["instance_domain"] = video.instance_domain;
  row["title"] = StringOrNull(video.title);
  row["thumbnail_url"] = StringOrNull(video.thumbnail_url);
  row["preview_path"] = StringOrNull(video.preview_path);
  row["channel_avatar_url"] = StringOrNull(video.channel_avatar_url);
  row["channel_name"] = StringOrNull(video.channel_name);
  row["channel_display_name"] = StringOrNull(video.channel_display_name);
  row["channel_url"] = StringOrNull(video.channel_url);
  row["published_at"] = TimestampOrNull(video.published_at);
  row["duration"] = static_cast<Json::Int64>(video.duration);
  row["video_url"] = StringOrNull(video.video_url);
  row["embed_path"] = StringOrNull(video.embed_path);
  return row;
}

Json::Value DebugJson(const CandidateRow& row) {
  const CandidateDebug& d = row.debug;
  Json::Value debug(Json::objectValue);
  debug["score"] = row.has_score ? Json::Value(row.score) : Json::Value(Json::nullValue);
  debug["similarity_score"] =
      row.has_similarity ? Json::Value(row.similarity_score) : Json::Value(Json::nullValue);
  debug["similarity_pool_min"] =
      d.has_pool_bounds ? Json::Value(d.pool_min) : Json::Value(Json::nullValue);
  debug["similarity_pool_max"] =
      d.has_pool_bounds ? Json::Value(d.pool_max) : Json::Value(Json::nullValue);
  debug["freshness_score"] = d.freshness_score;
  debug["popularity_score"] = d.popularity_score;
  debug["layer"] = StringOrNull(d.layer);
  debug["rank_before"] = d.rank_before > 0 ? Json::Value(d.rank_before) : Json::Value(Json::nullValue);
  debug["rank_after"] = d.rank_after > 0 ? Json::Value(d.rank_after) : Json::Value(Json::nullValue);
  debug["profile"] = StringOrNull(d.profile);
  if (d.has_explore_stats) {
    debug["explore_min"] = d.explore_min;
    debug["explore_max"] = d.explore_max;
    debug["explore_empty"] = d.explore_empty;
    debug["explore_pool_size"] = d.explore_pool_size;
    debug["explore_in_range"] = d.explore_in_range;
    debug["exploit_pool_size"] = d.exploit_pool_size;
    debug["exploit_in_range"] = d.exploit_in_range;
  } else {
    for (const char* key : {"explore_min", "explore_max", "explore_empty", "explore_pool_size",
                            "explore_in_range", "exploit_pool_size", "exploit_in_range"}) {
      debug[key] = Json::Value(Json::nullValue);
    }
  }
  return debug;
}

Json::Value SeedJson(const RecommendRequest& req, const RecommendResponse& resp) {
  Json::Value seed(Json::objectValue);
  switch (resp.path) {
    case RecommendPath::kRandom:
      seed["random"] = true;
      break;
    case RecommendPath::kHome:
      seed["user_id"] = req.user_id;
      seed["mode"] = resp.mode;
      break;
    case RecommendPath::kHomeRandomFill:
      seed["user_id"] = req.user_id;
      seed["random"] = true;
      seed["mode"] = resp.mode;
      break;
    case RecommendPath::kRelated:
      seed["video_id"] = resp.seed.video_id;
      seed["instance_domain"] = resp.seed.instance_domain;
      seed["channel_id"] = StringOrNull(resp.seed.channel_id);
      seed["title"] = StringOrNull(resp.seed.title);
      seed["mode"] = resp.mode;
      break;
  }
  return seed;
}

Json::Value RecommendationsJson(const RecommendRequest& req,
                                const RecommendResponse& resp,
                                uint64_t total,
                                bool include_debug,
                                int64_t generated_at_ms) {
  Json::Value rows(Json::arrayValue);
  for (const auto& row : resp.rows) {
    Json::Value item = StableVideoJson(row.video);
    if (include_debug) item["debug"] = DebugJson(row);
    rows.append(std::move(item));
  }

  Json::Value json(Json::objectValue);
  json["generatedAt"] = static_cast<Json::Int64>(generated_at_ms);
  json["total"] = static_cast<Json::UInt64>(total);
  json["count"] = static_cast<Json::UInt64>(resp.rows.size());
  json["seed"] = SeedJson(req, resp);
  json["rows"] = std::move(rows);
  return json;
}

Json::Value VideoMetadataJson(const VideoRecord& video) {
  Json::Value row(Json::objectValue);
  row["video_id"] = video.video_id;
  row["video_uuid"] = StringOrNull(video.video_uuid);
  row["video_numeric_id"] = static_cast<Json::Int64>(video.video_numeric_id);
  row["instance_domain"] = video.instance_domain;
  row["channel_id"] = StringOrNull(video.channel_id);
  row["channel_name"] = StringOrNull(video.channel_name);
  row["channel_url"] = StringOrNull(video.channel_url);
  row["channel_display_name"] = StringOrNull(video.channel_display_name);
  row["channel_avatar_url"] = StringOrNull(video.channel_avatar_url);
  row["account_name"] = StringOrNull(video.account_name);
  row["account_url"] = StringOrNull(video.account_url);
  row["title"] = StringOrNull(video.title);
  row["description"] = StringOrNull(video.description);
  row["tags_json"] = StringOrNull(video.tags_json);
  row["category"] = StringOrNull(video.category);
  row["published_at"] = TimestampOrNull(video.published_at);
  row["video_url"] = StringOrNull(video.video_url);
  row["duration"] = static_cast<Json::Int64>(video.duration);
  row["thumbnail_url"] = StringOrNull(video.thumbnail_url);
  row["embed_path"] = StringOrNull(video.embed_path);
  row["views"] = static_cast<Json::Int64>(video.views);
  row["likes"] = static_cast<Json::Int64>(video.likes);
  row["dislikes"] = static_cast<Json::Int64>(video.dislikes);
  row["comments_count"] = static_cast<Json::Int64>(video.comments_count);
  row["nsfw"] = video.nsfw;
  row["preview_path"] = StringOrNull(video.preview_path);
  row["last_checked_at"] = TimestampOrNull(video.last_checked_at);
  row["embedding_dim"] = video.embedding_dim;
  row["model_name"] = StringOrNull(video.model_name);
  return row;
}

namespace {

int64_t IntField(const Json::Value& obj, const char* key) {
  const Json::Value& v = obj[key];
  if (v.isNumeric()) return static_cast<int64_t>(v.asDouble());
  return 0;
}

}  // namespace

bool VideoFromJson(const Json::Value& obj,
                   VideoRecord* video,
                   std::vector<float>* embedding,
                   std::string* error) {
  if (!obj.isObject()) {
    *error = "line is not a JSON object";
    return false;
  }

  VideoRecord v;
  v.video_id = TextField(obj, "video_id");
  v.instance_domain = TextField(obj, "instance_domain");
  if (v.video_id.empty() || v.instance_domain.empty()) {
    *error = "video_id and instance_domain are required";
    return false;
  }

  v.video_uuid = TextField(obj, "video_uuid");
  v.video_numeric_id = IntField(obj, "video_numeric_id");
  v.channel_id = TextField(obj, "channel_id");
  v.channel_name = TextField(obj, "channel_name");
  v.channel_url = TextField(obj, "channel_url");
  v.channel_display_name = TextField(obj, "channel_display_name");
  v.channel_avatar_url = TextField(obj, "channel_avatar_url");
  v.account_name = TextField(obj, "account_name");
  v.account_url = TextField(obj, "account_url");
  v.title = TextField(obj, "title");
  v.description = TextField(obj, "description");
  v.category = TextField(obj, "category");
  v.published_at = IntField(obj, "published_at");
  v.video_url = TextField(obj, "video_url");
  v.duration = IntField(obj, "duration");
  v.thumbnail_url = TextField(obj, "thumbnail_url");
  v.embed_path = TextField(obj, "embed_path");
  v.preview_path = TextField(obj, "preview_path");
  v.views = IntField(obj, "views");
  v.likes = IntField(obj, "likes");
  v.dislikes = IntField(obj, "dislikes");
  v.comments_count = IntField(obj, "comments_count");
  v.last_checked_at = IntField(obj, "last_checked_at");
  v.error_count = IntField(obj, "error_count");
  v.model_name = TextField(obj, "model_name");

  const Json::Value& nsfw = obj["nsfw"];
  v.nsfw = nsfw.isBool() ? nsfw.asBool() : (nsfw.isNumeric() && nsfw.asInt() != 0);

  // tags may arrive as a JSON string or as the array itself
  const Json::Value& tags = obj["tags_json"];
  if (tags.isString()) {
    v.tags_json = tags.asString();
  } else if (tags.isArray()) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    v.tags_json = Json::writeString(writer, tags);
  }

  std::vector<float> values;
  const Json::Value& raw = obj["embedding"];
  if (!raw.isNull()) {
    if (!raw.isArray()) {
      *error = "embedding must be an array of numbers";
      return false;
    }
    values.reserve(raw.size());
    for (const auto& x : raw) {
      if (!x.isNumeric()) {
        *error = "embedding must be an array of numbers";
        return false;
      }
      values.push_back(x.asFloat());
    }
  }

  *video = std::move(v);
  *embedding = std::move(values);
  return true;
}

}  // namespace peerrec::server
