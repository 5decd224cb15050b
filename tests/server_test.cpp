// Server tests for the peerrec HTTP layer
// Tests: Config parsing, profile JSON, metrics, request helpers, and HTTP handlers

#include <gtest/gtest.h>

#include <peerrec/ann_source.hpp>
#include <peerrec/recommender.hpp>
#include <peerrec/server/config.hpp>
#include <peerrec/server/handlers.hpp>
#include <peerrec/server/metrics.hpp>
#include <peerrec/server/request.hpp>
#include <peerrec/store.hpp>
#include <peerrec/test_utils.hpp>
#include <peerrec/vector_index.hpp>

#include <drogon/drogon.h>
#include <json/json.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <random>
#include <thread>

namespace peerrec::server {
namespace {

// =============================================================================
// Test Utilities
// =============================================================================

std::string RandomSuffix() {
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<> dis(0, 999999);
  return std::to_string(dis(gen));
}

class TempDir {
 public:
  TempDir() {
    path_ = std::filesystem::temp_directory_path() /
            ("peerrec_server_test_" + RandomSuffix());
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  std::filesystem::path path() const { return path_; }
  std::string string() const { return path_.string(); }

 private:
  std::filesystem::path path_;
};

Json::Value ParseJson(const std::string& text) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  EXPECT_TRUE(reader->parse(text.data(), text.data() + text.size(), &root, &errors)) << errors;
  return root;
}

// =============================================================================
// Config Tests
// =============================================================================

class ConfigTest : public ::testing::Test {
 protected:
  std::string WriteFile(const std::string& name, const std::string& content) {
    auto path = temp_dir_.path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
  }

  static Config ValidConfig() {
    Config config;
    config.db_path = "/data/catalog";
    config.index.path = "/data/videos.hnsw";
    return config;
  }

  TempDir temp_dir_;
};

TEST_F(ConfigTest, DefaultValues) {
  Config config;
  EXPECT_EQ(config.server.host, "127.0.0.1");
  EXPECT_EQ(config.server.port, 7070);
  EXPECT_EQ(config.server.threads, 0u);
  EXPECT_EQ(config.server.log_level, "info");
  EXPECT_TRUE(config.server.use_client_likes);
  EXPECT_EQ(config.server.client_likes_max, 5u);
  EXPECT_EQ(config.server.recommend_body_limit, 65536u);
  EXPECT_EQ(config.server.internal_body_limit, 1000000u);
  EXPECT_TRUE(config.db_path.empty());
  EXPECT_TRUE(config.rate_limit.enabled);
  EXPECT_EQ(config.rate_limit.max_requests, 60);
  EXPECT_EQ(config.recommender.likes_source, "cache-optimized");
  EXPECT_EQ(config.recommender.default_limit, 48u);
  EXPECT_TRUE(config.metrics.enabled);
}

TEST_F(ConfigTest, LoadFromArgs_Flags) {
  const char* argv[] = {"peerrec-server", "--db-path", "/data/test", "--index-path",
                        "/data/index.hnsw", "-p", "9001", "--host", "0.0.0.0",
                        "--threads", "4", "--log-level", "debug", "--profiles", "/etc/p.json"};
  auto config = Config::LoadFromArgs(15, const_cast<char**>(argv));
  EXPECT_EQ(config.db_path, "/data/test");
  EXPECT_EQ(config.index.path, "/data/index.hnsw");
  EXPECT_EQ(config.server.port, 9001);
  EXPECT_EQ(config.server.host, "0.0.0.0");
  EXPECT_EQ(config.server.threads, 4u);
  EXPECT_EQ(config.server.log_level, "debug");
  EXPECT_EQ(config.profiles_path, "/etc/p.json");
}

TEST_F(ConfigTest, LoadFromArgs_UnknownOption) {
  const char* argv[] = {"peerrec-server", "--unknown"};
  EXPECT_THROW(Config::LoadFromArgs(2, const_cast<char**>(argv)), std::runtime_error);
}

TEST_F(ConfigTest, LoadFromArgs_MissingValue) {
  const char* argv[] = {"peerrec-server", "--db-path"};
  EXPECT_THROW(Config::LoadFromArgs(2, const_cast<char**>(argv)), std::runtime_error);
}

TEST_F(ConfigTest, LoadFromArgs_InvalidPort) {
  const char* argv[] = {"peerrec-server", "--port", "http"};
  EXPECT_THROW(Config::LoadFromArgs(3, const_cast<char**>(argv)), std::runtime_error);
}

TEST_F(ConfigTest, LoadFromArgs_FlagsOverrideConfigFile) {
  std::string path = WriteFile("config.yaml",
                               "server:\n"
                               "  port: 9000\n"
                               "store:\n"
                               "  path: /from/file\n");
  const char* argv[] = {"peerrec-server", "--port", "9100", "-c", path.c_str()};
  auto config = Config::LoadFromArgs(5, const_cast<char**>(argv));
  EXPECT_EQ(config.server.port, 9100);
  EXPECT_EQ(config.db_path, "/from/file");
}

TEST_F(ConfigTest, LoadFromFile_Sections) {
  std::string path = WriteFile("config.yaml",
                               "# peerrec\n"
                               "server:\n"
                               "  host: \"0.0.0.0\"\n"
                               "  port: 9000\n"
                               "  debug_enabled: false\n"
                               "  client_likes_max: 3\n"
                               "store:\n"
                               "  path: '/var/lib/peerrec'\n"
                               "  video_error_threshold: 2\n"
                               "index:\n"
                               "  path: /var/lib/peerrec/videos.hnsw\n"
                               "  ef_search: 128\n"
                               "  max_per_author: 2\n"
                               "recommendations:\n"
                               "  likes_source: ann\n"
                               "  similar_per_like: 200\n"
                               "personalization:\n"
                               "  alpha: 0.5\n"
                               "  beta: 0.5\n"
                               "rate_limit:\n"
                               "  enabled: false\n"
                               "random_cache:\n"
                               "  size: 1000\n"
                               "  filtered_mode: true\n"
                               "moderation:\n"
                               "  channel_filter: false\n"
                               "metrics:\n"
                               "  path: /prom\n");

  auto config = Config::LoadFromFile(path);
  EXPECT_EQ(config.server.host, "0.0.0.0");
  EXPECT_EQ(config.server.port, 9000);
  EXPECT_FALSE(config.server.debug_enabled);
  EXPECT_EQ(config.server.client_likes_max, 3u);
  EXPECT_EQ(config.db_path, "/var/lib/peerrec");
  EXPECT_EQ(config.store.video_error_threshold, 2);
  EXPECT_EQ(config.index.path, "/var/lib/peerrec/videos.hnsw");
  EXPECT_EQ(config.index.ef_search, 128);
  EXPECT_EQ(config.index.search.max_per_author, 2);
  EXPECT_EQ(config.recommender.likes_source, "ann");
  EXPECT_EQ(config.recommender.likes.similar_per_like, 200u);
  EXPECT_DOUBLE_EQ(config.recommender.personalization.alpha, 0.5);
  EXPECT_DOUBLE_EQ(config.recommender.personalization.beta, 0.5);
  EXPECT_FALSE(config.rate_limit.enabled);
  EXPECT_EQ(config.random_cache.settings.size, 1000u);
  EXPECT_TRUE(config.random_cache.settings.filtered_mode);
  EXPECT_TRUE(config.recommender.moderation.apply_instance_filter);
  EXPECT_FALSE(config.recommender.moderation.apply_channel_filter);
  EXPECT_EQ(config.metrics.path, "/prom");
}

TEST_F(ConfigTest, LoadFromFile_InvalidNumber) {
  std::string path = WriteFile("config.yaml", "server:\n  port: many\n");
  EXPECT_THROW(Config::LoadFromFile(path), std::runtime_error);
}

TEST_F(ConfigTest, LoadFromFile_NonExistent) {
  EXPECT_THROW(Config::LoadFromFile("/nonexistent/config.yaml"), std::runtime_error);
}

TEST_F(ConfigTest, Validate_Valid) {
  EXPECT_NO_THROW(ValidConfig().Validate());
}

TEST_F(ConfigTest, Validate_Rejections) {
  Config missing_db = ValidConfig();
  missing_db.db_path.clear();
  EXPECT_THROW(missing_db.Validate(), std::runtime_error);

  Config missing_index = ValidConfig();
  missing_index.index.path.clear();
  EXPECT_THROW(missing_index.Validate(), std::runtime_error);

  Config bad_port = ValidConfig();
  bad_port.server.port = 0;
  EXPECT_THROW(bad_port.Validate(), std::runtime_error);

  Config bad_level = ValidConfig();
  bad_level.server.log_level = "verbose";
  EXPECT_THROW(bad_level.Validate(), std::runtime_error);

  Config bad_source = ValidConfig();
  bad_source.recommender.likes_source = "faiss";
  EXPECT_THROW(bad_source.Validate(), std::runtime_error);

  Config bad_rate = ValidConfig();
  bad_rate.rate_limit.max_requests = 0;
  EXPECT_THROW(bad_rate.Validate(), std::runtime_error);
  bad_rate.rate_limit.enabled = false;
  EXPECT_NO_THROW(bad_rate.Validate());

  Config bad_body = ValidConfig();
  bad_body.server.recommend_body_limit = 0;
  EXPECT_THROW(bad_body.Validate(), std::runtime_error);
}

// =============================================================================
// Profile JSON Tests
// =============================================================================

TEST(ProfileJsonTest, ParsesProfiles) {
  Json::Value root = ParseJson(R"({
    "default_profile": "home",
    "profiles": {
      "home": {
        "batch_size": 24,
        "overfetch_factor": 2,
        "generators": {
          "exploit": {"gather_ratio": 0.7, "mix_ratio": 0.6, "requires_likes": true,
                      "pool_size": 100, "max_per_author": 2},
          "explore": {"similarity_min": 0.3, "similarity_max": 0.5, "shuffle": true}
        },
        "mixing": {"order": ["explore", "exploit"]},
        "scoring": {"weights": {"similarity": 0.5, "freshness": 0.3, "popularity": 0.2},
                    "layer_weights": {"exploit": 0.1},
                    "freshness_half_life_days": 7,
                    "popularity": {"views": 0.5, "likes": 3}},
        "soft_caps": {"min": {"explore": 2}, "max": {"exploit": 10}},
        "diversity": {"max_per_author": 4, "max_per_instance": 6}
      },
      "guest": {}
    }
  })");

  RecommendationConfig config = ParseRecommendationConfig(root);
  ASSERT_EQ(config.profiles.size(), 2u);
  EXPECT_EQ(config.default_profile, "home");

  const Profile* home = config.Find("home");
  ASSERT_NE(home, nullptr);
  EXPECT_EQ(home->batch_size, 24u);
  EXPECT_DOUBLE_EQ(home->overfetch_factor, 2.0);
  ASSERT_EQ(home->generators.size(), 2u);

  const GeneratorConfig* exploit = home->FindGenerator("exploit");
  ASSERT_NE(exploit, nullptr);
  EXPECT_DOUBLE_EQ(exploit->gather_ratio, 0.7);
  EXPECT_DOUBLE_EQ(exploit->mix_ratio, 0.6);
  EXPECT_TRUE(exploit->requires_likes);
  EXPECT_EQ(exploit->pool_size, 100u);
  EXPECT_EQ(exploit->max_per_author, 2);

  const GeneratorConfig* explore = home->FindGenerator("explore");
  ASSERT_NE(explore, nullptr);
  EXPECT_DOUBLE_EQ(explore->similarity_min, 0.3);
  EXPECT_DOUBLE_EQ(explore->similarity_max, 0.5);
  EXPECT_TRUE(explore->shuffle);

  EXPECT_EQ(home->order, (std::vector<std::string>{"explore", "exploit"}));
  EXPECT_DOUBLE_EQ(home->scoring.similarity_weight, 0.5);
  EXPECT_DOUBLE_EQ(home->scoring.freshness_weight, 0.3);
  EXPECT_DOUBLE_EQ(home->scoring.popularity_weight, 0.2);
  EXPECT_DOUBLE_EQ(home->scoring.LayerWeight("exploit"), 0.1);
  EXPECT_DOUBLE_EQ(home->scoring.freshness_half_life_days, 7.0);
  EXPECT_DOUBLE_EQ(home->scoring.popularity_view_weight, 0.5);
  EXPECT_DOUBLE_EQ(home->scoring.popularity_like_weight, 3.0);
  EXPECT_EQ(home->soft_min.at("explore"), 2);
  EXPECT_EQ(home->soft_max.at("exploit"), 10);
  EXPECT_EQ(home->diversity.max_per_author, 4);
  EXPECT_EQ(home->diversity.max_per_instance, 6);

  const Profile* guest = config.Find("guest");
  ASSERT_NE(guest, nullptr);
  EXPECT_TRUE(guest->generators.empty());
}

TEST(ProfileJsonTest, RejectsMalformedDocuments) {
  EXPECT_THROW(ParseRecommendationConfig(ParseJson("[]")), std::runtime_error);
  EXPECT_THROW(ParseRecommendationConfig(ParseJson(R"({"profiles": {}})")), std::runtime_error);
  EXPECT_THROW(ParseRecommendationConfig(ParseJson(R"({"profiles": {"home": 3}})")),
               std::runtime_error);
  EXPECT_THROW(ParseRecommendationConfig(ParseJson(
                   R"({"profiles": {"home": {"batch_size": "big"}}})")),
               std::runtime_error);
  EXPECT_THROW(ParseRecommendationConfig(ParseJson(
                   R"({"profiles": {"home": {"generators": {"popular": {"shuffle": 1}}}}})")),
               std::runtime_error);
  EXPECT_THROW(ParseRecommendationConfig(ParseJson(
                   R"({"default_profile": "upnext", "profiles": {"home": {}}})")),
               std::runtime_error);
}

TEST(ProfileJsonTest, LoadFromFile) {
  TempDir dir;
  auto path = dir.path() / "profiles.json";
  {
    std::ofstream out(path);
    out << R"({"profiles": {"home": {"batch_size": 12}}})";
  }
  RecommendationConfig config = LoadRecommendationConfigFile(path.string());
  ASSERT_NE(config.Find("home"), nullptr);
  EXPECT_EQ(config.Find("home")->batch_size, 12u);

  {
    std::ofstream out(path);
    out << "{not json";
  }
  EXPECT_THROW(LoadRecommendationConfigFile(path.string()), std::runtime_error);
  EXPECT_THROW(LoadRecommendationConfigFile((dir.path() / "missing.json").string()),
               std::runtime_error);
}

TEST(ProfileJsonTest, BuiltInProfilesWithoutPath) {
  Config config;
  RecommendationConfig profiles = config.LoadProfiles();
  EXPECT_NE(profiles.Find("home"), nullptr);
  EXPECT_NE(profiles.Find("upnext"), nullptr);
}

// =============================================================================
// PrometheusMetrics Tests
// =============================================================================

class MetricsTest : public ::testing::Test {
 protected:
  PrometheusMetrics metrics_;
};

TEST_F(MetricsTest, PrometheusName) {
  EXPECT_EQ(PrometheusName("peerrec.recommend.rows"), "peerrec_recommend_rows");
  EXPECT_EQ(PrometheusName("a-b c:d_e"), "a_b_c:d_e");
}

TEST_F(MetricsTest, Counter_Increments) {
  metrics_.Counter("peerrec.ann.calls", 1);
  metrics_.Counter("peerrec.ann.calls", 5);

  std::string output = metrics_.Export();
  EXPECT_NE(output.find("peerrec_ann_calls 6"), std::string::npos);
  EXPECT_NE(output.find("# TYPE peerrec_ann_calls counter"), std::string::npos);
}

TEST_F(MetricsTest, Gauge_Overwrite) {
  metrics_.Gauge("peerrec.catalog.videos", 10.0);
  metrics_.Gauge("peerrec.catalog.videos", 20.0);

  std::string output = metrics_.Export();
  EXPECT_NE(output.find("peerrec_catalog_videos 20"), std::string::npos);
  EXPECT_EQ(output.find("peerrec_catalog_videos 10"), std::string::npos);
}

TEST_F(MetricsTest, Histogram_RecordsValues) {
  metrics_.Histogram("peerrec.recommend.rows", 5);
  metrics_.Histogram("peerrec.recommend.rows", 50);
  metrics_.Histogram("peerrec.recommend.rows", 500);

  std::string output = metrics_.Export();
  EXPECT_NE(output.find("peerrec_recommend_rows_count 3"), std::string::npos);
  EXPECT_NE(output.find("peerrec_recommend_rows_sum 555"), std::string::npos);
  EXPECT_NE(output.find("peerrec_recommend_rows_bucket{le=\"+Inf\"} 3"), std::string::npos);
}

TEST_F(MetricsTest, HttpAndRateLimitCounters) {
  metrics_.RecordHttpRequest("POST", "/recommendations", 200, 1.5);
  metrics_.RecordHttpRequest("POST", "/recommendations", 429, 0.1);
  metrics_.RecordRateLimited("/recommendations");
  metrics_.RecordRateLimited("/recommendations");

  std::string output = metrics_.Export();
  EXPECT_NE(output.find("peerrec_http_requests_total{method=\"POST\",path=\"/recommendations\","
                        "status=\"429\"} 1"),
            std::string::npos);
  EXPECT_NE(output.find("peerrec_http_rate_limited_total{path=\"/recommendations\"} 2"),
            std::string::npos);
  EXPECT_NE(output.find("peerrec_http_request_duration_ms_count 2"), std::string::npos);
}

TEST(RequestTimerTest, RecordsLatency) {
  auto metrics = std::make_shared<PrometheusMetrics>();
  {
    RequestTimer timer(metrics, "GET", "/api/health");
    timer.SetStatusCode(503);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  std::string output = metrics->Export();
  EXPECT_NE(output.find("status=\"503\""), std::string::npos);
  EXPECT_NE(output.find("peerrec_http_request_duration_ms"), std::string::npos);
}

// =============================================================================
// Request Helper Tests
// =============================================================================

TEST(RequestParsingTest, ParseLimit) {
  EXPECT_EQ(ParseLimit(""), 0u);
  EXPECT_EQ(ParseLimit(" 12 "), 12u);
  EXPECT_EQ(ParseLimit("+7"), 7u);
  EXPECT_EQ(ParseLimit("-3"), 0u);
  EXPECT_EQ(ParseLimit("4x"), 0u);
  EXPECT_EQ(ParseLimit("abc"), 0u);
}

TEST(RequestParsingTest, ParseFlag) {
  for (const char* on : {"1", "true", "TRUE", " yes ", "On"}) EXPECT_TRUE(ParseFlag(on)) << on;
  for (const char* off : {"", "0", "false", "no", "2"}) EXPECT_FALSE(ParseFlag(off)) << off;
}

TEST(RequestParsingTest, ResolveUserId) {
  EXPECT_EQ(ResolveUserId(""), kDefaultUserId);
  EXPECT_EQ(ResolveUserId("   "), kDefaultUserId);
  EXPECT_EQ(ResolveUserId(" alice "), "alice");
}

TEST(RequestParsingTest, ParseJsonBody) {
  Json::Value body;
  ASSERT_TRUE(ParseJsonBody("", 100, &body));
  EXPECT_TRUE(body.isObject());
  EXPECT_TRUE(body.empty());

  ASSERT_TRUE(ParseJsonBody(R"({"likes": []})", 100, &body));
  EXPECT_TRUE(body["likes"].isArray());

  EXPECT_FALSE(ParseJsonBody("{broken", 100, &body));
  EXPECT_FALSE(ParseJsonBody("[1, 2]", 100, &body));
  EXPECT_FALSE(ParseJsonBody(R"({"a": 1})", 4, &body));
}

TEST(RequestParsingTest, ParseClientLikes) {
  std::vector<ClientLikeRef> refs;
  ClientLikesError error;

  ASSERT_TRUE(ParseClientLikes(ParseJson("{}"), 5, &refs, &error));
  EXPECT_TRUE(refs.empty());

  ASSERT_TRUE(ParseClientLikes(
      ParseJson(R"({"likes": [{"uuid": " u1 ", "host": "a.example"}]})"), 5, &refs, &error));
  ASSERT_EQ(refs.size(), 1u);
  EXPECT_EQ(refs[0].video_uuid, "u1");
  EXPECT_EQ(refs[0].instance_domain, "a.example");

  EXPECT_FALSE(ParseClientLikes(
      ParseJson(R"({"likes": [{"uuid": "a", "host": "h"}, {"uuid": "b", "host": "h"}]})"), 1,
      &refs, &error));
  EXPECT_EQ(error.error, "Too many likes in request body");
  EXPECT_EQ(error.index, -1);
  EXPECT_EQ(error.received, 2u);

  error = ClientLikesError{};
  EXPECT_FALSE(ParseClientLikes(
      ParseJson(R"({"likes": [{"uuid": "a", "host": "h"}, {"uuid": "b", "host": " "}]})"), 5,
      &refs, &error));
  EXPECT_EQ(error.error, "Invalid likes payload");
  EXPECT_EQ(error.reason, "likes.host must be a non-empty string");
  EXPECT_EQ(error.index, 1);

  error = ClientLikesError{};
  EXPECT_FALSE(ParseClientLikes(ParseJson(R"({"likes": ["u1"]})"), 5, &refs, &error));
  EXPECT_EQ(error.reason, "likes item must be an object");
  EXPECT_EQ(error.index, 0);
}

TEST(RequestParsingTest, RecommendationParams) {
  auto req = drogon::HttpRequest::newHttpRequest();
  req->setParameter("limit", "12");
  req->setParameter("video_id", " v1 ");
  req->setParameter("instance_domain", "a.example");
  req->setParameter("userId", "alice");
  req->setParameter("mode", "upnext");
  req->setParameter("random", "0");
  req->setParameter("refresh_cache", "true");
  req->setParameter("debug", "1");

  RecommendationParams params = ParseRecommendationParams(req, "");
  EXPECT_EQ(params.request.limit, 12u);
  EXPECT_EQ(params.request.video_id, "v1");
  EXPECT_EQ(params.request.host, "a.example");
  EXPECT_EQ(params.request.user_id, "alice");
  EXPECT_EQ(params.request.mode, "upnext");
  EXPECT_FALSE(params.request.random);
  EXPECT_TRUE(params.request.refresh_cache);
  EXPECT_TRUE(params.debug);

  auto bare = drogon::HttpRequest::newHttpRequest();
  bare->setParameter("random", "yes");
  RecommendationParams from_path = ParseRecommendationParams(bare, "path-id");
  EXPECT_EQ(from_path.request.video_id, "path-id");
  EXPECT_EQ(from_path.request.user_id, kDefaultUserId);
  EXPECT_TRUE(from_path.request.random);
}

TEST(RequestParsingTest, ClientIp) {
  auto req = drogon::HttpRequest::newHttpRequest();
  req->addHeader("X-Forwarded-For", " 10.0.0.1 , 10.0.0.2");
  req->addHeader("X-Real-IP", "10.0.0.9");
  EXPECT_EQ(ClientIp(req), "10.0.0.1");

  auto real_ip = drogon::HttpRequest::newHttpRequest();
  real_ip->addHeader("X-Real-IP", "10.0.0.9");
  EXPECT_EQ(ClientIp(real_ip), "10.0.0.9");
}

TEST(RequestParsingTest, EventFieldsFromJson) {
  RawEventFields raw = EventFieldsFromJson(ParseJson(R"({
    "event_id": 42,
    "event_type": "Like",
    "actor_id": "https://a.example/users/bob",
    "object": {"video_uuid": " u1 ", "instance_domain": "b.example"},
    "published_at": "1600000000000",
    "raw_payload": {"type": "Like"}
  })"));
  EXPECT_EQ(raw.event_id, "42");
  EXPECT_EQ(raw.event_type, "Like");
  ASSERT_TRUE(raw.has_object);
  EXPECT_EQ(raw.video_uuid, "u1");
  EXPECT_EQ(raw.instance_domain, "b.example");
  ASSERT_TRUE(raw.has_published_at);
  EXPECT_EQ(raw.published_at, 1600000000000);
  EXPECT_EQ(raw.raw_payload_json, R"({"type":"Like"})");

  RawEventFields bare = EventFieldsFromJson(ParseJson(R"({"published_at": "soon"})"));
  EXPECT_FALSE(bare.has_object);
  EXPECT_FALSE(bare.has_published_at);
  EXPECT_EQ(bare.raw_payload_json, "{}");
}

TEST(RequestParsingTest, VideoFromJson) {
  VideoRecord video;
  std::vector<float> embedding;
  std::string error;

  ASSERT_TRUE(VideoFromJson(ParseJson(R"({
    "video_id": "v1", "instance_domain": "a.example", "video_uuid": "u1",
    "title": "Hello", "views": 12, "nsfw": 1, "tags_json": ["x", "y"],
    "embedding": [1, 0.5]
  })"), &video, &embedding, &error)) << error;
  EXPECT_EQ(video.video_id, "v1");
  EXPECT_EQ(video.video_uuid, "u1");
  EXPECT_EQ(video.title, "Hello");
  EXPECT_EQ(video.views, 12);
  EXPECT_TRUE(video.nsfw);
  EXPECT_EQ(video.tags_json, R"(["x","y"])");
  EXPECT_EQ(embedding, (std::vector<float>{1.0f, 0.5f}));

  EXPECT_FALSE(VideoFromJson(ParseJson(R"({"video_id": "v1"})"), &video, &embedding, &error));
  EXPECT_EQ(error, "video_id and instance_domain are required");
  EXPECT_FALSE(VideoFromJson(ParseJson(R"({"video_id": "v1", "instance_domain": "a",
                                           "embedding": ["x"]})"),
                             &video, &embedding, &error));
  EXPECT_EQ(error, "embedding must be an array of numbers");
}

// =============================================================================
// Response Projection Tests
// =============================================================================

TEST(ResponseJsonTest, StableVideoJsonUsesNulls) {
  VideoRecord video = peerrec::testing::MakeVideo("v1", "a.example", "chan", 1600000000000);
  video.thumbnail_url = "https://a.example/t.jpg";
  video.duration = 90;

  Json::Value json = StableVideoJson(video);
  EXPECT_EQ(json["video_id"].asString(), "v1");
  EXPECT_EQ(json["video_uuid"].asString(), "uuid-v1");
  EXPECT_EQ(json["thumbnail_url"].asString(), "https://a.example/t.jpg");
  EXPECT_TRUE(json["preview_path"].isNull());
  EXPECT_TRUE(json["channel_name"].isNull());
  EXPECT_EQ(json["published_at"].asInt64(), 1600000000000);
  EXPECT_EQ(json["duration"].asInt64(), 90);
  EXPECT_FALSE(json.isMember("views"));
}

TEST(ResponseJsonTest, SeedShapes) {
  RecommendRequest req;
  req.user_id = "alice";

  RecommendResponse resp;
  resp.path = RecommendPath::kRandom;
  EXPECT_TRUE(SeedJson(req, resp)["random"].asBool());

  resp.path = RecommendPath::kHome;
  resp.mode = "home";
  Json::Value home = SeedJson(req, resp);
  EXPECT_EQ(home["user_id"].asString(), "alice");
  EXPECT_EQ(home["mode"].asString(), "home");
  EXPECT_FALSE(home.isMember("random"));

  resp.path = RecommendPath::kHomeRandomFill;
  Json::Value fill = SeedJson(req, resp);
  EXPECT_TRUE(fill["random"].asBool());
  EXPECT_EQ(fill["user_id"].asString(), "alice");

  resp.path = RecommendPath::kRelated;
  resp.mode = "upnext";
  resp.seed = peerrec::testing::MakeVideo("s1", "a.example");
  Json::Value related = SeedJson(req, resp);
  EXPECT_EQ(related["video_id"].asString(), "s1");
  EXPECT_EQ(related["instance_domain"].asString(), "a.example");
  EXPECT_TRUE(related["channel_id"].isNull());
  EXPECT_EQ(related["mode"].asString(), "upnext");
}

TEST(ResponseJsonTest, RecommendationsEnvelope) {
  RecommendRequest req;
  RecommendResponse resp;
  resp.path = RecommendPath::kRandom;
  CandidateRow row = peerrec::testing::MakeRow(peerrec::testing::MakeVideo("v1", "a.example"), 0.5);
  row.debug.layer = "popular";
  row.debug.rank_after = 1;
  resp.rows.push_back(row);

  Json::Value plain = RecommendationsJson(req, resp, 100, false, 1700000000000);
  EXPECT_EQ(plain["generatedAt"].asInt64(), 1700000000000);
  EXPECT_EQ(plain["total"].asUInt64(), 100u);
  EXPECT_EQ(plain["count"].asUInt64(), 1u);
  ASSERT_EQ(plain["rows"].size(), 1u);
  EXPECT_FALSE(plain["rows"][0].isMember("debug"));

  Json::Value debug = RecommendationsJson(req, resp, 100, true, 1700000000000);
  const Json::Value& d = debug["rows"][0]["debug"];
  EXPECT_DOUBLE_EQ(d["score"].asDouble(), 0.5);
  EXPECT_EQ(d["layer"].asString(), "popular");
  EXPECT_EQ(d["rank_after"].asInt(), 1);
  EXPECT_TRUE(d["rank_before"].isNull());
  EXPECT_TRUE(d["similarity_score"].isNull());
  EXPECT_TRUE(d["explore_min"].isNull());
}

// =============================================================================
// Error Response Tests
// =============================================================================

TEST(ErrorResponseTest, MakeErrorResponse) {
  struct Case {
    rocksdb::Status status;
    drogon::HttpStatusCode code;
    const char* error;
  };
  const Case cases[] = {
      {rocksdb::Status::NotFound("missing"), drogon::k404NotFound, "not_found"},
      {rocksdb::Status::InvalidArgument("bad"), drogon::k400BadRequest, "invalid_argument"},
      {rocksdb::Status::TimedOut("slow"), drogon::k504GatewayTimeout, "timeout"},
      {rocksdb::Status::Busy("busy"), drogon::k503ServiceUnavailable, "service_busy"},
      {rocksdb::Status::Corruption("bits"), drogon::k500InternalServerError, "internal_error"},
  };

  for (const auto& c : cases) {
    auto resp = MakeErrorResponse(c.status, "Lookup failed");
    EXPECT_EQ(resp->statusCode(), c.code);
    auto json = resp->getJsonObject();
    ASSERT_TRUE(json != nullptr);
    EXPECT_EQ((*json)["error"].asString(), c.error);
    EXPECT_EQ((*json)["code"].asInt(), static_cast<int>(c.code));
  }

  auto internal = MakeErrorResponse(rocksdb::Status::IOError("disk"), "Lookup failed");
  EXPECT_EQ((*internal->getJsonObject())["message"].asString(), "Lookup failed");
}

TEST(ErrorResponseTest, InternalRoutesReportStorageFailuresAs500) {
  const rocksdb::Status failures[] = {
      rocksdb::Status::TimedOut("slow"),
      rocksdb::Status::Busy("busy"),
      rocksdb::Status::TryAgain("again"),
      rocksdb::Status::IOError("disk"),
  };
  for (const auto& status : failures) {
    auto resp = MakeInternalRouteError(status, "Event ingest failed");
    EXPECT_EQ(resp->statusCode(), drogon::k500InternalServerError) << status.ToString();
    auto json = resp->getJsonObject();
    ASSERT_TRUE(json != nullptr);
    EXPECT_EQ((*json)["error"].asString(), "internal_error");
    EXPECT_EQ((*json)["message"].asString(), "Event ingest failed");
  }

  EXPECT_EQ(MakeInternalRouteError(rocksdb::Status::NotFound("x"), "Resolve failed")->statusCode(),
            drogon::k404NotFound);
  EXPECT_EQ(MakeInternalRouteError(rocksdb::Status::InvalidArgument("x"), "Resolve failed")->statusCode(),
            drogon::k400BadRequest);
}

TEST(ErrorResponseTest, MakeJsonError) {
  auto resp = MakeJsonError(drogon::k429TooManyRequests, "Rate limit exceeded");
  EXPECT_EQ(resp->statusCode(), drogon::k429TooManyRequests);
  auto json = resp->getJsonObject();
  ASSERT_TRUE(json != nullptr);
  EXPECT_EQ((*json)["error"].asString(), "rate_limited");
  EXPECT_EQ((*json)["code"].asInt(), 429);
  EXPECT_EQ((*json)["message"].asString(), "Rate limit exceeded");
}

// =============================================================================
// Client Likes Resolution Tests
// =============================================================================

class ResolveClientLikesTest : public peerrec::testing::StoreFixture {};

TEST_F(ResolveClientLikesTest, ResolvesKnownAndDeduplicates) {
  ASSERT_TRUE(OpenStore().ok());
  AddVideo(peerrec::testing::MakeVideo("v1", "a.example"), peerrec::testing::AxisEmbedding(4, 0));
  AddVideo(peerrec::testing::MakeVideo("v2", "b.example"), peerrec::testing::AxisEmbedding(4, 1));

  std::vector<ClientLikeRef> refs = {{"uuid-v2", "b.example"},
                                     {"uuid-missing", "a.example"},
                                     {"uuid-v1", "a.example"},
                                     {"uuid-v2", "b.example"}};
  std::vector<LikeEntry> likes;
  rocksdb::Status s = ResolveClientLikes(*store_, refs, &likes);
  ASSERT_TRUE(s.ok()) << s.ToString();
  ASSERT_EQ(likes.size(), 2u);
  EXPECT_EQ(likes[0].video_id, "v2");
  EXPECT_EQ(likes[0].instance_domain, "b.example");
  EXPECT_EQ(likes[1].video_id, "v1");
}

// =============================================================================
// End-to-End Server Tests (using Drogon test client)
// =============================================================================

class ServerE2ETest : public ::testing::Test {
 protected:
  static constexpr size_t kDim = 8;

  static void SetUpTestSuite() {
    temp_dir_ = std::make_unique<TempDir>();
    db_path_ = (temp_dir_->path() / "e2e_test_db").string();

    auto status = Store::Open(db_path_, &store_);
    ASSERT_TRUE(status.ok()) << status.ToString();

    index_ = internal::CreateHNSWIndex(kDim, 64);
    AddIndexed("liked", "a.example", "chan-a", peerrec::testing::AxisEmbedding(kDim, 0));
    AddIndexed("n1", "b.example", "chan-b", peerrec::testing::RotatedEmbedding(kDim, 0, 1, 0.2));
    AddIndexed("n2", "c.example", "chan-c", peerrec::testing::RotatedEmbedding(kDim, 0, 2, 0.4));
    AddIndexed("n3", "d.example", "chan-d", peerrec::testing::RotatedEmbedding(kDim, 0, 3, 0.7));
    AddIndexed("other", "e.example", "chan-e", peerrec::testing::AxisEmbedding(kDim, 5));

    ann_ = std::make_unique<AnnSimilaritySource>(store_.get(), index_.get());
    status = Recommender::Create(store_.get(), ann_.get(), DefaultRecommendationConfig(),
                                 RecommenderOptions{}, &recommender_);
    ASSERT_TRUE(status.ok()) << status.ToString();

    Config config;
    config.db_path = db_path_;
    config.server.client_likes_max = 2;

    Services services;
    services.store = store_.get();
    services.recommender = recommender_.get();
    RegisterHandlers(services, config);

    port_ = 18080 + (std::random_device{}() % 1000);

    drogon::app()
        .addListener("127.0.0.1", port_)
        .setThreadNum(1)
        .disableSession();

    server_thread_ = std::thread([]() { drogon::app().run(); });

    // Wait for server to start
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
  }

  static void TearDownTestSuite() {
    drogon::app().quit();
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
    recommender_.reset();
    ann_.reset();
    index_.reset();
    store_.reset();
    temp_dir_.reset();
  }

  static void AddIndexed(const std::string& id, const std::string& host,
                         const std::string& channel, const std::vector<float>& embedding) {
    uint64_t rowid = 0;
    auto status = store_->PutVideo(peerrec::testing::MakeVideo(id, host, channel), embedding,
                                   &rowid);
    ASSERT_TRUE(status.ok()) << status.ToString();
    ASSERT_TRUE(index_->Add(embedding, rowid));
  }

  static std::string BaseUrl() {
    return "http://127.0.0.1:" + std::to_string(port_);
  }

  // Sends req and waits for the response; null on transport failure.
  static drogon::HttpResponsePtr Send(const drogon::HttpRequestPtr& req) {
    auto client = drogon::HttpClient::newHttpClient(BaseUrl());
    std::promise<drogon::HttpResponsePtr> promise;
    auto future = promise.get_future();

    client->sendRequest(
        req,
        [&promise](drogon::ReqResult result, const drogon::HttpResponsePtr& resp) {
          promise.set_value(result == drogon::ReqResult::Ok ? resp : nullptr);
        });

    if (future.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
      ADD_FAILURE() << "request timed out";
      return nullptr;
    }
    return future.get();
  }

  // POST path_and_query with a JSON (or raw) body.
  static drogon::HttpResponsePtr Post(const std::string& path_and_query,
                                      const std::string& body) {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Post);
    req->setPathEncode(false);
    req->setPath(path_and_query);
    req->setContentTypeCode(drogon::CT_APPLICATION_JSON);
    req->setBody(body);
    return Send(req);
  }

  static std::unique_ptr<TempDir> temp_dir_;
  static std::string db_path_;
  static std::unique_ptr<Store> store_;
  static std::unique_ptr<internal::VectorIndex> index_;
  static std::unique_ptr<AnnSimilaritySource> ann_;
  static std::unique_ptr<Recommender> recommender_;
  static uint16_t port_;
  static std::thread server_thread_;
};

std::unique_ptr<TempDir> ServerE2ETest::temp_dir_;
std::string ServerE2ETest::db_path_;
std::unique_ptr<Store> ServerE2ETest::store_;
std::unique_ptr<internal::VectorIndex> ServerE2ETest::index_;
std::unique_ptr<AnnSimilaritySource> ServerE2ETest::ann_;
std::unique_ptr<Recommender> ServerE2ETest::recommender_;
uint16_t ServerE2ETest::port_ = 0;
std::thread ServerE2ETest::server_thread_;

TEST_F(ServerE2ETest, Health_Liveness) {
  auto req = drogon::HttpRequest::newHttpRequest();
  req->setPath("/health");
  req->setMethod(drogon::Get);

  auto resp = Send(req);
  ASSERT_TRUE(resp != nullptr);
  EXPECT_EQ(resp->statusCode(), drogon::k200OK);
  auto json = resp->getJsonObject();
  ASSERT_TRUE(json != nullptr);
  EXPECT_EQ((*json)["status"].asString(), "healthy");
  EXPECT_EQ(resp->getHeader("access-control-allow-origin"), "*");
}

TEST_F(ServerE2ETest, Health_Catalog) {
  auto req = drogon::HttpRequest::newHttpRequest();
  req->setPath("/api/health");
  req->setMethod(drogon::Get);

  auto resp = Send(req);
  ASSERT_TRUE(resp != nullptr);
  EXPECT_EQ(resp->statusCode(), drogon::k200OK);
  auto json = resp->getJsonObject();
  ASSERT_TRUE(json != nullptr);
  EXPECT_TRUE((*json)["ok"].asBool());
  EXPECT_TRUE(json->isMember("total"));
  EXPECT_EQ((*json)["embeddingDim"].asUInt(), kDim);
}

TEST_F(ServerE2ETest, Cors_Preflight) {
  auto req = drogon::HttpRequest::newHttpRequest();
  req->setPath("/recommendations");
  req->setMethod(drogon::Options);

  auto resp = Send(req);
  ASSERT_TRUE(resp != nullptr);
  EXPECT_EQ(resp->statusCode(), drogon::k204NoContent);
  EXPECT_EQ(resp->getHeader("access-control-max-age"), "600");
  EXPECT_EQ(resp->getHeader("access-control-allow-origin"), "*");
}

TEST_F(ServerE2ETest, Recommendations_Home) {
  auto resp = Post("/recommendations?user_id=alice&limit=3", "");
  ASSERT_TRUE(resp != nullptr);
  ASSERT_EQ(resp->statusCode(), drogon::k200OK);

  auto json = resp->getJsonObject();
  ASSERT_TRUE(json != nullptr);
  EXPECT_TRUE(json->isMember("generatedAt"));
  EXPECT_LE((*json)["count"].asUInt(), 3u);
  EXPECT_EQ((*json)["count"].asUInt(), (*json)["rows"].size());
  EXPECT_EQ((*json)["seed"]["user_id"].asString(), "alice");
  EXPECT_EQ((*json)["seed"]["mode"].asString(), "home");
}

TEST_F(ServerE2ETest, Recommendations_ClientLikesExcluded) {
  auto resp = Post("/recommendations?user_id=bob",
                   R"({"likes": [{"uuid": "uuid-other", "host": "e.example"}]})");
  ASSERT_TRUE(resp != nullptr);
  ASSERT_EQ(resp->statusCode(), drogon::k200OK);

  auto json = resp->getJsonObject();
  ASSERT_TRUE(json != nullptr);
  for (const auto& row : (*json)["rows"]) {
    EXPECT_NE(row["video_id"].asString(), "other");
  }
}

TEST_F(ServerE2ETest, Recommendations_TooManyLikes) {
  auto resp = Post("/recommendations",
                   R"({"likes": [{"uuid": "a", "host": "h"}, {"uuid": "b", "host": "h"},
                                 {"uuid": "c", "host": "h"}]})");
  ASSERT_TRUE(resp != nullptr);
  EXPECT_EQ(resp->statusCode(), drogon::k400BadRequest);

  auto json = resp->getJsonObject();
  ASSERT_TRUE(json != nullptr);
  EXPECT_EQ((*json)["message"].asString(), "Too many likes in request body");
  EXPECT_EQ((*json)["max_allowed"].asUInt(), 2u);
  EXPECT_EQ((*json)["received"].asUInt(), 3u);
}

TEST_F(ServerE2ETest, Recommendations_InvalidBody) {
  auto resp = Post("/recommendations", "{oops");
  ASSERT_TRUE(resp != nullptr);
  EXPECT_EQ(resp->statusCode(), drogon::k400BadRequest);
}

TEST_F(ServerE2ETest, Recommendations_UnknownSeed) {
  auto resp = Post("/videos/similar?id=missing", "");
  ASSERT_TRUE(resp != nullptr);
  EXPECT_EQ(resp->statusCode(), drogon::k400BadRequest);
}

TEST_F(ServerE2ETest, Similar_PathSeedWithDebug) {
  auto req = drogon::HttpRequest::newHttpRequest();
  req->setPath("/videos/liked/similar");
  req->setMethod(drogon::Get);
  req->setParameter("debug", "1");
  req->setParameter("host", "a.example");

  auto resp = Send(req);
  ASSERT_TRUE(resp != nullptr);
  ASSERT_EQ(resp->statusCode(), drogon::k200OK);

  auto json = resp->getJsonObject();
  ASSERT_TRUE(json != nullptr);
  EXPECT_EQ((*json)["seed"]["video_id"].asString(), "liked");
  EXPECT_EQ((*json)["seed"]["mode"].asString(), "upnext");
  ASSERT_GT((*json)["rows"].size(), 0u);
  EXPECT_EQ((*json)["rows"][0]["video_id"].asString(), "n1");
  EXPECT_TRUE((*json)["rows"][0].isMember("debug"));
}

TEST_F(ServerE2ETest, Internal_Resolve) {
  auto found = Post("/internal/videos/resolve", R"({"uuid": "uuid-n2"})");
  ASSERT_TRUE(found != nullptr);
  ASSERT_EQ(found->statusCode(), drogon::k200OK);
  auto json = found->getJsonObject();
  ASSERT_TRUE(json != nullptr);
  EXPECT_EQ((*json)["video"]["video_id"].asString(), "n2");
  EXPECT_EQ((*json)["video"]["instance_domain"].asString(), "c.example");

  auto missing = Post("/internal/videos/resolve", R"({"video_id": "nope"})");
  ASSERT_TRUE(missing != nullptr);
  EXPECT_EQ(missing->statusCode(), drogon::k404NotFound);

  auto invalid = Post("/internal/videos/resolve", R"({"host": "a.example"})");
  ASSERT_TRUE(invalid != nullptr);
  EXPECT_EQ(invalid->statusCode(), drogon::k400BadRequest);
}

TEST_F(ServerE2ETest, Internal_Metadata) {
  auto resp = Post("/internal/videos/metadata",
                   R"({"entries": [{"video_id": "n1", "instance_domain": "b.example"},
                                   {"video_id": "n1", "instance_domain": "b.example"},
                                   {"video_id": "zz", "instance_domain": "b.example"},
                                   {"video_id": "n3", "instance_domain": "d.example"}]})");
  ASSERT_TRUE(resp != nullptr);
  ASSERT_EQ(resp->statusCode(), drogon::k200OK);
  auto json = resp->getJsonObject();
  ASSERT_TRUE(json != nullptr);
  EXPECT_EQ((*json)["count"].asUInt(), 2u);
  EXPECT_EQ((*json)["rows"][0]["video_id"].asString(), "n1");
  EXPECT_EQ((*json)["rows"][1]["video_id"].asString(), "n3");

  auto missing = Post("/internal/videos/metadata", "{}");
  ASSERT_TRUE(missing != nullptr);
  EXPECT_EQ(missing->statusCode(), drogon::k400BadRequest);
}

TEST_F(ServerE2ETest, Internal_EventIngest) {
  const std::string event = R"({"event_id": "https://a.example/activities/9",
                                "event_type": "Like",
                                "actor_id": "https://a.example/users/bob",
                                "object": {"video_uuid": "uuid-n1",
                                           "instance_domain": "b.example"}})";

  auto first = Post("/internal/events/ingest", event);
  ASSERT_TRUE(first != nullptr);
  ASSERT_EQ(first->statusCode(), drogon::k200OK);
  auto json = first->getJsonObject();
  ASSERT_TRUE(json != nullptr);
  EXPECT_EQ((*json)["ingested"].asUInt(), 1u);
  EXPECT_EQ((*json)["duplicates"].asUInt(), 0u);
  EXPECT_EQ((*json)["results"][0]["event_type"].asString(), "Like");

  auto repeat = Post("/internal/events/ingest", R"({"events": [)" + event + "]}");
  ASSERT_TRUE(repeat != nullptr);
  ASSERT_EQ(repeat->statusCode(), drogon::k200OK);
  auto repeat_json = repeat->getJsonObject();
  ASSERT_TRUE(repeat_json != nullptr);
  EXPECT_EQ((*repeat_json)["duplicates"].asUInt(), 1u);
  EXPECT_TRUE((*repeat_json)["results"][0]["duplicate"].asBool());

  auto invalid = Post("/internal/events/ingest",
                      R"({"event_id": "x", "event_type": "Announce", "object": {}})");
  ASSERT_TRUE(invalid != nullptr);
  EXPECT_EQ(invalid->statusCode(), drogon::k400BadRequest);
  auto invalid_json = invalid->getJsonObject();
  ASSERT_TRUE(invalid_json != nullptr);
  EXPECT_EQ((*invalid_json)["message"].asString(), "Unsupported event_type");

  auto empty = Post("/internal/events/ingest", "{}");
  ASSERT_TRUE(empty != nullptr);
  EXPECT_EQ(empty->statusCode(), drogon::k400BadRequest);
}

}  // namespace
}  // namespace peerrec::server
