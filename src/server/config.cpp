#include <peerrec/server/config.hpp>

#include <json/json.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <stdexcept>

namespace peerrec::server {

namespace {

void PrintUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0 << " [options]\n"
            << "\nOptions:\n"
            << "  --config, -c <path>       Path to YAML config file\n"
            << "  --host <addr>             Bind address (default: 127.0.0.1)\n"
            << "  --port, -p <port>         Listen port (default: 7070)\n"
            << "  --threads <n>             Worker threads (default: auto)\n"
            << "  --db-path <path>          Catalog database path (required)\n"
            << "  --index-path <path>       ANN index file (required)\n"
            << "  --profiles <path>         Recommendation profiles JSON\n"
            << "  --log-level <level>       Log level: debug, info, warn, error\n"
            << "  --help, -h                Show this help\n"
            << "\nExamples:\n"
            << "  " << argv0 << " --db-path /data/peerrec --index-path /data/videos.hnsw\n"
            << "  " << argv0 << " --config /etc/peerrec/server.yaml --port 7071\n";
}

// Simple YAML-like parser for basic config files
// Format:
//   key: value
//   section:
//     key: value
std::string Trim(const std::string& s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

bool ParseBool(const std::string& value) {
  return value == "true" || value == "1" || value == "yes" || value == "on";
}

// Requires the next argument or throws "<flag> requires <what>".
const char* NextArg(int argc, char** argv, int* i, const std::string& flag, const char* what) {
  if (++*i >= argc) {
    throw std::runtime_error(flag + " requires " + what);
  }
  return argv[*i];
}

void ApplyKey(Config* config, const std::string& section,
              const std::string& key, const std::string& value) {
  RecommenderOptions& rec = config->recommender;

  if (section == "server") {
    if (key == "host") {
      config->server.host = value;
    } else if (key == "port") {
      config->server.port = static_cast<uint16_t>(std::stoul(value));
    } else if (key == "threads") {
      config->server.threads = static_cast<uint32_t>(std::stoul(value));
    } else if (key == "log_level") {
      config->server.log_level = value;
    } else if (key == "debug_enabled") {
      config->server.debug_enabled = ParseBool(value);
    } else if (key == "use_client_likes") {
      config->server.use_client_likes = ParseBool(value);
    } else if (key == "client_likes_max") {
      config->server.client_likes_max = std::stoull(value);
    } else if (key == "recommend_body_limit") {
      config->server.recommend_body_limit = std::stoull(value);
    } else if (key == "internal_body_limit") {
      config->server.internal_body_limit = std::stoull(value);
    }
  } else if (section == "store") {
    if (key == "path") {
      config->db_path = value;
    } else if (key == "block_cache_bytes") {
      config->store.block_cache_bytes = std::stoull(value);
    } else if (key == "lock_timeout_ms") {
      config->store.lock_timeout_ms = std::stoi(value);
    } else if (key == "video_error_threshold") {
      config->store.video_error_threshold = std::stoll(value);
    } else if (key == "max_likes_per_user") {
      config->store.max_likes_per_user = std::stoull(value);
    }
  } else if (section == "index") {
    if (key == "path") {
      config->index.path = value;
    } else if (key == "ef_search") {
      config->index.ef_search = std::stoi(value);
    } else if (key == "normalize_queries") {
      config->index.search.normalize_queries = ParseBool(value);
    } else if (key == "search_limit") {
      config->index.search.search_limit = std::stoull(value);
    } else if (key == "max_per_author") {
      config->index.search.max_per_author = std::stoi(value);
    } else if (key == "exclude_source_author") {
      config->index.search.exclude_source_author = ParseBool(value);
    }
  } else if (section == "recommendations") {
    if (key == "profiles") {
      config->profiles_path = value;
    } else if (key == "likes_source") {
      rec.likes_source = value;
    } else if (key == "max_likes") {
      rec.likes.max_likes = std::stoull(value);
    } else if (key == "max_likes_for_recs") {
      rec.likes.max_likes_for_recs = std::stoull(value);
    } else if (key == "similar_per_like") {
      rec.likes.similar_per_like = std::stoull(value);
    } else if (key == "require_full_cache") {
      rec.likes.require_full_cache = ParseBool(value);
    } else if (key == "allow_ann_on_cache_miss") {
      rec.likes.allow_ann_on_cache_miss = ParseBool(value);
    } else if (key == "refresh_similarity_cache") {
      rec.refresh_similarity_cache = ParseBool(value);
    } else if (key == "default_limit") {
      rec.default_limit = std::stoull(value);
    }
  } else if (section == "personalization") {
    if (key == "enabled") {
      rec.personalization.enabled = ParseBool(value);
    } else if (key == "alpha") {
      rec.personalization.alpha = std::stod(value);
    } else if (key == "beta") {
      rec.personalization.beta = std::stod(value);
    } else if (key == "max_likes") {
      rec.personalization.max_likes = std::stoull(value);
    }
  } else if (section == "rate_limit") {
    if (key == "enabled") {
      config->rate_limit.enabled = ParseBool(value);
    } else if (key == "max_requests") {
      config->rate_limit.max_requests = std::stoi(value);
    } else if (key == "window_seconds") {
      config->rate_limit.window_seconds = std::stod(value);
    }
  } else if (section == "random_cache") {
    RandomCacheSettings& cache = config->random_cache.settings;
    if (key == "populate_on_start") {
      config->random_cache.populate_on_start = ParseBool(value);
    } else if (key == "size") {
      cache.size = std::stoull(value);
    } else if (key == "refresh") {
      cache.refresh = ParseBool(value);
    } else if (key == "filtered_mode") {
      cache.filtered_mode = ParseBool(value);
    } else if (key == "max_per_instance") {
      cache.max_per_instance = std::stoi(value);
    } else if (key == "max_per_author") {
      cache.max_per_author = std::stoi(value);
    }
  } else if (section == "moderation") {
    if (key == "instance_filter") {
      rec.moderation.apply_instance_filter = ParseBool(value);
    } else if (key == "channel_filter") {
      rec.moderation.apply_channel_filter = ParseBool(value);
    }
  } else if (section == "metrics") {
    if (key == "enabled") {
      config->metrics.enabled = ParseBool(value);
    } else if (key == "path") {
      config->metrics.path = value;
    }
  } else if (section.empty()) {
    // Top-level keys
    if (key == "db_path") {
      config->db_path = value;
    } else if (key == "index_path") {
      config->index.path = value;
    }
  }
}

// --- Profile JSON ---

double NumberOr(const Json::Value& obj, const char* key, double fallback) {
  const Json::Value& v = obj[key];
  if (v.isNull()) return fallback;
  if (!v.isNumeric()) {
    throw std::runtime_error(std::string("profile field '") + key + "' must be a number");
  }
  return v.asDouble();
}

bool BoolOr(const Json::Value& obj, const char* key, bool fallback) {
  const Json::Value& v = obj[key];
  if (v.isNull()) return fallback;
  if (!v.isBool()) {
    throw std::runtime_error(std::string("profile field '") + key + "' must be a boolean");
  }
  return v.asBool();
}

const Json::Value& ObjectOrNull(const Json::Value& obj, const char* key) {
  const Json::Value& v = obj[key];
  if (!v.isNull() && !v.isObject()) {
    throw std::runtime_error(std::string("profile field '") + key + "' must be an object");
  }
  return v;
}

GeneratorConfig ParseGenerator(const Json::Value& g) {
  if (!g.isObject()) {
    throw std::runtime_error("generator settings must be an object");
  }
  GeneratorConfig cfg;
  cfg.enabled = BoolOr(g, "enabled", cfg.enabled);
  cfg.requires_likes = BoolOr(g, "requires_likes", cfg.requires_likes);
  cfg.gather_ratio = NumberOr(g, "gather_ratio", cfg.gather_ratio);
  cfg.mix_ratio = NumberOr(g, "mix_ratio", cfg.mix_ratio);
  cfg.shuffle = BoolOr(g, "shuffle", cfg.shuffle);
  cfg.pool_size = static_cast<size_t>(NumberOr(g, "pool_size", 0.0));
  cfg.max_per_author = static_cast<int>(NumberOr(g, "max_per_author", cfg.max_per_author));
  cfg.max_per_instance = static_cast<int>(NumberOr(g, "max_per_instance", cfg.max_per_instance));
  cfg.similarity_min = NumberOr(g, "similarity_min", cfg.similarity_min);
  cfg.similarity_max = NumberOr(g, "similarity_max", cfg.similarity_max);
  cfg.explore_min = NumberOr(g, "explore_min", cfg.explore_min);
  cfg.below_explore_min = BoolOr(g, "below_explore_min", cfg.below_explore_min);
  return cfg;
}

std::map<std::string, int> ParseCountMap(const Json::Value& obj) {
  std::map<std::string, int> out;
  if (obj.isNull()) return out;
  for (const auto& name : obj.getMemberNames()) {
    if (!obj[name].isNumeric()) {
      throw std::runtime_error("soft cap '" + name + "' must be a number");
    }
    out[name] = obj[name].asInt();
  }
  return out;
}

Profile ParseProfile(const std::string& name, const Json::Value& p) {
  if (!p.isObject()) {
    throw std::runtime_error("profile '" + name + "' must be an object");
  }
  Profile profile;
  profile.name = name;
  profile.batch_size = static_cast<size_t>(NumberOr(p, "batch_size", 0.0));
  profile.overfetch_factor = NumberOr(p, "overfetch_factor", profile.overfetch_factor);

  const Json::Value& generators = ObjectOrNull(p, "generators");
  if (!generators.isNull()) {
    for (const auto& gen_name : generators.getMemberNames()) {
      profile.generators.emplace_back(gen_name, ParseGenerator(generators[gen_name]));
    }
  }

  const Json::Value& mixing = ObjectOrNull(p, "mixing");
  if (!mixing.isNull() && mixing["order"].isArray()) {
    for (const auto& entry : mixing["order"]) {
      if (entry.isString()) profile.order.push_back(entry.asString());
    }
  }

  const Json::Value& scoring = ObjectOrNull(p, "scoring");
  if (!scoring.isNull()) {
    ScoringConfig& s = profile.scoring;
    const Json::Value& weights = ObjectOrNull(scoring, "weights");
    if (!weights.isNull()) {
      s.similarity_weight = NumberOr(weights, "similarity", s.similarity_weight);
      s.freshness_weight = NumberOr(weights, "freshness", s.freshness_weight);
      s.popularity_weight = NumberOr(weights, "popularity", s.popularity_weight);
    }
    const Json::Value& layer_weights = ObjectOrNull(scoring, "layer_weights");
    if (!layer_weights.isNull()) {
      for (const auto& layer : layer_weights.getMemberNames()) {
        s.layer_weights[layer] = NumberOr(layer_weights, layer.c_str(), 0.0);
      }
    }
    s.freshness_half_life_days =
        NumberOr(scoring, "freshness_half_life_days", s.freshness_half_life_days);
    const Json::Value& popularity = ObjectOrNull(scoring, "popularity");
    if (!popularity.isNull()) {
      s.popularity_view_weight = NumberOr(popularity, "views", s.popularity_view_weight);
      s.popularity_like_weight = NumberOr(popularity, "likes", s.popularity_like_weight);
    }
  }

  const Json::Value& soft_caps = ObjectOrNull(p, "soft_caps");
  if (!soft_caps.isNull()) {
    profile.soft_min = ParseCountMap(ObjectOrNull(soft_caps, "min"));
    profile.soft_max = ParseCountMap(ObjectOrNull(soft_caps, "max"));
  }

  const Json::Value& diversity = ObjectOrNull(p, "diversity");
  if (!diversity.isNull()) {
    profile.diversity.max_per_author =
        static_cast<int>(NumberOr(diversity, "max_per_author", profile.diversity.max_per_author));
    profile.diversity.max_per_instance = static_cast<int>(
        NumberOr(diversity, "max_per_instance", profile.diversity.max_per_instance));
  }
  return profile;
}

}  // namespace

Config Config::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open config file: " + path);
  }

  Config config;
  std::string current_section;
  std::string line;
  int line_no = 0;

  while (std::getline(file, line)) {
    ++line_no;
    line = Trim(line);

    // Skip empty lines and comments
    if (line.empty() || line[0] == '#') {
      continue;
    }

    size_t colon_pos = line.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    std::string key = Trim(line.substr(0, colon_pos));
    std::string value = Trim(line.substr(colon_pos + 1));

    // If value is empty, this is a section header
    if (value.empty()) {
      current_section = key;
      continue;
    }

    // Remove quotes from value if present
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
      value = value.substr(1, value.size() - 2);
    }

    try {
      ApplyKey(&config, current_section, key, value);
    } catch (const std::logic_error&) {
      // std::stoi and friends throw invalid_argument / out_of_range
      throw std::runtime_error("Invalid value for " + current_section + "." + key +
                               " at " + path + ":" + std::to_string(line_no) + ": " + value);
    }
  }

  return config;
}

Config Config::LoadFromArgs(int argc, char** argv) {
  // The config file is the base layer; find it before applying overrides.
  Config config;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" || arg == "-c") {
      config = LoadFromFile(NextArg(argc, argv, &i, arg, "a path argument"));
      break;
    }
  }

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      PrintUsage(argv[0]);
      std::exit(0);
    } else if (arg == "--config" || arg == "-c") {
      NextArg(argc, argv, &i, arg, "a path argument");
    } else if (arg == "--host") {
      config.server.host = NextArg(argc, argv, &i, arg, "an address argument");
    } else if (arg == "--port" || arg == "-p") {
      std::string value = NextArg(argc, argv, &i, arg, "a port number");
      try {
        config.server.port = static_cast<uint16_t>(std::stoul(value));
      } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid port number: " + value);
      }
    } else if (arg == "--threads") {
      std::string value = NextArg(argc, argv, &i, arg, "a number");
      try {
        config.server.threads = static_cast<uint32_t>(std::stoul(value));
      } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid thread count: " + value);
      }
    } else if (arg == "--db-path") {
      config.db_path = NextArg(argc, argv, &i, arg, "a path");
    } else if (arg == "--index-path") {
      config.index.path = NextArg(argc, argv, &i, arg, "a path");
    } else if (arg == "--profiles") {
      config.profiles_path = NextArg(argc, argv, &i, arg, "a path");
    } else if (arg == "--log-level") {
      config.server.log_level = NextArg(argc, argv, &i, arg, "a level");
    } else if (arg[0] == '-') {
      throw std::runtime_error("Unknown option: " + arg);
    }
  }

  return config;
}

void Config::Validate() const {
  if (db_path.empty()) {
    throw std::runtime_error("db_path is required (use --db-path or config file)");
  }

  if (index.path.empty()) {
    throw std::runtime_error("index path is required (use --index-path or config file)");
  }

  if (server.port == 0) {
    throw std::runtime_error("Invalid port number: " + std::to_string(server.port));
  }

  // Validate log level
  if (server.log_level != "debug" && server.log_level != "info" &&
      server.log_level != "warn" && server.log_level != "error") {
    throw std::runtime_error("Invalid log_level: " + server.log_level +
                             " (must be debug, info, warn, or error)");
  }

  if (recommender.likes_source != kAnnSourceName &&
      recommender.likes_source != kCacheOptimizedSourceName) {
    throw std::runtime_error("Unknown likes_source: " + recommender.likes_source +
                             " (must be ann or cache-optimized)");
  }

  if (rate_limit.enabled && (rate_limit.max_requests <= 0 || rate_limit.window_seconds <= 0.0)) {
    throw std::runtime_error("rate_limit.max_requests and rate_limit.window_seconds must be positive");
  }

  if (server.recommend_body_limit == 0 || server.internal_body_limit == 0) {
    throw std::runtime_error("request body limits must be positive");
  }
}

RecommendationConfig Config::LoadProfiles() const {
  if (profiles_path.empty()) return DefaultRecommendationConfig();
  return LoadRecommendationConfigFile(profiles_path);
}

RecommendationConfig ParseRecommendationConfig(const Json::Value& root) {
  if (!root.isObject()) {
    throw std::runtime_error("recommendation config must be a JSON object");
  }
  const Json::Value& profiles = root["profiles"];
  if (!profiles.isObject() || profiles.empty()) {
    throw std::runtime_error("recommendation config needs a non-empty 'profiles' object");
  }

  RecommendationConfig config;
  for (const auto& name : profiles.getMemberNames()) {
    config.profiles.push_back(ParseProfile(name, profiles[name]));
  }

  const Json::Value& default_profile = root["default_profile"];
  if (default_profile.isString()) {
    config.default_profile = default_profile.asString();
  }
  if (!config.default_profile.empty() && !config.Find(config.default_profile)) {
    throw std::runtime_error("default_profile '" + config.default_profile + "' is not defined");
  }
  return config;
}

RecommendationConfig LoadRecommendationConfigFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open profiles file: " + path);
  }

  Json::Value root;
  Json::CharReaderBuilder builder;
  std::string errors;
  if (!Json::parseFromStream(builder, file, &root, &errors)) {
    throw std::runtime_error("Invalid profiles JSON in " + path + ": " + errors);
  }
  return ParseRecommendationConfig(root);
}

}  // namespace peerrec::server
