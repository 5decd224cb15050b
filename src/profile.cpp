#include <peerrec/profile.hpp>

namespace peerrec {

namespace {

GeneratorConfig Layer(double gather, double mix, int max_per_instance, int max_per_author) {
  GeneratorConfig g;
  g.gather_ratio = gather;
  g.mix_ratio = mix;
  g.max_per_instance = max_per_instance;
  g.max_per_author = max_per_author;
  return g;
}

DiversityCaps TailCaps() {
  DiversityCaps caps;
  caps.max_per_author = 3;
  caps.max_per_instance = 0;
  caps.dedup = true;
  return caps;
}

Profile HomeProfile() {
  Profile p;
  p.name = "home";
  p.batch_size = 48;
  p.overfetch_factor = 1.0;

  GeneratorConfig random = Layer(0.1, 0.1, 5, 2);
  random.shuffle = true;
  random.below_explore_min = true;
  random.explore_min = 0.2;

  GeneratorConfig popular = Layer(0.1, 0.1, 5, 2);
  popular.pool_size = kDefaultPopularPoolSize;

  GeneratorConfig explore = Layer(0.2, 0.2, 5, 2);
  explore.pool_size = 5000;
  explore.similarity_min = 0.2;
  explore.similarity_max = 0.4;
  explore.requires_likes = true;

  GeneratorConfig exploit = Layer(0.5, 0.5, 5, 2);
  exploit.pool_size = 2000;
  exploit.requires_likes = true;

  GeneratorConfig fresh = Layer(0.1, 0.1, 5, 2);
  fresh.pool_size = kDefaultFreshPoolSize;

  p.generators = {{"random", random},
                  {"popular", popular},
                  {"explore", explore},
                  {"exploit", exploit},
                  {"fresh", fresh}};
  p.order = {"explore", "exploit", "popular", "random", "fresh"};

  p.scoring.similarity_weight = 1.0;
  p.scoring.freshness_weight = 0.25;
  p.scoring.popularity_weight = 0.2;
  p.scoring.layer_weights = {
      {"exploit", 0.15}, {"explore", 0.05}, {"popular", 0.05}, {"random", 0.0}, {"fresh", 0.05}};
  p.scoring.freshness_half_life_days = 14.0;
  p.scoring.popularity_view_weight = 1.0;
  p.scoring.popularity_like_weight = 2.0;

  p.soft_max = {{"fresh", 12}};
  p.diversity = TailCaps();
  return p;
}

Profile GuestHomeProfile() {
  Profile p;
  p.name = "guest_home";
  p.batch_size = 48;
  p.overfetch_factor = 2.0;

  GeneratorConfig random = Layer(0.6, 0.6, 0, 2);
  random.below_explore_min = false;
  random.explore_min = 0.2;

  GeneratorConfig popular = Layer(0.2, 0.2, 0, 2);
  popular.pool_size = kDefaultPopularPoolSize;

  GeneratorConfig fresh = Layer(0.2, 0.2, 0, 2);
  fresh.pool_size = kDefaultFreshPoolSize;

  p.generators = {{"random", random}, {"popular", popular}, {"fresh", fresh}};
  p.order = {"popular", "random", "fresh"};

  p.scoring.similarity_weight = 0.2;
  p.scoring.freshness_weight = 0.35;
  p.scoring.popularity_weight = 0.45;
  p.scoring.layer_weights = {{"popular", 0.05}, {"random", 0.0}, {"fresh", 0.05}};
  p.scoring.freshness_half_life_days = 14.0;

  p.soft_max = {{"fresh", 12}};
  p.diversity = TailCaps();
  return p;
}

ScoringConfig UpnextScoring() {
  ScoringConfig s;
  s.similarity_weight = 1.0;
  s.freshness_weight = 0.1;
  s.popularity_weight = 0.1;
  s.freshness_half_life_days = 30.0;
  s.popularity_view_weight = 1.0;
  s.popularity_like_weight = 1.0;
  return s;
}

Profile UpnextProfile() {
  Profile p;
  p.name = "upnext";

  GeneratorConfig random = Layer(0.2, 0.05, 5, 2);
  random.below_explore_min = true;
  random.explore_min = 0.25;

  GeneratorConfig popular = Layer(0.2, 0.05, 5, 2);
  popular.pool_size = kDefaultPopularPoolSize;

  GeneratorConfig explore = Layer(0.1, 0.1, 5, 2);
  explore.pool_size = 1200;
  explore.similarity_min = 0.25;
  explore.similarity_max = 0.55;
  explore.requires_likes = true;

  GeneratorConfig exploit = Layer(0.75, 0.75, 5, 2);
  exploit.pool_size = 2000;
  exploit.requires_likes = true;

  GeneratorConfig fresh = Layer(0.05, 0.05, 5, 2);
  fresh.pool_size = kDefaultFreshPoolSize;

  p.generators = {{"random", random},
                  {"popular", popular},
                  {"explore", explore},
                  {"exploit", exploit},
                  {"fresh", fresh}};
  p.order = {"explore", "exploit", "popular", "random", "fresh"};
  p.scoring = UpnextScoring();
  p.diversity = TailCaps();
  return p;
}

Profile GuestUpnextProfile() {
  Profile p;
  p.name = "guest_upnext";

  GeneratorConfig random = Layer(0.4, 0.4, 5, 2);
  random.below_explore_min = false;
  random.explore_min = 0.25;

  GeneratorConfig popular = Layer(0.4, 0.4, 5, 2);
  popular.pool_size = kDefaultPopularPoolSize;

  GeneratorConfig fresh = Layer(0.2, 0.2, 5, 2);
  fresh.pool_size = kDefaultFreshPoolSize;

  p.generators = {{"random", random}, {"popular", popular}, {"fresh", fresh}};
  p.order = {"popular", "random", "fresh"};
  p.scoring = UpnextScoring();
  p.diversity = TailCaps();
  return p;
}

}  // namespace

double ScoringConfig::LayerWeight(std::string_view layer) const {
  auto it = layer_weights.find(std::string(layer));
  return it == layer_weights.end() ? 0.0 : it->second;
}

const GeneratorConfig* Profile::FindGenerator(std::string_view name) const {
  for (const auto& [gen_name, cfg] : generators) {
    if (gen_name == name) return &cfg;
  }
  return nullptr;
}

std::vector<std::string> Profile::ResolvedOrder() const {
  std::vector<std::string> out;
  if (order.empty()) {
    for (const auto& entry : generators) out.push_back(entry.first);
    return out;
  }
  for (const auto& name : order) {
    if (FindGenerator(name)) out.push_back(name);
  }
  return out;
}

const Profile* RecommendationConfig::Find(std::string_view name) const {
  if (name.empty()) return nullptr;
  for (const auto& p : profiles) {
    if (p.name == name) return &p;
  }
  return nullptr;
}

const Profile* ResolveProfile(const RecommendationConfig& config,
                              std::string_view mode,
                              bool has_likes) {
  if (config.profiles.empty()) {
    static const Profile kEmpty = [] {
      Profile p;
      p.name = "default";
      return p;
    }();
    return &kEmpty;
  }

  if (!has_likes) {
    const Profile* guest = nullptr;
    if (mode == "upnext" && config.Find("guest_upnext")) {
      guest = config.Find("guest_upnext");
    } else if ((mode.empty() || mode == "home") && config.Find("guest_home")) {
      guest = config.Find("guest_home");
    } else {
      guest = config.Find("guest");
    }
    if (guest) return guest;
  }

  if (const Profile* p = config.Find(mode)) return p;
  if (const Profile* p = config.Find(config.default_profile)) return p;
  if (const Profile* p = config.Find("home")) return p;
  return &config.profiles.front();
}

RecommendationConfig DefaultRecommendationConfig() {
  RecommendationConfig config;
  config.profiles = {HomeProfile(), GuestHomeProfile(), UpnextProfile(), GuestUpnextProfile()};
  config.default_profile = "home";
  return config;
}

}  // namespace peerrec
