#pragma once

#include <peerrec/diversify.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace peerrec {

// Pool size used by the popular and fresh layers of the built-in profiles.
constexpr size_t kDefaultPopularPoolSize = 5000;
constexpr size_t kDefaultFreshPoolSize = 5000;

/** Settings of one candidate generator (layer) inside a profile. */
struct GeneratorConfig {
  bool enabled = true;
  bool requires_likes = false;

  // Share of the overfetched budget requested from this layer.
  double gather_ratio = 0.0;
  // Share of the final batch reserved for this layer.
  double mix_ratio = 0.0;
  bool shuffle = false;

  size_t pool_size = 0;
  int max_per_author = 0;    // 0 = unlimited
  int max_per_instance = 0;  // 0 = unlimited

  // explore: accepted similarity range [similarity_min, similarity_max).
  double similarity_min = 0.0;
  double similarity_max = 1.0;

  // random: keep only rows below explore_min when below_explore_min is set.
  double explore_min = 0.0;
  bool below_explore_min = false;
};

/** Linear scoring weights. */
struct ScoringConfig {
  double similarity_weight = 1.0;
  double freshness_weight = 0.0;
  double popularity_weight = 0.0;
  std::map<std::string, double> layer_weights;
  double freshness_half_life_days = 14.0;
  double popularity_view_weight = 1.0;
  double popularity_like_weight = 2.0;

  double LayerWeight(std::string_view layer) const;
};

/** Named bundle of recommendation settings. */
struct Profile {
  std::string name;

  size_t batch_size = 0;  // 0 = use the request limit
  double overfetch_factor = 1.0;

  // Generators in declaration order.
  std::vector<std::pair<std::string, GeneratorConfig>> generators;
  // Mixing order; empty means declaration order.
  std::vector<std::string> order;

  ScoringConfig scoring;

  // Per-layer minimum / maximum counts in the mixed batch.
  std::map<std::string, int> soft_min;
  std::map<std::string, int> soft_max;

  // Caps applied to the final list of every request using this profile.
  DiversityCaps diversity;

  const GeneratorConfig* FindGenerator(std::string_view name) const;

  /** Mixing order restricted to declared generators. */
  std::vector<std::string> ResolvedOrder() const;
};

/** All profiles of a deployment. */
struct RecommendationConfig {
  std::vector<Profile> profiles;  // declaration order
  std::string default_profile;

  const Profile* Find(std::string_view name) const;
};

/**
 * Pick the profile for a request.
 *
 * A user without likes gets a guest profile when one exists for the mode
 * ("guest_upnext" for "upnext", "guest_home" for "home" or no mode, then
 * "guest"). Otherwise the profile named by mode, then default_profile, then
 * "home", then the first declared profile. Never returns null; without any
 * profile an empty profile named "default" is returned.
 */
const Profile* ResolveProfile(const RecommendationConfig& config,
                              std::string_view mode,
                              bool has_likes);

/** The built-in home, guest_home, upnext and guest_upnext profiles. */
RecommendationConfig DefaultRecommendationConfig();

}  // namespace peerrec
