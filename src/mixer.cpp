#include <peerrec/mixer.hpp>

#include <peerrec/scoring.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>

namespace peerrec {

namespace {

// Floor shares of total by ratio over the layers with a positive ratio, then
// the remainder one by one in order.
LayerShares SplitByRatio(const std::vector<std::pair<std::string, double>>& ratios,
                         size_t total) {
  double total_ratio = 0.0;
  for (const auto& r : ratios) total_ratio += r.second;

  LayerShares shares;
  size_t allocated = 0;
  for (const auto& [name, ratio] : ratios) {
    if (!(ratio > 0.0)) continue;
    const size_t share = static_cast<size_t>(std::floor(static_cast<double>(total) * ratio / total_ratio));
    shares.emplace_back(name, share);
    allocated += share;
  }

  size_t remainder = total > allocated ? total - allocated : 0;
  for (auto& share : shares) {
    if (remainder == 0) break;
    ++share.second;
    --remainder;
  }
  return shares;
}

double TotalRatio(const std::vector<std::pair<std::string, double>>& ratios) {
  double total = 0.0;
  for (const auto& r : ratios) total += r.second;
  return total;
}

struct MixEntry {
  const std::string* layer;
  CandidateRow row;
};

}  // namespace

LayerShares ResolveFetchLimits(const Profile& profile,
                               const std::vector<std::string>& order,
                               size_t batch_size,
                               bool has_likes) {
  std::vector<std::pair<std::string, double>> ratios;
  for (const auto& name : order) {
    const GeneratorConfig* cfg = profile.FindGenerator(name);
    if (!cfg || !cfg->enabled) continue;
    if (cfg->requires_likes && !has_likes) continue;
    ratios.emplace_back(name, std::max(cfg->gather_ratio, 0.0));
  }
  if (ratios.empty()) return {};

  const double factor = std::max(profile.overfetch_factor, 1.0);
  const size_t total = static_cast<size_t>(static_cast<double>(batch_size) * factor);
  if (total == 0) return {};

  if (TotalRatio(ratios) <= 0.0) {
    const size_t per_layer = std::max<size_t>(total / ratios.size(), 1);
    LayerShares shares;
    for (const auto& r : ratios) shares.emplace_back(r.first, per_layer);
    return shares;
  }
  return SplitByRatio(ratios, total);
}

LayerShares ResolveOutputTargets(const Profile& profile,
                                 const std::vector<std::string>& active_layers,
                                 size_t batch_size) {
  std::vector<std::pair<std::string, double>> ratios;
  for (const auto& name : active_layers) {
    const GeneratorConfig* cfg = profile.FindGenerator(name);
    if (cfg && !cfg->enabled) continue;
    ratios.emplace_back(name, cfg ? std::max(cfg->mix_ratio, 0.0) : 0.0);
  }
  if (ratios.empty() || batch_size == 0) return {};

  if (TotalRatio(ratios) <= 0.0) {
    const size_t per_layer = batch_size / ratios.size();
    size_t remainder = batch_size - per_layer * ratios.size();
    LayerShares shares;
    for (const auto& r : ratios) {
      size_t share = per_layer;
      if (remainder > 0) {
        ++share;
        --remainder;
      }
      shares.emplace_back(r.first, share);
    }
    return shares;
  }
  return SplitByRatio(ratios, batch_size);
}

std::vector<std::string> BuildLayerSchedule(const LayerShares& targets) {
  std::vector<std::string> schedule;
  std::vector<size_t> counts(targets.size(), 0);

  size_t total = 0;
  for (const auto& t : targets) total += t.second;

  for (size_t step = 0; step < total; ++step) {
    size_t chosen = targets.size();
    double chosen_ratio = std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < targets.size(); ++i) {
      const size_t target = targets[i].second;
      if (target == 0 || counts[i] >= target) continue;
      const double ratio = static_cast<double>(counts[i]) / static_cast<double>(target);
      if (ratio < chosen_ratio) {
        chosen = i;
        chosen_ratio = ratio;
      }
    }
    if (chosen == targets.size()) break;
    ++counts[chosen];
    schedule.push_back(targets[chosen].first);
  }
  return schedule;
}

std::vector<CandidateRow> SoftMix(LayeredRows layers,
                                  const Profile& profile,
                                  size_t batch_size,
                                  std::unordered_set<std::string> seen_keys,
                                  int64_t now_ms) {
  std::vector<CandidateRow> output;
  if (layers.empty() || batch_size == 0) return output;

  const GeneratorConfig* explore_cfg = profile.FindGenerator("explore");
  const double explore_min = explore_cfg ? explore_cfg->similarity_min : 0.0;
  const double explore_max = explore_cfg ? explore_cfg->similarity_max : 1.0;

  double pool_min = std::numeric_limits<double>::infinity();
  double pool_max = -std::numeric_limits<double>::infinity();
  bool any_similarity = false;
  for (auto& [layer, rows] : layers) {
    for (auto& row : rows) {
      ScoreCandidate(&row, profile.scoring, layer, now_ms);
      pool_min = std::min(pool_min, row.similarity_score);
      pool_max = std::max(pool_max, row.similarity_score);
      any_similarity = true;
    }
  }
  for (auto& [layer, rows] : layers) {
    for (auto& row : rows) {
      CandidateDebug& d = row.debug;
      d.profile = profile.name;
      d.has_pool_bounds = any_similarity;
      d.pool_min = any_similarity ? pool_min : 0.0;
      d.pool_max = any_similarity ? pool_max : 0.0;
      d.has_explore_stats = true;
      d.explore_min = explore_min;
      d.explore_max = explore_max;
    }
  }

  std::vector<std::string> active;
  for (auto& [layer, rows] : layers) {
    if (rows.empty()) continue;
    active.push_back(layer);
    std::stable_sort(rows.begin(), rows.end(), [](const CandidateRow& a, const CandidateRow& b) {
      return a.score > b.score;
    });
    for (size_t i = 0; i < rows.size(); ++i) rows[i].debug.rank_before = static_cast<int>(i + 1);
  }
  if (active.empty()) return output;

  // Cursor into each layer; rows before it have been drawn.
  std::map<std::string, size_t> cursor;
  std::map<std::string, std::vector<CandidateRow>*> by_name;
  for (auto& [layer, rows] : layers) {
    cursor[layer] = 0;
    by_name[layer] = &rows;
  }

  LayerShares targets = ResolveOutputTargets(profile, active, batch_size);
  for (auto& target : targets) {
    target.second = std::min(target.second, by_name[target.first]->size());
  }

  std::vector<MixEntry> mixed;
  auto draw = [&](const std::string& layer) -> bool {
    auto it = by_name.find(layer);
    if (it == by_name.end()) return false;
    size_t& pos = cursor[layer];
    if (pos >= it->second->size()) return false;
    mixed.push_back(MixEntry{&it->first, std::move((*it->second)[pos])});
    ++pos;
    return true;
  };

  for (const auto& layer : BuildLayerSchedule(targets)) {
    if (mixed.size() >= batch_size) break;
    draw(layer);
  }
  for (const auto& entry : layers) {
    while (mixed.size() < batch_size) {
      if (!draw(entry.first)) break;
    }
  }

  // Post filters.
  std::map<std::string, int> layer_counts;
  std::vector<bool> taken(mixed.size(), false);

  auto can_take = [&](const MixEntry& e) {
    if (seen_keys.count(e.row.Key())) return false;
    auto cap = profile.soft_max.find(*e.layer);
    return cap == profile.soft_max.end() || cap->second <= 0 ||
           layer_counts[*e.layer] < cap->second;
  };
  auto take = [&](size_t i) {
    seen_keys.insert(mixed[i].row.Key());
    ++layer_counts[*mixed[i].layer];
    taken[i] = true;
    output.push_back(mixed[i].row);
  };

  for (const auto& [layer, min_count] : profile.soft_min) {
    if (min_count <= 0) continue;
    for (size_t i = 0; i < mixed.size() && output.size() < batch_size; ++i) {
      if (*mixed[i].layer != layer) continue;
      if (layer_counts[layer] >= min_count) break;
      if (taken[i] || !can_take(mixed[i])) continue;
      take(i);
    }
  }

  for (size_t i = 0; i < mixed.size() && output.size() < batch_size; ++i) {
    if (taken[i] || !can_take(mixed[i])) continue;
    take(i);
  }

  for (size_t i = 0; i < output.size(); ++i) output[i].debug.rank_after = static_cast<int>(i + 1);
  return output;
}

}  // namespace peerrec
