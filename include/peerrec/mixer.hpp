#pragma once

#include <peerrec/profile.hpp>
#include <peerrec/types.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace peerrec {

/** A per-layer row count, in mixing order. */
using LayerShares = std::vector<std::pair<std::string, size_t>>;

/** Candidate rows of each layer, in mixing order. */
using LayeredRows = std::vector<std::pair<std::string, std::vector<CandidateRow>>>;

/**
 * Fetch budget per layer for one batch.
 *
 * Enabled layers (minus requires_likes layers when has_likes is false) share
 * batch * max(overfetch_factor, 1) by gather_ratio: floor shares, then the
 * remainder one by one in order. Layers with a zero ratio get nothing.
 * When no layer has a ratio, every enabled layer gets an equal share of at
 * least 1.
 */
LayerShares ResolveFetchLimits(const Profile& profile,
                               const std::vector<std::string>& order,
                               size_t batch_size,
                               bool has_likes);

/**
 * Output target per layer: the same split over the layers that produced
 * candidates, by mix_ratio. Without ratios the batch is split equally and the
 * remainder goes to the first layers.
 */
LayerShares ResolveOutputTargets(const Profile& profile,
                                 const std::vector<std::string>& active_layers,
                                 size_t batch_size);

/**
 * Interleave layers so that each pick goes to the layer with the lowest
 * filled/target ratio (first in order on ties), until every target is met.
 */
std::vector<std::string> BuildLayerSchedule(const LayerShares& targets);

/**
 * Score, mix and filter generated layers into one batch.
 *
 * Every row is scored with its layer's weight. Layers are sorted by score
 * (rank_before) and drawn following BuildLayerSchedule over the targets
 * capped at each layer's size, then backfilled in layer order. Post filters
 * drop rows whose identity is in seen_keys (liked videos, earlier picks) and
 * enforce the profile's soft_min / soft_max per layer; soft_min layers are
 * served first. rank_after is the final position.
 */
std::vector<CandidateRow> SoftMix(LayeredRows layers,
                                  const Profile& profile,
                                  size_t batch_size,
                                  std::unordered_set<std::string> seen_keys,
                                  int64_t now_ms);

}  // namespace peerrec
