#pragma once

#include <peerrec/request_context.hpp>
#include <peerrec/store.hpp>
#include <peerrec/types.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <rocksdb/status.h>

namespace peerrec {

/** Related-video re-ranking weights. */
struct PersonalizationSettings {
  bool enabled = true;
  double alpha = 0.2;   // weight of the row's own score
  double beta = 0.8;    // weight of the user affinity
  size_t max_likes = 5;
};

/**
 * Reorder rows by alpha * score + beta * affinity, descending, ties kept in
 * input order. affinity is the highest inner product between a row's unit
 * embedding (looked up in embeddings by LikeKey) and the unit liked vectors,
 * floored at 0; rows without a usable embedding get 0. The result is always a
 * permutation of rows.
 */
std::vector<CandidateRow> RerankByAffinity(
    const std::vector<CandidateRow>& rows,
    const std::unordered_map<std::string, std::vector<float>>& embeddings,
    const std::vector<std::vector<float>>& liked_unit_vectors,
    double alpha,
    double beta);

/**
 * Post-hoc re-ranker for the related-video path. Never adds or removes rows.
 *
 * Leaves rows unchanged when disabled, when user_id is empty, when the user
 * has no likes, or when no embeddings resolve for the likes or the rows.
 */
class PersonalizedReranker {
 public:
  PersonalizedReranker(const Store* store, PersonalizationSettings settings);

  rocksdb::Status Rerank(const RequestContext& ctx,
                         std::string_view user_id,
                         std::vector<CandidateRow>* rows) const;

  const PersonalizationSettings& settings() const { return settings_; }

 private:
  const Store* store_;
  PersonalizationSettings settings_;
};

}  // namespace peerrec
