#include <peerrec/personalize.hpp>

#include <peerrec/internal.hpp>

#include <algorithm>
#include <utility>

namespace peerrec {

std::vector<CandidateRow> RerankByAffinity(
    const std::vector<CandidateRow>& rows,
    const std::unordered_map<std::string, std::vector<float>>& embeddings,
    const std::vector<std::vector<float>>& liked_unit_vectors,
    double alpha,
    double beta) {
  std::vector<std::pair<double, size_t>> order;
  order.reserve(rows.size());
  for (size_t i = 0; i < rows.size(); ++i) {
    double affinity = 0.0;
    auto it = embeddings.find(rows[i].Key());
    if (it != embeddings.end()) affinity = internal::MaxAffinity(it->second, liked_unit_vectors);
    const double base = rows[i].has_score ? rows[i].score : 0.0;
    order.emplace_back(alpha * base + beta * affinity, i);
  }

  std::sort(order.begin(), order.end(), [](const auto& a, const auto& b) {
    if (a.first != b.first) return a.first > b.first;
    return a.second < b.second;
  });

  std::vector<CandidateRow> out;
  out.reserve(rows.size());
  for (const auto& entry : order) out.push_back(rows[entry.second]);
  return out;
}

PersonalizedReranker::PersonalizedReranker(const Store* store, PersonalizationSettings settings)
    : store_(store), settings_(settings) {}

rocksdb::Status PersonalizedReranker::Rerank(const RequestContext& ctx,
                                             std::string_view user_id,
                                             std::vector<CandidateRow>* rows) const {
  if (!rows) return rocksdb::Status::InvalidArgument("rows is null");
  if (!settings_.enabled || rows->empty() || user_id.empty()) return rocksdb::Status::OK();

  std::vector<LikeEntry> likes;
  rocksdb::Status s = FetchRecentLikes(ctx, *store_, user_id, settings_.max_likes, &likes);
  if (!s.ok() || likes.empty()) return s;

  std::vector<VideoIdentity> liked_ids;
  for (const auto& like : likes) liked_ids.push_back({like.video_id, like.instance_domain});
  std::vector<VideoIdentity> row_ids;
  for (const auto& row : *rows) row_ids.push_back(row.video.Identity());

  std::unordered_map<std::string, std::vector<float>> liked_embeddings;
  s = store_->GetEmbeddings(liked_ids, &liked_embeddings);
  if (!s.ok()) return s;
  std::unordered_map<std::string, std::vector<float>> row_embeddings;
  s = store_->GetEmbeddings(row_ids, &row_embeddings);
  if (!s.ok()) return s;
  if (liked_embeddings.empty() || row_embeddings.empty()) return rocksdb::Status::OK();

  std::vector<std::vector<float>> liked;
  for (auto& entry : liked_embeddings) liked.push_back(std::move(entry.second));
  liked = internal::NormalizedVectors(liked);
  if (liked.empty()) return rocksdb::Status::OK();

  *rows = RerankByAffinity(*rows, row_embeddings, liked, settings_.alpha, settings_.beta);
  if (store_->options().metrics) {
    store_->options().metrics->Counter("peerrec.personalize.reranked_total", 1);
  }
  return rocksdb::Status::OK();
}

}  // namespace peerrec
