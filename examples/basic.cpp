#include <peerrec/ann_source.hpp>
#include <peerrec/recommender.hpp>
#include <peerrec/store.hpp>
#include <peerrec/vector_index.hpp>

#include <iostream>
#include <string>
#include <vector>

int main() {
  peerrec::Options opt;
  std::unique_ptr<peerrec::Store> db;

  auto s = peerrec::Store::Open("./peerrec_db", &db, opt);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  // Three videos on two instances; the index is keyed by catalog rowid.
  auto index = peerrec::internal::CreateHNSWIndex(3);
  const char* ids[] = {"intro", "follow-up", "unrelated"};
  const std::vector<float> embeddings[] = {{1.0f, 0.0f, 0.0f}, {0.9f, 0.436f, 0.0f}, {0.0f, 0.0f, 1.0f}};
  for (int i = 0; i < 3; ++i) {
    peerrec::VideoRecord video;
    video.video_id = ids[i];
    video.video_uuid = std::string("uuid-") + ids[i];
    video.instance_domain = i == 2 ? "b.example" : "a.example";
    video.channel_id = ids[i];
    uint64_t rowid = 0;
    s = db->PutVideo(video, embeddings[i], &rowid);
    if (!s.ok()) {
      std::cerr << "PutVideo failed: " << s.ToString() << "\n";
      return 1;
    }
    if (!index->Add(embeddings[i], rowid)) {
      std::cerr << "index add failed for " << ids[i] << "\n";
      return 1;
    }
  }

  peerrec::AnnSimilaritySource ann(db.get(), index.get());
  std::unique_ptr<peerrec::Recommender> rec;
  s = peerrec::Recommender::Create(db.get(), &ann, peerrec::DefaultRecommendationConfig(),
                                   peerrec::RecommenderOptions{}, &rec);
  if (!s.ok()) {
    std::cerr << "Create failed: " << s.ToString() << "\n";
    return 1;
  }

  // Related videos of "intro".
  peerrec::Random rng = peerrec::Random::FromEntropy();
  peerrec::RequestContext ctx;
  ctx.rng = &rng;

  peerrec::RecommendRequest req;
  req.video_id = "intro";
  req.host = "a.example";

  peerrec::RecommendResponse resp;
  s = rec->Recommend(ctx, req, &resp);
  if (!s.ok()) {
    std::cerr << "Recommend failed: " << s.ToString() << "\n";
    return 1;
  }

  std::cout << "profile=" << resp.profile << "\n";
  for (const auto& row : resp.rows) {
    std::cout << row.video.video_id << "@" << row.video.instance_domain << " score=" << row.score
              << "\n";
  }
  return 0;
}
