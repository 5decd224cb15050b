#include <peerrec/internal.hpp>
#include <peerrec/popularity.hpp>
#include <peerrec/random.hpp>
#include <peerrec/server/request.hpp>
#include <peerrec/store.hpp>
#include <peerrec/vector_index.hpp>

#include <json/json.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

static void usage(const char* argv0) {
  std::cerr
      << "usage:\n"
      << "  " << argv0 << " <db_path> import <catalog.jsonl>\n"
      << "  " << argv0 << " <db_path> build-index <index_path>\n"
      << "  " << argv0 << " <db_path> recompute-popularity [--incremental]\n"
      << "  " << argv0 << " <db_path> populate-random-cache [size]\n"
      << "  " << argv0 << " <db_path> like <user_id> <video_id> <instance_domain>\n"
      << "  " << argv0 << " <db_path> deny-host <host>\n"
      << "  " << argv0 << " <db_path> block-channel <channel_id> <host>\n"
      << "  " << argv0 << " <db_path> count\n";
}

static int Import(peerrec::Store* db, const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    std::cerr << "Cannot open " << path << "\n";
    return 1;
  }

  Json::CharReaderBuilder builder;
  uint64_t imported = 0, skipped = 0;
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (peerrec::internal::TrimWhitespace(line).empty()) continue;

    Json::Value obj;
    std::string errs;
    std::istringstream stream(line);
    if (!Json::parseFromStream(builder, stream, &obj, &errs)) {
      std::cerr << path << ":" << line_no << ": invalid JSON\n";
      ++skipped;
      continue;
    }

    peerrec::VideoRecord video;
    std::vector<float> embedding;
    std::string error;
    if (!peerrec::server::VideoFromJson(obj, &video, &embedding, &error)) {
      std::cerr << path << ":" << line_no << ": " << error << "\n";
      ++skipped;
      continue;
    }

    auto s = db->PutVideo(video, embedding);
    if (s.IsInvalidArgument()) {
      std::cerr << path << ":" << line_no << ": " << s.ToString() << "\n";
      ++skipped;
      continue;
    }
    if (!s.ok()) {
      std::cerr << "PutVideo failed: " << s.ToString() << "\n";
      return 1;
    }
    ++imported;
  }

  std::cout << "imported=" << imported << " skipped=" << skipped << "\n";
  return 0;
}

static int BuildIndex(peerrec::Store* db, const std::string& index_path) {
  uint32_t dim = 0;
  uint64_t approx = 0;
  auto s = db->EmbeddingDimension(&dim);
  if (s.ok()) s = db->CountEmbeddingsApprox(&approx);
  if (!s.ok()) {
    std::cerr << "Reading catalog failed: " << s.ToString() << "\n";
    return 1;
  }
  if (dim == 0) {
    std::cerr << "No embeddings in catalog\n";
    return 1;
  }

  auto index = peerrec::internal::CreateHNSWIndex(dim, std::max<uint64_t>(approx, 1000));
  uint64_t added = 0, failed = 0;
  s = db->ForEachEmbedding([&](uint64_t rowid, const std::vector<float>& embedding) {
    if (index->Add(embedding, rowid)) {
      ++added;
    } else {
      ++failed;
    }
    return true;
  });
  if (!s.ok()) {
    std::cerr << "Embedding scan failed: " << s.ToString() << "\n";
    return 1;
  }
  if (!index->Save(index_path)) {
    std::cerr << "Saving index to " << index_path << " failed\n";
    return 1;
  }

  std::cout << "indexed=" << added << " failed=" << failed << " dim=" << dim << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) { usage(argv[0]); return 2; }

  std::string db_path = argv[1];
  std::string cmd = argv[2];

  peerrec::Options opt;
  std::unique_ptr<peerrec::Store> db;
  auto s = peerrec::Store::Open(db_path, &db, opt);
  if (!s.ok()) {
    std::cerr << "Open failed: " << s.ToString() << "\n";
    return 1;
  }

  if (cmd == "import") {
    if (argc != 4) { usage(argv[0]); return 2; }
    return Import(db.get(), argv[3]);
  } else if (cmd == "build-index") {
    if (argc != 4) { usage(argv[0]); return 2; }
    return BuildIndex(db.get(), argv[3]);
  } else if (cmd == "recompute-popularity") {
    bool incremental = false;
    if (argc == 4 && std::string(argv[3]) == "--incremental") {
      incremental = true;
    } else if (argc != 3) {
      usage(argv[0]);
      return 2;
    }
    uint64_t updated = 0;
    s = db->RecomputePopularity(incremental, peerrec::kDefaultLikeWeight,
                                peerrec::internal::WallClockMillis(), &updated);
    if (!s.ok()) {
      std::cerr << "RecomputePopularity failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << "updated=" << updated << "\n";
    return 0;
  } else if (cmd == "populate-random-cache") {
    peerrec::RandomCacheSettings settings;
    if (argc == 4) {
      try {
        settings.size = std::stoull(argv[3]);
      } catch (const std::logic_error&) {
        std::cerr << "Invalid size: " << argv[3] << "\n";
        return 2;
      }
      settings.refresh = true;
    } else if (argc != 3) {
      usage(argv[0]);
      return 2;
    }
    peerrec::Random rng = peerrec::Random::FromEntropy();
    uint64_t count = 0;
    s = db->PopulateRandomCache(settings, &rng, &count);
    if (!s.ok()) {
      std::cerr << "PopulateRandomCache failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << "cached=" << count << "\n";
    return 0;
  } else if (cmd == "like") {
    if (argc != 6) { usage(argv[0]); return 2; }
    peerrec::VideoRecord video;
    s = db->GetVideo(argv[4], argv[5], &video);
    if (!s.ok()) {
      std::cerr << "GetVideo failed: " << s.ToString() << "\n";
      return 1;
    }
    peerrec::LikeEntry like;
    like.video_id = video.video_id;
    like.instance_domain = video.instance_domain;
    like.video_uuid = video.video_uuid;
    like.created_at = peerrec::internal::WallClockMillis();
    s = db->AddLike(argv[3], like);
    if (!s.ok()) {
      std::cerr << "AddLike failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << "OK\n";
    return 0;
  } else if (cmd == "deny-host") {
    if (argc != 4) { usage(argv[0]); return 2; }
    s = db->AddDeniedHost(argv[3]);
    if (!s.ok()) {
      std::cerr << "AddDeniedHost failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << "OK\n";
    return 0;
  } else if (cmd == "block-channel") {
    if (argc != 5) { usage(argv[0]); return 2; }
    s = db->AddBlockedChannel(argv[3], argv[4]);
    if (!s.ok()) {
      std::cerr << "AddBlockedChannel failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << "OK\n";
    return 0;
  } else if (cmd == "count") {
    if (argc != 3) { usage(argv[0]); return 2; }
    uint64_t videos = 0, embeddings = 0, cached = 0;
    uint32_t dim = 0;
    s = db->CountVideos(&videos);
    if (s.ok()) s = db->CountEmbeddingsApprox(&embeddings);
    if (s.ok()) s = db->RandomCacheSize(&cached);
    if (s.ok()) s = db->EmbeddingDimension(&dim);
    if (!s.ok()) {
      std::cerr << "Count failed: " << s.ToString() << "\n";
      return 1;
    }
    std::cout << "videos=" << videos << " embeddings~=" << embeddings
              << " random_cache=" << cached << " dim=" << dim << "\n";
    return 0;
  } else {
    usage(argv[0]);
    return 2;
  }
}
