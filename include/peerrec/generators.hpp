#pragma once

#include <peerrec/candidate_source.hpp>
#include <peerrec/profile.hpp>
#include <peerrec/request_context.hpp>
#include <peerrec/store.hpp>
#include <peerrec/types.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include <rocksdb/status.h>

namespace peerrec {

/** The requesting user's recent likes, loaded once per request. */
struct UserTaste {
  std::vector<LikeEntry> likes;
  std::unordered_set<std::string> liked_keys;
  // Unit-length embeddings of the liked videos that have one.
  std::vector<std::vector<float>> liked_embeddings;

  bool has_likes() const { return !likes.empty(); }
};

/** Load up to max_likes likes of user_id (or the request's client likes) and their embeddings. */
rocksdb::Status LoadUserTaste(const RequestContext& ctx,
                              const Store& store,
                              std::string_view user_id,
                              size_t max_likes,
                              UserTaste* out);

/**
 * Up to limit random rows: a window of the random cache, or a raw random
 * sample of the catalog when the cache is empty.
 */
rocksdb::Status FetchRandomPool(const RequestContext& ctx,
                                const Store& store,
                                size_t limit,
                                std::vector<CandidateRow>* out);

/** Input of one generator call. */
struct GeneratorRequest {
  std::string_view user_id;
  size_t limit = 0;
  bool refresh_cache = false;
  const GeneratorConfig* config = nullptr;  // never null
  const UserTaste* taste = nullptr;         // never null
};

/** One layer of the mixer: produces up to request.limit candidate rows. */
class CandidateGenerator {
 public:
  virtual ~CandidateGenerator() = default;

  virtual const char* name() const = 0;

  virtual rocksdb::Status Generate(const RequestContext& ctx,
                                   const GeneratorRequest& request,
                                   std::vector<CandidateRow>* out) const = 0;
};

/** Collaborators of the generators. Not owned; likes_fallback may be null. */
struct GeneratorDeps {
  const Store* store = nullptr;
  const CandidateSource* likes_source = nullptr;
  const CandidateSource* likes_fallback = nullptr;
};

/**
 * Build a generator by layer name:
 *  - "exploit": likes source, then likes_fallback, then the random cache,
 *    then a raw random pool. Each stage runs only when the previous one
 *    returned nothing.
 *  - "explore": random pool rows whose affinity to the user's likes lies in
 *    [similarity_min, similarity_max).
 *  - "popular": sample of the most popular rows.
 *  - "fresh": sample of the most recently published rows.
 *  - "random": random pool; with below_explore_min, rows under explore_min.
 * Returns nullptr for unknown names.
 */
std::unique_ptr<CandidateGenerator> CreateGenerator(std::string_view name,
                                                    const GeneratorDeps& deps);

}  // namespace peerrec
