#include <peerrec/request_context.hpp>

namespace peerrec {

rocksdb::Status FetchRecentLikes(const RequestContext& ctx,
                                 const Store& store,
                                 std::string_view user_id,
                                 size_t limit,
                                 std::vector<LikeEntry>* out) {
  if (!out) return rocksdb::Status::InvalidArgument("out is null");
  out->clear();

  if (ctx.use_client_likes) {
    for (const auto& like : ctx.client_likes) {
      if (limit != 0 && out->size() >= limit) break;
      out->push_back(like);
    }
    return rocksdb::Status::OK();
  }

  if (user_id.empty()) return rocksdb::Status::OK();
  return store.FetchRecentLikes(user_id, limit, out);
}

}  // namespace peerrec
