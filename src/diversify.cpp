#include <peerrec/diversify.hpp>

namespace peerrec {

std::vector<CandidateRow> Diversify(const std::vector<CandidateRow>& rows,
                                    size_t limit,
                                    const DiversityCaps& caps,
                                    DiversifyState* state) {
  const bool capped_authors = caps.max_per_author > 0;
  const bool capped_instances = caps.max_per_instance > 0;

  if (!capped_authors && !capped_instances && !caps.dedup) {
    if (limit == 0 || rows.size() <= limit) return rows;
    return std::vector<CandidateRow>(rows.begin(), rows.begin() + limit);
  }

  DiversifyState local;
  DiversifyState& st = state ? *state : local;

  std::vector<CandidateRow> kept;
  for (const auto& row : rows) {
    if (limit != 0 && kept.size() >= limit) break;

    std::string key;
    if (caps.dedup) {
      key = row.Key();
      if (st.seen.count(key)) continue;
    }

    const std::string author = row.video.Author();
    if (capped_authors && !author.empty() &&
        st.author_counts[author] >= caps.max_per_author) {
      continue;
    }
    const std::string& instance = row.video.instance_domain;
    if (capped_instances && !instance.empty() &&
        st.instance_counts[instance] >= caps.max_per_instance) {
      continue;
    }

    if (caps.dedup) st.seen.insert(std::move(key));
    if (!author.empty()) ++st.author_counts[author];
    if (!instance.empty()) ++st.instance_counts[instance];
    kept.push_back(row);
  }
  return kept;
}

}  // namespace peerrec
