#pragma once

#include <peerrec/types.hpp>

#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace peerrec {

/** Occurrence caps per response. 0 disables a cap. */
struct DiversityCaps {
  int max_per_author = 0;
  int max_per_instance = 0;
  bool dedup = true;  // drop identities already seen
};

/**
 * Counters and seen identities of one request. Threading the same state
 * through several Diversify calls composes their batches.
 */
struct DiversifyState {
  std::unordered_map<std::string, int> author_counts;
  std::unordered_map<std::string, int> instance_counts;
  std::unordered_set<std::string> seen;
};

/**
 * Order-preserving filter: keeps a row unless its identity was already seen
 * (dedup) or its author / instance already reached the cap, and stops after
 * limit kept rows (0 = no limit). Kept rows update state.
 */
std::vector<CandidateRow> Diversify(const std::vector<CandidateRow>& rows,
                                    size_t limit,
                                    const DiversityCaps& caps,
                                    DiversifyState* state = nullptr);

}  // namespace peerrec
