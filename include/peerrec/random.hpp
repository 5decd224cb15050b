#pragma once

#include <algorithm>
#include <cstdint>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace peerrec {

/**
 * Injectable random source for shuffles and samples.
 *
 * One instance per request; not thread-safe. Production code seeds from
 * entropy, tests pass a fixed seed.
 */
class Random {
 public:
  explicit Random(uint64_t seed) : engine_(seed) {}

  static Random FromEntropy() {
    std::random_device rd;
    uint64_t seed = (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
    seed ^= static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    return Random(seed);
  }

  // Uniform integer in [0, n). Returns 0 when n == 0.
  uint64_t Uniform(uint64_t n) {
    if (n == 0) return 0;
    std::uniform_int_distribution<uint64_t> dist(0, n - 1);
    return dist(engine_);
  }

  template <typename T>
  void Shuffle(std::vector<T>* items) {
    std::shuffle(items->begin(), items->end(), engine_);
  }

  // Uniform sample of k items without replacement; order is random.
  template <typename T>
  std::vector<T> Sample(const std::vector<T>& items, size_t k) {
    std::vector<T> out = items;
    Shuffle(&out);
    if (out.size() > k) out.resize(k);
    return out;
  }

  // Lowercase hex string of the given length (request ids).
  std::string HexId(size_t chars) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(chars);
    for (size_t i = 0; i < chars; ++i) out.push_back(kHex[Uniform(16)]);
    return out;
  }

  std::mt19937_64& engine() { return engine_; }

 private:
  std::mt19937_64 engine_;
};

}  // namespace peerrec
