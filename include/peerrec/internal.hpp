#pragma once
#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/evp.h>
#include <rocksdb/status.h>

namespace peerrec::internal {

// Monotonic timestamp helper for metrics/tracing (microseconds).
inline uint64_t NowMicros() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count());
}

// Wall-clock milliseconds since epoch. Catalog timestamps (published_at,
// like times, cache computed_at) all use this unit.
inline int64_t WallClockMillis() {
  using namespace std::chrono;
  return static_cast<int64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

// SHA-256 wrapper using OpenSSL's EVP API.
class Sha256 {
 public:
  static constexpr size_t kDigestBytes = 32;

  static std::array<uint8_t, kDigestBytes> Digest(std::string_view data) {
    std::array<uint8_t, kDigestBytes> out{};
    unsigned int len = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (ctx) {
      if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) &&
          EVP_DigestUpdate(ctx, data.data(), data.size()) &&
          EVP_DigestFinal_ex(ctx, out.data(), &len)) {
        // digest written to out
      }
      EVP_MD_CTX_free(ctx);
    }

    return out;
  }
};

inline std::string TrimWhitespace(std::string_view s) {
  size_t start = s.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return std::string(s.substr(start, end - start + 1));
}

inline std::string ToBytes(const uint8_t* p, size_t n) {
  return std::string(reinterpret_cast<const char*>(p), n);
}

inline std::string EncodeU64LE(uint64_t v) {
  std::string s(8, '\0');
  for (int i = 0; i < 8; ++i) {
    s[i] = static_cast<char>(v & 0xffu);
    v >>= 8;
  }
  return s;
}

inline bool DecodeU64LE(std::string_view s, uint64_t* out) {
  if (s.size() != 8) return false;
  uint64_t v = 0;
  for (int i = 7; i >= 0; --i) {
    v <<= 8;
    v |= static_cast<uint8_t>(s[static_cast<size_t>(i)]);
  }
  *out = v;
  return true;
}

// Big-endian encodings sort numerically under RocksDB's bytewise comparator.
inline void PutU64BE(std::string* dst, uint64_t v) {
  for (int i = 7; i >= 0; --i) {
    dst->push_back(static_cast<char>((v >> (i * 8)) & 0xff));
  }
}

inline std::string EncodeU64BE(uint64_t v) {
  std::string s;
  s.reserve(8);
  PutU64BE(&s, v);
  return s;
}

inline bool DecodeU64BE(std::string_view s, uint64_t* out) {
  if (s.size() < 8) return false;
  uint64_t v = 0;
  for (int i = 0; i < 8; ++i) {
    v = (v << 8) | static_cast<uint8_t>(s[static_cast<size_t>(i)]);
  }
  *out = v;
  return true;
}

inline void PutU32BE(std::string* dst, uint32_t v) {
  for (int i = 3; i >= 0; --i) {
    dst->push_back(static_cast<char>((v >> (i * 8)) & 0xff));
  }
}

inline bool DecodeU32BE(std::string_view s, uint32_t* out) {
  if (s.size() < 4) return false;
  uint32_t v = 0;
  for (int i = 0; i < 4; ++i) {
    v = (v << 8) | static_cast<uint8_t>(s[static_cast<size_t>(i)]);
  }
  *out = v;
  return true;
}

inline uint64_t DoubleBits(double d) {
  uint64_t bits = 0;
  std::memcpy(&bits, &d, sizeof(bits));
  return bits;
}

inline double BitsToDouble(uint64_t bits) {
  double d = 0.0;
  std::memcpy(&d, &bits, sizeof(d));
  return d;
}

inline bool IsRetryableTxnStatus(const rocksdb::Status& s) {
  return s.IsBusy() || s.IsTimedOut() || s.IsTryAgain() || s.IsAborted();
}

// ---------------------------------------------------------------------------
// Length-prefixed record encoding
// ---------------------------------------------------------------------------

// Append-only writer for catalog values.
//   strings: [len:4 LE][bytes]
//   integers / doubles: 8 bytes LE
class RecordWriter {
 public:
  void PutString(std::string_view s) {
    uint32_t len = static_cast<uint32_t>(s.size());
    out_.push_back(static_cast<char>(len & 0xff));
    out_.push_back(static_cast<char>((len >> 8) & 0xff));
    out_.push_back(static_cast<char>((len >> 16) & 0xff));
    out_.push_back(static_cast<char>((len >> 24) & 0xff));
    out_.append(s.data(), s.size());
  }

  void PutU64(uint64_t v) { out_.append(EncodeU64LE(v)); }
  void PutI64(int64_t v) { PutU64(static_cast<uint64_t>(v)); }
  void PutDouble(double v) { PutU64(DoubleBits(v)); }
  void PutBool(bool v) { out_.push_back(v ? '\1' : '\0'); }

  const std::string& data() const { return out_; }
  std::string Release() { return std::move(out_); }

 private:
  std::string out_;
};

// Reader counterpart; every getter returns false once the input is exhausted.
class RecordReader {
 public:
  explicit RecordReader(std::string_view data) : data_(data) {}

  bool GetString(std::string* out) {
    if (data_.size() - pos_ < 4) return false;
    uint32_t len = static_cast<uint8_t>(data_[pos_]) |
                   (static_cast<uint8_t>(data_[pos_ + 1]) << 8) |
                   (static_cast<uint8_t>(data_[pos_ + 2]) << 16) |
                   (static_cast<uint8_t>(data_[pos_ + 3]) << 24);
    pos_ += 4;
    if (data_.size() - pos_ < len) return false;
    out->assign(data_.data() + pos_, len);
    pos_ += len;
    return true;
  }

  bool GetU64(uint64_t* out) {
    if (data_.size() - pos_ < 8) return false;
    if (!DecodeU64LE(data_.substr(pos_, 8), out)) return false;
    pos_ += 8;
    return true;
  }

  bool GetI64(int64_t* out) {
    uint64_t v = 0;
    if (!GetU64(&v)) return false;
    *out = static_cast<int64_t>(v);
    return true;
  }

  bool GetDouble(double* out) {
    uint64_t v = 0;
    if (!GetU64(&v)) return false;
    *out = BitsToDouble(v);
    return true;
  }

  bool GetBool(bool* out) {
    if (pos_ >= data_.size()) return false;
    *out = data_[pos_] != '\0';
    ++pos_;
    return true;
  }

  bool AtEnd() const { return pos_ == data_.size(); }

 private:
  std::string_view data_;
  size_t pos_ = 0;
};

// ---------------------------------------------------------------------------
// Embedding utilities
// ---------------------------------------------------------------------------

// Serialize embedding vector to bytes (little-endian floats)
inline std::string SerializeEmbedding(const std::vector<float>& embedding) {
  std::string out;
  out.resize(embedding.size() * sizeof(float));
  std::memcpy(out.data(), embedding.data(), out.size());
  return out;
}

// Deserialize bytes to embedding vector
inline bool DeserializeEmbedding(std::string_view bytes, std::vector<float>* out) {
  if (bytes.size() % sizeof(float) != 0) return false;
  size_t count = bytes.size() / sizeof(float);
  out->resize(count);
  std::memcpy(out->data(), bytes.data(), bytes.size());
  return true;
}

// Compute cosine similarity between two embeddings.
// Returns value in [-1.0, 1.0]; 0 for mismatched, empty or zero-norm input.
inline float CosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.size() != b.size() || a.empty()) return 0.0f;

  float dot = 0.0f, norm_a = 0.0f, norm_b = 0.0f;
  for (size_t i = 0; i < a.size(); ++i) {
    dot += a[i] * b[i];
    norm_a += a[i] * a[i];
    norm_b += b[i] * b[i];
  }

  float denom = std::sqrt(norm_a) * std::sqrt(norm_b);
  if (denom < 1e-12f) return 0.0f;
  return dot / denom;
}

// Scale v to unit length in place. Returns false (and leaves v untouched)
// when the vector is empty, zero-norm or contains a non-finite component.
inline bool NormalizeL2(std::vector<float>* v) {
  if (!v || v->empty()) return false;
  double sum = 0.0;
  for (float x : *v) {
    if (!std::isfinite(x)) return false;
    sum += static_cast<double>(x) * static_cast<double>(x);
  }
  double norm = std::sqrt(sum);
  if (!(norm > 0.0) || !std::isfinite(norm)) return false;
  for (float& x : *v) x = static_cast<float>(x / norm);
  return true;
}

inline float Dot(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.size() != b.size()) return 0.0f;
  float dot = 0.0f;
  for (size_t i = 0; i < a.size(); ++i) dot += a[i] * b[i];
  return dot;
}

// Unit-length copies of vectors; empty, zero-norm and non-finite ones are dropped.
inline std::vector<std::vector<float>> NormalizedVectors(
    const std::vector<std::vector<float>>& vectors) {
  std::vector<std::vector<float>> out;
  out.reserve(vectors.size());
  for (const auto& v : vectors) {
    std::vector<float> copy = v;
    if (NormalizeL2(&copy)) out.push_back(std::move(copy));
  }
  return out;
}

// Highest cosine similarity of v against unit liked vectors, in [-1, 1].
// Returns 0 when v cannot be normalized or no liked vector gives a finite product.
inline double MaxAffinity(const std::vector<float>& v,
                          const std::vector<std::vector<float>>& liked) {
  std::vector<float> unit = v;
  if (liked.empty() || !NormalizeL2(&unit)) return 0.0;
  double best = -std::numeric_limits<double>::infinity();
  for (const auto& l : liked) {
    if (l.size() != unit.size()) continue;
    double d = Dot(unit, l);
    if (std::isfinite(d) && d > best) best = d;
  }
  return std::isfinite(best) ? best : 0.0;
}

}  // namespace peerrec::internal
