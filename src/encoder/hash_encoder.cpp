#include "notegraph/encoder/hash_encoder.hpp"

#include "notegraph/vector/ranker.hpp"

#include <cctype>
#include <cstdint>

namespace notegraph::encoder {

namespace {

constexpr std::uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;
constexpr float kWordWeight = 1.0F;
constexpr float kTrigramWeight = 0.5F;

std::uint64_t fnv1a(const std::string_view text, const std::uint64_t seed) {
  std::uint64_t hash = kFnvOffset ^ seed;
  for (const char ch : text) {
    hash ^= static_cast<unsigned char>(ch);
    hash *= kFnvPrime;
  }
  return hash;
}

void add_feature(vector::Vector &values, const std::string_view feature, const std::uint64_t seed,
                 const float weight) {
  const std::uint64_t hash = fnv1a(feature, seed);
  const std::size_t bucket = static_cast<std::size_t>(hash % values.size());
  values[bucket] += (hash >> 63U) != 0 ? -weight : weight;
}

std::vector<std::string> words(const std::string_view text) {
  std::vector<std::string> out;
  std::string current;
  for (const char ch : text) {
    const auto uch = static_cast<unsigned char>(ch);
    if (std::isalnum(uch) != 0 || uch >= 0x80) {
      current.push_back(static_cast<char>(std::tolower(uch)));
    } else if (!current.empty()) {
      out.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    out.push_back(std::move(current));
  }
  return out;
}

} // namespace

HashEncoder::HashEncoder(const std::size_t dimensions) : dimensions_(dimensions) {}

std::string_view HashEncoder::name() const { return "hash"; }

common::Result<vector::Vector> HashEncoder::encode(const std::string_view text) {
  if (dimensions_ == 0) {
    return common::Result<vector::Vector>::failure("hash encoder configured with 0 dimensions",
                                                   common::ErrorCode::EncodingFailed);
  }

  const auto tokens = words(text);
  if (tokens.empty()) {
    return common::Result<vector::Vector>::failure("nothing to encode: text has no words",
                                                   common::ErrorCode::EncodingFailed);
  }

  vector::Vector values(dimensions_, 0.0F);
  for (const auto &token : tokens) {
    add_feature(values, token, 0, kWordWeight);
    const std::string padded = " " + token + " ";
    for (std::size_t i = 0; i + 3 <= padded.size(); ++i) {
      add_feature(values, std::string_view(padded).substr(i, 3), 1, kTrigramWeight);
    }
  }

  vector::normalize(values);
  return common::Result<vector::Vector>::success(std::move(values));
}

std::size_t HashEncoder::dimensions() const { return dimensions_; }

} // namespace notegraph::encoder
