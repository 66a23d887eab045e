#include "test_framework.hpp"

#include "notegraph/vector/centroids.hpp"

#include <cmath>

namespace {

bool near(const float a, const float b, const float eps = 1e-6F) { return std::fabs(a - b) < eps; }

} // namespace

void register_centroids_tests(std::vector<notegraph::tests::TestCase> &tests) {
  using notegraph::tests::require;
  namespace vec = notegraph::vector;
  namespace common = notegraph::common;

  tests.push_back({"centroids_mean_is_normalized", [] {
                     vec::TagVectors tagged;
                     tagged["x"] = {{1.0F, 0.0F}, {0.0F, 1.0F}};
                     const auto centroids = vec::compute_centroids(tagged, {});
                     require(centroids.size() == 1, "one tag in, one centroid out");
                     const auto &c = centroids.at("x");
                     require(c.size() == 2, "centroid keeps the dimension");
                     require(near(c[0], 0.70710678F) && near(c[1], 0.70710678F),
                             "mean [0.5,0.5] should normalize to [0.707,0.707]");
                   }});

  tests.push_back({"centroids_single_member_is_member_direction", [] {
                     vec::TagVectors tagged;
                     tagged["solo"] = {{0.0F, 2.0F}};
                     const auto centroids = vec::compute_centroids(tagged, {});
                     require(near(centroids.at("solo")[0], 0.0F) &&
                                 near(centroids.at("solo")[1], 1.0F),
                             "single member should be rescaled to unit length");
                   }});

  tests.push_back({"centroids_zero_mean_is_emitted_unnormalized", [] {
                     vec::TagVectors tagged;
                     tagged["cancel"] = {{1.0F, 0.0F}, {-1.0F, 0.0F}};
                     const auto centroids = vec::compute_centroids(tagged, {});
                     require(centroids.contains("cancel"), "degenerate tag still present");
                     const auto &c = centroids.at("cancel");
                     require(c[0] == 0.0F && c[1] == 0.0F, "zero mean stays the zero vector");
                     require(!std::isnan(c[0]) && !std::isnan(c[1]), "no NaN from 0/0");
                   }});

  tests.push_back({"centroids_skip_tags_are_excluded", [] {
                     vec::TagVectors tagged;
                     tagged["conversation"] = {{1.0F, 0.0F}, {1.0F, 0.0F}, {0.9F, 0.1F}};
                     tagged["context"] = {{0.0F, 1.0F}};
                     tagged["rust"] = {{0.0F, 1.0F}};
                     const auto centroids =
                         vec::compute_centroids(tagged, {"conversation", "context"});
                     require(centroids.size() == 1, "only rust should remain");
                     require(!centroids.contains("conversation"), "conversation is skipped");
                     require(!centroids.contains("context"), "context is skipped");

                     const auto suggested = vec::suggest_tags({1.0F, 0.0F}, centroids, -1.0F, 10);
                     for (const auto &tag : suggested) {
                       require(tag != "conversation", "skipped tag must never be suggested");
                     }
                   }});

  tests.push_back({"centroids_tags_without_members_are_omitted", [] {
                     vec::TagVectors tagged;
                     tagged["empty"] = {};
                     tagged["full"] = {{1.0F, 0.0F}};
                     const auto centroids = vec::compute_centroids(tagged, {});
                     require(!centroids.contains("empty"), "no members, no centroid");
                     require(centroids.contains("full"), "populated tag kept");
                     require(vec::compute_centroids({}, {}).empty(), "no tags, no centroids");
                   }});

  tests.push_back({"suggest_threshold_is_inclusive", [] {
                     vec::CentroidMap at_threshold;
                     at_threshold["edge"] = {0.45F, 0.0F};
                     const auto included = vec::suggest_tags({1.0F, 0.0F}, at_threshold, 0.45F, 5);
                     require(included.size() == 1 && included[0] == "edge",
                             "score equal to the threshold should be included");

                     vec::CentroidMap below;
                     below["edge"] = {std::nextafter(0.45F, 0.0F), 0.0F};
                     const auto excluded = vec::suggest_tags({1.0F, 0.0F}, below, 0.45F, 5);
                     require(excluded.empty(), "score just below the threshold is excluded");
                   }});

  tests.push_back({"suggest_orders_by_score_then_name_and_truncates", [] {
                     vec::CentroidMap centroids;
                     centroids["mid"] = {0.8F, 0.6F};
                     centroids["beta"] = {1.0F, 0.0F};
                     centroids["alpha"] = {1.0F, 0.0F};
                     centroids["far"] = {0.0F, 1.0F};
                     centroids["low"] = {0.5F, 0.0F};

                     const auto scored = vec::scored_tags({1.0F, 0.0F}, centroids, 0.45F, 3);
                     require(scored.size() == 3, "max_tags should truncate");
                     require(scored[0].tag == "alpha" && scored[1].tag == "beta",
                             "ties broken by ascending tag name");
                     require(scored[2].tag == "mid", "then the next best score");
                     require(near(scored[2].score, 0.8F), "score is the dot product");

                     const auto names = vec::suggest_tags({1.0F, 0.0F}, centroids, 0.45F, 5);
                     require(names.size() == 4, "far falls below the threshold");
                     require(names.back() == "low", "lowest qualifying score last");
                   }});

  tests.push_back({"suggest_empty_centroids_is_empty", [] {
                     require(vec::suggest_tags({1.0F, 0.0F}, {}).empty(), "nothing to suggest");
                     require(vec::scored_tags({1.0F, 0.0F}, {}).empty(), "nothing to score");
                   }});

  tests.push_back({"suggest_defaults_match_documented_values", [] {
                     require(vec::kDefaultSuggestThreshold == 0.45F, "default threshold 0.45");
                     require(vec::kDefaultMaxSuggestedTags == 5, "default max tags 5");
                   }});

  tests.push_back({"centroid_cache_reuses_until_generation_changes", [] {
                     vec::CentroidCache cache;
                     int loads = 0;
                     const vec::CentroidCache::Loader loader = [&loads]() {
                       ++loads;
                       vec::TagVectors tagged;
                       tagged["x"] = {{1.0F, 0.0F}};
                       return common::Result<vec::TagVectors>::success(std::move(tagged));
                     };

                     auto first = cache.get(1, {}, loader);
                     require(first.ok(), first.error());
                     auto second = cache.get(1, {}, loader);
                     require(second.ok(), second.error());
                     require(loads == 1, "same generation should not reload");
                     require(cache.hits() == 1 && cache.misses() == 1, "one hit, one miss");
                     require(second.value().at("x") == first.value().at("x"),
                             "cached output equals computed output");

                     auto third = cache.get(2, {}, loader);
                     require(third.ok(), third.error());
                     require(loads == 2, "new generation should reload");

                     auto skipped = cache.get(2, {"x"}, loader);
                     require(skipped.ok(), skipped.error());
                     require(loads == 3, "different skip set should reload");
                     require(skipped.value().empty(), "skip set applies to cached result");

                     cache.invalidate();
                     auto after = cache.get(2, {"x"}, loader);
                     require(after.ok(), after.error());
                     require(loads == 4, "invalidate forces a reload");
                   }});

  tests.push_back({"centroid_cache_propagates_loader_errors", [] {
                     vec::CentroidCache cache;
                     auto result = cache.get(1, {}, [] {
                       return common::Result<vec::TagVectors>::failure(
                           "boom", common::ErrorCode::Storage);
                     });
                     require(!result.ok(), "loader failure should surface");
                     require(result.code() == common::ErrorCode::Storage, "code preserved");

                     int loads = 0;
                     auto retry = cache.get(1, {}, [&loads] {
                       ++loads;
                       return common::Result<vec::TagVectors>::success({});
                     });
                     require(retry.ok() && loads == 1, "a failed load is not cached");
                   }});
}
