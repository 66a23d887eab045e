#include "test_framework.hpp"

#include "notegraph/vector/ranker.hpp"

#include <cmath>
#include <limits>

namespace {

bool near(const float a, const float b) { return std::fabs(a - b) < 1e-6F; }

} // namespace

void register_ranker_tests(std::vector<notegraph::tests::TestCase> &tests) {
  using notegraph::tests::require;
  namespace vec = notegraph::vector;

  tests.push_back({"ranker_orders_by_descending_dot_product", [] {
                     const std::vector<vec::KeyedVector> candidates = {
                         {"b", {0.0F, 1.0F}}, {"c", {-1.0F, 0.0F}}, {"a", {1.0F, 0.0F}}};
                     const auto ranked = vec::rank({1.0F, 0.0F}, candidates);
                     require(ranked.size() == 3, "all candidates should be scored");
                     require(ranked[0].key == "a" && near(ranked[0].score, 1.0F), "a first at 1.0");
                     require(ranked[1].key == "b" && near(ranked[1].score, 0.0F), "b second at 0.0");
                     require(ranked[2].key == "c" && near(ranked[2].score, -1.0F), "c last at -1.0");
                   }});

  tests.push_back({"ranker_keeps_input_order_for_equal_scores", [] {
                     const std::vector<vec::KeyedVector> candidates = {{"z", {0.6F, 0.8F}},
                                                                       {"top", {1.0F, 0.0F}},
                                                                       {"x", {0.6F, 0.8F}},
                                                                       {"y", {0.6F, 0.8F}}};
                     const auto first = vec::rank({1.0F, 0.0F}, candidates);
                     require(first[0].key == "top", "highest score first");
                     require(first[1].key == "z" && first[2].key == "x" && first[3].key == "y",
                             "ties should keep candidate order");

                     for (int run = 0; run < 5; ++run) {
                       const auto again = vec::rank({1.0F, 0.0F}, candidates);
                       for (std::size_t i = 0; i < again.size(); ++i) {
                         require(again[i].key == first[i].key, "ranking should be deterministic");
                       }
                     }
                   }});

  tests.push_back({"ranker_empty_candidates_give_empty_result", [] {
                     require(vec::rank({1.0F, 0.0F}, {}).empty(), "no candidates, no results");
                     require(vec::rank_top({1.0F, 0.0F}, {}, 10).empty(), "rank_top too");
                   }});

  tests.push_back({"ranker_rank_top_truncates", [] {
                     std::vector<vec::KeyedVector> candidates;
                     for (int i = 0; i < 20; ++i) {
                       candidates.push_back({"k" + std::to_string(i),
                                             {static_cast<float>(i) / 20.0F, 0.0F}});
                     }
                     const auto top = vec::rank_top({1.0F, 0.0F}, candidates, 10);
                     require(top.size() == 10, "limit should apply");
                     require(top.front().key == "k19", "best candidate first");
                     require(top.back().key == "k10", "tenth best last");
                     require(vec::rank_top({1.0F, 0.0F}, candidates, 0).empty(), "limit 0 is empty");
                   }});

  tests.push_back({"ranker_nan_scores_sort_last", [] {
                     const float nan = std::numeric_limits<float>::quiet_NaN();
                     const std::vector<vec::KeyedVector> candidates = {
                         {"broken", {nan, 0.0F}}, {"low", {-1.0F, 0.0F}}, {"high", {1.0F, 0.0F}}};
                     const auto ranked = vec::rank({1.0F, 0.0F}, candidates);
                     require(ranked[0].key == "high", "finite best first");
                     require(ranked[1].key == "low", "finite worst second");
                     require(ranked[2].key == "broken", "NaN last");
                   }});

  tests.push_back({"ranker_dot_uses_shared_prefix", [] {
                     require(near(vec::dot({1.0F, 2.0F, 3.0F}, {1.0F, 1.0F}), 3.0F),
                             "mismatched dimensions use the shared prefix");
                     require(near(vec::dot({}, {1.0F}), 0.0F), "empty vector scores 0");
                   }});

  tests.push_back({"ranker_normalize_unit_length_and_zero_vector", [] {
                     vec::Vector values = {3.0F, 4.0F};
                     vec::normalize(values);
                     require(near(values[0], 0.6F) && near(values[1], 0.8F), "3-4-5 triangle");
                     require(std::fabs(vec::l2_norm(values) - 1.0) < 1e-6, "unit norm");

                     vec::Vector zero = {0.0F, 0.0F};
                     vec::normalize(zero);
                     require(zero[0] == 0.0F && zero[1] == 0.0F, "zero vector stays zero");
                   }});
}
