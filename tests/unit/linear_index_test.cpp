#include <catch2/catch_all.hpp>

#include <algorithm>
#include <vector>

#include "kestrel/index/linear_index.hpp"
#include "kestrel/kernels/distance.hpp"
#include "tests/support/example_factory.hpp"

using namespace kestrel;
using Catch::Approx;

namespace {

auto make_index(std::size_t dim) -> std::unique_ptr<index::LinearIndex> {
  auto idx = index::LinearIndex::create(dim);
  REQUIRE(idx.has_value());
  return std::move(*idx);
}

} // namespace

TEST_CASE("linear index rejects dimension mismatches", "[index][linear]") {
  auto idx = make_index(3);
  std::vector<float> wrong{1, 2};
  auto add = idx->add(1, wrong);
  REQUIRE_FALSE(add.has_value());
  REQUIRE(add.error().code == core::error_code::invalid_argument);
  REQUIRE(idx->size() == 0);

  auto search = idx->search_similar(wrong, 5);
  REQUIRE_FALSE(search.has_value());
  REQUIRE(search.error().code == core::error_code::invalid_argument);

  REQUIRE_FALSE(index::LinearIndex::create(0).has_value());
}

TEST_CASE("linear index overwrites duplicate ids", "[index][linear]") {
  auto idx = make_index(2);
  REQUIRE(idx->add(7, std::vector<float>{1, 0}).has_value());
  REQUIRE(idx->add(7, std::vector<float>{0, 1}).has_value());
  REQUIRE(idx->size() == 1);
  auto v = idx->get(7);
  REQUIRE(v.has_value());
  REQUIRE((*v)[1] == 1.0f);

  auto hits = idx->search_similar(std::vector<float>{0, 1}, 1);
  REQUIRE(hits.has_value());
  REQUIRE(hits->front().id == 7);
  REQUIRE(hits->front().score == Approx(1.0f));
}

TEST_CASE("linear index remove is idempotent and keeps other rows intact", "[index][linear]") {
  auto idx = make_index(2);
  REQUIRE(idx->add(1, std::vector<float>{1, 0}).has_value());
  REQUIRE(idx->add(2, std::vector<float>{0, 1}).has_value());
  REQUIRE(idx->add(3, std::vector<float>{1, 1}).has_value());

  REQUIRE(idx->remove(1).has_value());
  REQUIRE(idx->remove(1).has_value());
  REQUIRE(idx->remove(999).has_value());
  REQUIRE(idx->size() == 2);
  REQUIRE_FALSE(idx->contains(1));

  // Row 3 was swapped into the removed slot; its vector must be unchanged.
  auto v3 = idx->get(3);
  REQUIRE(v3.has_value());
  REQUIRE((*v3)[0] == 1.0f);
  REQUIRE((*v3)[1] == 1.0f);
}

TEST_CASE("linear index search returns exact top-k by cosine, descending", "[index][linear]") {
  constexpr std::size_t dim = 16;
  constexpr std::size_t n = 200;
  auto idx = make_index(dim);
  auto rows = example_factory::random_rows(n, dim, 11);
  for (std::size_t i = 0; i < n; ++i) {
    REQUIRE(idx->add(i, std::span<const float>(rows.data() + i * dim, dim)).has_value());
  }
  auto query = example_factory::random_vector(dim, 99);

  std::vector<std::pair<float, entity_id>> truth;
  for (std::size_t i = 0; i < n; ++i) {
    truth.emplace_back(kernels::cosine_similarity(query, std::span<const float>(rows.data() + i * dim, dim)), i);
  }
  std::sort(truth.begin(), truth.end(), [](auto& a, auto& b) { return a.first > b.first; });

  auto hits = idx->search_similar(query, 10);
  REQUIRE(hits.has_value());
  REQUIRE(hits->size() == 10);
  for (std::size_t i = 0; i < 10; ++i) {
    REQUIRE((*hits)[i].score == Approx(truth[i].first).margin(1e-5));
    if (i > 0) REQUIRE((*hits)[i - 1].score >= (*hits)[i].score);
  }

  SECTION("k larger than the population returns everything sorted") {
    auto all = idx->search_similar(query, n + 50);
    REQUIRE(all.has_value());
    REQUIRE(all->size() == n);
    REQUIRE(std::is_sorted(all->begin(), all->end(),
                           [](auto& a, auto& b) { return a.score > b.score; }));
  }
  SECTION("k == 0 returns nothing") {
    auto none = idx->search_similar(query, 0);
    REQUIRE(none.has_value());
    REQUIRE(none->empty());
  }
}

TEST_CASE("linear index honours the exclusion filter", "[index][linear][filter]") {
  auto idx = make_index(2);
  REQUIRE(idx->add(1, std::vector<float>{1, 0}).has_value());
  REQUIRE(idx->add(2, std::vector<float>{0.9f, 0.1f}).has_value());
  REQUIRE(idx->add(3, std::vector<float>{0, 1}).has_value());

  filter::IdFilter exclude{1};
  auto hits = idx->search_similar(std::vector<float>{1, 0}, 3, &exclude);
  REQUIRE(hits.has_value());
  REQUIRE(hits->size() == 2);
  REQUIRE(hits->front().id == 2);
  for (const auto& h : *hits) REQUIRE(h.id != 1);
}

TEST_CASE("linear index scores zero-norm vectors as zero", "[index][linear]") {
  auto idx = make_index(3);
  REQUIRE(idx->add(1, std::vector<float>{0, 0, 0}).has_value());
  auto hits = idx->search_similar(std::vector<float>{1, 2, 3}, 1);
  REQUIRE(hits.has_value());
  REQUIRE(hits->size() == 1);
  REQUIRE(hits->front().score == 0.0f);
}

TEST_CASE("empty linear index returns an empty result", "[index][linear]") {
  auto idx = make_index(4);
  auto hits = idx->search_similar(std::vector<float>{1, 2, 3, 4}, 5);
  REQUIRE(hits.has_value());
  REQUIRE(hits->empty());
}
