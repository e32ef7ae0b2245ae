#include <catch2/catch_all.hpp>
#include <promptvec/filter.hpp>

using namespace promptvec;

static DocumentMetadata make_meta(std::string domain, DocumentType type, std::set<std::string> tags,
                                  std::optional<double> eff, int day) {
  DocumentMetadata m;
  m.domain = std::move(domain);
  m.type = type;
  m.tags = std::move(tags);
  m.effectiveness = eff;
  m.created = Timestamp{std::chrono::hours(24 * day)};
  return m;
}

TEST_CASE("filter emptiness and categorical detection", "[filter]"){
  SearchFilters none;
  REQUIRE(none.empty());
  REQUIRE_FALSE(none.has_categorical());

  SearchFilters tags; tags.tags = {"email"};
  REQUIRE(tags.has_categorical());

  SearchFilters eff; eff.effectiveness_min = 0.5;
  REQUIRE_FALSE(eff.has_categorical());
  REQUIRE_FALSE(eff.empty());
}

TEST_CASE("filter eval numeric and date ranges", "[filter]"){
  const auto meta = make_meta("sales", DocumentType::Prompt, {}, 0.8, 100);
  const auto no_eff = make_meta("sales", DocumentType::Prompt, {}, std::nullopt, 100);

  SearchFilters eff; eff.effectiveness_min = 0.5;
  REQUIRE(filter_eval::matches_ranges(eff, meta));
  REQUIRE_FALSE(filter_eval::matches_ranges(eff, no_eff));
  eff.effectiveness_min = 0.9;
  REQUIRE_FALSE(filter_eval::matches_ranges(eff, meta));

  // Bounds are inclusive.
  SearchFilters dates;
  dates.created_after = Timestamp{std::chrono::hours(24 * 100)};
  dates.created_before = Timestamp{std::chrono::hours(24 * 100)};
  REQUIRE(filter_eval::matches_ranges(dates, meta));
  dates.created_after = Timestamp{std::chrono::hours(24 * 101)};
  REQUIRE_FALSE(filter_eval::matches_ranges(dates, meta));
  dates.created_after.reset();
  dates.created_before = Timestamp{std::chrono::hours(24 * 99)};
  REQUIRE_FALSE(filter_eval::matches_ranges(dates, meta));
}

TEST_CASE("range constraints are ANDed", "[filter]"){
  const auto meta = make_meta("sales", DocumentType::Prompt, {"email"}, 0.8, 100);
  SearchFilters f;
  f.effectiveness_min = 0.7;
  f.created_after = Timestamp{std::chrono::hours(24 * 50)};
  REQUIRE(filter_eval::matches_ranges(f, meta));
  f.created_before = Timestamp{std::chrono::hours(24 * 60)};
  REQUIRE_FALSE(filter_eval::matches_ranges(f, meta));
}
