// Catch2 tests for candidate sets and the exact/semantic merge

#include <catch2/catch_test_macros.hpp>

#include <namesake/search/candidate_merger.h>

using namespace namesake;
using namespace namesake::search;
using vector::QueryHit;

TEST_CASE("CandidateSet::fromExact deduplicates", "[search][candidates][catch2]") {
    auto set = CandidateSet::fromExact({"S|2", "S|1", "S|2"});
    CHECK(set.size() == 2);
    CHECK(set.contains("S|1"));
    CHECK(set.count(Provenance::Exact) == 2);

    const Candidate* c = set.find("S|2");
    REQUIRE(c != nullptr);
    CHECK(c->provenance == Provenance::Exact);
    CHECK_FALSE(c->similarity.has_value());
    CHECK(set.find("S|3") == nullptr);

    CHECK(provenanceToString(Provenance::Exact) == "exact");
    CHECK(provenanceToString(Provenance::Semantic) == "semantic");
    CHECK(provenanceToString(Provenance::Both) == "both");
}

TEST_CASE("CandidateMerger with no hits is the identity", "[search][merge][catch2]") {
    auto exact = CandidateSet::fromExact({"A|1", "A|2"});
    CHECK(CandidateMerger::merge(exact, {}) == exact);

    CandidateSet empty;
    CHECK(CandidateMerger::merge(empty, {}).empty());
}

TEST_CASE("CandidateMerger assigns provenance", "[search][merge][catch2]") {
    auto exact = CandidateSet::fromExact({"A|1", "A|2"});
    std::vector<QueryHit> hits{{"A|2", "bob smith", 0.91f}, {"B|7", "robert smith", 0.82f}};

    auto merged = CandidateMerger::merge(exact, hits);
    REQUIRE(merged.size() == 3);
    CHECK(merged.count(Provenance::Exact) == 1);
    CHECK(merged.count(Provenance::Both) == 1);
    CHECK(merged.count(Provenance::Semantic) == 1);

    const auto* both = merged.find("A|2");
    REQUIRE(both != nullptr);
    CHECK(both->provenance == Provenance::Both);
    REQUIRE(both->similarity.has_value());
    CHECK(*both->similarity == 0.91f);

    const auto* semantic = merged.find("B|7");
    REQUIRE(semantic != nullptr);
    CHECK(semantic->provenance == Provenance::Semantic);
    CHECK(*semantic->similarity == 0.82f);

    const auto* exactOnly = merged.find("A|1");
    REQUIRE(exactOnly != nullptr);
    CHECK(exactOnly->provenance == Provenance::Exact);
    CHECK_FALSE(exactOnly->similarity.has_value());

    // Every exact candidate survives the merge
    for (const auto& [id, c] : exact) {
        CHECK(merged.contains(id));
    }
}

TEST_CASE("CandidateMerger keeps the best score per id", "[search][merge][catch2]") {
    std::vector<QueryHit> hits{{"X|1", "a", 0.80f}, {"X|1", "a", 0.95f}, {"X|1", "a", 0.85f}};
    auto merged = CandidateMerger::merge(CandidateSet{}, hits);
    REQUIRE(merged.size() == 1);
    CHECK(merged.find("X|1")->provenance == Provenance::Semantic);
    CHECK(*merged.find("X|1")->similarity == 0.95f);

    auto withExact = CandidateMerger::merge(CandidateSet::fromExact({"X|1"}), hits);
    CHECK(withExact.find("X|1")->provenance == Provenance::Both);
    CHECK(*withExact.find("X|1")->similarity == 0.95f);
}
