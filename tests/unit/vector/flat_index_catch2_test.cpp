// Catch2 tests for the exact flat index and vector utilities

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <namesake/vector/flat_index.h>

#include <chrono>
#include <cmath>
#include <limits>

using namespace namesake;
using namespace namesake::vector;
using Catch::Approx;

namespace {

IndexConfig flatConfig(size_t dim = 3) {
    IndexConfig config;
    config.type = IndexType::FLAT;
    config.dimension = dim;
    return config;
}

} // namespace

TEST_CASE("vector_utils cosine and validation", "[vector][utils][catch2]") {
    Embedding a{1, 0, 0};
    Embedding b{1, 1, 0};
    CHECK(vector_utils::cosineSimilarity(a, a) == Approx(1.0f));
    CHECK(vector_utils::cosineSimilarity(a, b) == Approx(1.0f / std::sqrt(2.0f)));
    CHECK(vector_utils::cosineSimilarity(a, Embedding{-2, 0, 0}) == Approx(-1.0f));

    auto ok = vector_utils::validate(Embedding{3, 4, 0}, 3);
    REQUIRE(ok);
    CHECK(ok.value() == Approx(5.0f));

    auto wrongDim = vector_utils::validate(a, 4);
    REQUIRE_FALSE(wrongDim);
    CHECK(wrongDim.error().code == ErrorCode::DimensionMismatch);

    auto zero = vector_utils::validate(Embedding{0, 0, 0}, 3);
    REQUIRE_FALSE(zero);
    CHECK(zero.error().code == ErrorCode::DegenerateVector);

    auto inf = vector_utils::validate(Embedding{std::numeric_limits<float>::infinity(), 0, 0}, 3);
    REQUIRE_FALSE(inf);
    CHECK(inf.error().code == ErrorCode::DegenerateVector);
}

TEST_CASE("createVectorIndex honours the configured type", "[vector][factory][catch2]") {
    auto flat = createVectorIndex(flatConfig());
    REQUIRE(flat);
    CHECK(flat->type() == IndexType::FLAT);

    auto config = flatConfig();
    config.type = IndexType::HNSW;
    auto hnsw = createVectorIndex(config);
    REQUIRE(hnsw);
    CHECK(hnsw->type() == IndexType::HNSW);

    CHECK(indexTypeToString(IndexType::FLAT) == "FLAT");
    CHECK(indexTypeToString(IndexType::HNSW) == "HNSW");
}

TEST_CASE("FlatIndex exact search", "[vector][flat][catch2]") {
    FlatIndex index(flatConfig());
    REQUIRE(index.initialize());

    REQUIRE(index.upsert(IndexEntry{"a", "alpha", Embedding{1, 0, 0}}));
    REQUIRE(index.upsert(IndexEntry{"b", "beta", Embedding{1, 1, 0}}));
    REQUIRE(index.upsert(IndexEntry{"c", "gamma", Embedding{0, 0, 1}}));
    REQUIRE(index.upsert(IndexEntry{"d", "delta", Embedding{2, 0, 0}}));
    CHECK(index.size() == 4);

    QueryParams params;
    params.threshold = 0.5f;
    params.limit = 10;
    auto r = index.query(Embedding{1, 0, 0}, params);
    REQUIRE(r);
    const auto& hits = r.value().hits;
    REQUIRE(hits.size() == 3);
    // Equal similarities are ordered by id
    CHECK(hits[0].id == "a");
    CHECK(hits[1].id == "d");
    CHECK(hits[2].id == "b");
    CHECK(hits[0].similarity == Approx(1.0f));
    CHECK(hits[2].label == "beta");

    SECTION("threshold is inclusive") {
        params.threshold = hits[2].similarity;
        auto again = index.query(Embedding{1, 0, 0}, params);
        REQUIRE(again);
        CHECK(again.value().hits.size() == 3);
    }

    SECTION("limit keeps the best hits") {
        params.limit = 1;
        auto top = index.query(Embedding{1, 0, 0}, params);
        REQUIRE(top);
        REQUIRE(top.value().hits.size() == 1);
        CHECK(top.value().hits[0].id == "a");
    }

    SECTION("update and remove") {
        REQUIRE(index.upsert(IndexEntry{"c", "gamma", Embedding{1, 0, 0}}));
        auto updated = index.query(Embedding{1, 0, 0}, params);
        REQUIRE(updated);
        CHECK(updated.value().hits.size() == 4);

        REQUIRE(index.remove("a"));
        CHECK_FALSE(index.contains("a"));
        auto missing = index.remove("a");
        REQUIRE_FALSE(missing);
        CHECK(missing.error().code == ErrorCode::NotFound);
        CHECK(index.getStats().total_updates == 1);
    }

    SECTION("expired deadline") {
        params.deadline = std::chrono::steady_clock::now() - std::chrono::seconds(1);
        auto late = index.query(Embedding{1, 0, 0}, params);
        REQUIRE_FALSE(late);
        CHECK(late.error().code == ErrorCode::Timeout);
    }
}

TEST_CASE("FlatIndex capacity and validation", "[vector][flat][catch2]") {
    auto config = flatConfig();
    config.max_elements = 1;
    FlatIndex index(config);

    auto early = index.upsert(IndexEntry{"a", "a", Embedding{1, 0, 0}});
    REQUIRE_FALSE(early);
    CHECK(early.error().code == ErrorCode::IndexUnavailable);

    REQUIRE(index.initialize());
    REQUIRE(index.upsert(IndexEntry{"a", "a", Embedding{1, 0, 0}}));
    // Replacing an existing id does not need new capacity
    REQUIRE(index.upsert(IndexEntry{"a", "a2", Embedding{0, 1, 0}}));

    auto full = index.upsert(IndexEntry{"b", "b", Embedding{0, 0, 1}});
    REQUIRE_FALSE(full);
    CHECK(full.error().code == ErrorCode::ResourceExhausted);

    auto degenerate = index.query(Embedding{0, 0, 0}, QueryParams{});
    REQUIRE_FALSE(degenerate);
    CHECK(degenerate.error().code == ErrorCode::DegenerateVector);
}
