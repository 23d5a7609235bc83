// Catch2 tests for the record ingestion pipeline

#include <catch2/catch_test_macros.hpp>

#include <namesake/pipeline/ingestion_pipeline.h>
#include <namesake/vector/flat_index.h>

#include <pipeline_fixture.hpp>
#include <scripted_embedding_provider.hpp>
#include <temp_dir_scope.hpp>

#include <atomic>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace namesake;
using namespace namesake::pipeline;
using test_support::makeRecord;
using test_support::namedRecord;

namespace {

PipelineConfig fastConfig() {
    PipelineConfig config;
    config.worker_threads = 4;
    config.index_retries = 2;
    config.retry_backoff_ms = 1;
    return config;
}

// Store that can refuse entries or removals on demand
class FailingStore : public storage::IDurableStore {
public:
    Result<void> append(const vector::IndexEntry& entry) override {
        const bool removal = entry.vector.empty();
        if ((removal && failRemovals) || (!removal && failAppends)) {
            return Error{ErrorCode::WriteError, "disk full"};
        }
        appended.fetch_add(1);
        return Result<void>();
    }

    Result<size_t> scan(const std::function<void(const vector::IndexEntry&)>&) override {
        return size_t{0};
    }

    std::atomic<bool> failAppends{false};
    std::atomic<bool> failRemovals{false};
    std::atomic<size_t> appended{0};
};

// Flat index whose removals always fail
class StickyIndex : public vector::FlatIndex {
public:
    using vector::FlatIndex::FlatIndex;

    Result<void> remove(const std::string& id) override {
        return Error{ErrorCode::InternalError, "cannot remove " + id};
    }
};

} // namespace

TEST_CASE("PipelineState names and terminal states", "[pipeline][state][catch2]") {
    CHECK(stateToString(PipelineState::NoNameSkip) == "NoNameSkip");
    CHECK(stateToString(PipelineState::Indexed) == "Indexed");
    CHECK(isTerminal(PipelineState::Indexed));
    CHECK(isTerminal(PipelineState::NoNameSkip));
    CHECK(isTerminal(PipelineState::EmbedFailed));
    CHECK(isTerminal(PipelineState::IndexFailed));
    CHECK(isTerminal(PipelineState::Merged));
    CHECK(isTerminal(PipelineState::QueryFailed));
    CHECK_FALSE(isTerminal(PipelineState::Received));
    CHECK_FALSE(isTerminal(PipelineState::NameExtracted));
    CHECK_FALSE(isTerminal(PipelineState::Embedded));
}

TEST_CASE_METHOD(test_support::NgramPipelineFixture, "IngestionPipeline indexes named records",
                 "[pipeline][ingest][catch2]") {
    IngestionPipeline ingest(embeddings, index, fastConfig());

    std::vector<record::Record> batch{
        namedRecord("1", "Robert Johnson"),
        makeRecord("CUST", "2", R"({"NAME_FIRST": "Bob", "NAME_LAST": "Johnson"})"),
        makeRecord("CUST", "3", R"({"PHONE_NUMBER": "555-0100"})"),
    };
    auto outcomes = ingest.ingestBatch(batch);
    REQUIRE(outcomes.size() == 3);

    CHECK(outcomes[0].state == PipelineState::Indexed);
    CHECK(outcomes[0].canonicalName == std::optional<std::string>("Robert Johnson"));
    CHECK(outcomes[1].state == PipelineState::Indexed);
    CHECK(outcomes[1].canonicalName == std::optional<std::string>("Bob Johnson"));
    CHECK(outcomes[2].state == PipelineState::NoNameSkip);
    CHECK_FALSE(outcomes[2].error.has_value());

    CHECK(index->size() == 2);
    auto stored = index->get("CUST|1");
    REQUIRE(stored);
    CHECK(stored.value().label == "Robert Johnson");

    auto stats = ingest.stats();
    CHECK(stats.received == 3);
    CHECK(stats.indexed == 2);
    CHECK(stats.skipped == 1);
    CHECK(stats.embed_failed == 0);
}

TEST_CASE_METHOD(test_support::NgramPipelineFixture, "IngestionPipeline is idempotent per id",
                 "[pipeline][ingest][catch2]") {
    IngestionPipeline ingest(embeddings, index, fastConfig());

    REQUIRE(ingest.ingest(namedRecord("1", "Ann Lee")).state == PipelineState::Indexed);
    REQUIRE(ingest.ingest(namedRecord("1", "Ann Lee")).state == PipelineState::Indexed);
    CHECK(index->size() == 1);
    CHECK(index->getStats().total_updates == 0);

    SECTION("later items for the same id win within a batch") {
        auto outcomes = ingest.ingestBatch({namedRecord("1", "Ann Leigh"),
                                            namedRecord("2", "Tom Ray"),
                                            namedRecord("1", "Anne Lee")});
        for (const auto& o : outcomes) {
            CHECK(o.state == PipelineState::Indexed);
        }
        auto stored = index->get("CUST|1");
        REQUIRE(stored);
        CHECK(stored.value().label == "Anne Lee");
        CHECK(index->size() == 2);
    }

    SECTION("a record that loses its name is removed") {
        auto outcome = ingest.ingest(makeRecord("CUST", "1", R"({"ADDR_CITY": "Paris"})"));
        CHECK(outcome.state == PipelineState::NoNameSkip);
        CHECK_FALSE(index->contains("CUST|1"));
    }
}

TEST_CASE("IngestionPipeline isolates embedding failures", "[pipeline][ingest][catch2]") {
    ml::EmbeddingConfig embeddingConfig;
    embeddingConfig.embedding_dim = 4;
    embeddingConfig.threads = 1;
    auto provider = std::make_unique<test_support::ScriptedEmbeddingProvider>(4);
    provider->failing = {"Broken Name"};
    auto embeddings = std::make_shared<ml::EmbeddingService>(std::move(provider), embeddingConfig);
    REQUIRE(embeddings->start());

    vector::IndexConfig indexConfig;
    indexConfig.type = vector::IndexType::FLAT;
    indexConfig.dimension = 4;
    auto index = std::make_shared<vector::FlatIndex>(indexConfig);
    REQUIRE(index->initialize());

    IngestionPipeline ingest(embeddings, index, fastConfig());
    auto outcomes = ingest.ingestBatch({namedRecord("1", "Good One"),
                                        namedRecord("2", "Broken Name"),
                                        namedRecord("3", "Good Two")});

    REQUIRE(outcomes.size() == 3);
    CHECK(outcomes[0].state == PipelineState::Indexed);
    CHECK(outcomes[1].state == PipelineState::EmbedFailed);
    REQUIRE(outcomes[1].error.has_value());
    CHECK(outcomes[1].error->code == ErrorCode::EmbeddingFailure);
    CHECK(outcomes[2].state == PipelineState::Indexed);

    CHECK(index->size() == 2);
    CHECK_FALSE(index->contains("CUST|2"));
    CHECK(ingest.stats().embed_failed == 1);
}

TEST_CASE("IngestionPipeline reports an unavailable index", "[pipeline][ingest][catch2]") {
    ml::EmbeddingConfig embeddingConfig;
    embeddingConfig.embedding_dim = 4;
    auto embeddings = std::make_shared<ml::EmbeddingService>(
        std::make_unique<test_support::ScriptedEmbeddingProvider>(4), embeddingConfig);
    REQUIRE(embeddings->start());

    vector::IndexConfig indexConfig;
    indexConfig.type = vector::IndexType::FLAT;
    indexConfig.dimension = 4;
    auto index = std::make_shared<vector::FlatIndex>(indexConfig); // never initialized

    IngestionPipeline ingest(embeddings, index, fastConfig());
    auto outcome = ingest.ingest(namedRecord("1", "Lost Record"));
    CHECK(outcome.state == PipelineState::IndexFailed);
    REQUIRE(outcome.error.has_value());
    CHECK(outcome.error->code == ErrorCode::IndexUnavailable);
    CHECK(ingest.stats().index_failed == 1);
}

TEST_CASE_METHOD(test_support::NgramPipelineFixture, "IngestionPipeline writes the entry store",
                 "[pipeline][ingest][storage][catch2]") {
    auto dir = test_support::TempDirScope::unique_under("namesake-ingest");
    auto store = std::make_shared<storage::JsonlEntryStore>(dir.path() / "entries.jsonl");
    {
        IngestionPipeline ingest(embeddings, index, fastConfig(), extraction::NameExtractor{},
                                 store);
        ingest.ingestBatch({namedRecord("1", "Ann Lee"), namedRecord("2", "Tom Ray")});
        ingest.ingest(makeRecord("CUST", "2", R"({"PHONE_NUMBER": "1"})"));
    }

    vector::IndexConfig config;
    config.type = vector::IndexType::FLAT;
    config.dimension = embeddings->dimension();
    vector::FlatIndex rebuilt(config);
    REQUIRE(rebuilt.initialize());
    auto applied = storage::rebuildIndex(*store, rebuilt);
    REQUIRE(applied);

    CHECK(rebuilt.size() == 1);
    CHECK(rebuilt.contains("CUST|1"));
    CHECK_FALSE(rebuilt.contains("CUST|2"));
}

TEST_CASE_METHOD(test_support::NgramPipelineFixture,
                 "IngestionPipeline reports entry store failures per item",
                 "[pipeline][ingest][storage][catch2]") {
    auto store = std::make_shared<FailingStore>();
    IngestionPipeline ingest(embeddings, index, fastConfig(), extraction::NameExtractor{},
                             store);

    SECTION("failed append") {
        store->failAppends = true;
        auto outcomes = ingest.ingestBatch({namedRecord("1", "Ann Lee"),
                                            makeRecord("CUST", "2", R"({"PHONE": "1"})")});
        REQUIRE(outcomes.size() == 2);
        CHECK(outcomes[0].state == PipelineState::StoreFailed);
        REQUIRE(outcomes[0].error.has_value());
        CHECK(outcomes[0].error->code == ErrorCode::WriteError);
        CHECK(outcomes[0].key.str() == "CUST|1");
        CHECK(outcomes[1].state == PipelineState::NoNameSkip);

        // The index took the entry; only durability was lost
        CHECK(index->contains("CUST|1"));
        CHECK(ingest.stats().store_failed == 1);
        CHECK(ingest.stats().indexed == 0);
        CHECK(isTerminal(PipelineState::StoreFailed));
    }

    SECTION("failed removal record") {
        REQUIRE(ingest.ingest(namedRecord("1", "Ann Lee")).state == PipelineState::Indexed);
        store->failRemovals = true;

        auto outcome = ingest.ingest(makeRecord("CUST", "1", R"({"ADDR_CITY": "Paris"})"));
        CHECK(outcome.state == PipelineState::StoreFailed);
        REQUIRE(outcome.error.has_value());
        CHECK(outcome.error->code == ErrorCode::WriteError);
        CHECK_FALSE(index->contains("CUST|1"));
        CHECK(ingest.stats().store_failed == 1);
    }
}

TEST_CASE("IngestionPipeline reports a stale entry it cannot drop",
          "[pipeline][ingest][catch2]") {
    ml::EmbeddingConfig embeddingConfig;
    embeddingConfig.embedding_dim = 4;
    auto embeddings = std::make_shared<ml::EmbeddingService>(
        std::make_unique<test_support::ScriptedEmbeddingProvider>(4), embeddingConfig);
    REQUIRE(embeddings->start());

    vector::IndexConfig indexConfig;
    indexConfig.type = vector::IndexType::FLAT;
    indexConfig.dimension = 4;
    auto index = std::make_shared<StickyIndex>(indexConfig);
    REQUIRE(index->initialize());

    IngestionPipeline ingest(embeddings, index, fastConfig());
    REQUIRE(ingest.ingest(namedRecord("1", "Ann Lee")).state == PipelineState::Indexed);

    auto outcome = ingest.ingest(makeRecord("CUST", "1", R"({"ADDR_CITY": "Paris"})"));
    CHECK(outcome.state == PipelineState::IndexFailed);
    REQUIRE(outcome.error.has_value());
    CHECK(outcome.error->code == ErrorCode::InternalError);
    CHECK(index->contains("CUST|1"));
    CHECK(ingest.stats().index_failed == 1);
    CHECK(ingest.stats().skipped == 0);
}

TEST_CASE_METHOD(test_support::NgramPipelineFixture,
                 "IngestionPipeline keeps keys with separators apart",
                 "[pipeline][ingest][catch2]") {
    IngestionPipeline ingest(embeddings, index, fastConfig());
    auto outcomes =
        ingest.ingestBatch({makeRecord("A|B", "C", R"({"NAME_FULL": "Ann Lee"})"),
                            makeRecord("A", "B|C", R"({"NAME_FULL": "Tom Ray"})")});
    REQUIRE(outcomes.size() == 2);
    CHECK(outcomes[0].state == PipelineState::Indexed);
    CHECK(outcomes[1].state == PipelineState::Indexed);
    CHECK(index->size() == 2);

    auto first = index->get(record::RecordKey{"A|B", "C"}.str());
    REQUIRE(first);
    CHECK(first.value().label == "Ann Lee");
    auto second = index->get(record::RecordKey{"A", "B|C"}.str());
    REQUIRE(second);
    CHECK(second.value().label == "Tom Ray");
}

TEST_CASE_METHOD(test_support::NgramPipelineFixture,
                 "IngestionPipeline indexes 10000 identifiers from 8 threads",
                 "[pipeline][ingest][concurrency][catch2]") {
    constexpr size_t kThreads = 8;
    constexpr size_t kRecords = 10000;
    IngestionPipeline ingest(embeddings, index, fastConfig());

    std::atomic<size_t> indexed{0};
    std::vector<std::thread> workers;
    for (size_t t = 0; t < kThreads; ++t) {
        workers.emplace_back([&, t]() {
            for (size_t i = t; i < kRecords; i += kThreads) {
                auto outcome = ingest.ingest(
                    namedRecord(std::to_string(i), "Person " + std::to_string(i) + " Smith"));
                if (outcome.state == PipelineState::Indexed) {
                    indexed.fetch_add(1);
                }
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    CHECK(indexed.load() == kRecords);
    CHECK(index->size() == kRecords);

    std::multiset<std::string> ids;
    index->forEachEntry([&](const vector::IndexEntry& entry) { ids.insert(entry.id); });
    REQUIRE(ids.size() == kRecords);
    std::set<std::string> unique(ids.begin(), ids.end());
    CHECK(unique.size() == kRecords);
    for (size_t i = 0; i < kRecords; ++i) {
        if (unique.count("CUST|" + std::to_string(i)) == 0) {
            FAIL("missing CUST|" << i);
        }
    }

    auto stats = ingest.stats();
    CHECK(stats.received == kRecords);
    CHECK(stats.indexed == kRecords);
}
