// Catch2 tests for configuration parsing, validation and environment overrides

#include <catch2/catch_test_macros.hpp>

#include <namesake/config/config.h>
#include <namesake/config/config_helpers.h>

#include <temp_dir_scope.hpp>

#include <cstdlib>
#include <fstream>
#include <string>

using namespace namesake;
using namespace namesake::config;

namespace {

// Sets an environment variable for the lifetime of the guard
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            old_ = old;
            hadOld_ = true;
        }
        ::setenv(name, value, 1);
    }
    ~EnvGuard() {
        if (hadOld_) {
            ::setenv(name_, old_.c_str(), 1);
        } else {
            ::unsetenv(name_);
        }
    }

private:
    const char* name_;
    std::string old_;
    bool hadOld_ = false;
};

} // namespace

TEST_CASE("parseTomlString reads sections and values", "[config][toml][catch2]") {
    auto table = parseTomlString(R"(
# top comment
[embedding]
provider = "NameNgram"   # trailing comment
dimension = 256

[query]
threshold = 0.8
name = 'quoted # not a comment'
)");

    CHECK(table["embedding"]["provider"] == "NameNgram");
    CHECK(table["embedding"]["dimension"] == "256");
    CHECK(table["query"]["threshold"] == "0.8");
    CHECK(table["query"]["name"] == "quoted # not a comment");
}

TEST_CASE("configFromTable maps values onto defaults", "[config][catch2]") {
    SECTION("defaults") {
        auto config = configFromTable({});
        REQUIRE(config);
        CHECK(config.value().embedding.provider == "NameNgram");
        CHECK(config.value().embedding.embedding_dim == DEFAULT_EMBEDDING_DIM);
        CHECK(config.value().index.type == vector::IndexType::HNSW);
        CHECK(config.value().query.threshold == 0.75f);
        CHECK(config.value().query.limit == 10);
    }

    SECTION("explicit values") {
        auto table = parseTomlString(R"(
[embedding]
dimension = 128
normalize = false
word_weight = 3.5
[index]
type = flat
m = 24
[query]
threshold = 0.6
limit = 25
timeout_ms = 200
[pipeline]
worker_threads = 3
[storage]
data_dir = /tmp/namesake-data
[logging]
level = debug
)");
        auto config = configFromTable(table);
        REQUIRE(config);
        const auto& c = config.value();
        CHECK(c.embedding.embedding_dim == 128);
        CHECK(c.index.dimension == 128);
        CHECK_FALSE(c.embedding.normalize_embeddings);
        CHECK(c.embedding.word_weight == 3.5f);
        CHECK(c.index.type == vector::IndexType::FLAT);
        CHECK(c.index.hnsw_m == 24);
        CHECK(c.query.threshold == 0.6f);
        CHECK(c.query.limit == 25);
        CHECK(c.query.timeout_ms == 200);
        CHECK(c.pipeline.worker_threads == 3);
        CHECK(c.storage.data_dir == std::filesystem::path("/tmp/namesake-data"));
        CHECK(c.logging.level == "debug");
    }

    SECTION("unknown keys are ignored") {
        auto config = configFromTable(parseTomlString("[embedding]\ncolour = blue\n[extra]\nx=1"));
        CHECK(config);
    }
}

TEST_CASE("configFromTable rejects bad values", "[config][catch2]") {
    auto expectInvalid = [](const std::string& text, const std::string& key) {
        auto config = configFromTable(parseTomlString(text));
        REQUIRE_FALSE(config);
        CHECK(config.error().code == ErrorCode::InvalidArgument);
        CHECK(config.error().message.find(key) != std::string::npos);
    };

    expectInvalid("[embedding]\ndimension = abc", "embedding.dimension");
    expectInvalid("[embedding]\ndimension = -4", "embedding.dimension");
    expectInvalid("[embedding]\ndimension = 0", "embedding.dimension");
    expectInvalid("[embedding]\nnormalize = maybe", "embedding.normalize");
    expectInvalid("[index]\ntype = ivf", "index.type");
    expectInvalid("[index]\nm = 1", "index.m");
    expectInvalid("[query]\nthreshold = 1.5", "query.threshold");
    expectInvalid("[query]\nthreshold = 0.5x", "query.threshold");
    expectInvalid("[query]\nlimit = 0", "query.limit");
}

TEST_CASE("applyEnvironmentOverrides", "[config][env][catch2]") {
    NamesakeConfig config;

    SECTION("values are applied") {
        EnvGuard level("NAMESAKE_LOG_LEVEL", "warn");
        EnvGuard provider("NAMESAKE_EMBEDDING_PROVIDER", "ONNX");
        EnvGuard threads("NAMESAKE_WORKER_THREADS", "6");
        EnvGuard dataDir("NAMESAKE_DATA_DIR", "/tmp/namesake-env");
        REQUIRE(applyEnvironmentOverrides(config));
        CHECK(config.logging.level == "warn");
        CHECK(config.embedding.provider == "ONNX");
        CHECK(config.pipeline.worker_threads == 6);
        CHECK(config.storage.data_dir == std::filesystem::path("/tmp/namesake-env"));
    }

    SECTION("malformed thread count") {
        EnvGuard threads("NAMESAKE_WORKER_THREADS", "many");
        auto r = applyEnvironmentOverrides(config);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("loadConfig resolves files", "[config][load][catch2]") {
    auto dir = test_support::TempDirScope::unique_under("namesake-config");

    SECTION("explicit file") {
        const auto file = dir.path() / "namesake.toml";
        {
            std::ofstream out(file);
            out << "[storage]\ndata_dir = " << (dir.path() / "data").string() << "\n"
                << "[query]\nlimit = 3\n";
        }
        auto config = loadConfig(file.string());
        REQUIRE(config);
        CHECK(config.value().query.limit == 3);
        CHECK(config.value().source == file);
        CHECK(config.value().storage.entries_file == dir.path() / "data" / "entries.jsonl");
    }

    SECTION("missing explicit file is an error") {
        auto config = loadConfig((dir.path() / "missing.toml").string());
        REQUIRE_FALSE(config);
        CHECK(config.error().code == ErrorCode::FileNotFound);
    }

    SECTION("missing default file yields defaults") {
        EnvGuard xdg("XDG_CONFIG_HOME", dir.path().c_str());
        EnvGuard data("XDG_DATA_HOME", (dir.path() / "share").c_str());
        ::unsetenv("NAMESAKE_CONFIG");
        auto config = loadConfig();
        REQUIRE(config);
        CHECK(config.value().source.empty());
        CHECK(config.value().storage.data_dir == dir.path() / "share" / "namesake");
    }
}

TEST_CASE("config helpers", "[config][helpers][catch2]") {
    std::string s = "  padded \t";
    trim(s);
    CHECK(s == "padded");
    CHECK(unquote("\"quoted\"") == "quoted");
    CHECK(unquote("'single'") == "single");
    CHECK(unquote("bare") == "bare");

    EnvGuard home("HOME", "/home/tester");
    CHECK(expand_tilde("~/x/y") == std::filesystem::path("/home/tester/x/y"));
    CHECK(expand_tilde("/abs") == std::filesystem::path("/abs"));
    CHECK(get_config_path("/etc/namesake.toml") == std::filesystem::path("/etc/namesake.toml"));
}
