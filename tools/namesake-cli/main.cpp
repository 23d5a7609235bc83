#include <namesake/config/config.h>
#include <namesake/ml/embedding_service.h>
#include <namesake/pipeline/ingestion_pipeline.h>
#include <namesake/pipeline/query_pipeline.h>
#include <namesake/record/json_record.h>
#include <namesake/storage/entry_store.h>
#include <namesake/vector/vector_index.h>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace namesake;

namespace {

constexpr const char* kExactCandidatesField = "EXACT_CANDIDATES";

struct GlobalOptions {
    std::string configPath;
    std::string logLevel;
    size_t threads = 0;
};

void configureLogging(const config::LoggingConfig& logging) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!logging.file.empty()) {
        try {
            const size_t max_size = 10 * 1024 * 1024; // 10MB per file
            const size_t max_files = 5;
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logging.file, max_size, max_files));
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Cannot open log file " << logging.file << ": " << e.what() << "\n";
        }
    }
    auto logger = std::make_shared<spdlog::logger>("namesake", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    if (logging.level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (logging.level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (logging.level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (logging.level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

/**
 * Services shared by all subcommands
 */
struct Runtime {
    config::NamesakeConfig settings;
    std::shared_ptr<ml::EmbeddingService> embeddings;
    std::shared_ptr<vector::VectorIndex> index;
    std::shared_ptr<storage::JsonlEntryStore> store;
};

Result<Runtime> openRuntime(const GlobalOptions& options, bool withIndex) {
    auto loaded = config::loadConfig(options.configPath);
    if (!loaded) {
        return loaded.error();
    }
    Runtime rt;
    rt.settings = std::move(loaded).value();
    if (!options.logLevel.empty()) {
        rt.settings.logging.level = options.logLevel;
    }
    if (options.threads > 0) {
        rt.settings.pipeline.worker_threads = options.threads;
    }
    configureLogging(rt.settings.logging);

    auto embeddings = ml::EmbeddingService::create(rt.settings.embedding);
    if (!embeddings) {
        return embeddings.error();
    }
    rt.embeddings = std::move(embeddings).value();

    if (withIndex) {
        rt.settings.index.dimension = rt.embeddings->dimension();
        rt.index = vector::createVectorIndex(rt.settings.index);
        if (auto r = rt.index->initialize(); !r) {
            return r.error();
        }
        rt.store = std::make_shared<storage::JsonlEntryStore>(rt.settings.storage.entries_file);
    }
    return rt;
}

// Calls fn for every non-blank line of a JSON-lines file; stops on the first error fn returns
template <typename Fn> Result<size_t> forEachLine(const std::string& path, Fn&& fn) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::FileNotFound, "Cannot open " + path};
    }
    size_t lineNo = 0;
    std::string line;
    while (std::getline(in, line)) {
        ++lineNo;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        if (auto r = fn(line, lineNo); !r) {
            return r.error();
        }
    }
    return lineNo;
}

int reportError(const Error& error) {
    spdlog::error("{}", error.message);
    return 1;
}

int runLoad(const GlobalOptions& options, const std::string& file, size_t batchSize) {
    auto rt = openRuntime(options, true);
    if (!rt) {
        return reportError(rt.error());
    }
    auto& runtime = rt.value();
    pipeline::IngestionPipeline ingest(runtime.embeddings, runtime.index, runtime.settings.pipeline,
                                       extraction::NameExtractor{}, runtime.store);

    const auto started = std::chrono::steady_clock::now();
    size_t malformed = 0;
    std::vector<record::Record> batch;
    auto flush = [&]() {
        if (!batch.empty()) {
            ingest.ingestBatch(batch);
            batch.clear();
        }
    };

    auto lines = forEachLine(file, [&](const std::string& line, size_t lineNo) -> Result<void> {
        auto parsed = record::parseRecordLine(line);
        if (!parsed) {
            ++malformed;
            spdlog::warn("[Load] Line {}: {}", lineNo, parsed.error().message);
            return Result<void>();
        }
        batch.push_back(std::move(parsed).value());
        if (batch.size() >= batchSize) {
            flush();
        }
        return Result<void>();
    });
    flush();
    if (!lines) {
        return reportError(lines.error());
    }

    const auto stats = ingest.stats();
    const double secs =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    spdlog::info("[Load] Done: {} records in {:.1f}s, {} indexed, {} skipped (no name), "
                 "{} embed failures, {} index failures, {} store failures, {} malformed lines",
                 stats.received, secs, stats.indexed, stats.skipped, stats.embed_failed,
                 stats.index_failed, stats.store_failed, malformed);
    return stats.embed_failed + stats.index_failed + stats.store_failed > 0 ? 2 : 0;
}

nlohmann::ordered_json outcomeToJson(const pipeline::SearchOutcome& outcome) {
    nlohmann::ordered_json out;
    out[record::kDataSourceField] = outcome.key.dataSource;
    out[record::kRecordIdField] = outcome.key.recordId;
    out["STATE"] = std::string(pipeline::stateToString(outcome.state));
    if (outcome.canonicalName) {
        out["NAME"] = *outcome.canonicalName;
    }
    if (outcome.truncated) {
        out["TRUNCATED"] = true;
    }
    if (outcome.error) {
        out["ERROR"] = outcome.error->message;
    }
    auto candidates = nlohmann::ordered_json::array();
    for (const auto& [id, candidate] : outcome.candidates) {
        nlohmann::ordered_json c;
        c["id"] = id;
        c["provenance"] = std::string(search::provenanceToString(candidate.provenance));
        if (candidate.similarity) {
            c["similarity"] = *candidate.similarity;
        }
        candidates.push_back(std::move(c));
    }
    out["CANDIDATES"] = std::move(candidates);
    return out;
}

struct Timing {
    double seconds;
    std::string recordId;
};

void printLatencySummary(std::vector<Timing> timings) {
    if (timings.empty()) {
        return;
    }
    std::sort(timings.begin(), timings.end(),
              [](const Timing& a, const Timing& b) { return a.seconds > b.seconds; });
    double total = 0.0;
    size_t underOneSecond = 0;
    for (const auto& t : timings) {
        total += t.seconds;
        if (t.seconds <= 1.0) {
            ++underOneSecond;
        }
    }
    const size_t count = timings.size();
    auto at = [&](double fraction) -> const Timing& {
        return timings[std::min(count - 1, static_cast<size_t>(count * fraction))];
    };

    std::fprintf(stderr, "Searches: %zu avg[%.3fs] min[%.3fs] max[%.3fs]\n", count,
                 total / static_cast<double>(count), timings.back().seconds,
                 timings.front().seconds);
    std::fprintf(stderr, "Percent under 1s: %.1f%%\n",
                 100.0 * static_cast<double>(underOneSecond) / static_cast<double>(count));
    std::fprintf(stderr, "longest: %.3fs record[%s]\n", timings.front().seconds,
                 timings.front().recordId.c_str());
    std::fprintf(stderr, "p99: %.3fs record[%s]\n", at(0.01).seconds, at(0.01).recordId.c_str());
    std::fprintf(stderr, "p95: %.3fs record[%s]\n", at(0.05).seconds, at(0.05).recordId.c_str());
    std::fprintf(stderr, "p90: %.3fs record[%s]\n", at(0.10).seconds, at(0.10).recordId.c_str());
}

int runSearch(const GlobalOptions& options, const std::string& file,
              std::optional<float> threshold, std::optional<size_t> limit,
              std::optional<size_t> timeoutMs) {
    auto rt = openRuntime(options, true);
    if (!rt) {
        return reportError(rt.error());
    }
    auto& runtime = rt.value();
    if (timeoutMs) {
        runtime.settings.query.timeout_ms = *timeoutMs;
    }
    if (auto rebuilt = storage::rebuildIndex(*runtime.store, *runtime.index); !rebuilt) {
        return reportError(rebuilt.error());
    }

    pipeline::QueryPipeline query(runtime.embeddings, runtime.index, runtime.settings.query,
                                  runtime.settings.pipeline);
    std::vector<Timing> timings;

    auto lines = forEachLine(file, [&](const std::string& line, size_t lineNo) -> Result<void> {
        nlohmann::ordered_json doc;
        try {
            doc = nlohmann::ordered_json::parse(line);
        } catch (const nlohmann::json::parse_error& e) {
            spdlog::warn("[Search] Line {}: {}", lineNo, e.what());
            return Result<void>();
        }
        auto rec = record::recordFromJson(doc);
        if (!rec) {
            spdlog::warn("[Search] Line {}: {}", lineNo, rec.error().message);
            return Result<void>();
        }

        pipeline::SearchRequest request;
        request.record = std::move(rec).value();
        std::vector<std::string> exact;
        if (auto it = doc.find(kExactCandidatesField); it != doc.end() && it->is_array()) {
            for (const auto& id : *it) {
                if (id.is_string()) {
                    exact.push_back(id.get<std::string>());
                }
            }
        }
        request.exact = search::CandidateSet::fromExact(exact);
        request.threshold = threshold;
        request.limit = limit;

        const auto started = std::chrono::steady_clock::now();
        auto outcome = query.search(request);
        timings.push_back(Timing{
            std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count(),
            outcome.key.recordId});

        std::cout << outcomeToJson(outcome).dump() << '\n';
        return Result<void>();
    });
    if (!lines) {
        return reportError(lines.error());
    }
    std::cout.flush();
    printLatencySummary(std::move(timings));
    return 0;
}

int runAnnotate(const GlobalOptions& options, const std::string& file) {
    auto rt = openRuntime(options, false);
    if (!rt) {
        return reportError(rt.error());
    }
    auto& runtime = rt.value();
    extraction::NameExtractor extractor;

    auto lines = forEachLine(file, [&](const std::string& line, size_t lineNo) -> Result<void> {
        nlohmann::ordered_json doc;
        try {
            doc = nlohmann::ordered_json::parse(line);
        } catch (const nlohmann::json::parse_error& e) {
            spdlog::warn("[Annotate] Line {}: {}", lineNo, e.what());
            return Result<void>();
        }
        auto root = record::fromJson(doc);
        if (auto name = extractor.extract(*root)) {
            auto embedding = runtime.embeddings->embed(*name);
            if (embedding) {
                record::annotateSearchRecord(doc, *name, embedding.value());
            } else {
                spdlog::warn("[Annotate] Line {}: {}", lineNo, embedding.error().message);
            }
        }
        std::cout << doc.dump() << '\n';
        return Result<void>();
    });
    if (!lines) {
        return reportError(lines.error());
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"namesake - semantic name candidate generation", "namesake-cli"};
    app.require_subcommand(1);

    GlobalOptions options;
    app.add_option("--config", options.configPath, "Configuration file path");
    app.add_option("--log-level", options.logLevel, "Log level (trace/debug/info/warn/error)");
    app.add_option("--threads", options.threads, "Pipeline worker threads (0 = auto)");

    int exitCode = 0;

    auto* load = app.add_subcommand("load", "Index records from a JSON-lines file");
    std::string loadFile;
    size_t batchSize = 1000;
    load->add_option("file", loadFile, "Records, one JSON object per line")
        ->required()
        ->check(CLI::ExistingFile);
    load->add_option("--batch", batchSize, "Records per ingestion batch")->default_val(1000);
    load->callback([&]() { exitCode = runLoad(options, loadFile, std::max<size_t>(1, batchSize)); });

    auto* search = app.add_subcommand("search", "Run each line of a JSON-lines file as a search");
    std::string searchFile;
    std::optional<float> threshold;
    std::optional<size_t> limit;
    std::optional<size_t> timeoutMs;
    search->add_option("file", searchFile, "Search records, one JSON object per line")
        ->required()
        ->check(CLI::ExistingFile);
    search->add_option("--threshold", threshold, "Minimum cosine similarity")
        ->check(CLI::Range(-1.0f, 1.0f));
    search->add_option("--limit", limit, "Maximum semantic candidates per search");
    search->add_option("--timeout-ms", timeoutMs, "Per-search index deadline");
    search->callback(
        [&]() { exitCode = runSearch(options, searchFile, threshold, limit, timeoutMs); });

    auto* annotate =
        app.add_subcommand("annotate", "Add NAME_SEM_KEY_LABEL/NAME_SEM_KEY_EMBEDDING to records");
    std::string annotateFile;
    annotate->add_option("file", annotateFile, "Records, one JSON object per line")
        ->required()
        ->check(CLI::ExistingFile);
    annotate->callback([&]() { exitCode = runAnnotate(options, annotateFile); });

    CLI11_PARSE(app, argc, argv);
    return exitCode;
}
