#pragma once

#include <namesake/core/types.h>
#include <namesake/ml/provider.h>
#include <namesake/pipeline/pipeline_types.h>
#include <namesake/vector/vector_index.h>

#include <filesystem>
#include <map>
#include <string>

namespace namesake::config {

// section -> key -> raw value
using TomlTable = std::map<std::string, std::map<std::string, std::string>>;

struct StorageConfig {
    std::filesystem::path data_dir;     // defaults to get_data_dir()
    std::filesystem::path entries_file; // defaults to <data_dir>/entries.jsonl
};

struct LoggingConfig {
    std::string level = "info";
    std::string file; // optional rotating log file
};

/**
 * Complete runtime configuration
 */
struct NamesakeConfig {
    ml::EmbeddingConfig embedding;
    vector::IndexConfig index;
    namesake::pipeline::QueryConfig query;
    namesake::pipeline::PipelineConfig pipeline;
    StorageConfig storage;
    LoggingConfig logging;

    std::filesystem::path source; // file the values were read from, empty for defaults
};

/**
 * Parse the TOML subset used for configuration: [section] headers, key = value pairs,
 * # comments. Values are unquoted; arrays are kept as raw text.
 */
Result<TomlTable> parseTomlConfig(const std::filesystem::path& path);
TomlTable parseTomlString(const std::string& text);

/**
 * Map a parsed table onto the typed configuration, starting from defaults.
 * Unknown keys are ignored with a debug log; malformed or out-of-range values fail with
 * InvalidArgument naming section.key.
 */
Result<NamesakeConfig> configFromTable(const TomlTable& table);

/**
 * Apply NAMESAKE_LOG_LEVEL, NAMESAKE_DATA_DIR, NAMESAKE_EMBEDDING_PROVIDER and
 * NAMESAKE_WORKER_THREADS.
 */
Result<void> applyEnvironmentOverrides(NamesakeConfig& config);

Result<void> validateConfig(const NamesakeConfig& config);

/**
 * Resolve and load the configuration: explicit path, else NAMESAKE_CONFIG, else the default
 * location. A missing default file yields defaults; a missing explicit file is an error.
 * Environment overrides are applied last.
 */
Result<NamesakeConfig> loadConfig(const std::string& overridePath = "");

} // namespace namesake::config
