#include <namesake/config/config.h>
#include <namesake/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace namesake::config {

namespace {

Error badValue(const std::string& section, const std::string& key, const std::string& value,
               const std::string& why) {
    return Error{ErrorCode::InvalidArgument,
                 "Invalid value '" + value + "' for " + section + "." + key + ": " + why};
}

Result<size_t> parseSize(const std::string& section, const std::string& key,
                         const std::string& value) {
    try {
        size_t pos = 0;
        if (!value.empty() && value[0] == '-') {
            return badValue(section, key, value, "must not be negative");
        }
        unsigned long long v = std::stoull(value, &pos);
        if (pos != value.size()) {
            return badValue(section, key, value, "not an integer");
        }
        return static_cast<size_t>(v);
    } catch (const std::invalid_argument&) {
        return badValue(section, key, value, "not an integer");
    } catch (const std::out_of_range&) {
        return badValue(section, key, value, "out of range");
    }
}

Result<float> parseFloat(const std::string& section, const std::string& key,
                         const std::string& value) {
    try {
        size_t pos = 0;
        float v = std::stof(value, &pos);
        if (pos != value.size() || !std::isfinite(v)) {
            return badValue(section, key, value, "not a number");
        }
        return v;
    } catch (const std::invalid_argument&) {
        return badValue(section, key, value, "not a number");
    } catch (const std::out_of_range&) {
        return badValue(section, key, value, "out of range");
    }
}

Result<bool> parseBool(const std::string& section, const std::string& key,
                       const std::string& value) {
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        return false;
    }
    return badValue(section, key, value, "expected true or false");
}

// Strips a trailing comment that is outside quotes
std::string stripComment(const std::string& value) {
    char quote = 0;
    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return value.substr(0, i);
        }
    }
    return value;
}

TomlTable parseTomlStream(std::istream& in) {
    TomlTable table;
    std::string line;
    std::string currentSection;

    while (std::getline(in, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Section headers
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string key = line.substr(0, eq);
        trim(key);
        std::string value = unquote(stripComment(line.substr(eq + 1)));
        table[currentSection][key] = value;
    }
    return table;
}

} // namespace

Result<TomlTable> parseTomlConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "Cannot open config file: " + path.string()};
    }
    return parseTomlStream(file);
}

TomlTable parseTomlString(const std::string& text) {
    std::istringstream in(text);
    return parseTomlStream(in);
}

Result<NamesakeConfig> configFromTable(const TomlTable& table) {
    NamesakeConfig config;

// Assigns a parsed value or returns its error from the enclosing function
#define NAMESAKE_ASSIGN(target, parser)                                                            \
    do {                                                                                           \
        auto parsed = parser(section, key, value);                                                 \
        if (!parsed) {                                                                             \
            return parsed.error();                                                                 \
        }                                                                                          \
        target = parsed.value();                                                                   \
    } while (0)

    for (const auto& [section, values] : table) {
        for (const auto& [key, value] : values) {
            if (section == "embedding") {
                if (key == "provider") {
                    config.embedding.provider = value;
                } else if (key == "dimension") {
                    NAMESAKE_ASSIGN(config.embedding.embedding_dim, parseSize);
                } else if (key == "batch_size") {
                    NAMESAKE_ASSIGN(config.embedding.batch_size, parseSize);
                } else if (key == "threads") {
                    NAMESAKE_ASSIGN(config.embedding.threads, parseSize);
                } else if (key == "max_retries") {
                    NAMESAKE_ASSIGN(config.embedding.max_retries, parseSize);
                } else if (key == "normalize") {
                    NAMESAKE_ASSIGN(config.embedding.normalize_embeddings, parseBool);
                } else if (key == "word_weight") {
                    NAMESAKE_ASSIGN(config.embedding.word_weight, parseFloat);
                } else if (key == "trigram_weight") {
                    NAMESAKE_ASSIGN(config.embedding.trigram_weight, parseFloat);
                } else if (key == "nickname_file") {
                    config.embedding.nickname_file = expand_tilde(value).string();
                } else if (key == "model_path") {
                    config.embedding.model_path = expand_tilde(value).string();
                } else if (key == "vocab_path") {
                    config.embedding.vocab_path = expand_tilde(value).string();
                } else if (key == "max_sequence_length") {
                    NAMESAKE_ASSIGN(config.embedding.max_sequence_length, parseSize);
                } else {
                    spdlog::debug("Ignoring unknown config key {}.{}", section, key);
                }
            } else if (section == "index") {
                if (key == "type") {
                    if (value == "hnsw" || value == "HNSW") {
                        config.index.type = vector::IndexType::HNSW;
                    } else if (value == "flat" || value == "FLAT") {
                        config.index.type = vector::IndexType::FLAT;
                    } else {
                        return badValue(section, key, value, "expected hnsw or flat");
                    }
                } else if (key == "m") {
                    NAMESAKE_ASSIGN(config.index.hnsw_m, parseSize);
                } else if (key == "ef_construction") {
                    NAMESAKE_ASSIGN(config.index.hnsw_ef_construction, parseSize);
                } else if (key == "ef_search") {
                    NAMESAKE_ASSIGN(config.index.hnsw_ef_search, parseSize);
                } else if (key == "max_elements") {
                    NAMESAKE_ASSIGN(config.index.max_elements, parseSize);
                } else if (key == "seed") {
                    NAMESAKE_ASSIGN(config.index.hnsw_seed, parseSize);
                } else {
                    spdlog::debug("Ignoring unknown config key {}.{}", section, key);
                }
            } else if (section == "query") {
                if (key == "threshold") {
                    NAMESAKE_ASSIGN(config.query.threshold, parseFloat);
                } else if (key == "limit") {
                    NAMESAKE_ASSIGN(config.query.limit, parseSize);
                } else if (key == "timeout_ms") {
                    NAMESAKE_ASSIGN(config.query.timeout_ms, parseSize);
                } else {
                    spdlog::debug("Ignoring unknown config key {}.{}", section, key);
                }
            } else if (section == "pipeline") {
                if (key == "worker_threads") {
                    NAMESAKE_ASSIGN(config.pipeline.worker_threads, parseSize);
                } else if (key == "index_retries") {
                    NAMESAKE_ASSIGN(config.pipeline.index_retries, parseSize);
                } else if (key == "retry_backoff_ms") {
                    NAMESAKE_ASSIGN(config.pipeline.retry_backoff_ms, parseSize);
                } else {
                    spdlog::debug("Ignoring unknown config key {}.{}", section, key);
                }
            } else if (section == "storage") {
                if (key == "data_dir") {
                    config.storage.data_dir = expand_tilde(value);
                } else if (key == "entries_file") {
                    config.storage.entries_file = expand_tilde(value);
                } else {
                    spdlog::debug("Ignoring unknown config key {}.{}", section, key);
                }
            } else if (section == "logging") {
                if (key == "level") {
                    config.logging.level = value;
                } else if (key == "file") {
                    config.logging.file = expand_tilde(value).string();
                } else {
                    spdlog::debug("Ignoring unknown config key {}.{}", section, key);
                }
            } else {
                spdlog::debug("Ignoring unknown config section [{}]", section);
            }
        }
    }
#undef NAMESAKE_ASSIGN

    config.index.dimension = config.embedding.embedding_dim;
    if (auto r = validateConfig(config); !r) {
        return r.error();
    }
    return config;
}

Result<void> applyEnvironmentOverrides(NamesakeConfig& config) {
    if (const char* env = std::getenv("NAMESAKE_LOG_LEVEL"); env && *env) {
        config.logging.level = env;
    }
    if (const char* env = std::getenv("NAMESAKE_DATA_DIR"); env && *env) {
        config.storage.data_dir = expand_tilde(env);
    }
    if (const char* env = std::getenv("NAMESAKE_EMBEDDING_PROVIDER"); env && *env) {
        config.embedding.provider = env;
    }
    if (const char* env = std::getenv("NAMESAKE_WORKER_THREADS"); env && *env) {
        auto threads = parseSize("env", "NAMESAKE_WORKER_THREADS", env);
        if (!threads) {
            return threads.error();
        }
        config.pipeline.worker_threads = threads.value();
    }
    return Result<void>();
}

Result<void> validateConfig(const NamesakeConfig& config) {
    auto invalid = [](const std::string& key, const std::string& why) {
        return Error{ErrorCode::InvalidArgument, "Invalid " + key + ": " + why};
    };
    if (config.embedding.embedding_dim == 0) {
        return invalid("embedding.dimension", "must be positive");
    }
    if (config.embedding.batch_size == 0) {
        return invalid("embedding.batch_size", "must be positive");
    }
    if (config.index.hnsw_m < 2) {
        return invalid("index.m", "must be at least 2");
    }
    if (config.index.hnsw_ef_construction == 0) {
        return invalid("index.ef_construction", "must be positive");
    }
    if (config.index.hnsw_ef_search == 0) {
        return invalid("index.ef_search", "must be positive");
    }
    if (config.index.max_elements == 0 || config.index.max_elements > UINT32_MAX) {
        return invalid("index.max_elements", "must be between 1 and 4294967295");
    }
    if (config.query.threshold < -1.0f || config.query.threshold > 1.0f) {
        return invalid("query.threshold", "must be within [-1, 1]");
    }
    if (config.query.limit == 0) {
        return invalid("query.limit", "must be positive");
    }
    return Result<void>();
}

Result<NamesakeConfig> loadConfig(const std::string& overridePath) {
    std::string requested = overridePath;
    if (requested.empty()) {
        if (const char* env = std::getenv("NAMESAKE_CONFIG"); env && *env) {
            requested = env;
        }
    }
    const auto path = get_config_path(requested);

    NamesakeConfig config;
    if (std::filesystem::exists(path)) {
        auto table = parseTomlConfig(path);
        if (!table) {
            return table.error();
        }
        auto parsed = configFromTable(table.value());
        if (!parsed) {
            return parsed.error();
        }
        config = std::move(parsed).value();
        config.source = path;
        spdlog::debug("Loaded configuration from {}", path.string());
    } else if (!requested.empty()) {
        return Error{ErrorCode::FileNotFound, "Config file not found: " + path.string()};
    } else {
        spdlog::debug("No config file at {}, using defaults", path.string());
    }

    if (auto r = applyEnvironmentOverrides(config); !r) {
        return r.error();
    }
    if (config.storage.data_dir.empty()) {
        config.storage.data_dir = get_data_dir();
    }
    if (config.storage.entries_file.empty()) {
        config.storage.entries_file = config.storage.data_dir / "entries.jsonl";
    }
    return config;
}

} // namespace namesake::config
