#pragma once

#include <namesake/record/value.h>

#include <cstddef>
#include <optional>
#include <string>

namespace namesake::extraction {

/**
 * Configuration for canonical name extraction
 */
struct NameExtractorConfig {
    // Containers nested deeper than this are treated as absent.
    size_t max_depth = 64;
};

/**
 * Derives the single canonical name of a record.
 *
 * Priority (first match wins):
 *  1. The first string field whose name ends in NAME_FULL or NAME_ORG (case-insensitive),
 *     scanned depth-first in declaration order through nested mappings and sequences.
 *  2. Otherwise NAME_FIRST, NAME_MIDDLE and NAME_LAST of the first mapping (same scan order)
 *     that has any of them, joined with single spaces.
 *
 * Non-string and blank values count as absent. Cyclic structures are visited once.
 * The extractor is stateless and safe to share between threads.
 */
class NameExtractor {
public:
    explicit NameExtractor(NameExtractorConfig config = {}) : config_(config) {}

    std::optional<std::string> extract(const record::Value& root) const;

    const NameExtractorConfig& getConfig() const { return config_; }

private:
    std::optional<std::string> findFullName(const record::Value& root) const;
    std::optional<std::string> constructFromParts(const record::Value& root) const;

    NameExtractorConfig config_;
};

namespace name_utils {
// ASCII case-insensitive suffix test on a field name
bool endsWithIgnoreCase(const std::string& field, const char* suffix);

// ASCII case-insensitive equality on a field name
bool equalsIgnoreCase(const std::string& field, const char* name);

// Trimmed copy of a string value, or nullopt when the value is not a non-blank string
std::optional<std::string> nonBlankString(const record::Value* value);
} // namespace name_utils

} // namespace namesake::extraction
