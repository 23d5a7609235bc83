#pragma once

#include <namesake/core/types.h>
#include <namesake/record/record.h>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace namesake::record {

// Field names used on the JSON boundary
inline constexpr const char* kDataSourceField = "DATA_SOURCE";
inline constexpr const char* kRecordIdField = "RECORD_ID";
inline constexpr const char* kSemanticLabelField = "NAME_SEM_KEY_LABEL";
inline constexpr const char* kSemanticEmbeddingField = "NAME_SEM_KEY_EMBEDDING";

/**
 * Convert an order-preserving JSON document into a value tree.
 * Object field order is kept exactly as it appears in the document.
 */
ValuePtr fromJson(const nlohmann::ordered_json& json);

/**
 * Build a record from a JSON object carrying DATA_SOURCE and RECORD_ID at the top level.
 * RECORD_ID may be a string or an integer. Returns InvalidData if either is missing.
 */
Result<Record> recordFromJson(const nlohmann::ordered_json& json);

/**
 * Parse one line of a JSON-lines file into a record.
 */
Result<Record> parseRecordLine(std::string_view line);

/**
 * Attach the semantic key to a search record so the resolution engine can use it for
 * candidate generation: NAME_SEM_KEY_LABEL holds the canonical name and
 * NAME_SEM_KEY_EMBEDDING the embedding serialized as a JSON array string.
 */
void annotateSearchRecord(nlohmann::ordered_json& record, const std::string& label,
                          const Embedding& embedding);

} // namespace namesake::record
