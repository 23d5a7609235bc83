#include <namesake/record/json_record.h>

#include <spdlog/spdlog.h>

namespace namesake::record {

ValuePtr fromJson(const nlohmann::ordered_json& json) {
    switch (json.type()) {
        case nlohmann::ordered_json::value_t::null:
        case nlohmann::ordered_json::value_t::discarded:
            return Value::null();
        case nlohmann::ordered_json::value_t::boolean:
            return Value::boolean(json.get<bool>());
        case nlohmann::ordered_json::value_t::number_integer:
        case nlohmann::ordered_json::value_t::number_unsigned:
        case nlohmann::ordered_json::value_t::number_float:
            return Value::number(json.get<double>());
        case nlohmann::ordered_json::value_t::string:
            return Value::string(json.get<std::string>());
        case nlohmann::ordered_json::value_t::array: {
            Sequence seq;
            seq.reserve(json.size());
            for (const auto& item : json) {
                seq.push_back(fromJson(item));
            }
            return Value::sequence(std::move(seq));
        }
        case nlohmann::ordered_json::value_t::object: {
            Mapping map;
            map.reserve(json.size());
            for (auto it = json.begin(); it != json.end(); ++it) {
                map.emplace_back(it.key(), fromJson(it.value()));
            }
            return Value::mapping(std::move(map));
        }
        case nlohmann::ordered_json::value_t::binary:
            break;
    }
    return Value::null();
}

Result<Record> recordFromJson(const nlohmann::ordered_json& json) {
    if (!json.is_object()) {
        return Error{ErrorCode::InvalidData, "Record must be a JSON object"};
    }

    auto ds = json.find(kDataSourceField);
    if (ds == json.end() || !ds->is_string() || ds->get<std::string>().empty()) {
        return Error{ErrorCode::InvalidData, "Record is missing DATA_SOURCE"};
    }

    auto rid = json.find(kRecordIdField);
    std::string recordId;
    if (rid != json.end()) {
        if (rid->is_string()) {
            recordId = rid->get<std::string>();
        } else if (rid->is_number_integer()) {
            recordId = std::to_string(rid->get<long long>());
        } else if (rid->is_number_unsigned()) {
            recordId = std::to_string(rid->get<unsigned long long>());
        }
    }
    if (recordId.empty()) {
        return Error{ErrorCode::InvalidData, "Record is missing RECORD_ID"};
    }

    Record record;
    record.key = RecordKey{ds->get<std::string>(), std::move(recordId)};
    record.root = fromJson(json);
    return record;
}

Result<Record> parseRecordLine(std::string_view line) {
    try {
        auto json = nlohmann::ordered_json::parse(line);
        return recordFromJson(json);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::debug("[Record] Malformed JSON line: {}", e.what());
        return Error{ErrorCode::InvalidData, std::string("Malformed JSON: ") + e.what()};
    }
}

void annotateSearchRecord(nlohmann::ordered_json& record, const std::string& label,
                          const Embedding& embedding) {
    record[kSemanticLabelField] = label;
    record[kSemanticEmbeddingField] = nlohmann::json(embedding).dump();
}

} // namespace namesake::record
