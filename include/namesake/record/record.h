#pragma once

#include <namesake/record/value.h>

#include <functional>
#include <string>

namespace namesake::record {

/**
 * Caller-assigned composite identifier of a record (data source code + record id).
 */
struct RecordKey {
    std::string dataSource;
    std::string recordId;

    // Stable identifier used by the vector index and candidate sets: "DATA_SOURCE|RECORD_ID".
    // A '|' or '\' inside either part is escaped with '\', so distinct keys never collide.
    std::string str() const { return escapePart(dataSource) + "|" + escapePart(recordId); }

    bool operator==(const RecordKey&) const = default;

private:
    static std::string escapePart(const std::string& part) {
        if (part.find_first_of("|\\") == std::string::npos) {
            return part;
        }
        std::string out;
        out.reserve(part.size() + 4);
        for (char c : part) {
            if (c == '|' || c == '\\') {
                out.push_back('\\');
            }
            out.push_back(c);
        }
        return out;
    }
};

/**
 * A submitted record. The value tree is shared read-only once submitted.
 */
struct Record {
    RecordKey key;
    std::shared_ptr<const Value> root;
};

} // namespace namesake::record

template <> struct std::hash<namesake::record::RecordKey> {
    size_t operator()(const namesake::record::RecordKey& k) const noexcept {
        size_t h = std::hash<std::string>{}(k.dataSource);
        return h ^ (std::hash<std::string>{}(k.recordId) + 0x9e3779b97f4a7c15ULL + (h << 6) +
                    (h >> 2));
    }
};
