#include <namesake/ml/nickname_table.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

namespace namesake::ml {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const std::vector<std::pair<std::string, std::vector<std::string>>>& defaultNicknames() {
    static const std::vector<std::pair<std::string, std::vector<std::string>>> table = {
        {"robert", {"bob", "bobby", "rob", "robbie", "robby", "bert"}},
        {"william", {"bill", "billy", "will", "willy", "willie", "liam"}},
        {"richard", {"rick", "ricky", "rich", "richie", "dick"}},
        {"james", {"jim", "jimmy", "jamie"}},
        {"john", {"johnny", "jack", "jon"}},
        {"michael", {"mike", "mikey", "mick", "mickey"}},
        {"thomas", {"tom", "tommy"}},
        {"joseph", {"joe", "joey"}},
        {"charles", {"charlie", "chuck", "chas"}},
        {"edward", {"ed", "eddie", "ted", "teddy", "ned"}},
        {"anthony", {"tony"}},
        {"daniel", {"dan", "danny"}},
        {"david", {"dave", "davey"}},
        {"christopher", {"chris", "kit"}},
        {"matthew", {"matt"}},
        {"nicholas", {"nick", "nicky"}},
        {"alexander", {"alex", "sasha"}},
        {"benjamin", {"ben", "benny"}},
        {"samuel", {"sam", "sammy"}},
        {"stephen", {"steve", "steven", "stevie"}},
        {"peter", {"pete"}},
        {"andrew", {"andy", "drew"}},
        {"patrick", {"pat", "paddy"}},
        {"elizabeth", {"liz", "lizzie", "beth", "betty", "betsy", "eliza"}},
        {"margaret", {"maggie", "meg", "peggy", "marge"}},
        {"katherine", {"kate", "katie", "kathy", "catherine", "kathryn"}},
        {"jennifer", {"jen", "jenny"}},
        {"susan", {"sue", "susie"}},
        {"patricia", {"patty", "trish", "tricia"}},
        {"deborah", {"debbie", "deb"}},
        {"rebecca", {"becky", "becca"}},
        {"victoria", {"vicky", "tori"}},
        {"alexandra", {"alex", "sandra", "sandy"}},
        {"mohammed", {"muhammad", "mohamed", "mohammad", "mohamad"}},
    };
    return table;
}

} // namespace

NicknameTable NicknameTable::withDefaults() {
    NicknameTable table;
    for (const auto& [canonicalName, variants] : defaultNicknames()) {
        for (const auto& variant : variants) {
            table.add(canonicalName, variant);
        }
    }
    return table;
}

std::string NicknameTable::canonical(std::string_view token) const {
    if (auto it = variants_.find(std::string(token)); it != variants_.end()) {
        return it->second;
    }
    return std::string(token);
}

void NicknameTable::add(const std::string& canonicalName, const std::string& variant) {
    // First registration wins so that ambiguous short forms ("alex") stay stable
    variants_.emplace(toLower(variant), toLower(canonicalName));
}

Result<void> NicknameTable::loadFromString(const std::string& json) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        return Error{ErrorCode::InvalidData, std::string("Invalid nickname JSON: ") + e.what()};
    }
    if (!doc.is_object()) {
        return Error{ErrorCode::InvalidData, "Nickname JSON must be an object"};
    }

    size_t added = 0;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        if (!it.value().is_array()) {
            continue;
        }
        for (const auto& variant : it.value()) {
            if (variant.is_string()) {
                add(it.key(), variant.get<std::string>());
                ++added;
            }
        }
    }
    spdlog::debug("[Nicknames] Loaded {} variants ({} total)", added, variants_.size());
    return Result<void>();
}

Result<void> NicknameTable::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::FileNotFound, "Cannot open nickname file: " + path.string()};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadFromString(buffer.str());
}

} // namespace namesake::ml
