#pragma once

#include <namesake/core/types.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>

namespace namesake::ml {

/**
 * Maps given-name variants (nicknames, diminutives, common short forms) to one canonical
 * form, e.g. "bobby" -> "robert". Keys and values are lower-case ASCII.
 */
class NicknameTable {
public:
    NicknameTable() = default;

    // Table preloaded with the built-in English given-name variants.
    static NicknameTable withDefaults();

    // Canonical form of a lower-case token, or the token itself when unknown.
    std::string canonical(std::string_view token) const;

    void add(const std::string& canonical, const std::string& variant);

    /**
     * Merge entries from a JSON object of the form {"robert": ["bob", "bobby"], ...}.
     */
    Result<void> loadFromString(const std::string& json);
    Result<void> loadFromFile(const std::filesystem::path& path);

    size_t size() const { return variants_.size(); }

private:
    std::unordered_map<std::string, std::string> variants_;
};

} // namespace namesake::ml
