#include <namesake/extraction/name_extractor.h>

#include <algorithm>
#include <cctype>
#include <unordered_set>
#include <vector>

namespace namesake::extraction {

using record::Mapping;
using record::Sequence;
using record::Value;

namespace name_utils {

bool endsWithIgnoreCase(const std::string& field, const char* suffix) {
    const std::string_view sfx(suffix);
    if (field.size() < sfx.size()) {
        return false;
    }
    const size_t offset = field.size() - sfx.size();
    for (size_t i = 0; i < sfx.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(field[offset + i])) !=
            std::toupper(static_cast<unsigned char>(sfx[i]))) {
            return false;
        }
    }
    return true;
}

bool equalsIgnoreCase(const std::string& field, const char* name) {
    return field.size() == std::char_traits<char>::length(name) && endsWithIgnoreCase(field, name);
}

std::optional<std::string> nonBlankString(const Value* value) {
    if (value == nullptr) {
        return std::nullopt;
    }
    const auto* s = value->asString();
    if (s == nullptr) {
        return std::nullopt;
    }
    auto first = std::find_if(s->begin(), s->end(),
                              [](unsigned char c) { return !std::isspace(c); });
    auto last = std::find_if(s->rbegin(), s->rend(), [](unsigned char c) {
                    return !std::isspace(c);
                }).base();
    if (first >= last) {
        return std::nullopt;
    }
    return std::string(first, last);
}

} // namespace name_utils

namespace {

constexpr const char* kFullNameSuffixes[] = {"NAME_FULL", "NAME_ORG"};
constexpr const char* kNameParts[] = {"NAME_FIRST", "NAME_MIDDLE", "NAME_LAST"};

struct Frame {
    const Value* container;
    size_t next;
    size_t depth;
};

size_t childCount(const Value& v) {
    if (const auto* m = v.asMapping()) {
        return m->size();
    }
    if (const auto* s = v.asSequence()) {
        return s->size();
    }
    return 0;
}

/**
 * Depth-first walk over mappings and sequences in declaration order.
 * onMapping(const Mapping&) fires when a mapping is entered, onField(key, value) for each
 * mapping field before descending into it. Either returning a value stops the walk.
 */
template <typename OnMapping, typename OnField>
std::optional<std::string> walk(const Value& root, size_t maxDepth, OnMapping&& onMapping,
                                OnField&& onField) {
    std::unordered_set<const Value*> visited;
    std::vector<Frame> stack;

    auto enter = [&](const Value* v, size_t depth) -> std::optional<std::string> {
        if (depth > maxDepth || !visited.insert(v).second) {
            return std::nullopt;
        }
        if (const auto* m = v->asMapping()) {
            if (auto found = onMapping(*m)) {
                return found;
            }
        }
        stack.push_back(Frame{v, 0, depth});
        return std::nullopt;
    };

    if (!root.isMapping() && !root.isSequence()) {
        return std::nullopt;
    }
    if (auto found = enter(&root, 0)) {
        return found;
    }

    while (!stack.empty()) {
        Frame& top = stack.back();
        if (top.next >= childCount(*top.container)) {
            stack.pop_back();
            continue;
        }
        const size_t depth = top.depth;
        const Value* child = nullptr;
        if (const auto* m = top.container->asMapping()) {
            const auto& [key, value] = (*m)[top.next++];
            child = value.get();
            if (child != nullptr) {
                if (auto found = onField(key, *child)) {
                    return found;
                }
            }
        } else {
            child = (*top.container->asSequence())[top.next++].get();
        }
        // top may dangle after push_back below; only locals are used from here on
        if (child != nullptr && (child->isMapping() || child->isSequence())) {
            if (auto found = enter(child, depth + 1)) {
                return found;
            }
        }
    }
    return std::nullopt;
}

} // namespace

std::optional<std::string> NameExtractor::extract(const Value& root) const {
    if (auto full = findFullName(root)) {
        return full;
    }
    return constructFromParts(root);
}

std::optional<std::string> NameExtractor::findFullName(const Value& root) const {
    return walk(
        root, config_.max_depth, [](const Mapping&) -> std::optional<std::string> { return {}; },
        [](const std::string& key, const Value& value) -> std::optional<std::string> {
            for (const char* suffix : kFullNameSuffixes) {
                if (name_utils::endsWithIgnoreCase(key, suffix)) {
                    return name_utils::nonBlankString(&value);
                }
            }
            return std::nullopt;
        });
}

std::optional<std::string> NameExtractor::constructFromParts(const Value& root) const {
    return walk(
        root, config_.max_depth,
        [](const Mapping& map) -> std::optional<std::string> {
            std::string joined;
            for (const char* part : kNameParts) {
                for (const auto& [key, value] : map) {
                    if (!name_utils::equalsIgnoreCase(key, part)) {
                        continue;
                    }
                    if (auto text = name_utils::nonBlankString(value.get())) {
                        if (!joined.empty()) {
                            joined.push_back(' ');
                        }
                        joined += *text;
                    }
                    break;
                }
            }
            if (joined.empty()) {
                return std::nullopt;
            }
            return joined;
        },
        [](const std::string&, const Value&) -> std::optional<std::string> { return {}; });
}

} // namespace namesake::extraction
