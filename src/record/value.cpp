#include <namesake/record/value.h>

#include <set>

namespace namesake::record {

namespace {

using PairSet = std::set<std::pair<const Value*, const Value*>>;

bool equalImpl(const Value& a, const Value& b, PairSet& inProgress) {
    if (&a == &b) {
        return true;
    }
    if (a.kind() != b.kind()) {
        return false;
    }
    // A pair already being compared higher up the stack is assumed equal; any difference
    // will surface at the frame that started it.
    auto key = std::make_pair(&a, &b);
    if (!inProgress.insert(key).second) {
        return true;
    }

    bool equal = true;
    switch (a.kind()) {
        case Value::Kind::Null:
            break;
        case Value::Kind::Bool:
            equal = *a.asBool() == *b.asBool();
            break;
        case Value::Kind::Number:
            equal = *a.asNumber() == *b.asNumber();
            break;
        case Value::Kind::String:
            equal = *a.asString() == *b.asString();
            break;
        case Value::Kind::Sequence: {
            const auto& sa = *a.asSequence();
            const auto& sb = *b.asSequence();
            equal = sa.size() == sb.size();
            for (size_t i = 0; equal && i < sa.size(); ++i) {
                if (!sa[i] || !sb[i]) {
                    equal = !sa[i] && !sb[i];
                } else {
                    equal = equalImpl(*sa[i], *sb[i], inProgress);
                }
            }
            break;
        }
        case Value::Kind::Mapping: {
            const auto& ma = *a.asMapping();
            const auto& mb = *b.asMapping();
            equal = ma.size() == mb.size();
            for (size_t i = 0; equal && i < ma.size(); ++i) {
                if (ma[i].first != mb[i].first) {
                    equal = false;
                } else if (!ma[i].second || !mb[i].second) {
                    equal = !ma[i].second && !mb[i].second;
                } else {
                    equal = equalImpl(*ma[i].second, *mb[i].second, inProgress);
                }
            }
            break;
        }
    }

    inProgress.erase(key);
    return equal;
}

} // namespace

Value& Value::set(std::string key, ValuePtr value) {
    if (auto* map = asMapping()) {
        map->emplace_back(std::move(key), std::move(value));
    }
    return *this;
}

ValuePtr Value::get(std::string_view key) const {
    if (const auto* map = asMapping()) {
        for (const auto& [k, v] : *map) {
            if (k == key) {
                return v;
            }
        }
    }
    return nullptr;
}

bool operator==(const Value& a, const Value& b) {
    PairSet inProgress;
    return equalImpl(a, b, inProgress);
}

} // namespace namesake::record
