// Catch2 tests for canonical name extraction

#include <catch2/catch_test_macros.hpp>

#include <namesake/extraction/name_extractor.h>
#include <namesake/record/json_record.h>

#include <string>

using namespace namesake;
using namespace namesake::extraction;
using record::Value;

namespace {

record::ValuePtr parse(const char* text) {
    return record::fromJson(nlohmann::ordered_json::parse(text));
}

} // namespace

TEST_CASE("NameExtractor prefers full name fields", "[extraction][name][catch2]") {
    NameExtractor extractor;

    SECTION("top-level NAME_FULL") {
        auto r = parse(R"({"NAME_FULL": "Robert Johnson", "NAME_FIRST": "Bob"})");
        CHECK(extractor.extract(*r) == std::optional<std::string>("Robert Johnson"));
    }

    SECTION("suffix match is case-insensitive") {
        auto r = parse(R"({"primary_name_org": "Acme Corp"})");
        CHECK(extractor.extract(*r) == std::optional<std::string>("Acme Corp"));
    }

    SECTION("full name nested below parts still wins") {
        auto r = parse(R"({"NAME_FIRST": "Bob", "NAMES": [{"NAME_FULL": "Robert J"}]})");
        CHECK(extractor.extract(*r) == std::optional<std::string>("Robert J"));
    }

    SECTION("first full name in declaration order wins") {
        auto r = parse(R"({"A": {"NAME_ORG": "First Inc"}, "NAME_FULL": "Second"})");
        CHECK(extractor.extract(*r) == std::optional<std::string>("First Inc"));
    }

    SECTION("values are trimmed") {
        auto r = parse(R"({"NAME_FULL": "  Jane Doe \t"})");
        CHECK(extractor.extract(*r) == std::optional<std::string>("Jane Doe"));
    }
}

TEST_CASE("NameExtractor builds names from parts", "[extraction][name][catch2]") {
    NameExtractor extractor;

    SECTION("first middle last") {
        auto r = parse(R"({"NAME_LAST": "Doe", "NAME_FIRST": "John", "NAME_MIDDLE": "Q"})");
        CHECK(extractor.extract(*r) == std::optional<std::string>("John Q Doe"));
    }

    SECTION("missing parts are skipped without extra spaces") {
        auto r = parse(R"({"NAME_FIRST": "Cher", "NAME_MIDDLE": "  ", "NAME_LAST": 7})");
        CHECK(extractor.extract(*r) == std::optional<std::string>("Cher"));
    }

    SECTION("parts come from the first mapping that has any") {
        auto r = parse(R"({"OTHER": {"NAME_LAST": "Smith"},
                           "PEOPLE": [{"NAME_FIRST": "Ann", "NAME_LAST": "Lee"}]})");
        CHECK(extractor.extract(*r) == std::optional<std::string>("Smith"));
    }

    SECTION("blank full name falls back to parts") {
        auto r = parse(R"({"NAME_FULL": "", "NAME_FIRST": "Ann"})");
        CHECK(extractor.extract(*r) == std::optional<std::string>("Ann"));
    }
}

TEST_CASE("NameExtractor returns nothing without a name", "[extraction][name][catch2]") {
    NameExtractor extractor;

    auto phoneOnly = parse(R"({"DATA_SOURCE": "X", "RECORD_ID": "1", "PHONE_NUMBER": "555"})");
    CHECK_FALSE(extractor.extract(*phoneOnly).has_value());

    auto nonString = parse(R"({"NAME_FULL": 12, "NAME_ORG": null})");
    CHECK_FALSE(extractor.extract(*nonString).has_value());

    auto scalar = Value::string("Robert");
    CHECK_FALSE(extractor.extract(*scalar).has_value());

    // Field must end in NAME_FULL, not merely contain it
    auto suffix = parse(R"({"NAME_FULL_TEXT": "nope"})");
    CHECK_FALSE(extractor.extract(*suffix).has_value());
}

TEST_CASE("NameExtractor terminates on cyclic records", "[extraction][name][catch2]") {
    NameExtractor extractor;

    auto root = Value::mapping();
    auto child = Value::mapping();
    child->set("parent", root);
    root->set("child", child);
    CHECK_FALSE(extractor.extract(*root).has_value());

    child->set("NAME_FULL", Value::string("Loop Name"));
    CHECK(extractor.extract(*root) == std::optional<std::string>("Loop Name"));

    // Release the cycle
    child->asMapping()->clear();
}

TEST_CASE("NameExtractor honours the depth limit", "[extraction][name][catch2]") {
    auto root = Value::mapping();
    auto* current = root.get();
    record::ValuePtr keep = root;
    for (int i = 0; i < 10; ++i) {
        auto next = Value::mapping();
        current->set("level", next);
        current = next.get();
    }
    current->set("NAME_FULL", Value::string("Deep Name"));

    NameExtractor shallow(NameExtractorConfig{4});
    CHECK_FALSE(shallow.extract(*root).has_value());

    NameExtractor deep;
    CHECK(deep.extract(*root) == std::optional<std::string>("Deep Name"));
}

TEST_CASE("NameExtractor is deterministic", "[extraction][name][catch2]") {
    NameExtractor extractor;
    auto r = parse(R"({"X": [{"NAME_FIRST": "A"}, {"NAME_FULL": "B"}]})");
    const auto first = extractor.extract(*r);
    for (int i = 0; i < 10; ++i) {
        CHECK(extractor.extract(*r) == first);
    }
    CHECK(first == std::optional<std::string>("B"));
}
