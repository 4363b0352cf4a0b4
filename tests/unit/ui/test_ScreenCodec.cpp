#include <doctest/doctest.h>

#include <techscreen/ui/declarative/ScreenCodec.hpp>

#include <nlohmann/json.hpp>

#include <string>

using namespace TS;
using namespace TS::UI::Declarative;
using json = nlohmann::json;

namespace {

auto const kRouteScreen = R"({
    "version": 3,
    "component": {
        "type": "vstack",
        "spacing": 8,
        "children": [
            {"type": "text", "id": "title", "text": "Arrive by {{eta}}", "font": "headline"},
            {"type": "list", "itemView": {
                "type": "hstack",
                "children": [
                    {"type": "text", "key": "customerName"},
                    {"type": "button", "label": "Start", "actionId": "startJob"}
                ]
            }},
            {"type": "slider", "id": "temp", "valueKey": "temperature", "minValue": 40, "maxValue": 110, "step": 1},
            {"type": "picker", "valueKey": "pest", "options": [
                {"text": "Ants", "value": "ants"},
                {"id": "opt-roach", "text": "Roaches", "value": "roaches"}
            ]}
        ]
    }
})";

} // namespace

TEST_SUITE("techscreen.ui.codec") {

TEST_CASE("decodes a nested screen") {
    auto screen = ParseScreen(kRouteScreen);
    REQUIRE(screen.has_value());
    CHECK(screen->version == 3);

    auto const& root = screen->root;
    CHECK(root.kind == ComponentKind::VStack);
    REQUIRE(root.layout() != nullptr);
    CHECK(root.layout()->spacing == 8.0);
    REQUIRE(root.children.size() == 4);

    auto const& title = root.children[0];
    CHECK(title.id == "title");
    CHECK(title.text == "Arrive by {{eta}}");
    CHECK(title.style.font == "headline");

    auto const& list = root.children[1];
    CHECK(list.kind == ComponentKind::List);
    REQUIRE(list.itemTemplate);
    CHECK(list.itemTemplate->children.size() == 2);
    CHECK(list.itemTemplate->children[0].bindingKey == "customerName");
    CHECK(list.itemTemplate->children[1].actionId == "startJob");

    auto const& slider = root.children[2];
    REQUIRE(slider.input() != nullptr);
    CHECK(slider.input()->minValue == 40.0);
    CHECK(slider.input()->maxValue == 110.0);
    CHECK(slider.valueKey == "temperature");

    auto const& picker = root.children[3];
    REQUIRE(picker.input() != nullptr);
    REQUIRE(picker.input()->options);
    auto const& options = *picker.input()->options;
    REQUIRE(options.size() == 2);
    CHECK_FALSE(options[0].id.empty());
    CHECK(options[1].id == "opt-roach");
    CHECK(options[1].value == "roaches");
}

TEST_CASE("missing ids are generated and survive an encode/decode cycle") {
    auto first = ParseScreen(kRouteScreen);
    REQUIRE(first.has_value());
    auto const& root = first->root;
    CHECK_FALSE(root.id.empty());
    CHECK_FALSE(root.children[1].id.empty());
    CHECK_FALSE(root.children[1].itemTemplate->id.empty());

    auto encoded = EncodeScreen(*first);
    CHECK(encoded["component"]["id"] == root.id);

    auto second = DecodeScreen(encoded);
    REQUIRE(second.has_value());
    CHECK(second->root == first->root);
    CHECK(EncodeScreen(*second) == encoded);
}

TEST_CASE("unsupported versions fail closed") {
    auto payload = json::parse(R"({"type": "text", "text": "hi"})");
    for (int version : {0, 6, -1}) {
        auto decoded = DecodeComponent(payload, version);
        REQUIRE_FALSE(decoded.has_value());
        CHECK(decoded.error().code == Error::Code::UnsupportedVersion);
    }
    CHECK(DecodeComponent(payload, 1).has_value());
}

TEST_CASE("root failures are reported as errors") {
    SUBCASE("unknown type") {
        auto decoded = DecodeComponent(json::parse(R"({"type": "carousel"})"), 5);
        REQUIRE_FALSE(decoded.has_value());
        CHECK(decoded.error().code == Error::Code::UnknownKind);
    }
    SUBCASE("missing type") {
        auto decoded = DecodeComponent(json::parse(R"({"id": "x"})"), 5);
        REQUIRE_FALSE(decoded.has_value());
        CHECK(decoded.error().code == Error::Code::MalformedInput);
    }
    SUBCASE("mistyped field") {
        auto decoded = DecodeComponent(json::parse(R"({"type": "slider", "minValue": "low"})"), 5);
        REQUIRE_FALSE(decoded.has_value());
        CHECK(decoded.error().message.value_or("").find("minValue") != std::string::npos);
    }
    SUBCASE("invalid json text") {
        auto decoded = ParseScreen("{\"version\": 5, ");
        REQUIRE_FALSE(decoded.has_value());
        CHECK(decoded.error().code == Error::Code::MalformedInput);
    }
    SUBCASE("wrapper without version") {
        auto decoded = ParseScreen(R"({"component": {"type": "text"}})");
        REQUIRE_FALSE(decoded.has_value());
        CHECK(decoded.error().code == Error::Code::MalformedInput);
    }
}

TEST_CASE("a malformed child becomes an unresolved placeholder beside its siblings") {
    auto payload = json::parse(R"({
        "type": "vstack",
        "children": [
            {"type": "text", "id": "ok", "text": "fine"},
            {"type": "hologram", "id": "bad", "intensity": 3},
            {"type": "text", "text": 42}
        ]
    })");
    auto decoded = DecodeComponent(payload, 5);
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->children.size() == 3);

    CHECK(decoded->children[0].kind == ComponentKind::Text);

    auto const& bad = decoded->children[1];
    CHECK(bad.kind == ComponentKind::Unresolved);
    CHECK(bad.id == "bad");
    REQUIRE(bad.unresolved() != nullptr);
    CHECK(bad.unresolved()->error.code == Error::Code::UnknownKind);

    auto const& mistyped = decoded->children[2];
    CHECK(mistyped.kind == ComponentKind::Unresolved);
    CHECK_FALSE(mistyped.id.empty());

    auto encoded = EncodeComponent(*decoded);
    CHECK(encoded["children"][1]["type"] == "hologram");
    CHECK(encoded["children"][1]["intensity"] == 3);
}

TEST_CASE("placeholders survive an encode and decode cycle unchanged") {
    auto payload = json::parse(R"({
        "type": "vstack",
        "id": "root",
        "children": [
            {"type": "text", "id": 5, "text": "hi"},
            {"type": "text", "text": 42},
            "loose string"
        ]
    })");
    auto first = DecodeComponent(payload, 5);
    REQUIRE(first.has_value());
    REQUIRE(first->children.size() == 3);
    for (auto const& child : first->children) {
        CHECK(child.kind == ComponentKind::Unresolved);
    }

    auto second = DecodeComponent(EncodeComponent(*first), 5);
    REQUIRE(second.has_value());
    REQUIRE(second->children.size() == 3);
    CHECK(second->children[0].kind == ComponentKind::Unresolved);
    CHECK(second->children[0].id == first->children[0].id);
    CHECK(second->children[1].id == first->children[1].id);
    CHECK(*second == *first);

    // The mistyped id is kept for diagnosis.
    auto encoded = EncodeComponent(*second);
    CHECK(encoded["children"][0]["payload"]["id"] == 5);
    CHECK(encoded["children"][0]["id"] == first->children[0].id);
}

TEST_CASE("domain kinds keep their attributes") {
    auto payload = json::parse(R"({"type": "dosageCalculator", "id": "dose", "chemicalId": "C-12", "area": 1200})");
    auto decoded = DecodeComponent(payload, 5);
    REQUIRE(decoded.has_value());
    auto const* domain = std::get_if<DomainProps>(&decoded->props);
    REQUIRE(domain != nullptr);
    CHECK(domain->attributes["chemicalId"] == "C-12");
    CHECK_FALSE(domain->attributes.contains("id"));

    auto encoded = EncodeComponent(*decoded);
    CHECK(encoded == payload);
}

TEST_CASE("nesting deeper than the limit is rejected") {
    json node = json{{"type", "text"}};
    for (int i = 0; i < 10; ++i) {
        node = json{{"type", "vstack"}, {"children", json::array({node})}};
    }
    DecodeOptions options{};
    options.max_depth = 4;
    auto decoded = DecodeComponent(node, 5, options);
    REQUIRE(decoded.has_value());
    // The subtree past the limit collapses into a placeholder.
    auto const* cursor = &*decoded;
    for (int depth = 0; depth < 4; ++depth) {
        REQUIRE(cursor->children.size() == 1);
        cursor = &cursor->children[0];
    }
    CHECK(cursor->children.size() == 1);
    CHECK(cursor->children[0].kind == ComponentKind::Unresolved);
}

} // TEST_SUITE
