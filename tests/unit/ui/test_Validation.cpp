#include <doctest/doctest.h>

#include <techscreen/ui/declarative/ScreenCodec.hpp>
#include <techscreen/ui/declarative/Validation.hpp>

#include <nlohmann/json.hpp>

#include <string>

using namespace TS;
using namespace TS::UI::Declarative;
using json = nlohmann::json;

namespace {

auto violation_for(ComponentDescriptor const& node) -> std::string {
    auto error = ValidateComponent(node);
    REQUIRE(error.has_value());
    CHECK(error->code == Error::Code::ValidationFailed);
    return error->message.value_or("");
}

auto input_node(ComponentKind kind, std::string id = "input") -> ComponentDescriptor {
    auto node     = MakeComponent(kind, std::move(id));
    node.valueKey = "field";
    return node;
}

auto with_input(ComponentDescriptor node, InputProps props) -> ComponentDescriptor {
    node.props = std::move(props);
    return node;
}

} // namespace

TEST_SUITE("techscreen.ui.validation") {

TEST_CASE("well formed nodes pass") {
    auto text  = MakeComponent(ComponentKind::Text, "t");
    text.text  = "hello";
    CHECK_FALSE(ValidateComponent(text).has_value());

    auto stack = MakeComponent(ComponentKind::VStack, "stack");
    stack.children.push_back(text);
    CHECK_FALSE(ValidateComponent(stack).has_value());

    InputProps range{};
    range.minValue = 0.0;
    range.maxValue = 10.0;
    CHECK_FALSE(ValidateComponent(with_input(input_node(ComponentKind::Slider), range)).has_value());
}

TEST_CASE("each rule reports its own message") {
    SUBCASE("id") {
        CHECK(violation_for(MakeComponent(ComponentKind::Text)) == "Component missing required 'id'");
    }
    SUBCASE("valueKey") {
        CHECK(violation_for(MakeComponent(ComponentKind::Toggle, "toggle"))
              == "Input component missing required 'valueKey'");
    }
    SUBCASE("picker options") {
        CHECK(violation_for(input_node(ComponentKind::Picker)) == "Picker component missing 'options'");
        InputProps empty{};
        empty.options = std::vector<PickerOption>{};
        CHECK(violation_for(with_input(input_node(ComponentKind::SegmentedControl), empty))
              == "Picker component missing 'options'");
    }
    SUBCASE("slider and stepper ranges") {
        InputProps inverted{};
        inverted.minValue = 10.0;
        inverted.maxValue = 5.0;
        CHECK(violation_for(with_input(input_node(ComponentKind::Slider), inverted))
              == "Slider minValue must be less than maxValue");
        CHECK(violation_for(with_input(input_node(ComponentKind::Stepper), inverted))
              == "Stepper minValue must be less than maxValue");

        InputProps equal{};
        equal.minValue = 3.0;
        equal.maxValue = 3.0;
        CHECK(ValidateComponent(with_input(input_node(ComponentKind::Slider), equal)).has_value());

        InputProps open{};
        open.minValue = 10.0;
        CHECK_FALSE(ValidateComponent(with_input(input_node(ComponentKind::Slider), open)).has_value());
    }
    SUBCASE("containers") {
        CHECK(violation_for(MakeComponent(ComponentKind::HStack, "row")) == "Container component missing 'children'");
        CHECK(violation_for(MakeComponent(ComponentKind::List, "list")) == "List component missing 'itemView'");
    }
    SUBCASE("navigation and presentation") {
        CHECK(violation_for(MakeComponent(ComponentKind::NavigationLink, "nav"))
              == "NavigationLink missing 'destination'");
        CHECK(violation_for(MakeComponent(ComponentKind::Alert, "alert")) == "alert missing 'isPresented' key");
        CHECK(violation_for(MakeComponent(ComponentKind::ActionSheet, "sheet"))
              == "actionSheet missing 'isPresented' key");
    }
    SUBCASE("image source") {
        CHECK(violation_for(MakeComponent(ComponentKind::Image, "img"))
              == "Image component missing 'imageName' or 'url'");
        auto image  = MakeComponent(ComponentKind::Image, "img");
        image.props = ImageProps{.imageName = std::nullopt, .url = "https://example.invalid/a.png"};
        CHECK_FALSE(ValidateComponent(image).has_value());
    }
    SUBCASE("progress bounds") {
        auto progress  = MakeComponent(ComponentKind::ProgressView, "p");
        progress.props = ProgressProps{.progress = 1.5, .gaugeMin = std::nullopt, .gaugeMax = std::nullopt};
        CHECK(violation_for(progress) == "ProgressView progress must be between 0 and 1");
        progress.props = ProgressProps{.progress = 1.0, .gaugeMin = std::nullopt, .gaugeMax = std::nullopt};
        CHECK_FALSE(ValidateComponent(progress).has_value());
        progress.props = ProgressProps{};
        CHECK_FALSE(ValidateComponent(progress).has_value());
    }
}

TEST_CASE("the first violated rule wins") {
    auto picker = MakeComponent(ComponentKind::Picker);
    CHECK(violation_for(picker) == "Component missing required 'id'");
    picker.id = "p";
    CHECK(violation_for(picker) == "Input component missing required 'valueKey'");
}

TEST_CASE("tree validation reports every broken node independently") {
    auto screen = ParseScreen(R"({
        "version": 5,
        "component": {
            "type": "vstack",
            "children": [
                {"type": "slider", "id": "bad-slider", "valueKey": "temp", "minValue": 10, "maxValue": 5},
                {"type": "text", "id": "fine", "text": "ok"},
                {"type": "picker", "id": "bad-picker", "valueKey": "pest", "options": []},
                {"type": "gizmo", "id": "mystery"},
                {"type": "list", "id": "jobs", "itemView": {"type": "hstack", "id": "row"}}
            ]
        }
    })");
    REQUIRE(screen.has_value());

    auto issues = ValidateTree(screen->root);
    REQUIRE(issues.size() == 4);

    CHECK(issues[0].id == "bad-slider");
    CHECK(issues[0].error.message == "Slider minValue must be less than maxValue");
    CHECK(issues[1].id == "bad-picker");
    CHECK(issues[1].error.message == "Picker component missing 'options'");
    CHECK(issues[2].id == "mystery");
    CHECK(issues[2].kind == ComponentKind::Unresolved);
    CHECK(issues[2].error.code == Error::Code::UnknownKind);
    CHECK(issues[3].id == "row");
    CHECK(issues[3].error.message == "Container component missing 'children'");
}

} // TEST_SUITE
