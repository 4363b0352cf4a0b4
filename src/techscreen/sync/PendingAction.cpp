#include <techscreen/sync/PendingAction.hpp>

#include <array>
#include <charconv>
#include <cmath>

namespace TS::Sync {

auto action_kind_name(ActionKind kind) -> std::string_view {
    switch (kind) {
    case ActionKind::Start:
        return "start";
    case ActionKind::Complete:
        return "complete";
    case ActionKind::Skip:
        return "skip";
    case ActionKind::Move:
        return "move";
    case ActionKind::TextInput:
        return "textInput";
    case ActionKind::ToggleInput:
        return "toggleInput";
    case ActionKind::SliderInput:
        return "sliderInput";
    case ActionKind::PickerInput:
        return "pickerInput";
    case ActionKind::DatePickerInput:
        return "datePickerInput";
    case ActionKind::StepperInput:
        return "stepperInput";
    case ActionKind::SegmentedInput:
        return "segmentedInput";
    case ActionKind::MultiSelectInput:
        return "multiSelectInput";
    case ActionKind::RouteStart:
        return "routeStart";
    case ActionKind::RouteEnd:
        return "routeEnd";
    }
    return "unknown";
}

auto is_input_action(ActionKind kind) -> bool {
    switch (kind) {
    case ActionKind::TextInput:
    case ActionKind::ToggleInput:
    case ActionKind::SliderInput:
    case ActionKind::PickerInput:
    case ActionKind::DatePickerInput:
    case ActionKind::StepperInput:
    case ActionKind::SegmentedInput:
    case ActionKind::MultiSelectInput:
        return true;
    default:
        return false;
    }
}

auto format_number(double value) -> std::string {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    std::array<char, 64> buffer{};
    auto const result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    std::string text{buffer.data(), result.ptr};
    if (text.find_first_of(".e") == std::string::npos) {
        text.append(".0");
    }
    return text;
}

auto format_flag(bool value) -> std::string {
    return value ? "true" : "false";
}

auto join_selection(std::vector<std::string> const& values) -> std::string {
    std::string joined;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            joined.push_back(',');
        }
        joined.append(values[i]);
    }
    return joined;
}

auto EncodePendingAction(PendingAction const& action) -> nlohmann::json {
    nlohmann::json object{
        {"type", std::string{action_kind_name(action.kind)}},
        {"timestamp", Route::format_iso8601(action.timestamp)},
    };
    if (action.entityId) {
        object["jobId"] = *action.entityId;
    }
    if (action.key) {
        object["valueKey"] = *action.key;
    }
    if (action.value) {
        object["value"] = *action.value;
    }
    if (action.reason) {
        object["reason"] = *action.reason;
    }
    return object;
}

auto describe_action(PendingAction const& action) -> std::string {
    std::string text{"PendingAction(type: "};
    text.append(action_kind_name(action.kind));
    text.append(", jobId: ").append(action.entityId.value_or("-"));
    text.append(", key: ").append(action.key.value_or("-"));
    text.append(", value: ").append(action.value.value_or("-"));
    text.append(")");
    return text;
}

} // namespace TS::Sync
