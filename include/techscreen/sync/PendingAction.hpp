#pragma once

#include <techscreen/route/Job.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TS::Sync {

enum class ActionKind {
    Start,
    Complete,
    Skip,
    Move,
    TextInput,
    ToggleInput,
    SliderInput,
    PickerInput,
    DatePickerInput,
    StepperInput,
    SegmentedInput,
    MultiSelectInput,
    RouteStart,
    RouteEnd,
};

// A mutation already applied locally that still awaits remote acknowledgment.
struct PendingAction {
    ActionKind                 kind;
    std::optional<std::string> entityId;
    std::optional<std::string> key;
    std::optional<std::string> value;
    // Reason text attached to skip and move.
    std::optional<std::string> reason;
    Route::TimePoint           timestamp{};

    bool operator==(PendingAction const&) const = default;
};

[[nodiscard]] auto action_kind_name(ActionKind kind) -> std::string_view;
// Value-carrying input kinds; these are the only ones eligible for compaction.
[[nodiscard]] auto is_input_action(ActionKind kind) -> bool;

// Shortest round-trip text; integral values keep a trailing ".0".
[[nodiscard]] auto format_number(double value) -> std::string;
[[nodiscard]] auto format_flag(bool value) -> std::string;
[[nodiscard]] auto join_selection(std::vector<std::string> const& values) -> std::string;

[[nodiscard]] auto EncodePendingAction(PendingAction const& action) -> nlohmann::json;
[[nodiscard]] auto describe_action(PendingAction const& action) -> std::string;

} // namespace TS::Sync
