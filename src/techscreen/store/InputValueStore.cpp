#include <techscreen/store/InputValueStore.hpp>

#include <techscreen/log/TaggedLogger.hpp>

#include <utility>

namespace TS::Store {

struct InputValueStore::Registry {
    std::uint64_t                      next_id = 1;
    std::map<std::uint64_t, Listener>  listeners;
};

namespace {

auto action_kind_for(ValueKind kind) -> std::optional<Sync::ActionKind> {
    switch (kind) {
    case ValueKind::Text:
        return Sync::ActionKind::TextInput;
    case ValueKind::Toggle:
        return Sync::ActionKind::ToggleInput;
    case ValueKind::Slider:
        return Sync::ActionKind::SliderInput;
    case ValueKind::Picker:
        return Sync::ActionKind::PickerInput;
    case ValueKind::Date:
        return Sync::ActionKind::DatePickerInput;
    case ValueKind::Stepper:
        return Sync::ActionKind::StepperInput;
    case ValueKind::Segmented:
        return Sync::ActionKind::SegmentedInput;
    case ValueKind::MultiSelect:
        return Sync::ActionKind::MultiSelectInput;
    case ValueKind::Presentation:
        return std::nullopt;
    }
    return std::nullopt;
}

template <typename Map>
auto lookup_or(Map const& map, std::string const& key, typename Map::mapped_type fallback) -> typename Map::mapped_type {
    auto const it = map.find(key);
    if (it == map.end()) {
        return fallback;
    }
    return it->second;
}

template <typename Map, typename Encode>
void export_map(nlohmann::json& out, std::string_view name, Map const& map, Encode encode) {
    if (map.empty()) {
        return;
    }
    auto& section = out[std::string{name}];
    section       = nlohmann::json::object();
    for (auto const& [key, value] : map) {
        section[key] = encode(value);
    }
}

} // namespace

auto makeCompositeKey(std::string_view valueKey, std::optional<std::string_view> entityId) -> std::string {
    std::string key{valueKey};
    key.push_back('_');
    key.append(entityId ? *entityId : std::string_view{"global"});
    return key;
}

auto value_kind_name(ValueKind kind) -> std::string_view {
    switch (kind) {
    case ValueKind::Text:
        return "text";
    case ValueKind::Toggle:
        return "toggle";
    case ValueKind::Slider:
        return "slider";
    case ValueKind::Picker:
        return "picker";
    case ValueKind::Date:
        return "date";
    case ValueKind::Stepper:
        return "stepper";
    case ValueKind::Segmented:
        return "segmented";
    case ValueKind::MultiSelect:
        return "multiSelect";
    case ValueKind::Presentation:
        return "presentation";
    }
    return "text";
}

InputValueStore::Subscription::Subscription(Subscription&& other) noexcept
    : registry_(std::move(other.registry_)), id_(std::exchange(other.id_, 0)) {}

auto InputValueStore::Subscription::operator=(Subscription&& other) noexcept -> Subscription& {
    if (this != &other) {
        reset();
        registry_ = std::move(other.registry_);
        id_       = std::exchange(other.id_, 0);
    }
    return *this;
}

InputValueStore::Subscription::~Subscription() {
    reset();
}

void InputValueStore::Subscription::reset() {
    if (auto registry = registry_.lock()) {
        registry->listeners.erase(id_);
    }
    registry_.reset();
    id_ = 0;
}

auto InputValueStore::Subscription::active() const -> bool {
    auto registry = registry_.lock();
    return registry && registry->listeners.contains(id_);
}

InputValueStore::InputValueStore(Sync::ActionJournal& journal, NowFn now)
    : journal_(journal), now_(std::move(now)), registry_(std::make_shared<Registry>()) {
    if (!now_) {
        now_ = [] { return Route::Clock::now(); };
    }
}

void InputValueStore::setText(std::string const& key, std::string value) {
    auto serialized = value;
    text_[key]      = std::move(value);
    publish(ValueKind::Text, key, std::move(serialized));
}

void InputValueStore::setToggle(std::string const& key, bool value) {
    toggle_[key] = value;
    publish(ValueKind::Toggle, key, Sync::format_flag(value));
}

void InputValueStore::setSlider(std::string const& key, double value) {
    slider_[key] = value;
    publish(ValueKind::Slider, key, Sync::format_number(value));
}

void InputValueStore::setPicker(std::string const& key, std::string value) {
    auto serialized = value;
    picker_[key]    = std::move(value);
    publish(ValueKind::Picker, key, std::move(serialized));
}

void InputValueStore::setDate(std::string const& key, Route::TimePoint value) {
    date_[key] = value;
    publish(ValueKind::Date, key, Route::format_iso8601(value));
}

void InputValueStore::setStepper(std::string const& key, double value) {
    stepper_[key] = value;
    publish(ValueKind::Stepper, key, Sync::format_number(value));
}

void InputValueStore::setSegmented(std::string const& key, int value) {
    segmented_[key] = value;
    publish(ValueKind::Segmented, key, std::to_string(value));
}

void InputValueStore::setMultiSelect(std::string const& key, std::vector<std::string> values) {
    auto serialized   = Sync::join_selection(values);
    multiSelect_[key] = std::move(values);
    publish(ValueKind::MultiSelect, key, std::move(serialized));
}

void InputValueStore::setPresentation(std::string const& key, bool value) {
    presentation_[key] = value;
    publish(ValueKind::Presentation, key, std::nullopt);
}

auto InputValueStore::text(std::string const& key) const -> std::string {
    return lookup_or(text_, key, {});
}

auto InputValueStore::toggle(std::string const& key) const -> bool {
    return lookup_or(toggle_, key, false);
}

auto InputValueStore::slider(std::string const& key) const -> double {
    return lookup_or(slider_, key, 0.0);
}

auto InputValueStore::picker(std::string const& key) const -> std::string {
    return lookup_or(picker_, key, {});
}

auto InputValueStore::date(std::string const& key) const -> std::optional<Route::TimePoint> {
    auto const it = date_.find(key);
    if (it == date_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto InputValueStore::stepper(std::string const& key) const -> double {
    return lookup_or(stepper_, key, 0.0);
}

auto InputValueStore::segmented(std::string const& key) const -> int {
    return lookup_or(segmented_, key, 0);
}

auto InputValueStore::multiSelect(std::string const& key) const -> std::vector<std::string> {
    return lookup_or(multiSelect_, key, {});
}

auto InputValueStore::presentation(std::string const& key) const -> bool {
    return lookup_or(presentation_, key, false);
}

auto InputValueStore::contains(ValueKind kind, std::string const& key) const -> bool {
    switch (kind) {
    case ValueKind::Text:
        return text_.contains(key);
    case ValueKind::Toggle:
        return toggle_.contains(key);
    case ValueKind::Slider:
        return slider_.contains(key);
    case ValueKind::Picker:
        return picker_.contains(key);
    case ValueKind::Date:
        return date_.contains(key);
    case ValueKind::Stepper:
        return stepper_.contains(key);
    case ValueKind::Segmented:
        return segmented_.contains(key);
    case ValueKind::MultiSelect:
        return multiSelect_.contains(key);
    case ValueKind::Presentation:
        return presentation_.contains(key);
    }
    return false;
}

auto InputValueStore::valueText(ValueKind kind, std::string const& key) const -> std::optional<std::string> {
    if (!contains(kind, key)) {
        return std::nullopt;
    }
    switch (kind) {
    case ValueKind::Text:
        return text(key);
    case ValueKind::Toggle:
        return Sync::format_flag(toggle(key));
    case ValueKind::Slider:
        return Sync::format_number(slider(key));
    case ValueKind::Picker:
        return picker(key);
    case ValueKind::Date:
        return Route::format_iso8601(date_.at(key));
    case ValueKind::Stepper:
        return Sync::format_number(stepper(key));
    case ValueKind::Segmented:
        return std::to_string(segmented(key));
    case ValueKind::MultiSelect:
        return Sync::join_selection(multiSelect_.at(key));
    case ValueKind::Presentation:
        return Sync::format_flag(presentation(key));
    }
    return std::nullopt;
}

auto InputValueStore::subscribe(Listener listener) -> Subscription {
    auto const id = registry_->next_id++;
    registry_->listeners.emplace(id, std::move(listener));
    return Subscription{registry_, id};
}

auto InputValueStore::toJson() const -> nlohmann::json {
    auto out      = nlohmann::json::object();
    auto identity = [](auto const& value) { return nlohmann::json(value); };
    export_map(out, "text", text_, identity);
    export_map(out, "toggle", toggle_, identity);
    export_map(out, "slider", slider_, identity);
    export_map(out, "picker", picker_, identity);
    export_map(out, "date", date_, [](Route::TimePoint value) { return nlohmann::json(Route::format_iso8601(value)); });
    export_map(out, "stepper", stepper_, identity);
    export_map(out, "segmented", segmented_, identity);
    export_map(out, "multiSelect", multiSelect_, identity);
    export_map(out, "presentation", presentation_, identity);
    return out;
}

void InputValueStore::publish(ValueKind kind, std::string const& key, std::optional<std::string> serialized) {
    auto queued = false;
    if (auto const actionKind = action_kind_for(kind); actionKind && serialized) {
        queued = journal_.record(Sync::PendingAction{.kind      = *actionKind,
                                                     .entityId  = std::nullopt,
                                                     .key       = key,
                                                     .value     = std::move(serialized),
                                                     .reason    = std::nullopt,
                                                     .timestamp = now_()});
    }
    ts_log("Set " + std::string{value_kind_name(kind)} + " " + key + (queued ? " (queued)" : ""), "Store");

    if (registry_->listeners.empty()) {
        return;
    }
    StoreChange const change{kind, key, queued};
    std::vector<std::uint64_t> ids;
    ids.reserve(registry_->listeners.size());
    for (auto const& [id, listener] : registry_->listeners) {
        ids.push_back(id);
    }
    for (auto const id : ids) {
        // A listener may drop itself or others while being notified.
        auto const it = registry_->listeners.find(id);
        if (it == registry_->listeners.end() || !it->second) {
            continue;
        }
        auto listener = it->second;
        listener(change);
    }
}

} // namespace TS::Store
