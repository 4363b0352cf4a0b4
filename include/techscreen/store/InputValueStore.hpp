#pragma once

#include <techscreen/route/Job.hpp>
#include <techscreen/sync/OfflineActionQueue.hpp>

#include <nlohmann/json.hpp>
#include <parallel_hashmap/phmap.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TS::Store {

// "{valueKey}_{entityId}" or "{valueKey}_global".
[[nodiscard]] auto makeCompositeKey(std::string_view valueKey, std::optional<std::string_view> entityId = std::nullopt)
    -> std::string;

enum class ValueKind {
    Text,
    Toggle,
    Slider,
    Picker,
    Date,
    Stepper,
    Segmented,
    MultiSelect,
    Presentation,
};

[[nodiscard]] auto value_kind_name(ValueKind kind) -> std::string_view;

struct StoreChange {
    ValueKind   kind;
    std::string key;
    bool        queued = false;
};

/**
 * Typed values held locally for form controls, addressed by composite key.
 * Each kind lives in its own map; the same key in two maps is two values.
 * Setters write the value, then queue a PendingAction through the journal
 * when offline. Presentation flags are local only and never queued. Getters
 * return the kind's default for unknown keys.
 */
class InputValueStore {
    struct Registry;

public:
    using Listener = std::function<void(StoreChange const&)>;
    using NowFn    = std::function<Route::TimePoint()>;

    // Removes its listener when destroyed. Safe to outlive the store.
    class Subscription {
    public:
        Subscription() = default;
        Subscription(Subscription&&) noexcept;
        auto operator=(Subscription&&) noexcept -> Subscription&;
        Subscription(Subscription const&)            = delete;
        auto operator=(Subscription const&) -> Subscription& = delete;
        ~Subscription();

        void reset();
        [[nodiscard]] auto active() const -> bool;

    private:
        friend class InputValueStore;
        Subscription(std::weak_ptr<Registry> registry, std::uint64_t id)
            : registry_(std::move(registry)), id_(id) {}

        std::weak_ptr<Registry> registry_;
        std::uint64_t           id_ = 0;
    };

    explicit InputValueStore(Sync::ActionJournal& journal, NowFn now = {});

    void setText(std::string const& key, std::string value);
    void setToggle(std::string const& key, bool value);
    void setSlider(std::string const& key, double value);
    void setPicker(std::string const& key, std::string value);
    void setDate(std::string const& key, Route::TimePoint value);
    void setStepper(std::string const& key, double value);
    void setSegmented(std::string const& key, int value);
    void setMultiSelect(std::string const& key, std::vector<std::string> values);
    void setPresentation(std::string const& key, bool value);

    [[nodiscard]] auto text(std::string const& key) const -> std::string;
    [[nodiscard]] auto toggle(std::string const& key) const -> bool;
    [[nodiscard]] auto slider(std::string const& key) const -> double;
    [[nodiscard]] auto picker(std::string const& key) const -> std::string;
    [[nodiscard]] auto date(std::string const& key) const -> std::optional<Route::TimePoint>;
    [[nodiscard]] auto stepper(std::string const& key) const -> double;
    [[nodiscard]] auto segmented(std::string const& key) const -> int;
    [[nodiscard]] auto multiSelect(std::string const& key) const -> std::vector<std::string>;
    [[nodiscard]] auto presentation(std::string const& key) const -> bool;

    [[nodiscard]] auto contains(ValueKind kind, std::string const& key) const -> bool;
    // Serialized form of the current value as it would be queued; nullopt when unset.
    [[nodiscard]] auto valueText(ValueKind kind, std::string const& key) const -> std::optional<std::string>;

    [[nodiscard]] auto subscribe(Listener listener) -> Subscription;

    // `{"text": {...}, "toggle": {...}, ...}`, omitting empty maps.
    [[nodiscard]] auto toJson() const -> nlohmann::json;

private:
    void publish(ValueKind kind, std::string const& key, std::optional<std::string> serialized);

    Sync::ActionJournal& journal_;
    NowFn                now_;

    phmap::flat_hash_map<std::string, std::string>              text_;
    phmap::flat_hash_map<std::string, bool>                     toggle_;
    phmap::flat_hash_map<std::string, double>                   slider_;
    phmap::flat_hash_map<std::string, std::string>              picker_;
    phmap::flat_hash_map<std::string, Route::TimePoint>         date_;
    phmap::flat_hash_map<std::string, double>                   stepper_;
    phmap::flat_hash_map<std::string, int>                      segmented_;
    phmap::flat_hash_map<std::string, std::vector<std::string>> multiSelect_;
    phmap::flat_hash_map<std::string, bool>                     presentation_;

    std::shared_ptr<Registry> registry_;
};

} // namespace TS::Store
