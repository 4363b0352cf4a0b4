#include "unit/TechScreenTestHelper.hpp"

#include <doctest/doctest.h>

#include <techscreen/store/InputValueStore.hpp>

#include <chrono>
#include <string>
#include <vector>

using namespace TS;
using namespace TS::Store;
using TS::Testing::reference_time;

namespace {

struct OfflineStore {
    Sync::OfflineActionQueue queue;
    Sync::ActionJournal      journal{queue, false};
    InputValueStore          store{journal};
};

} // namespace

TEST_SUITE("techscreen.store.inputs") {

TEST_CASE("composite keys scope values to an entity or the route") {
    CHECK(makeCompositeKey("notes", "J1") == "notes_J1");
    CHECK(makeCompositeKey("notes") == "notes_global");
    CHECK(makeCompositeKey("notes", std::nullopt) == "notes_global");
}

TEST_CASE_FIXTURE(OfflineStore, "unset keys read as defaults") {
    CHECK(store.text("missing").empty());
    CHECK_FALSE(store.toggle("missing"));
    CHECK(store.slider("missing") == 0.0);
    CHECK(store.picker("missing").empty());
    CHECK_FALSE(store.date("missing").has_value());
    CHECK(store.stepper("missing") == 0.0);
    CHECK(store.segmented("missing") == 0);
    CHECK(store.multiSelect("missing").empty());
    CHECK_FALSE(store.presentation("missing"));
    CHECK_FALSE(store.valueText(ValueKind::Text, "missing").has_value());
}

TEST_CASE_FIXTURE(OfflineStore, "each offline set queues one action in order") {
    store.setText("notes_A", "Ant issue");
    store.setToggle("gate_A", true);
    store.setSlider("temp_A", 72.0);
    store.setPicker("pest_A", "ants");
    store.setDate("visit_A", reference_time());
    store.setStepper("traps_A", 3.5);
    store.setSegmented("rating_A", 2);
    store.setMultiSelect("areas_A", {"kitchen", "garage"});

    auto const actions = queue.snapshot();
    REQUIRE(actions.size() == 8);

    using Sync::ActionKind;
    std::vector<ActionKind> const kinds{ActionKind::TextInput,
                                        ActionKind::ToggleInput,
                                        ActionKind::SliderInput,
                                        ActionKind::PickerInput,
                                        ActionKind::DatePickerInput,
                                        ActionKind::StepperInput,
                                        ActionKind::SegmentedInput,
                                        ActionKind::MultiSelectInput};
    std::vector<std::string> const values{
        "Ant issue", "true", "72.0", "ants", "2025-09-25T08:00:00Z", "3.5", "2", "kitchen,garage"};
    for (std::size_t i = 0; i < actions.size(); ++i) {
        CAPTURE(i);
        CHECK(actions[i].kind == kinds[i]);
        CHECK(actions[i].value == std::optional<std::string>{values[i]});
        CHECK_FALSE(actions[i].entityId.has_value());
    }
    CHECK(actions[0].key == std::optional<std::string>{"notes_A"});
}

TEST_CASE_FIXTURE(OfflineStore, "repeated writes each produce an action") {
    store.setText("notes_global", "a");
    store.setText("notes_global", "ab");
    store.setText("notes_global", "abc");
    CHECK(store.text("notes_global") == "abc");
    CHECK(queue.size() == 3);
}

TEST_CASE_FIXTURE(OfflineStore, "presentation flags are never queued") {
    store.setPresentation("confirm_global", true);
    CHECK(store.presentation("confirm_global"));
    CHECK(queue.empty());
}

TEST_CASE("online writes apply locally without queueing") {
    Sync::OfflineActionQueue queue;
    Sync::ActionJournal      journal{queue, true};
    InputValueStore          store{journal};

    store.setText("notes_global", "hi");
    store.setToggle("gate_global", true);
    CHECK(store.text("notes_global") == "hi");
    CHECK(store.toggle("gate_global"));
    CHECK(queue.empty());
}

TEST_CASE_FIXTURE(OfflineStore, "kinds are stored independently") {
    store.setText("shared", "words");
    store.setToggle("shared", true);
    CHECK(store.contains(ValueKind::Text, "shared"));
    CHECK(store.contains(ValueKind::Toggle, "shared"));
    CHECK_FALSE(store.contains(ValueKind::Slider, "shared"));
    CHECK(store.valueText(ValueKind::Text, "shared") == std::optional<std::string>{"words"});
    CHECK(store.valueText(ValueKind::Toggle, "shared") == std::optional<std::string>{"true"});
}

TEST_CASE_FIXTURE(OfflineStore, "json export groups values by kind") {
    store.setText("notes_global", "hi");
    store.setSlider("temp_A", 70.5);
    store.setDate("visit_A", reference_time());

    auto const exported = store.toJson();
    CHECK(exported["text"]["notes_global"] == "hi");
    CHECK(exported["slider"]["temp_A"] == 70.5);
    CHECK(exported["date"]["visit_A"] == "2025-09-25T08:00:00Z");
    CHECK_FALSE(exported.contains("toggle"));
}

TEST_CASE_FIXTURE(OfflineStore, "subscribers see changes until they let go") {
    std::vector<StoreChange> seen;
    auto subscription = store.subscribe([&seen](StoreChange const& change) { seen.push_back(change); });
    CHECK(subscription.active());

    store.setToggle("gate_A", true);
    store.setPresentation("confirm_global", true);
    REQUIRE(seen.size() == 2);
    CHECK(seen[0].kind == ValueKind::Toggle);
    CHECK(seen[0].key == "gate_A");
    CHECK(seen[0].queued);
    CHECK(seen[1].kind == ValueKind::Presentation);
    CHECK_FALSE(seen[1].queued);

    subscription.reset();
    CHECK_FALSE(subscription.active());
    store.setToggle("gate_A", false);
    CHECK(seen.size() == 2);
}

TEST_CASE("subscriptions may outlive the store") {
    Sync::OfflineActionQueue queue;
    Sync::ActionJournal      journal{queue};
    InputValueStore::Subscription subscription;
    {
        InputValueStore store{journal};
        subscription = store.subscribe([](StoreChange const&) {});
        CHECK(subscription.active());
    }
    CHECK_FALSE(subscription.active());
    subscription.reset();
}

TEST_CASE_FIXTURE(OfflineStore, "a listener may unsubscribe itself") {
    int calls = 0;
    InputValueStore::Subscription subscription;
    subscription = store.subscribe([&](StoreChange const&) {
        ++calls;
        subscription.reset();
    });
    store.setText("a", "1");
    store.setText("a", "2");
    CHECK(calls == 1);
}

TEST_CASE_FIXTURE(OfflineStore, "a listener dropped by another listener is not called") {
    int                           firstCalls  = 0;
    int                           secondCalls = 0;
    InputValueStore::Subscription second;
    auto first = store.subscribe([&](StoreChange const&) {
        ++firstCalls;
        second.reset();
    });
    second = store.subscribe([&](StoreChange const&) { ++secondCalls; });

    store.setText("a", "1");
    CHECK(firstCalls == 1);
    CHECK(secondCalls == 0);
    CHECK_FALSE(second.active());
    CHECK(first.active());
}

TEST_CASE("queued actions carry the injected clock") {
    Testing::ManualClock     clock;
    Sync::OfflineActionQueue queue;
    Sync::ActionJournal      journal{queue, false};
    InputValueStore          store{journal, clock.fn()};

    store.setToggle("pump_on", true);
    clock.advance(std::chrono::seconds{45});
    store.setSlider("pressure", 72.0);

    auto const actions = queue.snapshot();
    REQUIRE(actions.size() == 2);
    CHECK(actions[0].timestamp == reference_time());
    CHECK(actions[1].timestamp == reference_time() + std::chrono::seconds{45});
}

} // TEST_SUITE
