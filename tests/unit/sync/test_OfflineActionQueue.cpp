#include "unit/TechScreenTestHelper.hpp"

#include <doctest/doctest.h>

#include <techscreen/sync/OfflineActionQueue.hpp>

#include <string>

using namespace TS;
using namespace TS::Sync;
using TS::Testing::reference_time;

namespace {

auto text_action(std::string key, std::string value) -> PendingAction {
    return PendingAction{.kind      = ActionKind::TextInput,
                         .entityId  = std::nullopt,
                         .key       = std::move(key),
                         .value     = std::move(value),
                         .reason    = std::nullopt,
                         .timestamp = reference_time()};
}

} // namespace

TEST_SUITE("techscreen.sync.queue") {

TEST_CASE("drain returns everything in insertion order and empties the queue") {
    OfflineActionQueue queue;
    queue.enqueue(text_action("a", "1"));
    queue.enqueue(text_action("b", "2"));
    queue.enqueue(text_action("a", "3"));
    CHECK(queue.size() == 3);

    auto drained = queue.drain();
    REQUIRE(drained.size() == 3);
    CHECK(drained[0].value == std::optional<std::string>{"1"});
    CHECK(drained[2].value == std::optional<std::string>{"3"});
    CHECK(queue.empty());
    CHECK(queue.drain().empty());
}

TEST_CASE("restored actions go ahead of newer ones") {
    OfflineActionQueue queue;
    queue.enqueue(text_action("a", "1"));
    queue.enqueue(text_action("a", "2"));
    auto drained = queue.drain();

    queue.enqueue(text_action("a", "3"));
    queue.restoreFront(drained);

    auto const all = queue.snapshot();
    REQUIRE(all.size() == 3);
    CHECK(all[0] == drained[0]);
    CHECK(all[1] == drained[1]);
    CHECK(all[2].value == std::optional<std::string>{"3"});
}

TEST_CASE("the journal queues only while offline") {
    OfflineActionQueue queue;
    ActionJournal      journal{queue};
    CHECK(journal.isOnline());
    CHECK_FALSE(journal.record(text_action("a", "1")));
    CHECK(queue.empty());

    CHECK_FALSE(journal.setOnline(false));
    CHECK(journal.record(text_action("a", "2")));
    CHECK(journal.queue().size() == 1);

    CHECK(journal.setOnline(true));
    CHECK_FALSE(journal.setOnline(true));
}

TEST_CASE("actions encode for the wire") {
    auto action     = text_action("notes_A", "Ant issue");
    action.entityId = "A";
    auto const encoded = EncodePendingAction(action);
    CHECK(encoded["type"] == "textInput");
    CHECK(encoded["jobId"] == "A");
    CHECK(encoded["valueKey"] == "notes_A");
    CHECK(encoded["value"] == "Ant issue");
    CHECK(encoded["timestamp"] == "2025-09-25T08:00:00Z");
    CHECK_FALSE(encoded.contains("reason"));

    CHECK(describe_action(action) == "PendingAction(type: textInput, jobId: A, key: notes_A, value: Ant issue)");

    action.entityId.reset();
    action.value.reset();
    CHECK(describe_action(action) == "PendingAction(type: textInput, jobId: -, key: notes_A, value: -)");
}

TEST_CASE("value formatting") {
    CHECK(format_number(72.0) == "72.0");
    CHECK(format_number(0.25) == "0.25");
    CHECK(format_number(-3.0) == "-3.0");
    CHECK(format_flag(false) == "false");
    CHECK(join_selection({}) == "");
    CHECK(join_selection({"a"}) == "a");
    CHECK(join_selection({"a", "b", "c"}) == "a,b,c");
    CHECK(is_input_action(ActionKind::SliderInput));
    CHECK_FALSE(is_input_action(ActionKind::Skip));
}

} // TEST_SUITE
