#include "unit/TechScreenTestHelper.hpp"

#include <doctest/doctest.h>

#include <techscreen/runtime/ProgressionTicker.hpp>

#include <chrono>
#include <memory>

using namespace TS;
using namespace TS::Runtime;
using namespace std::chrono_literals;
using TS::Testing::make_route;
using TS::Testing::ManualClock;

namespace {

struct ProgressionFixture {
    ManualClock              clock;
    Sync::OfflineActionQueue queue;
    Sync::ActionJournal      journal{queue, false};
    Route::RouteController   route{make_route(), journal, clock.fn()};
};

} // namespace

TEST_SUITE("techscreen.runtime.progression") {

TEST_CASE_FIXTURE(ProgressionFixture, "the ticker starts, dwells, then completes") {
    ProgressionOptions options{};
    options.dwell = 10s;
    ProgressionTicker ticker{route, options};

    CHECK(ticker.tick(clock.now).value() == ProgressionStep::Started);
    CHECK(route.findJob("A")->status == Route::JobStatus::InProgress);

    CHECK(ticker.tick(clock.advance(10s)).value() == ProgressionStep::Waiting);
    CHECK(ticker.tick(clock.advance(1s)).value() == ProgressionStep::Completed);
    auto const* done = route.findJob("A");
    CHECK(done->status == Route::JobStatus::Completed);
    CHECK(done->signature == std::optional<std::string>{"Demo Signature Data"});

    CHECK(ticker.tick(clock.now).value() == ProgressionStep::Started);
    CHECK(route.findJob("B")->status == Route::JobStatus::InProgress);
}

TEST_CASE_FIXTURE(ProgressionFixture, "the ticker finishes once nothing is left") {
    REQUIRE(route.requestSkip("A").has_value());
    REQUIRE(route.commit(Route::ReasonCode::Other).has_value());
    REQUIRE(route.requestSkip("B").has_value());
    REQUIRE(route.commit(Route::ReasonCode::Other).has_value());
    REQUIRE(route.requestSkip("C").has_value());
    REQUIRE(route.commit(Route::ReasonCode::Other).has_value());

    ProgressionTicker ticker{route};
    CHECK(ticker.tick(clock.now).value() == ProgressionStep::Finished);
    CHECK(progression_step_name(ProgressionStep::Finished) == "finished");
}

TEST_CASE_FIXTURE(ProgressionFixture, "a session drives the whole route on the poll loop") {
    ProgressionOptions options{};
    options.first_delay = 3s;
    options.interval    = 5s;
    options.dwell       = 7s;

    PollLoop           loop;
    ProgressionSession session{loop, route, clock.now, options};
    CHECK(session.active());

    CHECK(loop.runOnce(clock.advance(1s)) == 1);
    CHECK(session.ticks() == 0);

    for (int i = 0; i < 100 && session.active(); ++i) {
        (void)loop.runOnce(clock.advance(1s));
    }
    CHECK_FALSE(session.active());
    CHECK_FALSE(session.lastError().has_value());
    CHECK(route.completedJobsCount() == 3);

    // one start and one complete per job
    auto const actions = queue.snapshot();
    CHECK(actions.size() == 6);
}

TEST_CASE_FIXTURE(ProgressionFixture, "destroying the session stops further progress") {
    PollLoop loop;
    auto     session = std::make_unique<ProgressionSession>(loop, route, clock.now);
    (void)loop.runOnce(clock.advance(3s));
    CHECK(route.findJob("A")->status == Route::JobStatus::InProgress);

    session.reset();
    CHECK(loop.size() == 0);
    (void)loop.runOnce(clock.advance(600s));
    CHECK(route.findJob("A")->status == Route::JobStatus::InProgress);
    CHECK(route.completedJobsCount() == 0);
}

TEST_CASE_FIXTURE(ProgressionFixture, "stop is idempotent") {
    PollLoop           loop;
    ProgressionSession session{loop, route, clock.now};
    session.stop();
    session.stop();
    CHECK_FALSE(session.active());
    CHECK(loop.runOnce(clock.advance(10s)) == 0);
}

} // TEST_SUITE
