#include <doctest/doctest.h>

#include <techscreen/log/TaggedLogger.hpp>

#ifdef TS_LOG_DEBUG

#include <functional>
#include <iostream>
#include <source_location>
#include <sstream>
#include <string>

namespace {

auto captureStderr(std::function<void()> fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

} // namespace

TEST_SUITE("techscreen.log") {

TEST_CASE("disabled logger drops messages") {
    auto output = captureStderr([] {
        TS::TaggedLogger logger;
        logger.log_impl("should not appear", std::source_location::current(), "Sync");
        logger.flush();
    });
    CHECK(output.empty());
}

TEST_CASE("enabled logger writes tags, thread and message") {
    auto output = captureStderr([] {
        TS::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setThreadName("Field-1");
        logger.log_impl("queued start", std::source_location::current(), "Queue", "INFO");
        logger.flush();
    });
    CHECK(output.find("[INFO][Queue]") != std::string::npos);
    CHECK(output.find("[Field-1]") != std::string::npos);
    CHECK(output.find("queued start") != std::string::npos);
}

TEST_CASE("resolver chatter is skipped by default") {
    auto output = captureStderr([] {
        TS::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("placeholder", std::source_location::current(), "Resolver");
        logger.flush();
    });
    CHECK(output.empty());
}

TEST_CASE("an explicit tag list gates output and clears the skip list") {
    auto output = captureStderr([] {
        TS::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setEnabledTags("Resolver,,Sync");
        logger.log_impl("kept resolver", std::source_location::current(), "Resolver");
        logger.log_impl("kept sync", std::source_location::current(), "Sync");
        logger.log_impl("dropped store", std::source_location::current(), "Store");
        logger.flush();
    });
    CHECK(output.find("kept resolver") != std::string::npos);
    CHECK(output.find("kept sync") != std::string::npos);
    CHECK(output.find("dropped store") == std::string::npos);
}

TEST_CASE("source location is shortened to its parent directory") {
    auto output = captureStderr([] {
        TS::TaggedLogger logger;
        logger.setLoggingEnabled(true);
#line 42 "dir/route/RouteLogChild.cpp"
        logger.log_impl("has parent", std::source_location::current(), "Lifecycle");
#line 82 "tests/unit/log/test_TaggedLogger.cpp"
        logger.flush();
    });
    CHECK(output.find("route/RouteLogChild.cpp:42") != std::string::npos);
}

} // TEST_SUITE

#endif // TS_LOG_DEBUG
