#include <doctest/doctest.h>

#ifdef CS_LOG_DEBUG
#include "log/TaggedLogger.hpp"

#include <chrono>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

auto captureStderr(std::function<void()> fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

// Destroying the logger joins its worker, so every queued line is written before capture ends.
auto logOnce(std::function<void(CS::TaggedLogger&)> fn) -> std::string {
    return captureStderr([&fn] {
        CS::TaggedLogger logger;
        fn(logger);
    });
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("messages carry their tags and location") {
    auto output = logOnce([](CS::TaggedLogger& logger) {
        logger.log_impl("hello log", std::source_location::current(), "Composition");
    });

    CHECK(output.find("[Composition]") != std::string::npos);
    CHECK(output.find("hello log") != std::string::npos);
    CHECK(output.find("log/test_TaggedLogger.cpp:") != std::string::npos);
    CHECK(output.find("[Thread 0]") != std::string::npos);
}

TEST_CASE("chatty tags are skipped") {
    auto output = logOnce([](CS::TaggedLogger& logger) {
        logger.log_impl("per read", std::source_location::current(), "Tracker");
        logger.log_impl("per slot", std::source_location::current(), "Slot", "Composer");
    });
    CHECK(output.empty());
}

TEST_CASE("thread names appear in output") {
    auto output = logOnce([](CS::TaggedLogger& logger) {
        logger.setThreadName("Hydrator");
        logger.log_impl("with name", std::source_location::current(), "Hydration");
    });
    CHECK(output.find("[Hydrator]") != std::string::npos);
}

TEST_CASE("disabled loggers drop messages") {
    auto output = logOnce([](CS::TaggedLogger& logger) {
        logger.setLoggingEnabled(false);
        logger.log_impl("dropped", std::source_location::current(), "Scheduler");
        logger.setLoggingEnabled(true);
        logger.log_impl("kept", std::source_location::current(), "Scheduler");
    });
    CHECK(output.find("dropped") == std::string::npos);
    CHECK(output.find("kept") != std::string::npos);
}

TEST_CASE("messages from other threads get numbered names") {
    auto output = logOnce([](CS::TaggedLogger& logger) {
        logger.log_impl("main", std::source_location::current(), "Main");
        std::thread worker([&logger] { logger.log_impl("worker", std::source_location::current(), "Worker"); });
        worker.join();
    });
    CHECK(output.find("[Thread 0]") != std::string::npos);
    CHECK(output.find("[Thread 1]") != std::string::npos);
}

}

#endif // CS_LOG_DEBUG
