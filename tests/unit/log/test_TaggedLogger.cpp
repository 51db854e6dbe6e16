#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"

#ifdef DS_LOG_DEBUG

#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

namespace {

class EnvGuard {
public:
    EnvGuard(std::string key, const char* value) : key(std::move(key)) {
        if (const char* existing = std::getenv(this->key.c_str())) {
            original = std::string(existing);
        }
        if (value) {
            setenv(this->key.c_str(), value, 1);
        } else {
            unsetenv(this->key.c_str());
        }
    }

    EnvGuard(const EnvGuard&)            = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

    ~EnvGuard() {
        if (original) {
            setenv(key.c_str(), original->c_str(), 1);
        } else {
            unsetenv(key.c_str());
        }
    }

private:
    std::string                key;
    std::optional<std::string> original;
};

// Clears every DATASPEC_LOG* variable for the lifetime of a test.
class CleanLogEnvironment {
public:
    CleanLogEnvironment()
        : enabled("DATASPEC_LOG_ENABLED", nullptr),
          log("DATASPEC_LOG", nullptr),
          clearSkips("DATASPEC_LOG_CLEAR_DEFAULT_SKIPS", nullptr),
          enableTags("DATASPEC_LOG_ENABLE_TAGS", nullptr),
          skipTags("DATASPEC_LOG_SKIP_TAGS", nullptr) {}

private:
    EnvGuard enabled;
    EnvGuard log;
    EnvGuard clearSkips;
    EnvGuard enableTags;
    EnvGuard skipTags;
};

auto captureStderr(std::function<void()> fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

void waitForFlush() {
    std::this_thread::sleep_for(20ms);
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("logging_disabled_by_default_drops_messages") {
    CleanLogEnvironment env;

    auto output = captureStderr([] {
        DS::TaggedLogger logger;
        logger.log_impl("should not appear", std::source_location::current(), "Attribute");
        waitForFlush();
    });

    CHECK(output.empty());
}

TEST_CASE("environment_flag_enables_logging") {
    CleanLogEnvironment env;
    EnvGuard            enableLog("DATASPEC_LOG_ENABLED", "1");

    auto output = captureStderr([] {
        DS::TaggedLogger logger;
        logger.log_impl("rejected value", std::source_location::current(), "Attribute");
        waitForFlush();
    });

    CHECK(output.find("[Attribute]") != std::string::npos);
    CHECK(output.find("rejected value") != std::string::npos);
    CHECK(output.find("Thread 0") != std::string::npos);
}

TEST_CASE("DATASPEC_LOG_zero_keeps_logging_off") {
    CleanLogEnvironment env;
    EnvGuard            enableLog("DATASPEC_LOG", "0");

    auto output = captureStderr([] {
        DS::TaggedLogger logger;
        logger.log_impl("quiet", std::source_location::current(), "Spec");
        waitForFlush();
    });

    CHECK(output.empty());
}

TEST_CASE("default_skip_list_and_clearing_it") {
    CleanLogEnvironment env;
    EnvGuard            enableLog("DATASPEC_LOG", "on");

    auto skipped = captureStderr([] {
        DS::TaggedLogger logger;
        logger.log_impl("filtered", std::source_location::current(), "INFO");
        waitForFlush();
    });
    CHECK(skipped.empty());

    EnvGuard clearSkips("DATASPEC_LOG_CLEAR_DEFAULT_SKIPS", "1");
    auto     allowed = captureStderr([] {
        DS::TaggedLogger logger;
        logger.log_impl("info allowed", std::source_location::current(), "INFO");
        waitForFlush();
    });
    CHECK(allowed.find("info allowed") != std::string::npos);
}

TEST_CASE("enabled_tags_gate_output") {
    CleanLogEnvironment env;
    EnvGuard            enableLog("DATASPEC_LOG_ENABLED", "1");
    EnvGuard            enableTags("DATASPEC_LOG_ENABLE_TAGS", "ElementSet");

    auto accepted = captureStderr([] {
        DS::TaggedLogger logger;
        logger.log_impl("keep me", std::source_location::current(), "ElementSet");
        waitForFlush();
    });
    CHECK(accepted.find("keep me") != std::string::npos);

    auto rejected = captureStderr([] {
        DS::TaggedLogger logger;
        logger.log_impl("drop me", std::source_location::current(), "ElementSet", "Operation");
        waitForFlush();
    });
    CHECK(rejected.empty());
}

TEST_CASE("skip_tag_parsing_trims_tokens") {
    CleanLogEnvironment env;
    EnvGuard            enableLog("DATASPEC_LOG_ENABLED", "1");
    EnvGuard            extraSkip("DATASPEC_LOG_SKIP_TAGS", " Spec , Operation ");

    auto skipped = captureStderr([] {
        DS::TaggedLogger logger;
        logger.log_impl("first", std::source_location::current(), "Operation");
        waitForFlush();
    });
    CHECK(skipped.empty());

    auto kept = captureStderr([] {
        DS::TaggedLogger logger;
        logger.log_impl("second", std::source_location::current(), "Attribute");
        waitForFlush();
    });
    CHECK(kept.find("second") != std::string::npos);
}

TEST_CASE("thread_name_and_short_path_in_output") {
    CleanLogEnvironment env;
    EnvGuard            enableLog("DATASPEC_LOG_ENABLED", "1");

    auto output = captureStderr([] {
        DS::TaggedLogger logger;
        logger.setThreadName("Validator-2");
#line 42 "dir/subdir/TaggedLoggerChild.cpp"
        logger.log_impl("has parent", std::source_location::current(), "Solo");
#line 220 "tests/unit/log/test_TaggedLogger.cpp"
        waitForFlush();
    });

    CHECK(output.find("[Validator-2]") != std::string::npos);
    CHECK(output.find("subdir/TaggedLoggerChild.cpp:42") != std::string::npos);
}

TEST_CASE("set_logging_enabled_overrides_env") {
    CleanLogEnvironment env;
    EnvGuard            enableLog("DATASPEC_LOG_ENABLED", "1");

    auto suppressed = captureStderr([] {
        DS::TaggedLogger logger;
        logger.setLoggingEnabled(false);
        logger.log_impl("disabled", std::source_location::current(), "Test");
        waitForFlush();
    });
    CHECK(suppressed.empty());
}

TEST_CASE("macro_emits_joined_tags") {
    CleanLogEnvironment env;

    auto output = captureStderr([] {
        DS::set_thread_name("WrapperThread");
        DS::set_logging_enabled(true);
        ds_log("via macro", "Alpha", "Beta");
        waitForFlush();
        DS::set_logging_enabled(false);
    });

    CHECK(output.find("[Alpha][Beta]") != std::string::npos);
    CHECK(output.find("[WrapperThread]") != std::string::npos);
}

} // TEST_SUITE

#endif // DS_LOG_DEBUG
