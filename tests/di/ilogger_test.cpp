/**
 * @file ilogger_test.cpp
 * @brief Unit tests for ILogger interface and implementations
 */

#include <dcmx/di/ilogger.hpp>
#include <dcmx/exporter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <memory>
#include <string>

using namespace dcmx::di;
using dcmx::integration::log_level;

// =============================================================================
// Mock Logger for Testing
// =============================================================================

namespace {

/**
 * @brief Mock logger that counts log calls per level
 */
class MockLogger final : public ILogger {
public:
    MockLogger() = default;
    ~MockLogger() override = default;

    void trace(std::string_view message) override { bump(trace_count_, message); }
    void debug(std::string_view message) override { bump(debug_count_, message); }
    void info(std::string_view message) override { bump(info_count_, message); }
    void warn(std::string_view message) override { bump(warn_count_, message); }
    void error(std::string_view message) override { bump(error_count_, message); }
    void fatal(std::string_view message) override { bump(fatal_count_, message); }

    [[nodiscard]] bool is_enabled(log_level level) const noexcept override {
        return level >= enabled_level_;
    }

    [[nodiscard]] size_t trace_count() const noexcept { return trace_count_.load(); }
    [[nodiscard]] size_t debug_count() const noexcept { return debug_count_.load(); }
    [[nodiscard]] size_t info_count() const noexcept { return info_count_.load(); }
    [[nodiscard]] size_t warn_count() const noexcept { return warn_count_.load(); }
    [[nodiscard]] size_t error_count() const noexcept { return error_count_.load(); }
    [[nodiscard]] size_t fatal_count() const noexcept { return fatal_count_.load(); }

    [[nodiscard]] const std::string& last_message() const noexcept {
        return last_message_;
    }

    void set_enabled_level(log_level level) noexcept { enabled_level_ = level; }

private:
    void bump(std::atomic<size_t>& counter, std::string_view message) {
        counter.fetch_add(1, std::memory_order_relaxed);
        last_message_ = std::string(message);
    }

    std::atomic<size_t> trace_count_{0};
    std::atomic<size_t> debug_count_{0};
    std::atomic<size_t> info_count_{0};
    std::atomic<size_t> warn_count_{0};
    std::atomic<size_t> error_count_{0};
    std::atomic<size_t> fatal_count_{0};
    std::string last_message_;
    log_level enabled_level_ = log_level::trace;
};

}  // namespace

// =============================================================================
// NullLogger Tests
// =============================================================================

TEST_CASE("NullLogger is a no-op implementation", "[di][logger][null]") {
    NullLogger logger;

    SECTION("all log methods are safe to call") {
        logger.trace("trace message");
        logger.debug("debug message");
        logger.info("info message");
        logger.warn("warn message");
        logger.error("error message");
        logger.fatal("fatal message");
    }

    SECTION("is_enabled always returns false") {
        CHECK_FALSE(logger.is_enabled(log_level::trace));
        CHECK_FALSE(logger.is_enabled(log_level::info));
        CHECK_FALSE(logger.is_enabled(log_level::warn));
        CHECK_FALSE(logger.is_enabled(log_level::fatal));
    }

    SECTION("formatted logging methods are safe") {
        logger.trace_fmt("value: {}", 42);
        logger.debug_fmt("value: {}", 3.14);
        logger.info_fmt("value: {}", "test");
        logger.warn_fmt("values: {} {}", 1, 2);
        logger.error_fmt("error: {}", "failure");
    }
}

TEST_CASE("null_logger() returns singleton instance", "[di][logger][null]") {
    auto logger1 = null_logger();
    auto logger2 = null_logger();

    REQUIRE(logger1 != nullptr);
    CHECK(logger1.get() == logger2.get());
    CHECK_FALSE(logger1->is_enabled(log_level::error));
}

// =============================================================================
// LoggerService Tests
// =============================================================================

TEST_CASE("LoggerService delegates to logger_adapter", "[di][logger][service]") {
    LoggerService service;

    SECTION("log methods are safe without an initialized adapter") {
        service.trace("trace message");
        service.info("info message");
        service.warn("warn message");
        service.error("error message");
        service.fatal("fatal message");
    }

    SECTION("is_enabled follows the adapter's minimum level") {
        dcmx::integration::logger_adapter::set_min_level(log_level::error);
        CHECK_FALSE(service.is_enabled(log_level::warn));
        CHECK(service.is_enabled(log_level::error));

        dcmx::integration::logger_adapter::set_min_level(log_level::info);
        CHECK(service.is_enabled(log_level::info));
    }
}

// =============================================================================
// ILogger Formatted Logging Tests
// =============================================================================

TEST_CASE("ILogger formatted logging with MockLogger", "[di][logger][format]") {
    auto mock = std::make_shared<MockLogger>();
    ILogger* logger = mock.get();

    SECTION("trace_fmt formats and logs correctly") {
        logger->trace_fmt("value: {} and {}", 42, "test");
        CHECK(mock->trace_count() == 1);
        CHECK(mock->last_message() == "value: 42 and test");
    }

    SECTION("info_fmt formats and logs correctly") {
        logger->info_fmt("{} record(s) written", 12);
        CHECK(mock->info_count() == 1);
        CHECK(mock->last_message() == "12 record(s) written");
    }

    SECTION("error_fmt supports format specs") {
        logger->error_fmt("tag ({:04X},{:04X})", 0x7FE0, 0x0010);
        CHECK(mock->error_count() == 1);
        CHECK(mock->last_message() == "tag (7FE0,0010)");
    }

    SECTION("formatted logging respects is_enabled") {
        mock->set_enabled_level(log_level::warn);

        logger->trace_fmt("skip: {}", 1);
        logger->debug_fmt("skip: {}", 2);
        logger->info_fmt("skip: {}", 3);
        logger->warn_fmt("log: {}", 4);
        logger->error_fmt("log: {}", 5);

        CHECK(mock->trace_count() == 0);
        CHECK(mock->debug_count() == 0);
        CHECK(mock->info_count() == 0);
        CHECK(mock->warn_count() == 1);
        CHECK(mock->error_count() == 1);
        CHECK(mock->last_message() == "log: 5");
    }

    SECTION("unformatted fatal bypasses the level check") {
        mock->set_enabled_level(log_level::off);
        logger->fatal("stop");
        CHECK(mock->fatal_count() == 1);
    }
}

// =============================================================================
// Logger Injection
// =============================================================================

TEST_CASE("extract_archive() logger injection", "[di][logger][injection]") {
    dcmx::extract_options options;
    options.archive = "/nonexistent/archive.zip";

    SECTION("null logger is replaced by the default") {
        auto report = dcmx::extract_archive(options, nullptr);
        CHECK_FALSE(report.error.empty());
    }

    SECTION("custom logger receives the open failure") {
        auto mock = std::make_shared<MockLogger>();
        auto report = dcmx::extract_archive(options, mock);

        CHECK_FALSE(report.error.empty());
        CHECK(mock->error_count() == 1);
        CHECK(mock->last_message().find("Cannot open archive") != std::string::npos);
    }

    SECTION("disabled levels are filtered before formatting") {
        auto mock = std::make_shared<MockLogger>();
        mock->set_enabled_level(log_level::off);
        auto report = dcmx::extract_archive(options, mock);

        CHECK_FALSE(report.error.empty());
        CHECK(mock->error_count() == 0);
    }
}
