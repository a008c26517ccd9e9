/**
 * @file logger_adapter.cpp
 * @brief Implementation of the logger_system adapter and export audit trail
 */

#include <dcmx/integration/logger_adapter.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <array>
#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <mutex>
#include <string_view>
#include <utility>
#include <vector>

namespace dcmx::integration {

namespace {

constexpr const char* kLogFileName = "dicom_extract.log";
constexpr const char* kAuditFileName = "export_audit.json";

auto to_logger_level(log_level level) -> kcenon::logger::log_level {
    switch (level) {
        case log_level::trace: return kcenon::logger::log_level::trace;
        case log_level::debug: return kcenon::logger::log_level::debug;
        case log_level::info:  return kcenon::logger::log_level::info;
        case log_level::warn:  return kcenon::logger::log_level::warn;
        case log_level::error: return kcenon::logger::log_level::error;
        case log_level::fatal: return kcenon::logger::log_level::fatal;
        case log_level::off:   break;
    }
    return kcenon::logger::log_level::off;
}

/// UTC timestamp with millisecond precision, e.g. 2024-03-01T12:00:00.250Z
auto utc_timestamp() -> std::string {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    std::array<char, 32> buffer{};
    const auto length = std::strftime(buffer.data(), buffer.size(), "%Y-%m-%dT%H:%M:%S", &utc);
    return dcmx::compat::format("{}.{:03}Z", std::string_view{buffer.data(), length}, millis);
}

void append_json_string(std::string& out, std::string_view value) {
    out += '"';
    for (const char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += dcmx::compat::format("\\u{:04x}", static_cast<int>(c));
                } else {
                    out += c;
                }
                break;
        }
    }
    out += '"';
}

}  // namespace

// =============================================================================
// Audit Events
// =============================================================================

/**
 * @brief One line of the export audit trail.
 *
 * Fields are written in insertion order after timestamp, event_type and
 * outcome.
 */
struct logger_adapter::audit_event {
    std::string_view event_type;
    bool success{true};
    std::vector<std::pair<std::string_view, std::string>> fields;

    [[nodiscard]] auto to_json_line() const -> std::string {
        std::string line = "{\"timestamp\":";
        append_json_string(line, utc_timestamp());
        line += ",\"event_type\":";
        append_json_string(line, event_type);
        line += ",\"outcome\":";
        append_json_string(line, success ? "success" : "failure");
        for (const auto& [key, value] : fields) {
            line += ',';
            append_json_string(line, key);
            line += ':';
            append_json_string(line, value);
        }
        line += "}\n";
        return line;
    }
};

// =============================================================================
// Implementation Class
// =============================================================================

class logger_adapter::impl {
public:
    impl() = default;
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard lock(mutex_);

        if (initialized_) {
            return;
        }

        config_ = config;
        min_level_.store(config.min_level);

        if (config_.enable_file || config_.enable_audit_log) {
            std::error_code ec;
            std::filesystem::create_directories(config_.log_directory, ec);
            if (ec) {
                // Console output only
                config_.enable_file = false;
                config_.enable_audit_log = false;
            }
        }

        logger_ = std::make_unique<kcenon::logger::logger>(config_.async_mode,
                                                           config_.buffer_size);
        logger_->set_min_level(to_logger_level(config_.min_level));

        if (config_.enable_console) {
            logger_->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }
        if (config_.enable_file) {
            logger_->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
                (config_.log_directory / kLogFileName).string(),
                config_.max_file_size_mb * 1024 * 1024, config_.max_files));
        }
        logger_->start();

        if (config_.enable_audit_log) {
            std::lock_guard audit_lock(audit_mutex_);
            audit_stream_.open(config_.log_directory / kAuditFileName, std::ios::app);
        }

        initialized_ = true;
    }

    void shutdown() {
        std::lock_guard lock(mutex_);

        if (!initialized_) {
            return;
        }

        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
        {
            std::lock_guard audit_lock(audit_mutex_);
            if (audit_stream_.is_open()) {
                audit_stream_.close();
            }
        }

        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const noexcept -> bool { return initialized_.load(); }

    void log(log_level level, const std::string& message) {
        if (!initialized_ || !logger_ || !is_level_enabled(level)) {
            return;
        }
        logger_->log(to_logger_level(level), message);
    }

    [[nodiscard]] auto is_level_enabled(log_level level) const noexcept -> bool {
        return level != log_level::off &&
               static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void flush() {
        if (logger_) {
            logger_->flush();
        }
        std::lock_guard audit_lock(audit_mutex_);
        if (audit_stream_.is_open()) {
            audit_stream_.flush();
        }
    }

    void set_min_level(log_level level) {
        min_level_.store(level);
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
    }

    [[nodiscard]] auto get_min_level() const noexcept -> log_level { return min_level_.load(); }

    [[nodiscard]] auto get_config() const -> const logger_config& { return config_; }

    void append_audit(const audit_event& event) {
        if (!initialized_) {
            return;
        }

        const auto line = event.to_json_line();

        std::lock_guard audit_lock(audit_mutex_);
        if (!audit_stream_.is_open()) {
            return;
        }
        audit_stream_ << line;
        audit_stream_.flush();
    }

private:
    std::mutex mutex_;
    std::mutex audit_mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<log_level> min_level_{log_level::warn};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> logger_;
    std::ofstream audit_stream_;
};

// =============================================================================
// Static Member Initialization
// =============================================================================

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

// =============================================================================
// Initialization
// =============================================================================

void logger_adapter::initialize(const logger_config& config) { pimpl_->initialize(config); }

void logger_adapter::shutdown() { pimpl_->shutdown(); }

auto logger_adapter::is_initialized() noexcept -> bool { return pimpl_->is_initialized(); }

// =============================================================================
// Standard Logging
// =============================================================================

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->is_level_enabled(level);
}

void logger_adapter::set_min_level(log_level level) { pimpl_->set_min_level(level); }

auto logger_adapter::get_min_level() noexcept -> log_level { return pimpl_->get_min_level(); }

void logger_adapter::flush() { pimpl_->flush(); }

auto logger_adapter::get_config() -> const logger_config& { return pimpl_->get_config(); }

// =============================================================================
// Export Audit Trail
// =============================================================================

void logger_adapter::log_archive_extracted(const std::string& archive,
                                           const std::string& destination,
                                           std::size_t records,
                                           bool from_cache) {
    info("Archive {} -> {}: {} record(s){}", archive, destination, records,
         from_cache ? " (cached)" : "");
    append_audit({"ARCHIVE_EXTRACTED",
                  true,
                  {{"archive", archive},
                   {"destination", destination},
                   {"records", std::to_string(records)},
                   {"cached", from_cache ? "true" : "false"}}});
}

void logger_adapter::log_archive_rejected(const std::string& archive,
                                          const std::string& reason) {
    warn("Archive {} rejected: {}", archive, reason);
    append_audit({"ARCHIVE_EXTRACTED", false, {{"archive", archive}, {"reason", reason}}});
}

void logger_adapter::log_gallery_exported(const std::string& export_dir, std::size_t images) {
    info("Gallery written to {} ({} image(s))", export_dir, images);
    append_audit({"GALLERY_EXPORTED",
                  true,
                  {{"export_dir", export_dir}, {"images", std::to_string(images)}}});
}

void logger_adapter::append_audit(const audit_event& event) { pimpl_->append_audit(event); }

}  // namespace dcmx::integration
