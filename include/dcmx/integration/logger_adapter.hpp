/**
 * @file logger_adapter.hpp
 * @brief Process-wide logging on top of logger_system
 *
 * The command-line front end configures this adapter once; library code
 * never touches it directly and logs through di::ILogger instead
 * (di::LoggerService forwards here).
 *
 * Besides regular log lines the adapter can keep a JSON-lines audit trail
 * of data export events (archives extracted, galleries written), since an
 * export copies patient data out of its container.
 */

#pragma once

#include <dcmx/compat/format.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace dcmx::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for the rotating log file and the audit trail
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::warn};

    bool enable_console{true};

    /// Write dicom_extract.log under log_directory
    bool enable_file{false};

    /// Write export_audit.json under log_directory
    bool enable_audit_log{false};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{10};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{5};

    /// Asynchronous logging; the CLI is short-lived and keeps this off
    bool async_mode{false};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

// ─────────────────────────────────────────────────────
// Logger Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @class logger_adapter
 * @brief Static facade over a kcenon::logger::logger instance
 *
 * Calls made before initialize() or after shutdown() are dropped.
 * Thread Safety: All methods are thread-safe.
 *
 * @code
 * logger_config config;
 * config.min_level = log_level::info;
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Extracting {}", archive.string());
 * logger_adapter::log_archive_extracted(archive.string(), dest.string(), 12, false);
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    /**
     * @brief Set up writers and start the logger.
     *
     * A second call while initialized is ignored.
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and stop the logger.
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(dcmx::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::trace, dcmx::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debug(dcmx::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, dcmx::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(dcmx::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, dcmx::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(dcmx::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, dcmx::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(dcmx::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, dcmx::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(dcmx::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, dcmx::compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a message at the specified level
     */
    static void log(log_level level, const std::string& message);

    /**
     * @brief Check if a log level is enabled
     * @return true if messages at this level will be logged
     */
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    static void flush();

    [[nodiscard]] static auto get_config() -> const logger_config&;

    // ─────────────────────────────────────────────────────
    // Export Audit Trail
    // ─────────────────────────────────────────────────────

    /**
     * @brief Record that records of @p archive were materialized.
     * @param records Number of DICOM records now present in @p destination
     * @param from_cache True when an earlier extraction was reused
     */
    static void log_archive_extracted(const std::string& archive,
                                      const std::string& destination,
                                      std::size_t records,
                                      bool from_cache);

    /**
     * @brief Record an archive that yielded nothing (unreadable or no DICOM).
     */
    static void log_archive_rejected(const std::string& archive,
                                     const std::string& reason);

    /**
     * @brief Record that a gallery with @p images rendered images was written.
     */
    static void log_gallery_exported(const std::string& export_dir,
                                     std::size_t images);

private:
    struct audit_event;
    static void append_audit(const audit_event& event);

    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace dcmx::integration
