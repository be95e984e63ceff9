#pragma once

#include <cstdint>
#include <string>
#include <sstream>

namespace libinfstat {
namespace utils {

/**
 * @brief Configurable tracing and logging utilities
 *
 * Provides:
 * - Configurable log levels (trace, debug, info, warn, error)
 * - Structured logging with timestamps and file/line info
 * - Performance timing measurements
 * - Environment variable control
 * - Thread-safe output
 *
 * Control via environment variable: INFSTAT_LOG_LEVEL
 * Values: trace, debug, info, warn, error, none
 *
 * Example usage:
 *   INFSTAT_DEBUG("Fitting " << rows << " rows");
 *   INFSTAT_TIMING_START();
 *   // ... do work ...
 *   INFSTAT_TIMING_END("Some operation");
 */

enum class LogLevel { TRACE = 0, DBG = 1, INFO = 2, WARN = 3, ERR = 4, NONE = 5 };

class Tracer {
public:
	/**
	 * @brief Initialize tracing system
	 *
	 * Reads INFSTAT_LOG_LEVEL environment variable
	 */
	static void Initialize();

	/**
	 * @brief Set global log level
	 *
	 * @param level Minimum level to output
	 */
	static void SetLogLevel(LogLevel level);

	static LogLevel GetLogLevel();

	/**
	 * @brief Check if a message at given level should be logged
	 */
	static bool ShouldLog(LogLevel level);

	/**
	 * @brief Log a message with location information
	 *
	 * @param level Message level
	 * @param file Source file name
	 * @param line Source line number
	 * @param message Message content
	 */
	static void Log(LogLevel level, const std::string &file, int line, const std::string &message);

	/**
	 * @brief Log a message without location information
	 */
	static void LogDirect(LogLevel level, const std::string &message);

	static std::string GetLevelName(LogLevel level);

	/**
	 * @brief Parse a level name (case-insensitive)
	 *
	 * @param name One of trace, debug, info, warn, error, none
	 * @param fallback Level returned for unrecognized names
	 */
	static LogLevel ParseLevel(const std::string &name, LogLevel fallback);

	static std::string GetTimestamp();

	/**
	 * @brief Start a timed operation
	 *
	 * @return Opaque handle for timing
	 */
	static uint64_t TimingStart();

	/**
	 * @brief End a timed operation and log duration at debug level
	 *
	 * @param handle Handle from TimingStart()
	 * @param operation_name Human-readable operation name
	 * @return Duration in milliseconds
	 */
	static double TimingEnd(uint64_t handle, const std::string &operation_name);

private:
	static LogLevel DefaultLevel();

	Tracer() = delete;
	~Tracer() = delete;
};

// ============================================================================
// Convenience Macros for Logging
// ============================================================================

#define INFSTAT_LOG_AT(level, msg)                                                                                     \
	do {                                                                                                               \
		if (::libinfstat::utils::Tracer::ShouldLog(level)) {                                                           \
			std::ostringstream infstat_oss;                                                                            \
			infstat_oss << msg;                                                                                        \
			::libinfstat::utils::Tracer::Log(level, __FILE__, __LINE__, infstat_oss.str());                           \
		}                                                                                                              \
	} while (0)

/**
 * @brief Macro for trace-level logging with stream syntax
 *
 * Usage: INFSTAT_TRACE(message << stream << contents)
 */
#define INFSTAT_TRACE(msg) INFSTAT_LOG_AT(::libinfstat::utils::LogLevel::TRACE, msg)

#define INFSTAT_DEBUG(msg) INFSTAT_LOG_AT(::libinfstat::utils::LogLevel::DBG, msg)

#define INFSTAT_INFO(msg) INFSTAT_LOG_AT(::libinfstat::utils::LogLevel::INFO, msg)

#define INFSTAT_WARN(msg) INFSTAT_LOG_AT(::libinfstat::utils::LogLevel::WARN, msg)

#define INFSTAT_ERROR(msg) INFSTAT_LOG_AT(::libinfstat::utils::LogLevel::ERR, msg)

/**
 * @brief Macro for timing operations
 *
 * Usage:
 *   INFSTAT_TIMING_START();
 *   // ... do work ...
 *   INFSTAT_TIMING_END("Operation name");
 */
#define INFSTAT_TIMING_START() uint64_t infstat_timing_handle = ::libinfstat::utils::Tracer::TimingStart()

#define INFSTAT_TIMING_END(operation_name) ::libinfstat::utils::Tracer::TimingEnd(infstat_timing_handle, operation_name)

} // namespace utils
} // namespace libinfstat
