#pragma once

#include <cstdint>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace libseries {
namespace utils {

/**
 * @brief Leveled logging and timing for series evaluation
 *
 * A Tracer is an ordinary object handed to whoever should log; there is no
 * process-wide log switch. Components that accept a `const Tracer *` stay
 * silent when given nullptr.
 *
 * Provides:
 * - Log levels (trace, debug, info, warn, error, none)
 * - Timestamped output with file/line info
 * - Performance timing measurements
 * - Construction from the LIBSERIES_LOG_LEVEL environment variable
 *
 * Example usage:
 *   auto tracer = Tracer::FromEnvironment();
 *   LIBSERIES_DEBUG(&tracer, "Radius estimate " << r);
 *   LIBSERIES_TIMING_START(&tracer);
 *   // ... do work ...
 *   LIBSERIES_TIMING_END(&tracer, "Some operation");
 */

enum class LogLevel { TRACE = 0, DBG = 1, INFO = 2, WARN = 3, ERR = 4, NONE = 5 };

class Tracer {
public:
	/**
	 * @brief Create a tracer writing to std::cerr
	 *
	 * @param level Minimum level to output
	 */
	explicit Tracer(LogLevel level = DefaultLevel());

	/**
	 * @brief Create a tracer writing to an arbitrary stream
	 *
	 * The stream must outlive the tracer.
	 */
	Tracer(LogLevel level, std::ostream &sink);

	/**
	 * @brief Create a tracer configured from LIBSERIES_LOG_LEVEL
	 *
	 * Values: trace, debug, info, warn, error, none (case-insensitive).
	 * Unset or unrecognized values fall back to DefaultLevel().
	 */
	static Tracer FromEnvironment();

	/**
	 * @brief Parse a level name
	 *
	 * @param name Level name, case-insensitive
	 * @param level Receives the parsed level
	 * @return false if the name is not recognized
	 */
	static bool ParseLevel(const std::string &name, LogLevel &level);

	/// WARN in release builds, INFO in debug builds
	static LogLevel DefaultLevel();

	void SetLogLevel(LogLevel level) {
		level_ = level;
	}

	LogLevel GetLogLevel() const {
		return level_;
	}

	bool ShouldLog(LogLevel level) const {
		return level != LogLevel::NONE && level >= level_;
	}

	/**
	 * @brief Log a message with location information
	 */
	void Log(LogLevel level, const std::string &file, int line, const std::string &message) const;

	/**
	 * @brief Log a message without location information
	 */
	void LogDirect(LogLevel level, const std::string &message) const;

	static std::string GetLevelName(LogLevel level);

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
	double TimingEnd(uint64_t handle, const std::string &operation_name) const;

	Tracer(const Tracer &other);
	Tracer &operator=(const Tracer &other);

private:
	LogLevel level_;
	std::ostream *sink_;
	mutable std::mutex mutex_;
};

// ============================================================================
// Convenience Macros for Logging
// ============================================================================

/**
 * @brief Log through a (possibly null) tracer pointer with stream syntax
 *
 * The message expression is only evaluated when the level is enabled.
 * Usage: LIBSERIES_LOG(tracer, libseries::utils::LogLevel::INFO, "x = " << x)
 */
#define LIBSERIES_LOG(tracer, level, msg)                                                                              \
	do {                                                                                                               \
		const libseries::utils::Tracer *libseries_tracer_ = (tracer);                                                  \
		if (libseries_tracer_ != nullptr && libseries_tracer_->ShouldLog(level)) {                                     \
			std::ostringstream oss;                                                                                    \
			oss << msg;                                                                                                \
			libseries_tracer_->Log(level, __FILE__, __LINE__, oss.str());                                              \
		}                                                                                                              \
	} while (0)

#define LIBSERIES_TRACE(tracer, msg) LIBSERIES_LOG(tracer, libseries::utils::LogLevel::TRACE, msg)
#define LIBSERIES_DEBUG(tracer, msg) LIBSERIES_LOG(tracer, libseries::utils::LogLevel::DBG, msg)
#define LIBSERIES_INFO(tracer, msg)  LIBSERIES_LOG(tracer, libseries::utils::LogLevel::INFO, msg)
#define LIBSERIES_WARN(tracer, msg)  LIBSERIES_LOG(tracer, libseries::utils::LogLevel::WARN, msg)
#define LIBSERIES_ERROR(tracer, msg) LIBSERIES_LOG(tracer, libseries::utils::LogLevel::ERR, msg)

/**
 * @brief Macros for timing operations
 *
 * Usage:
 *   LIBSERIES_TIMING_START(tracer);
 *   // ... do work ...
 *   LIBSERIES_TIMING_END(tracer, "Operation name");
 */
#define LIBSERIES_TIMING_START(tracer)                                                                                 \
	const uint64_t libseries_timing_handle_ = libseries::utils::Tracer::TimingStart()

#define LIBSERIES_TIMING_END(tracer, operation_name)                                                                   \
	do {                                                                                                               \
		const libseries::utils::Tracer *libseries_tracer_ = (tracer);                                                  \
		if (libseries_tracer_ != nullptr) {                                                                            \
			libseries_tracer_->TimingEnd(libseries_timing_handle_, operation_name);                                    \
		}                                                                                                              \
	} while (0)

} // namespace utils
} // namespace libseries
