#include "libseries/utils/tracing.hpp"

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>

namespace libseries {
namespace utils {

Tracer::Tracer(LogLevel level) : level_(level), sink_(&std::cerr) {
}

Tracer::Tracer(LogLevel level, std::ostream &sink) : level_(level), sink_(&sink) {
}

Tracer::Tracer(const Tracer &other) : level_(other.level_), sink_(other.sink_) {
}

Tracer &Tracer::operator=(const Tracer &other) {
	if (this != &other) {
		level_ = other.level_;
		sink_ = other.sink_;
	}
	return *this;
}

LogLevel Tracer::DefaultLevel() {
#ifdef NDEBUG
	return LogLevel::WARN;
#else
	return LogLevel::INFO;
#endif
}

bool Tracer::ParseLevel(const std::string &name, LogLevel &level) {
	std::string level_str = name;

	// Convert to lowercase for comparison
	for (auto &c : level_str) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}

	if (level_str == "trace") {
		level = LogLevel::TRACE;
	} else if (level_str == "debug") {
		level = LogLevel::DBG;
	} else if (level_str == "info") {
		level = LogLevel::INFO;
	} else if (level_str == "warn") {
		level = LogLevel::WARN;
	} else if (level_str == "error") {
		level = LogLevel::ERR;
	} else if (level_str == "none") {
		level = LogLevel::NONE;
	} else {
		return false;
	}
	return true;
}

Tracer Tracer::FromEnvironment() {
	LogLevel level = DefaultLevel();
	const char *env_level = std::getenv("LIBSERIES_LOG_LEVEL");
	if (env_level != nullptr && !ParseLevel(env_level, level)) {
		level = DefaultLevel();
	}
	return Tracer(level);
}

std::string Tracer::GetLevelName(LogLevel level) {
	switch (level) {
	case LogLevel::TRACE:
		return "TRACE";
	case LogLevel::DBG:
		return "DEBUG";
	case LogLevel::INFO:
		return "INFO";
	case LogLevel::WARN:
		return "WARN";
	case LogLevel::ERR:
		return "ERROR";
	case LogLevel::NONE:
		return "NONE";
	default:
		return "UNKNOWN";
	}
}

std::string Tracer::GetTimestamp() {
	auto now = std::chrono::system_clock::now();
	auto time = std::chrono::system_clock::to_time_t(now);
	auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

	std::tm local_time {};
	localtime_r(&time, &local_time);

	std::ostringstream oss;
	oss << std::put_time(&local_time, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3)
	    << ms.count();

	return oss.str();
}

void Tracer::Log(LogLevel level, const std::string &file, int line, const std::string &message) const {
	if (!ShouldLog(level)) {
		return;
	}

	std::string timestamp = GetTimestamp();
	std::string level_name = GetLevelName(level);

	// Extract filename from full path
	size_t last_slash = file.find_last_of("/\\");
	std::string filename = (last_slash == std::string::npos) ? file : file.substr(last_slash + 1);

	std::lock_guard<std::mutex> lock(mutex_);
	*sink_ << "[" << timestamp << "] [libseries/" << level_name << "] " << filename << ":" << line << " - "
	       << message << '\n';
}

void Tracer::LogDirect(LogLevel level, const std::string &message) const {
	if (!ShouldLog(level)) {
		return;
	}

	std::string timestamp = GetTimestamp();
	std::string level_name = GetLevelName(level);

	std::lock_guard<std::mutex> lock(mutex_);
	*sink_ << "[" << timestamp << "] [libseries/" << level_name << "] " << message << '\n';
}

uint64_t Tracer::TimingStart() {
	auto start_time = std::chrono::steady_clock::now().time_since_epoch();
	return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(start_time).count());
}

double Tracer::TimingEnd(uint64_t handle, const std::string &operation_name) const {
	auto end_time = std::chrono::steady_clock::now().time_since_epoch();
	uint64_t end_ns = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(end_time).count());
	uint64_t duration_ns = end_ns - handle;
	double duration_ms = static_cast<double>(duration_ns) / 1000000.0;

	std::ostringstream oss;
	oss << std::fixed << std::setprecision(2);
	oss << operation_name << " completed in " << duration_ms << " ms";

	LogDirect(LogLevel::DBG, oss.str());

	return duration_ms;
}

} // namespace utils
} // namespace libseries
