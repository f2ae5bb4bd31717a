#include <catch2/catch_test_macros.hpp>

#include <libseries/evaluator/series_evaluator.hpp>
#include <libseries/utils/tracing.hpp>

#include <cstdlib>
#include <sstream>
#include <string>

using namespace libseries;
using namespace libseries::utils;

TEST_CASE("Tracer - Level filtering", "[utils][tracing]") {
	std::ostringstream sink;
	Tracer tracer(LogLevel::WARN, sink);

	REQUIRE(!tracer.ShouldLog(LogLevel::DBG));
	REQUIRE(!tracer.ShouldLog(LogLevel::INFO));
	REQUIRE(tracer.ShouldLog(LogLevel::WARN));
	REQUIRE(tracer.ShouldLog(LogLevel::ERR));

	LIBSERIES_INFO(&tracer, "hidden " << 1);
	LIBSERIES_WARN(&tracer, "shown " << 2);

	const std::string output = sink.str();
	REQUIRE(output.find("hidden") == std::string::npos);
	REQUIRE(output.find("shown 2") != std::string::npos);
	REQUIRE(output.find("[libseries/WARN]") != std::string::npos);
	REQUIRE(output.find("test_tracing.cpp") != std::string::npos);
}

TEST_CASE("Tracer - NONE silences everything", "[utils][tracing]") {
	std::ostringstream sink;
	Tracer tracer(LogLevel::NONE, sink);

	LIBSERIES_ERROR(&tracer, "nothing");
	tracer.LogDirect(LogLevel::ERR, "nothing either");
	REQUIRE(sink.str().empty());
}

TEST_CASE("Tracer - Null tracer is a no-op", "[utils][tracing]") {
	const Tracer *tracer = nullptr;
	int evaluated = 0;
	LIBSERIES_ERROR(tracer, "never " << ++evaluated);
	REQUIRE(evaluated == 0);
}

TEST_CASE("Tracer - Message is only built when enabled", "[utils][tracing]") {
	std::ostringstream sink;
	Tracer tracer(LogLevel::ERR, sink);
	int evaluated = 0;

	LIBSERIES_DEBUG(&tracer, "skipped " << ++evaluated);
	REQUIRE(evaluated == 0);

	tracer.SetLogLevel(LogLevel::TRACE);
	REQUIRE(tracer.GetLogLevel() == LogLevel::TRACE);
	LIBSERIES_DEBUG(&tracer, "built " << ++evaluated);
	REQUIRE(evaluated == 1);
	REQUIRE(sink.str().find("[libseries/DEBUG]") != std::string::npos);
}

TEST_CASE("Tracer - Level names", "[utils][tracing]") {
	LogLevel level = LogLevel::NONE;

	REQUIRE(Tracer::ParseLevel("trace", level));
	REQUIRE(level == LogLevel::TRACE);
	REQUIRE(Tracer::ParseLevel("DEBUG", level));
	REQUIRE(level == LogLevel::DBG);
	REQUIRE(Tracer::ParseLevel("Warn", level));
	REQUIRE(level == LogLevel::WARN);
	REQUIRE(Tracer::ParseLevel("none", level));
	REQUIRE(level == LogLevel::NONE);

	REQUIRE(!Tracer::ParseLevel("verbose", level));
	REQUIRE(level == LogLevel::NONE);

	REQUIRE(Tracer::GetLevelName(LogLevel::DBG) == "DEBUG");
	REQUIRE(Tracer::GetLevelName(LogLevel::ERR) == "ERROR");
}

TEST_CASE("Tracer - Environment configuration", "[utils][tracing]") {
	setenv("LIBSERIES_LOG_LEVEL", "trace", 1);
	REQUIRE(Tracer::FromEnvironment().GetLogLevel() == LogLevel::TRACE);

	setenv("LIBSERIES_LOG_LEVEL", "bogus", 1);
	REQUIRE(Tracer::FromEnvironment().GetLogLevel() == Tracer::DefaultLevel());

	unsetenv("LIBSERIES_LOG_LEVEL");
	REQUIRE(Tracer::FromEnvironment().GetLogLevel() == Tracer::DefaultLevel());
}

TEST_CASE("Tracer - Timing", "[utils][tracing]") {
	std::ostringstream sink;
	Tracer tracer(LogLevel::DBG, sink);

	uint64_t handle = Tracer::TimingStart();
	double elapsed = tracer.TimingEnd(handle, "noop");
	REQUIRE(elapsed >= 0.0);
	REQUIRE(sink.str().find("noop completed in") != std::string::npos);
}

TEST_CASE("Tracer - Injected into the evaluator", "[utils][tracing][evaluator]") {
	std::ostringstream sink;
	Tracer tracer(LogLevel::DBG, sink);
	evaluator::SeriesEvaluator evaluator(core::SeriesOptions(), &tracer);

	SECTION("Radius estimate is logged") {
		auto series = core::SeriesCoefficients::Streaming(core::MakeGeneratorStream([]() { return 1.0; }));
		evaluator.Evaluate(series, 0.5);
		REQUIRE(sink.str().find("Domb-Sykes estimate from 10 samples") != std::string::npos);
		REQUIRE(sink.str().find("Streaming series evaluation completed") != std::string::npos);
	}

	SECTION("Inconclusive estimate is a warning") {
		double sign = 1.0;
		auto series = core::SeriesCoefficients::Streaming(core::MakeGeneratorStream([sign]() mutable {
			sign = -sign;
			return -sign;
		}));
		evaluator.Evaluate(series, 0.5);
		REQUIRE(sink.str().find("[libseries/WARN]") != std::string::npos);
		REQUIRE(sink.str().find("inconclusive") != std::string::npos);
	}

	SECTION("Separate evaluators do not share log state") {
		evaluator::SeriesEvaluator silent;
		auto series = core::SeriesCoefficients::Streaming(core::MakeGeneratorStream([]() { return 1.0; }));
		silent.Evaluate(series, 0.5);
		REQUIRE(sink.str().empty());
	}
}
