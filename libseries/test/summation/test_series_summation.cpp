#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <libseries/summation/series_summation.hpp>

#include <cmath>
#include <vector>

using namespace libseries;
using namespace libseries::core;
using namespace libseries::summation;

TEST_CASE("Summation: Accumulate cached terms", "[summation]") {
	auto state = SeriesSummation::Accumulate({1.0, 2.0, 3.0, 4.0}, 0.5);

	// 1 + 1 + 0.75 + 0.5
	REQUIRE(state.sum == 3.25);
	REQUIRE(state.previous_sum == 2.75);
	REQUIRE(state.LastDelta() == 0.5);
	REQUIRE(state.index == 4);
	REQUIRE(state.terms_consumed == 4);
	REQUIRE(state.extra_terms == 0);
	REQUIRE(!state.exhausted);
}

TEST_CASE("Summation: Continue until converged", "[summation]") {
	SeriesOptions opts;
	auto stream = MakeGeneratorStream([]() { return 1.0; });
	auto state = SeriesSummation::Accumulate(std::vector<double>(10, 1.0), 0.5);

	state = SeriesSummation::Continue(*stream, 0.5, state, opts);

	// Stops at the first term below 1e-7: 0.5^24
	REQUIRE(state.terms_consumed == 25);
	REQUIRE(state.extra_terms == 15);
	REQUIRE(state.sum == 2.0 - std::pow(0.5, 24));
	REQUIRE(SeriesSummation::HasConverged(state, opts.convergence_threshold));
}

TEST_CASE("Summation: Convergence is checked before pulling", "[summation]") {
	SeriesOptions opts;
	size_t pulled = 0;
	auto stream = MakeGeneratorStream([&pulled]() {
		pulled++;
		return 1.0;
	});

	// At x = 0 the cached terms already settle the sum
	auto state = SeriesSummation::Accumulate(std::vector<double>(10, 1.0), 0.0);
	state = SeriesSummation::Continue(*stream, 0.0, state, opts);

	REQUIRE(state.sum == 1.0);
	REQUIRE(pulled == 0);
	REQUIRE(state.extra_terms == 0);
}

TEST_CASE("Summation: Convergence wins over the cap on the same step", "[summation]") {
	SeriesOptions opts;
	opts.max_iterations = 15;
	auto stream = MakeGeneratorStream([]() { return 1.0; });
	auto state = SeriesSummation::Accumulate(std::vector<double>(10, 1.0), 0.5);

	// The 15th extra term is the one that converges
	REQUIRE_NOTHROW(state = SeriesSummation::Continue(*stream, 0.5, state, opts));
	REQUIRE(state.extra_terms == 15);
}

TEST_CASE("Summation: Iteration cap", "[summation][timeout]") {
	SeriesOptions opts;
	opts.max_iterations = 14;
	auto stream = MakeGeneratorStream([]() { return 1.0; });
	auto state = SeriesSummation::Accumulate(std::vector<double>(10, 1.0), 0.5);

	try {
		SeriesSummation::Continue(*stream, 0.5, state, opts);
		FAIL("expected ConvergenceTimeoutError");
	} catch (const ConvergenceTimeoutError &e) {
		REQUIRE(e.terms_used == 24);
		REQUIRE(e.partial_sum == 2.0 - std::pow(0.5, 23));
		REQUIRE(e.last_delta == std::pow(0.5, 23));
	}
}

TEST_CASE("Summation: Divergent partial sums", "[summation][timeout]") {
	SeriesOptions opts;
	auto stream = MakeGeneratorStream([]() { return 1e300; });
	auto state = SeriesSummation::Accumulate({1e300, 1e300, 1e300}, 10.0);

	REQUIRE_THROWS_AS(SeriesSummation::Continue(*stream, 10.0, state, opts), ConvergenceTimeoutError);
}

TEST_CASE("Summation: Stream exhaustion ends the series", "[summation]") {
	SeriesOptions opts;
	SequenceStream stream({1.0, 1.0});
	auto state = SeriesSummation::Accumulate({1.0, 1.0, 1.0}, 0.5);

	state = SeriesSummation::Continue(stream, 0.5, state, opts);

	REQUIRE(state.exhausted);
	REQUIRE(state.terms_consumed == 5);
	REQUIRE(state.extra_terms == 2);
	REQUIRE(state.sum == 1.9375);
	REQUIRE(!SeriesSummation::HasConverged(state, opts.convergence_threshold));
}

TEST_CASE("Summation: Threshold is strict", "[summation]") {
	SummationState state;
	state.previous_sum = 1.0;
	state.sum = 1.5;

	REQUIRE(!SeriesSummation::HasConverged(state, 0.5));
	REQUIRE(SeriesSummation::HasConverged(state, 0.5000001));
}
