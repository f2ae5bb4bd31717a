#include <libseries/libseries.hpp>

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace libseries;

namespace {

void PrintUsage(const char *program) {
	std::cerr << "Usage: " << program << " [--threshold T] [--max-iterations N] <x> <c0> [c1 ...]" << std::endl
	          << std::endl
	          << "Evaluates the finite power series c0 + c1*x + c2*x^2 + ... at x." << std::endl
	          << "Log level is read from LIBSERIES_LOG_LEVEL (trace, debug, info, warn, error, none)." << std::endl;
}

// std::stod accepts trailing garbage; reject it
double ParseNumber(const std::string &text) {
	size_t consumed = 0;
	double value = std::stod(text, &consumed);
	if (consumed != text.size()) {
		throw std::invalid_argument("not a number: '" + text + "'");
	}
	return value;
}

} // namespace

int main(int argc, char **argv) {
	const utils::Tracer tracer = utils::Tracer::FromEnvironment();

	core::SeriesOptions options;
	std::vector<std::string> positional;

	try {
		for (int i = 1; i < argc; i++) {
			const std::string arg = argv[i];
			if (arg == "-h" || arg == "--help") {
				PrintUsage(argv[0]);
				return 0;
			} else if (arg == "--threshold" && i + 1 < argc) {
				options.convergence_threshold = ParseNumber(argv[++i]);
			} else if (arg == "--max-iterations" && i + 1 < argc) {
				options.max_iterations = static_cast<size_t>(std::stoul(argv[++i]));
			} else {
				positional.push_back(arg);
			}
		}
		if (positional.size() < 2) {
			PrintUsage(argv[0]);
			return 2;
		}

		const double x = ParseNumber(positional[0]);
		std::vector<double> coefficients;
		coefficients.reserve(positional.size() - 1);
		for (size_t i = 1; i < positional.size(); i++) {
			coefficients.push_back(ParseNumber(positional[i]));
		}

		auto series = core::SeriesCoefficients::Finite(coefficients);
		const double value = EvaluateSeries(series, x, options, &tracer);
		std::cout << std::setprecision(17) << value << std::endl;
		return 0;
	} catch (const core::InvalidInputError &e) {
		LIBSERIES_ERROR(&tracer, "invalid input: " << e.what());
		std::cerr << "error: " << e.what() << std::endl;
		return 1;
	} catch (const core::OutOfRadiusError &e) {
		std::cerr << "error: " << e.what() << std::endl;
		return 1;
	} catch (const core::ConvergenceTimeoutError &e) {
		std::cerr << "error: " << e.what() << std::endl;
		return 1;
	} catch (const std::invalid_argument &e) {
		std::cerr << "error: " << e.what() << std::endl;
		PrintUsage(argv[0]);
		return 2;
	} catch (const std::out_of_range &e) {
		std::cerr << "error: value out of range: " << e.what() << std::endl;
		return 2;
	}
}
