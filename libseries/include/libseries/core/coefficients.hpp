#pragma once

#include "libseries/core/errors.hpp"
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace libseries {
namespace core {

/**
 * ICoefficientStream: one-shot, forward-only source of series coefficients
 *
 * The only operation is "pull the next value, or signal that the series has
 * ended". A stream is not indexable and cannot be rewound: a value once
 * pulled is consumed, so whoever pulls it must keep it if it is still
 * needed. A stream has a single consumer and must not be read by two
 * evaluations at once.
 */
class ICoefficientStream {
public:
	virtual ~ICoefficientStream() = default;

	/**
	 * Pull the next coefficient
	 *
	 * @param value Receives the coefficient on success
	 * @return false if the stream is exhausted (value is left untouched)
	 */
	virtual bool Next(double &value) = 0;
};

/**
 * GeneratorStream: adapts a callable `double()` to an endless stream
 *
 * Each call to the generator yields the next coefficient. Example:
 * ```cpp
 * // 1 + x + x^2 + ... == 1 / (1 - x)
 * auto ones = MakeGeneratorStream([]() { return 1.0; });
 * ```
 */
template <typename TGenerator>
class GeneratorStream : public ICoefficientStream {
private:
	TGenerator generator_;

public:
	explicit GeneratorStream(TGenerator generator) : generator_(std::move(generator)) {
	}

	bool Next(double &value) override {
		value = static_cast<double>(generator_());
		return true;
	}
};

template <typename TGenerator>
std::unique_ptr<ICoefficientStream> MakeGeneratorStream(TGenerator generator) {
	return std::make_unique<GeneratorStream<TGenerator>>(std::move(generator));
}

/**
 * SequenceStream: streams a stored list and then reports exhaustion
 *
 * Models a lazily produced series that happens to terminate.
 */
class SequenceStream : public ICoefficientStream {
private:
	std::vector<double> values_;
	size_t position_ = 0;

public:
	explicit SequenceStream(std::vector<double> values) : values_(std::move(values)) {
	}

	bool Next(double &value) override {
		if (position_ >= values_.size()) {
			return false;
		}
		value = values_[position_++];
		return true;
	}

	size_t Consumed() const {
		return position_;
	}
};

/**
 * SeriesCoefficients: coefficient source tagged as finite or streaming
 *
 * Callers declare which kind they pass; the evaluator never guesses.
 * - Finite: ordered, indexable, length known up front
 * - Streaming: one-shot ICoefficientStream, possibly infinite. The stream
 *   is handed out once; evaluating the same series again needs a new
 *   SeriesCoefficients built on a fresh stream.
 */
class SeriesCoefficients {
public:
	enum class Kind { FINITE, STREAMING };

	static SeriesCoefficients Finite(std::vector<double> values) {
		SeriesCoefficients coefficients(Kind::FINITE);
		coefficients.values_ = std::move(values);
		return coefficients;
	}

	static SeriesCoefficients Streaming(std::unique_ptr<ICoefficientStream> stream) {
		if (!stream) {
			throw InvalidInputError("streaming coefficients require a non-null stream");
		}
		SeriesCoefficients coefficients(Kind::STREAMING);
		coefficients.stream_ = std::move(stream);
		return coefficients;
	}

	Kind GetKind() const {
		return kind_;
	}

	bool IsFinite() const {
		return kind_ == Kind::FINITE;
	}

	/// Coefficients of a finite series
	/// @throws InvalidInputError if the series is streaming
	const std::vector<double> &Values() const {
		if (kind_ != Kind::FINITE) {
			throw InvalidInputError("streaming coefficients have no indexable values");
		}
		return values_;
	}

	/// True once Stream() has handed out the stream
	bool IsConsumed() const {
		return consumed_;
	}

	/// Stream of an infinite series, available to a single consumer
	/// @throws InvalidInputError if the series is finite or already consumed
	ICoefficientStream &Stream() {
		if (kind_ != Kind::STREAMING) {
			throw InvalidInputError("finite coefficients have no stream");
		}
		if (consumed_) {
			throw InvalidInputError("coefficient stream was already consumed, supply a fresh stream");
		}
		consumed_ = true;
		return *stream_;
	}

private:
	explicit SeriesCoefficients(Kind kind) : kind_(kind) {
	}

	Kind kind_;
	std::vector<double> values_;
	std::unique_ptr<ICoefficientStream> stream_;
	bool consumed_ = false;
};

} // namespace core
} // namespace libseries
