#ifndef CHOPSTICKS_METRICS_HISTOGRAM_H_
#define CHOPSTICKS_METRICS_HISTOGRAM_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Chopsticks {

/// Generates log-scale upper bounds in whole microseconds from min_us to
/// max_us (both included). Rounded duplicates are collapsed so the result is
/// strictly increasing.
std::vector<uint64_t> MakeLogScaleBounds(uint64_t min_us, uint64_t max_us, int buckets_per_doubling);

/// Returns false and fills error when bounds are empty, zero-led or not
/// strictly increasing.
bool ValidateBounds(const std::vector<uint64_t>& bounds, std::string* error);

/**
 * Fixed latency bucket boundaries shared by every worker of a run.
 * Bucket i covers (bounds[i-1], bounds[i]]; bucket 0 starts at zero and the
 * extra last bucket holds everything above bounds.back().
 */
class BucketLayout {
	public:
		BucketLayout() = default;
		explicit BucketLayout(std::vector<uint64_t> bounds_us);

		size_t NumBuckets() const { return bounds_us_.size() + 1; }
		size_t BucketFor(double value_us) const;

		/// Lower edge of bucket i in microseconds
		double LowerEdge(size_t i) const;
		/// Upper edge of bucket i, or +inf for the overflow bucket
		double UpperEdge(size_t i) const;

		const std::vector<uint64_t>& bounds_us() const { return bounds_us_; }

		bool operator==(const BucketLayout& other) const { return bounds_us_ == other.bounds_us_; }
		bool operator!=(const BucketLayout& other) const { return !(*this == other); }

	private:
		std::vector<uint64_t> bounds_us_;
};

/**
 * Mergeable latency histogram. Values are microseconds. The histogram does
 * not own its layout; callers pass the run's BucketLayout where edges matter.
 */
class Histogram {
	public:
		Histogram() = default;
		explicit Histogram(const BucketLayout& layout);

		/// Rebuilds a histogram from its serialized parts. count is derived
		/// from the bucket counts.
		Histogram(std::vector<uint64_t> counts, double min_us, double max_us,
				double sum_us, double sum_sq_us);

		/// The histogram must have been built for layout
		void Observe(const BucketLayout& layout, double value_us);

		/// Element-wise sum. Returns false (and leaves this untouched) when
		/// the bucket counts differ in size.
		bool Merge(const Histogram& other);

		/// Estimated value at quantile q in [0, 1]. Zero when empty.
		double Percentile(const BucketLayout& layout, double q) const;

		double Mean() const;
		double StdDev() const;

		uint64_t count() const { return count_; }
		double min() const { return min_; }
		double max() const { return max_; }
		double sum() const { return sum_; }
		double sum_sq() const { return sum_sq_; }
		const std::vector<uint64_t>& counts() const { return counts_; }

		bool operator==(const Histogram& other) const;
		bool operator!=(const Histogram& other) const { return !(*this == other); }

	private:
		std::vector<uint64_t> counts_;
		uint64_t count_ = 0;
		double min_ = 0.0;
		double max_ = 0.0;
		double sum_ = 0.0;
		double sum_sq_ = 0.0;
};

} // End of namespace Chopsticks
#endif // CHOPSTICKS_METRICS_HISTOGRAM_H_
