#include "histogram.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

#include <glog/logging.h>

namespace Chopsticks {

std::vector<uint64_t> MakeLogScaleBounds(uint64_t min_us, uint64_t max_us, int buckets_per_doubling) {
	std::vector<uint64_t> bounds;
	if (min_us == 0 || max_us < min_us || buckets_per_doubling < 1) {
		return bounds;
	}

	const double step = std::pow(2.0, 1.0 / static_cast<double>(buckets_per_doubling));
	double edge = static_cast<double>(min_us);
	while (true) {
		uint64_t rounded = static_cast<uint64_t>(std::llround(edge));
		if (rounded >= max_us) {
			break;
		}
		if (bounds.empty() || rounded > bounds.back()) {
			bounds.push_back(rounded);
		}
		edge *= step;
	}
	if (bounds.empty() || bounds.back() < max_us) {
		bounds.push_back(max_us);
	}
	return bounds;
}

bool ValidateBounds(const std::vector<uint64_t>& bounds, std::string* error) {
	if (bounds.empty()) {
		*error = "Histogram bounds must not be empty";
		return false;
	}
	if (bounds.front() == 0) {
		*error = "Histogram bounds must start above zero";
		return false;
	}
	for (size_t i = 1; i < bounds.size(); ++i) {
		if (bounds[i] <= bounds[i - 1]) {
			*error = "Histogram bounds must be strictly increasing (index " + std::to_string(i) + ")";
			return false;
		}
	}
	return true;
}

//
// BucketLayout
//

BucketLayout::BucketLayout(std::vector<uint64_t> bounds_us)
	: bounds_us_(std::move(bounds_us)) {}

size_t BucketLayout::BucketFor(double value_us) const {
	auto it = std::lower_bound(bounds_us_.begin(), bounds_us_.end(), value_us,
			[](uint64_t bound, double value) { return static_cast<double>(bound) < value; });
	return static_cast<size_t>(std::distance(bounds_us_.begin(), it));
}

double BucketLayout::LowerEdge(size_t i) const {
	if (i == 0 || bounds_us_.empty()) {
		return 0.0;
	}
	return static_cast<double>(bounds_us_[std::min(i, bounds_us_.size()) - 1]);
}

double BucketLayout::UpperEdge(size_t i) const {
	if (i >= bounds_us_.size()) {
		return std::numeric_limits<double>::infinity();
	}
	return static_cast<double>(bounds_us_[i]);
}

//
// Histogram
//

Histogram::Histogram(const BucketLayout& layout)
	: counts_(layout.NumBuckets(), 0) {}

Histogram::Histogram(std::vector<uint64_t> counts, double min_us, double max_us,
		double sum_us, double sum_sq_us)
	: counts_(std::move(counts)),
	min_(min_us),
	max_(max_us),
	sum_(sum_us),
	sum_sq_(sum_sq_us) {
		for (uint64_t c : counts_) {
			count_ += c;
		}
		if (count_ == 0) {
			min_ = max_ = sum_ = sum_sq_ = 0.0;
		}
	}

void Histogram::Observe(const BucketLayout& layout, double value_us) {
	DCHECK_EQ(counts_.size(), layout.NumBuckets()) << "histogram built for another bucket layout";
	if (counts_.size() != layout.NumBuckets()) {
		LOG_EVERY_N(ERROR, 1000) << "[Histogram] observation for a foreign bucket layout ignored";
		return;
	}
	if (value_us < 0.0) {
		value_us = 0.0;
	}
	counts_[layout.BucketFor(value_us)]++;
	if (count_ == 0) {
		min_ = max_ = value_us;
	} else {
		min_ = std::min(min_, value_us);
		max_ = std::max(max_, value_us);
	}
	count_++;
	sum_ += value_us;
	sum_sq_ += value_us * value_us;
}

bool Histogram::Merge(const Histogram& other) {
	if (other.count_ == 0 && other.counts_.empty()) {
		return true;
	}
	if (counts_.empty() && count_ == 0) {
		counts_.assign(other.counts_.size(), 0);
	}
	if (counts_.size() != other.counts_.size()) {
		return false;
	}
	for (size_t i = 0; i < counts_.size(); ++i) {
		counts_[i] += other.counts_[i];
	}
	if (other.count_ > 0) {
		if (count_ == 0) {
			min_ = other.min_;
			max_ = other.max_;
		} else {
			min_ = std::min(min_, other.min_);
			max_ = std::max(max_, other.max_);
		}
	}
	count_ += other.count_;
	sum_ += other.sum_;
	sum_sq_ += other.sum_sq_;
	return true;
}

double Histogram::Percentile(const BucketLayout& layout, double q) const {
	if (count_ == 0 || counts_.size() != layout.NumBuckets()) {
		return 0.0;
	}
	q = std::clamp(q, 0.0, 1.0);
	const double rank = q * static_cast<double>(count_);
	if (rank <= 0.0) {
		return min_;
	}

	// Walk to the bucket holding the target rank, then interpolate inside its
	// range narrowed to the observed [min, max].
	double cumulative = 0.0;
	for (size_t i = 0; i < counts_.size(); ++i) {
		if (counts_[i] == 0) {
			continue;
		}
		const double in_bucket = static_cast<double>(counts_[i]);
		if (cumulative + in_bucket >= rank) {
			double lower = std::max(layout.LowerEdge(i), min_);
			double upper = std::min(layout.UpperEdge(i), max_);
			if (upper < lower) {
				upper = lower;
			}
			double fraction = (rank - cumulative) / in_bucket;
			return lower + (upper - lower) * fraction;
		}
		cumulative += in_bucket;
	}
	return max_;
}

double Histogram::Mean() const {
	if (count_ == 0) return 0.0;
	return sum_ / static_cast<double>(count_);
}

double Histogram::StdDev() const {
	if (count_ < 2) return 0.0;
	const double n = static_cast<double>(count_);
	const double mean = sum_ / n;
	double variance = sum_sq_ / n - mean * mean;
	return variance > 0.0 ? std::sqrt(variance) : 0.0;
}

bool Histogram::operator==(const Histogram& other) const {
	return counts_ == other.counts_ && count_ == other.count_ &&
		min_ == other.min_ && max_ == other.max_ &&
		sum_ == other.sum_ && sum_sq_ == other.sum_sq_;
}

} // End of namespace Chopsticks
