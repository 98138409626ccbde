#pragma once
// hmb/core/stats.h
//
// RerunStats: single-pass (Welford) count, mean, sample standard deviation,
// min and max over the numeric values of one group's reruns.

#include "hmb/core/types.h"

#include <algorithm>
#include <cmath>

namespace hmb {

class RerunStats {
 public:
  void Add(double x) {
    if (n_ == 0) {
      min_ = max_ = x;
    } else {
      min_ = std::min(min_, x);
      max_ = std::max(max_, x);
    }
    ++n_;
    const double delta = x - mean_;
    mean_ += delta / static_cast<double>(n_);
    m2_ += delta * (x - mean_);
  }

  usize Count() const { return n_; }
  bool Empty() const { return n_ == 0; }

  double Mean() const { return mean_; }

  // n-1 denominator; a single rerun has no spread and reports 0.
  double SampleStddev() const {
    if (n_ < 2) return 0.0;
    return std::sqrt(std::max(0.0, m2_ / static_cast<double>(n_ - 1)));
  }

  double Min() const { return min_; }
  double Max() const { return max_; }

 private:
  usize n_ = 0;
  double mean_ = 0.0;
  double m2_ = 0.0;
  double min_ = 0.0;
  double max_ = 0.0;
};

}  // namespace hmb
