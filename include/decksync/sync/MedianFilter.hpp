// Repository: DeckSync
// Component: Median Filter
// Purpose: Bounded window of drift readings consumed through its median.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_SYNC_MEDIAN_FILTER_HPP_
#define DECKSYNC_SYNC_MEDIAN_FILTER_HPP_

#include <cstddef>
#include <deque>

namespace decksync::sync {

// Keeps the last `capacity` values. Median() of an even-sized window is the
// upper-middle element of the sorted window; an empty window yields 0.
class MedianFilter {
 public:
  explicit MedianFilter(size_t capacity = 5);

  void Add(double value);
  double Median() const;
  void Clear() { values_.clear(); }

  size_t size() const { return values_.size(); }
  size_t capacity() const { return capacity_; }
  bool empty() const { return values_.empty(); }

 private:
  size_t capacity_;
  std::deque<double> values_;  // Oldest first
};

}  // namespace decksync::sync

#endif  // DECKSYNC_SYNC_MEDIAN_FILTER_HPP_
