// Repository: DeckSync
// Component: Median Filter
// Purpose: Bounded window of drift readings consumed through its median.
// Copyright (c) 2025 DeckSync

#include "decksync/sync/MedianFilter.hpp"

#include <algorithm>
#include <cstddef>
#include <vector>

namespace decksync::sync {

MedianFilter::MedianFilter(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {}

void MedianFilter::Add(double value) {
  values_.push_back(value);
  while (values_.size() > capacity_) {
    values_.pop_front();
  }
}

double MedianFilter::Median() const {
  if (values_.empty()) {
    return 0.0;
  }
  std::vector<double> sorted(values_.begin(), values_.end());
  auto mid = sorted.begin() + static_cast<std::ptrdiff_t>(sorted.size() / 2);
  std::nth_element(sorted.begin(), mid, sorted.end());
  return *mid;
}

}  // namespace decksync::sync
