// Repository: DeckSync
// Component: System Time Source
// Purpose: Production ITimeSource backed by std::chrono::system_clock.
// Copyright (c) 2025 DeckSync

#pragma once

#include <chrono>

#include "decksync/time/ITimeSource.hpp"

namespace decksync::time {

class SystemTimeSource : public ITimeSource {
 public:
  int64_t NowUtcMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()).count();
  }
};

}  // namespace decksync::time
