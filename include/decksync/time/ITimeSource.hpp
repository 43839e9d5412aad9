// Repository: DeckSync
// Component: Time Source Interface
// Purpose: Injected wall clock for every sync component (system clock in
//          production, deterministic clock in tests and the soak tool).
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_TIME_ITIME_SOURCE_HPP_
#define DECKSYNC_TIME_ITIME_SOURCE_HPP_

#include <cstdint>

namespace decksync::time {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;

  // Local wall-clock time in milliseconds since the Unix epoch.
  // Ping t0 values and sample ages are expressed on this clock.
  virtual int64_t NowUtcMs() const = 0;
};

}  // namespace decksync::time

#endif  // DECKSYNC_TIME_ITIME_SOURCE_HPP_
