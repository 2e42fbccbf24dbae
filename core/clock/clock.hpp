/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace blockforge::clock {

  /**
   * An interface for a clock
   * @tparam clock type is an underlying clock type, such as std::steady_clock
   */
  template <typename ClockType>
  class Clock {
   public:
    /**
     * Difference between two time points
     */
    using Duration = typename ClockType::duration;
    /**
     * A moment in time
     */
    using TimePoint = typename ClockType::time_point;

    virtual ~Clock() = default;

    /**
     * @return a time point representing the current time
     */
    virtual TimePoint now() const = 0;

    /**
     * @return uint64_t representing number of seconds since the clock's
     * epoch
     */
    virtual uint64_t nowUint64() const = 0;

    static TimePoint zero() {
      return TimePoint{};
    }
  };

  /**
   * SteadyClock alias over Clock. Used to measure build and finalize
   * durations and to evaluate the build deadline
   */
  using SteadyClock = Clock<std::chrono::steady_clock>;

  /**
   * SystemClock alias over Clock. Used for wall-clock stamps in build traces
   */
  using SystemClock = Clock<std::chrono::system_clock>;

}  // namespace blockforge::clock
