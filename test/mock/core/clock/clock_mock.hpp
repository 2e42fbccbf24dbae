/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock.hpp"

#include <gmock/gmock.h>

namespace blockforge::clock {

  class SystemClockMock : public SystemClock {
   public:
    MOCK_CONST_METHOD0(now, TimePoint());
    MOCK_CONST_METHOD0(nowUint64, uint64_t());
  };

  class SteadyClockMock : public SteadyClock {
   public:
    MOCK_CONST_METHOD0(now, TimePoint());
    MOCK_CONST_METHOD0(nowUint64, uint64_t());
  };

}  // namespace blockforge::clock
