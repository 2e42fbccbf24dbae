/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>

#include "primitives/common.hpp"

namespace blockforge::telemetry {

  /**
   * Collector of per block building statistics
   */
  class BuiltBlockMetrics {
   public:
    virtual ~BuiltBlockMetrics() = default;

    virtual void addBuiltBlockMetrics(std::chrono::microseconds build_time,
                                      std::chrono::microseconds finalize_time,
                                      size_t txs,
                                      size_t blobs,
                                      primitives::Gas gas_used,
                                      primitives::Gas sim_gas_used,
                                      const std::string &builder_name,
                                      primitives::Timestamp slot_timestamp) = 0;
  };

}  // namespace blockforge::telemetry
