/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "telemetry/built_block_metrics.hpp"

#include <mutex>
#include <unordered_map>

#include "log/logger.hpp"
#include "metrics/metrics.hpp"

namespace blockforge::telemetry {

  class BuiltBlockMetricsImpl : public BuiltBlockMetrics {
   public:
    explicit BuiltBlockMetricsImpl(metrics::RegistryPtr registry);

    void addBuiltBlockMetrics(std::chrono::microseconds build_time,
                              std::chrono::microseconds finalize_time,
                              size_t txs,
                              size_t blobs,
                              primitives::Gas gas_used,
                              primitives::Gas sim_gas_used,
                              const std::string &builder_name,
                              primitives::Timestamp slot_timestamp) override;

   private:
    struct BuilderMetrics {
      metrics::Histogram *fill_time;
      metrics::Histogram *finalize_time;
      metrics::Gauge *txs;
      metrics::Gauge *blobs;
      metrics::Gauge *gas_used;
      metrics::Gauge *sim_gas_used;
      metrics::Gauge *slot_timestamp;
    };

    BuilderMetrics &metricsOf(const std::string &builder_name);

    log::Logger log_;
    metrics::RegistryPtr registry_;
    std::mutex mutex_;
    std::unordered_map<std::string, BuilderMetrics> builders_;
  };

}  // namespace blockforge::telemetry
