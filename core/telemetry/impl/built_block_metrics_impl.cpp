/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "telemetry/impl/built_block_metrics_impl.hpp"

#include <boost/assert.hpp>

namespace {
  constexpr auto fillTimeName = "blockforge_block_fill_time_ms";
  constexpr auto finalizeTimeName = "blockforge_block_finalize_time_ms";
  constexpr auto txsName = "blockforge_built_block_txs";
  constexpr auto blobsName = "blockforge_built_block_blobs";
  constexpr auto gasUsedName = "blockforge_built_block_gas_used";
  constexpr auto simGasUsedName = "blockforge_built_block_sim_gas_used";
  constexpr auto slotTimestampName = "blockforge_built_block_slot_timestamp";
  constexpr auto builderLabel = "builder_name";

  double toMillis(std::chrono::microseconds duration) {
    return static_cast<double>(duration.count()) / 1000.0;
  }
}  // namespace

namespace blockforge::telemetry {

  BuiltBlockMetricsImpl::BuiltBlockMetricsImpl(metrics::RegistryPtr registry)
      : log_{log::createLogger("BuiltBlockMetrics", "metrics")},
        registry_{std::move(registry)} {
    BOOST_ASSERT(registry_ != nullptr);
    registry_->registerHistogramFamily(fillTimeName,
                                       "Time spent filling a block");
    registry_->registerHistogramFamily(finalizeTimeName,
                                       "Time spent finalizing a block");
    registry_->registerGaugeFamily(txsName,
                                   "Transactions in the last built block");
    registry_->registerGaugeFamily(blobsName,
                                   "Blob sidecars of the last built block");
    registry_->registerGaugeFamily(gasUsedName,
                                   "Gas used by the last built block");
    registry_->registerGaugeFamily(
        simGasUsedName, "Simulated gas used by the last built block");
    registry_->registerGaugeFamily(
        slotTimestampName, "Slot timestamp of the last built block");
  }

  BuiltBlockMetricsImpl::BuilderMetrics &BuiltBlockMetricsImpl::metricsOf(
      const std::string &builder_name) {
    if (auto it = builders_.find(builder_name); it != builders_.end()) {
      return it->second;
    }
    SL_DEBUG(log_, "Registering block metrics of builder {}", builder_name);
    const std::map<std::string, std::string> labels{
        {builderLabel, builder_name}};
    const auto buckets = metrics::exponentialBuckets(1, 2, 14);
    BuilderMetrics builder_metrics{
        .fill_time =
            registry_->registerHistogramMetric(fillTimeName, buckets, labels),
        .finalize_time = registry_->registerHistogramMetric(
            finalizeTimeName, buckets, labels),
        .txs = registry_->registerGaugeMetric(txsName, labels),
        .blobs = registry_->registerGaugeMetric(blobsName, labels),
        .gas_used = registry_->registerGaugeMetric(gasUsedName, labels),
        .sim_gas_used = registry_->registerGaugeMetric(simGasUsedName, labels),
        .slot_timestamp =
            registry_->registerGaugeMetric(slotTimestampName, labels),
    };
    return builders_.emplace(builder_name, builder_metrics).first->second;
  }

  void BuiltBlockMetricsImpl::addBuiltBlockMetrics(
      std::chrono::microseconds build_time,
      std::chrono::microseconds finalize_time,
      size_t txs,
      size_t blobs,
      primitives::Gas gas_used,
      primitives::Gas sim_gas_used,
      const std::string &builder_name,
      primitives::Timestamp slot_timestamp) {
    std::lock_guard lock{mutex_};
    auto &m = metricsOf(builder_name);
    m.fill_time->observe(toMillis(build_time));
    m.finalize_time->observe(toMillis(finalize_time));
    m.txs->set(static_cast<double>(txs));
    m.blobs->set(static_cast<double>(blobs));
    m.gas_used->set(static_cast<double>(gas_used));
    m.sim_gas_used->set(static_cast<double>(sim_gas_used));
    m.slot_timestamp->set(static_cast<double>(slot_timestamp));
  }

}  // namespace blockforge::telemetry
