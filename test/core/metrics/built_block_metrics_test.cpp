/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "telemetry/impl/built_block_metrics_impl.hpp"

#include <gtest/gtest.h>
#include <prometheus/registry.h>

#include "metrics/impl/prometheus/registry_impl.hpp"
#include "testutil/prepare_loggers.hpp"

using blockforge::metrics::PrometheusRegistry;
using blockforge::telemetry::BuiltBlockMetricsImpl;
using std::chrono::microseconds;

class BuiltBlockMetricsTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    auto registry = std::make_unique<PrometheusRegistry>();
    collectable_ = registry->collectable();
    metrics_ = std::make_unique<BuiltBlockMetricsImpl>(std::move(registry));
  }

  /// value of a gauge of the given builder
  std::optional<double> gauge(const std::string &family_name,
                              const std::string &builder_name) {
    for (auto &family : collectable_->Collect()) {
      if (family.name != family_name) {
        continue;
      }
      for (auto &metric : family.metric) {
        for (auto &label : metric.label) {
          if (label.name == "builder_name" and label.value == builder_name) {
            return metric.gauge.value;
          }
        }
      }
    }
    return std::nullopt;
  }

 protected:
  std::shared_ptr<prometheus::Collectable> collectable_;
  std::unique_ptr<BuiltBlockMetricsImpl> metrics_;
};

/**
 * @given metrics of two builders
 * @when reporting built blocks
 * @then gauges are labelled per builder and keep the last values
 */
TEST_F(BuiltBlockMetricsTest, ReportsPerBuilder) {
  metrics_->addBuiltBlockMetrics(
      microseconds{1500}, microseconds{300}, 10, 0, 210000, 210000, "a", 100);
  metrics_->addBuiltBlockMetrics(
      microseconds{900}, microseconds{200}, 4, 1, 84000, 90000, "b", 100);
  metrics_->addBuiltBlockMetrics(
      microseconds{800}, microseconds{100}, 7, 0, 147000, 147000, "a", 112);

  EXPECT_EQ(gauge("blockforge_built_block_txs", "a"), 7.0);
  EXPECT_EQ(gauge("blockforge_built_block_txs", "b"), 4.0);
  EXPECT_EQ(gauge("blockforge_built_block_blobs", "b"), 1.0);
  EXPECT_EQ(gauge("blockforge_built_block_sim_gas_used", "b"), 90000.0);
  EXPECT_EQ(gauge("blockforge_built_block_slot_timestamp", "a"), 112.0);
  EXPECT_EQ(gauge("blockforge_built_block_gas_used", "c"), std::nullopt);
}
