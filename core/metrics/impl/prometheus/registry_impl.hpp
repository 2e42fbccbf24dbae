/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>
#include <unordered_map>

#include <prometheus/registry.h>

#include "metrics/impl/prometheus/metrics_impl.hpp"
#include "metrics/registry.hpp"

namespace blockforge::metrics {

  /**
   * Registry backed by its own prometheus::Registry. The underlying registry
   * is exposed as a collectable for whatever serves the metrics.
   */
  class PrometheusRegistry : public Registry {
   public:
    PrometheusRegistry();

    std::shared_ptr<prometheus::Collectable> collectable() const {
      return registry_;
    }

    static prometheus::Counter *internalMetric(Counter *metric);
    static prometheus::Gauge *internalMetric(Gauge *metric);
    static prometheus::Summary *internalMetric(Summary *metric);
    static prometheus::Histogram *internalMetric(Histogram *metric);

    void registerCounterFamily(
        const std::string &name,
        const std::string &help,
        const std::map<std::string, std::string> &labels) override;

    void registerGaugeFamily(
        const std::string &name,
        const std::string &help,
        const std::map<std::string, std::string> &labels) override;

    void registerHistogramFamily(
        const std::string &name,
        const std::string &help,
        const std::map<std::string, std::string> &labels) override;

    void registerSummaryFamily(
        const std::string &name,
        const std::string &help,
        const std::map<std::string, std::string> &labels) override;

    Counter *registerCounterMetric(
        const std::string &name,
        const std::map<std::string, std::string> &labels) override;

    Gauge *registerGaugeMetric(
        const std::string &name,
        const std::map<std::string, std::string> &labels) override;

    Histogram *registerHistogramMetric(
        const std::string &name,
        const std::vector<double> &bucket_boundaries,
        const std::map<std::string, std::string> &labels) override;

    Summary *registerSummaryMetric(
        const std::string &name,
        const std::vector<std::pair<double, double>> &quantiles,
        std::chrono::milliseconds max_age,
        int age_buckets,
        const std::map<std::string, std::string> &labels) override;

   private:
    template <typename T, typename Wrapper, typename... Args>
    Wrapper *registerMetric(
        std::unordered_map<std::string, prometheus::Family<T> *> &families,
        std::vector<std::unique_ptr<Wrapper>> &storage,
        const std::string &name,
        const std::map<std::string, std::string> &labels,
        Args &&...args);

    std::shared_ptr<prometheus::Registry> registry_;
    std::mutex mutex_;
    std::unordered_map<std::string, prometheus::Family<prometheus::Counter> *>
        counters_;
    std::unordered_map<std::string, prometheus::Family<prometheus::Gauge> *>
        gauges_;
    std::unordered_map<std::string, prometheus::Family<prometheus::Histogram> *>
        histograms_;
    std::unordered_map<std::string, prometheus::Family<prometheus::Summary> *>
        summaries_;
    std::vector<std::unique_ptr<PrometheusCounter>> counter_metrics_;
    std::vector<std::unique_ptr<PrometheusGauge>> gauge_metrics_;
    std::vector<std::unique_ptr<PrometheusHistogram>> histogram_metrics_;
    std::vector<std::unique_ptr<PrometheusSummary>> summary_metrics_;
  };

}  // namespace blockforge::metrics
