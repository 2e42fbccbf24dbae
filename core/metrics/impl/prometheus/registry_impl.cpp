/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/prometheus/registry_impl.hpp"

#include <boost/assert.hpp>

namespace blockforge::metrics {

  RegistryPtr createRegistry() {
    return std::make_unique<PrometheusRegistry>();
  }

  PrometheusRegistry::PrometheusRegistry()
      : registry_{std::make_shared<prometheus::Registry>()} {}

  prometheus::Counter *PrometheusRegistry::internalMetric(Counter *metric) {
    return &static_cast<PrometheusCounter *>(metric)->m_;
  }

  prometheus::Gauge *PrometheusRegistry::internalMetric(Gauge *metric) {
    return &static_cast<PrometheusGauge *>(metric)->m_;
  }

  prometheus::Summary *PrometheusRegistry::internalMetric(Summary *metric) {
    return &static_cast<PrometheusSummary *>(metric)->m_;
  }

  prometheus::Histogram *PrometheusRegistry::internalMetric(
      Histogram *metric) {
    return &static_cast<PrometheusHistogram *>(metric)->m_;
  }

  void PrometheusRegistry::registerCounterFamily(
      const std::string &name,
      const std::string &help,
      const std::map<std::string, std::string> &labels) {
    std::lock_guard lock{mutex_};
    counters_[name] = &prometheus::BuildCounter()
                           .Name(name)
                           .Help(help)
                           .Labels(labels)
                           .Register(*registry_);
  }

  void PrometheusRegistry::registerGaugeFamily(
      const std::string &name,
      const std::string &help,
      const std::map<std::string, std::string> &labels) {
    std::lock_guard lock{mutex_};
    gauges_[name] = &prometheus::BuildGauge()
                         .Name(name)
                         .Help(help)
                         .Labels(labels)
                         .Register(*registry_);
  }

  void PrometheusRegistry::registerHistogramFamily(
      const std::string &name,
      const std::string &help,
      const std::map<std::string, std::string> &labels) {
    std::lock_guard lock{mutex_};
    histograms_[name] = &prometheus::BuildHistogram()
                             .Name(name)
                             .Help(help)
                             .Labels(labels)
                             .Register(*registry_);
  }

  void PrometheusRegistry::registerSummaryFamily(
      const std::string &name,
      const std::string &help,
      const std::map<std::string, std::string> &labels) {
    std::lock_guard lock{mutex_};
    summaries_[name] = &prometheus::BuildSummary()
                            .Name(name)
                            .Help(help)
                            .Labels(labels)
                            .Register(*registry_);
  }

  template <typename T, typename Wrapper, typename... Args>
  Wrapper *PrometheusRegistry::registerMetric(
      std::unordered_map<std::string, prometheus::Family<T> *> &families,
      std::vector<std::unique_ptr<Wrapper>> &storage,
      const std::string &name,
      const std::map<std::string, std::string> &labels,
      Args &&...args) {
    std::lock_guard lock{mutex_};
    auto it = families.find(name);
    BOOST_ASSERT_MSG(it != families.end(), "metric family is not registered");
    if (it == families.end()) {
      return nullptr;
    }
    auto &metric = it->second->Add(labels, std::forward<Args>(args)...);
    return storage.emplace_back(std::make_unique<Wrapper>(metric)).get();
  }

  Counter *PrometheusRegistry::registerCounterMetric(
      const std::string &name,
      const std::map<std::string, std::string> &labels) {
    return registerMetric(counters_, counter_metrics_, name, labels);
  }

  Gauge *PrometheusRegistry::registerGaugeMetric(
      const std::string &name,
      const std::map<std::string, std::string> &labels) {
    return registerMetric(gauges_, gauge_metrics_, name, labels);
  }

  Histogram *PrometheusRegistry::registerHistogramMetric(
      const std::string &name,
      const std::vector<double> &bucket_boundaries,
      const std::map<std::string, std::string> &labels) {
    return registerMetric(histograms_,
                          histogram_metrics_,
                          name,
                          labels,
                          prometheus::Histogram::BucketBoundaries{
                              bucket_boundaries.begin(),
                              bucket_boundaries.end()});
  }

  Summary *PrometheusRegistry::registerSummaryMetric(
      const std::string &name,
      const std::vector<std::pair<double, double>> &quantiles,
      std::chrono::milliseconds max_age,
      int age_buckets,
      const std::map<std::string, std::string> &labels) {
    prometheus::Summary::Quantiles prometheus_quantiles;
    prometheus_quantiles.reserve(quantiles.size());
    for (const auto &[quantile, error] : quantiles) {
      prometheus_quantiles.emplace_back(quantile, error);
    }
    return registerMetric(summaries_,
                          summary_metrics_,
                          name,
                          labels,
                          std::move(prometheus_quantiles),
                          max_age,
                          age_buckets);
  }

}  // namespace blockforge::metrics
