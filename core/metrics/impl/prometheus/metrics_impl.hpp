/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/summary.h>

#include "metrics/metrics.hpp"

namespace blockforge::metrics {

  class PrometheusCounter : public Counter {
    friend class PrometheusRegistry;
    prometheus::Counter &m_;

   public:
    explicit PrometheusCounter(prometheus::Counter &m);
    void inc() override;
    void inc(double val) override;
  };

  class PrometheusGauge : public Gauge {
    friend class PrometheusRegistry;
    prometheus::Gauge &m_;

   public:
    explicit PrometheusGauge(prometheus::Gauge &m);
    void inc() override;
    void inc(double val) override;
    void dec() override;
    void dec(double val) override;
    void set(double val) override;
  };

  class PrometheusSummary : public Summary {
    friend class PrometheusRegistry;
    prometheus::Summary &m_;

   public:
    explicit PrometheusSummary(prometheus::Summary &m);
    void observe(const double value) override;
  };

  class PrometheusHistogram : public Histogram {
    friend class PrometheusRegistry;
    prometheus::Histogram &m_;

   public:
    explicit PrometheusHistogram(prometheus::Histogram &m);
    void observe(const double value) override;
  };

}  // namespace blockforge::metrics
