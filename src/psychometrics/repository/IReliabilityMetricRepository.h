#pragma once

#include "PsychometricTypes.h"
#include <optional>
#include <vector>

namespace psychometrics::repository
{
  /**
   * @brief Append-only log of reliability measurements.
   */
  class IReliabilityMetricRepository
  {
  public:
    virtual ~IReliabilityMetricRepository() = default;

    virtual void append(const ReliabilityMetric& metric) = 0;

    /// Metrics calculated at or after @p since, most recent first.
    virtual std::vector<ReliabilityMetric> history(std::optional<MetricType> type,
                                                   const Timestamp& since) const = 0;
  };
} // namespace psychometrics::repository
