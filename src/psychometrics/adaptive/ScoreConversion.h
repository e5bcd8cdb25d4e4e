#pragma once

#include "config/EngineConfiguration.h"

namespace psychometrics::adaptive
{
  constexpr double kScoreMean = 100.0;
  constexpr double kScoreSD = 15.0;

  /**
   * @brief score = round(100 + 15 theta), clamped to the instrument range.
   */
  int thetaToScore(double theta, const config::PrecisionSettings& range = config::PrecisionSettings());

  /// Percentile of theta under the standard normal, in [0, 100] with one decimal.
  double thetaToPercentile(double theta);
} // namespace psychometrics::adaptive
