#include "adaptive/ScoreConversion.h"
#include "NormalQuantile.h"
#include "PsychometricStats.h"

#include <algorithm>
#include <cmath>

namespace psychometrics::adaptive
{
  int thetaToScore(double theta, const config::PrecisionSettings& range)
  {
    const long raw = std::lround(kScoreMean + kScoreSD * theta);
    return static_cast<int>(std::clamp<long>(raw, range.scoreFloor, range.scoreCeiling));
  }

  double thetaToPercentile(double theta)
  {
    return stats::roundTo(stats::normalCdf(theta) * 100.0, 1);
  }
} // namespace psychometrics::adaptive
