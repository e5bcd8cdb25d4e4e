#include "reliability/ReliabilityTypes.h"

namespace psychometrics::reliability
{
  std::string toString(ReliabilityTier tier)
  {
    switch (tier)
    {
    case ReliabilityTier::Excellent:
      return "excellent";
    case ReliabilityTier::Good:
      return "good";
    case ReliabilityTier::Acceptable:
      return "acceptable";
    case ReliabilityTier::Questionable:
      return "questionable";
    case ReliabilityTier::Poor:
      return "poor";
    case ReliabilityTier::Unacceptable:
      return "unacceptable";
    }
    return "unknown";
  }

  ReliabilityTier interpretAlpha(double alpha)
  {
    if (alpha >= 0.90)
      return ReliabilityTier::Excellent;
    if (alpha >= 0.80)
      return ReliabilityTier::Good;
    if (alpha >= 0.70)
      return ReliabilityTier::Acceptable;
    if (alpha >= 0.60)
      return ReliabilityTier::Questionable;
    if (alpha >= 0.50)
      return ReliabilityTier::Poor;
    return ReliabilityTier::Unacceptable;
  }

  ReliabilityTier interpretSplitHalf(double spearmanBrownR)
  {
    return interpretAlpha(spearmanBrownR);
  }

  ReliabilityTier interpretTestRetest(double r)
  {
    if (r > 0.90)
      return ReliabilityTier::Excellent;
    if (r > 0.70)
      return ReliabilityTier::Good;
    if (r > 0.50)
      return ReliabilityTier::Acceptable;
    return ReliabilityTier::Poor;
  }

  bool alphaMeetsMinimum(double alpha)
  {
    return alpha >= kAlphaMinimum;
  }

  bool splitHalfMeetsMinimum(double spearmanBrownR)
  {
    return spearmanBrownR >= kSplitHalfMinimum;
  }

  bool testRetestMeetsMinimum(double r)
  {
    return r > kTestRetestMinimum;
  }
} // namespace psychometrics::reliability
