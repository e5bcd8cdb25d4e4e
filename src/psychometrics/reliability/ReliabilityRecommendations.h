#pragma once

#include "reliability/ReliabilityTypes.h"

#include <string>
#include <vector>

namespace psychometrics::reliability
{
  enum class RecommendationCategory
  {
    DataCollection,
    ItemReview,
    ThresholdWarning
  };

  enum class RecommendationPriority
  {
    High,
    Medium,
    Low
  };

  enum class OverallReliabilityStatus
  {
    Excellent,
    Acceptable,
    NeedsAttention,
    InsufficientData
  };

  std::string toString(RecommendationCategory category);
  std::string toString(RecommendationPriority priority);
  std::string toString(OverallReliabilityStatus status);

  struct Recommendation
  {
    RecommendationCategory category = RecommendationCategory::DataCollection;
    RecommendationPriority priority = RecommendationPriority::Low;
    std::string message;
  };

  /**
   * @brief Actionable follow-ups derived from the three coefficients,
   * sorted high priority first (stable within a priority).
   */
  std::vector<Recommendation> generateRecommendations(const AlphaResult& alpha,
                                                      const TestRetestResult& testRetest,
                                                      const SplitHalfResult& splitHalf);

  /**
   * @brief Combined verdict.
   *
   * InsufficientData when no coefficient is available, Excellent when every
   * available coefficient is in its excellent band, Acceptable when every
   * available coefficient meets its minimum, NeedsAttention otherwise.
   */
  OverallReliabilityStatus determineOverallStatus(const AlphaResult& alpha,
                                                  const TestRetestResult& testRetest,
                                                  const SplitHalfResult& splitHalf);
} // namespace psychometrics::reliability
