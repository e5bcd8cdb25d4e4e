#include "reliability/ReliabilityRecommendations.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace psychometrics::reliability
{
  std::string toString(RecommendationCategory category)
  {
    switch (category)
    {
    case RecommendationCategory::DataCollection:
      return "data_collection";
    case RecommendationCategory::ItemReview:
      return "item_review";
    case RecommendationCategory::ThresholdWarning:
      return "threshold_warning";
    }
    return "unknown";
  }

  std::string toString(RecommendationPriority priority)
  {
    switch (priority)
    {
    case RecommendationPriority::High:
      return "high";
    case RecommendationPriority::Medium:
      return "medium";
    case RecommendationPriority::Low:
      return "low";
    }
    return "unknown";
  }

  std::string toString(OverallReliabilityStatus status)
  {
    switch (status)
    {
    case OverallReliabilityStatus::Excellent:
      return "excellent";
    case OverallReliabilityStatus::Acceptable:
      return "acceptable";
    case OverallReliabilityStatus::NeedsAttention:
      return "needs_attention";
    case OverallReliabilityStatus::InsufficientData:
      return "insufficient_data";
    }
    return "unknown";
  }

  namespace
  {
    // Retest samples below this size get a low-priority nudge
    constexpr std::size_t kRecommendedRetestPairs = 100;

    std::string fixed2(double v)
    {
      std::ostringstream os;
      os << std::fixed << std::setprecision(2) << v;
      return os.str();
    }
  }

  std::vector<Recommendation> generateRecommendations(const AlphaResult& alpha,
                                                      const TestRetestResult& testRetest,
                                                      const SplitHalfResult& splitHalf)
  {
    std::vector<Recommendation> out;

    // Data collection
    if (alpha.insufficientData)
      out.push_back({RecommendationCategory::DataCollection, RecommendationPriority::High,
                     "Cronbach's alpha requires more test sessions. Current: " +
                     std::to_string(alpha.numSessions) + "."});

    if (testRetest.insufficientData)
      out.push_back({RecommendationCategory::DataCollection, RecommendationPriority::Medium,
                     "Test-retest reliability requires more retest pairs. Current: " +
                     std::to_string(testRetest.numPairs) + "."});
    else if (testRetest.correlation && testRetest.numPairs < kRecommendedRetestPairs)
      out.push_back({RecommendationCategory::DataCollection, RecommendationPriority::Low,
                     "Test-retest sample size is low (" + std::to_string(testRetest.numPairs) +
                     " pairs). Target: 100+ pairs for stable estimates."});

    if (splitHalf.insufficientData)
      out.push_back({RecommendationCategory::DataCollection, RecommendationPriority::High,
                     "Split-half reliability requires more test sessions. Current: " +
                     std::to_string(splitHalf.numSessions) + "."});

    // Item review
    const auto negativeCount = std::count_if(
      alpha.itemTotalCorrelations.begin(), alpha.itemTotalCorrelations.end(),
      [](const ItemTotalCorrelation& c) { return c.correlation < 0.0; });
    if (negativeCount > 0)
      out.push_back({RecommendationCategory::ItemReview,
                     static_cast<std::size_t>(negativeCount) >= kProblematicItemCount
                       ? RecommendationPriority::High : RecommendationPriority::Medium,
                     "Found " + std::to_string(negativeCount) +
                     " item(s) with negative item-total correlations. These items may harm "
                     "internal consistency and should be reviewed."});

    const auto lowCount = std::count_if(
      alpha.itemTotalCorrelations.begin(), alpha.itemTotalCorrelations.end(),
      [](const ItemTotalCorrelation& c) {
        return c.correlation >= 0.0 && c.correlation < kLowItemTotalCorrelation;
      });
    if (static_cast<std::size_t>(lowCount) >= kProblematicItemCount)
      out.push_back({RecommendationCategory::ItemReview, RecommendationPriority::Low,
                     "Found " + std::to_string(lowCount) +
                     " items with very low item-total correlations (< 0.15). "
                     "Consider reviewing these items for quality."});

    // Threshold warnings
    if (alpha.alpha && !alpha.meetsThreshold)
      out.push_back({RecommendationCategory::ThresholdWarning, RecommendationPriority::High,
                     "Cronbach's alpha (" + fixed2(*alpha.alpha) +
                     ") is below the acceptable threshold (>= 0.70). Internal consistency is " +
                     toString(*alpha.interpretation) + "."});

    if (testRetest.correlation && !testRetest.meetsThreshold)
      out.push_back({RecommendationCategory::ThresholdWarning, RecommendationPriority::High,
                     "Test-retest reliability (" + fixed2(*testRetest.correlation) +
                     ") is not above the acceptable threshold (> 0.50). Score stability is " +
                     toString(*testRetest.interpretation) + "."});

    if (splitHalf.spearmanBrown && !splitHalf.meetsThreshold)
      out.push_back({RecommendationCategory::ThresholdWarning, RecommendationPriority::Medium,
                     "Split-half reliability (" + fixed2(*splitHalf.spearmanBrown) +
                     ") is below the acceptable threshold (>= 0.70). Internal consistency is " +
                     toString(*splitHalf.interpretation) + "."});

    if (testRetest.meanScoreChange && testRetest.practiceEffectDetected)
    {
      const double change = *testRetest.meanScoreChange;
      std::ostringstream os;
      os << "Large practice effect detected (" << std::fixed << std::setprecision(1)
         << std::fabs(change) << " points " << (change > 0 ? "increase" : "decrease")
         << "). This may indicate insufficient item variety or test-taking strategy effects.";
      out.push_back({RecommendationCategory::ThresholdWarning, RecommendationPriority::Medium,
                     os.str()});
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const Recommendation& a, const Recommendation& b) {
                       return static_cast<int>(a.priority) < static_cast<int>(b.priority);
                     });
    return out;
  }

  OverallReliabilityStatus determineOverallStatus(const AlphaResult& alpha,
                                                  const TestRetestResult& testRetest,
                                                  const SplitHalfResult& splitHalf)
  {
    std::size_t available = 0, met = 0, excellent = 0;

    if (alpha.alpha)
    {
      ++available;
      met += alpha.meetsThreshold ? 1 : 0;
      excellent += *alpha.interpretation == ReliabilityTier::Excellent ? 1 : 0;
    }
    if (testRetest.correlation)
    {
      ++available;
      met += testRetest.meetsThreshold ? 1 : 0;
      excellent += *testRetest.interpretation == ReliabilityTier::Excellent ? 1 : 0;
    }
    if (splitHalf.spearmanBrown)
    {
      ++available;
      met += splitHalf.meetsThreshold ? 1 : 0;
      excellent += *splitHalf.interpretation == ReliabilityTier::Excellent ? 1 : 0;
    }

    if (available == 0)
      return OverallReliabilityStatus::InsufficientData;
    if (excellent == available)
      return OverallReliabilityStatus::Excellent;
    if (met == available)
      return OverallReliabilityStatus::Acceptable;
    return OverallReliabilityStatus::NeedsAttention;
  }
} // namespace psychometrics::reliability
