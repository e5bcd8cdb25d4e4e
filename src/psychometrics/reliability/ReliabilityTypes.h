#pragma once

#include "PsychometricTypes.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace psychometrics::reliability
{
  enum class ReliabilityTier
  {
    Excellent,
    Good,
    Acceptable,
    Questionable,
    Poor,
    Unacceptable
  };

  std::string toString(ReliabilityTier tier);

  /// Minimum bars for the instrument
  constexpr double kAlphaMinimum = 0.70;
  constexpr double kSplitHalfMinimum = 0.70;
  constexpr double kTestRetestMinimum = 0.50;     // strict: r must exceed it

  constexpr double kLowItemTotalCorrelation = 0.15;
  constexpr double kLargePracticeEffect = 5.0;
  constexpr std::size_t kProblematicItemCount = 3;
  constexpr double kSessionCompletionFallbackRatio = 0.80;

  /**
   * @brief Internal-consistency bands, inclusive lower bounds:
   * 0.90 excellent, 0.80 good, 0.70 acceptable, 0.60 questionable, 0.50 poor.
   */
  ReliabilityTier interpretAlpha(double alpha);

  /// Same bands as alpha, applied to the Spearman-Brown corrected value.
  ReliabilityTier interpretSplitHalf(double spearmanBrownR);

  /// Stability bands, strict lower bounds: > 0.90, > 0.70, > 0.50, else poor.
  ReliabilityTier interpretTestRetest(double r);

  bool alphaMeetsMinimum(double alpha);
  bool splitHalfMeetsMinimum(double spearmanBrownR);
  bool testRetestMeetsMinimum(double r);

  /// Completed session responses ordered by administration sequence.
  struct SessionResponses
  {
    SessionId sessionId = 0;
    std::vector<ResponseRecord> responses;
  };

  struct ItemTotalCorrelation
  {
    ItemId itemId = 0;
    double correlation = 0.0;   ///< corrected: total excludes the item itself
  };

  struct ProblematicItem
  {
    ItemId itemId = 0;
    double correlation = 0.0;
    std::string recommendation;
  };

  struct AlphaResult
  {
    std::optional<double> alpha;
    std::optional<ReliabilityTier> interpretation;
    bool meetsThreshold = false;
    std::size_t numSessions = 0;
    std::size_t numItems = 0;
    std::vector<ItemTotalCorrelation> itemTotalCorrelations;
    std::vector<ProblematicItem> problematicItems;   ///< most negative first
    bool insufficientData = false;
    std::string message;
  };

  struct SplitHalfResult
  {
    std::optional<double> halfCorrelation;
    std::optional<double> spearmanBrown;
    std::optional<ReliabilityTier> interpretation;
    bool meetsThreshold = false;
    std::size_t numSessions = 0;
    std::size_t numItems = 0;
    bool insufficientData = false;
    std::string message;
  };

  struct TestRetestResult
  {
    std::optional<double> correlation;
    std::optional<ReliabilityTier> interpretation;
    bool meetsThreshold = false;
    std::size_t numPairs = 0;
    std::optional<double> meanIntervalDays;
    std::optional<double> meanScoreChange;
    std::optional<double> scoreChangeSD;
    bool practiceEffectDetected = false;
    bool insufficientData = false;
    std::string message;
  };
} // namespace psychometrics::reliability
