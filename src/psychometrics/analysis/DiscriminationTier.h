#pragma once

#include <optional>
#include <string>

namespace psychometrics::analysis
{
  /**
   * @brief Quality band of a point-biserial discrimination value.
   *
   * Bands are half-open and non-overlapping:
   *   Excellent >= 0.40, Good [0.30, 0.40), Acceptable [0.20, 0.30),
   *   Poor [0.10, 0.20), VeryPoor [0.00, 0.10), Negative < 0.00
   */
  enum class DiscriminationTier
  {
    Excellent,
    Good,
    Acceptable,
    Poor,
    VeryPoor,
    Negative
  };

  /// A null discrimination has no tier; unmeasured items are not problematic.
  inline std::optional<DiscriminationTier> classifyDiscrimination(std::optional<double> value)
  {
    if (!value)
      return std::nullopt;

    const double d = *value;
    if (d >= 0.40)
      return DiscriminationTier::Excellent;
    if (d >= 0.30)
      return DiscriminationTier::Good;
    if (d >= 0.20)
      return DiscriminationTier::Acceptable;
    if (d >= 0.10)
      return DiscriminationTier::Poor;
    if (d >= 0.0)
      return DiscriminationTier::VeryPoor;
    return DiscriminationTier::Negative;
  }

  inline std::string toString(DiscriminationTier tier)
  {
    switch (tier)
    {
    case DiscriminationTier::Excellent:
      return "excellent";
    case DiscriminationTier::Good:
      return "good";
    case DiscriminationTier::Acceptable:
      return "acceptable";
    case DiscriminationTier::Poor:
      return "poor";
    case DiscriminationTier::VeryPoor:
      return "very_poor";
    case DiscriminationTier::Negative:
      return "negative";
    }
    return "unknown";
  }
} // namespace psychometrics::analysis
