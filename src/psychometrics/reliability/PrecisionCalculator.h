#pragma once

#include "PsychometricTypes.h"
#include "config/EngineConfiguration.h"

#include <optional>

namespace psychometrics::reliability
{
  /**
   * @brief Turns a reliability coefficient into score precision.
   *
   *   SEM = populationSD * sqrt(1 - reliability)
   *   CI  = score +/- z * SEM, rounded to integers and clamped into the
   *         instrument's score range
   */
  class PrecisionCalculator
  {
  public:
    explicit PrecisionCalculator(const config::PrecisionSettings& settings = config::PrecisionSettings());

    /// @throws InvalidInputException if reliability is outside [0, 1]
    double computeSEM(double reliability) const;

    /// @throws InvalidInputException if reliability is outside [0, 1] or populationSD <= 0
    static double computeSEM(double reliability, double populationSD);

    /**
     * @brief Two-sided interval around an observed score.
     *
     * The score is first clamped into [scoreFloor, scoreCeiling]; the result
     * always satisfies floor <= lower <= round(score) <= upper <= ceiling.
     *
     * @throws InvalidInputException if confidenceLevel is outside (0, 1) or
     *         sem is negative
     */
    ConfidenceInterval computeConfidenceInterval(double score,
                                                 double sem,
                                                 double confidenceLevel) const;

    /**
     * @brief Interval at the configured confidence level, or nothing.
     *
     * Returns std::nullopt when no reliability is available or it is below
     * the usability floor; the caller reports "too imprecise" instead of a
     * misleadingly wide band.
     */
    std::optional<ConfidenceInterval> intervalForScore(double score,
                                                       std::optional<double> reliability) const;

    const config::PrecisionSettings& getSettings() const
    {
      return mSettings;
    }

  private:
    config::PrecisionSettings mSettings;
  };
} // namespace psychometrics::reliability
