#pragma once

#include "adaptive/ItemInformation.h"

#include <cstddef>
#include <vector>

namespace psychometrics::adaptive
{
  struct AbilityEstimate
  {
    double theta = 0.0;
    double standardError = 1.0;   ///< posterior standard deviation
  };

  struct ScoredResponse
  {
    ItemParameters parameters;
    bool correct = false;
  };

  /**
   * @brief Expected A Posteriori ability estimation.
   *
   * The posterior is evaluated on an evenly spaced quadrature grid over
   * [lowerBound, upperBound] with a normal prior N(priorMean, priorSD^2).
   * theta is the posterior mean and the standard error the posterior SD, so
   * the estimate exists for any response pattern, including all-correct or
   * all-incorrect ones.
   */
  class EapAbilityEstimator
  {
  public:
    EapAbilityEstimator(const IItemInformationModel& model,
                        double priorMean = 0.0,
                        double priorSD = 1.0,
                        std::size_t quadraturePoints = 81,
                        double lowerBound = -4.0,
                        double upperBound = 4.0);

    AbilityEstimate estimate(const std::vector<ScoredResponse>& responses) const;

    /// Estimate before any response: the prior itself
    AbilityEstimate initialEstimate() const;

  private:
    const IItemInformationModel& mModel;
    double mPriorMean;
    double mPriorSD;
    std::vector<double> mGrid;
    std::vector<double> mLogPrior;
  };
} // namespace psychometrics::adaptive
