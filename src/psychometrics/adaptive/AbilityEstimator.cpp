#include "adaptive/AbilityEstimator.h"
#include "PsychometricExceptions.h"

#include <algorithm>
#include <cmath>

namespace psychometrics::adaptive
{
  namespace
  {
    constexpr double kProbabilityFloor = 1e-10;
  }

  EapAbilityEstimator::EapAbilityEstimator(const IItemInformationModel& model,
                                           double priorMean,
                                           double priorSD,
                                           std::size_t quadraturePoints,
                                           double lowerBound,
                                           double upperBound)
    : mModel(model),
      mPriorMean(priorMean),
      mPriorSD(priorSD)
  {
    if (quadraturePoints < 3)
      throw InvalidInputException("EAP estimation needs at least 3 quadrature points");
    if (!(priorSD > 0.0))
      throw InvalidInputException("EAP prior SD must be positive");
    if (!(upperBound > lowerBound))
      throw InvalidInputException("EAP grid bounds are empty");

    mGrid.reserve(quadraturePoints);
    mLogPrior.reserve(quadraturePoints);
    const double step = (upperBound - lowerBound) / static_cast<double>(quadraturePoints - 1);
    for (std::size_t i = 0; i < quadraturePoints; ++i)
    {
      const double theta = lowerBound + step * static_cast<double>(i);
      const double z = (theta - priorMean) / priorSD;
      mGrid.push_back(theta);
      mLogPrior.push_back(-0.5 * z * z);   // constant factor cancels on normalization
    }
  }

  AbilityEstimate EapAbilityEstimator::initialEstimate() const
  {
    return AbilityEstimate{mPriorMean, mPriorSD};
  }

  AbilityEstimate EapAbilityEstimator::estimate(const std::vector<ScoredResponse>& responses) const
  {
    std::vector<double> logPosterior(mLogPrior);

    for (std::size_t i = 0; i < mGrid.size(); ++i)
    {
      for (const auto& r : responses)
      {
        const double P = std::clamp(mModel.probability(mGrid[i], r.parameters),
                                    kProbabilityFloor, 1.0 - kProbabilityFloor);
        logPosterior[i] += r.correct ? std::log(P) : std::log(1.0 - P);
      }
    }

    const double maxLog = *std::max_element(logPosterior.begin(), logPosterior.end());

    double norm = 0.0, mean = 0.0;
    std::vector<double> weights(mGrid.size());
    for (std::size_t i = 0; i < mGrid.size(); ++i)
    {
      weights[i] = std::exp(logPosterior[i] - maxLog);
      norm += weights[i];
      mean += weights[i] * mGrid[i];
    }
    mean /= norm;

    double variance = 0.0;
    for (std::size_t i = 0; i < mGrid.size(); ++i)
    {
      const double d = mGrid[i] - mean;
      variance += weights[i] * d * d;
    }
    variance /= norm;

    return AbilityEstimate{mean, std::sqrt(variance)};
  }
} // namespace psychometrics::adaptive
