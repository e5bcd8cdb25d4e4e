#include "adaptive/ItemInformation.h"

#include <algorithm>
#include <cmath>

namespace psychometrics::adaptive
{
  namespace
  {
    double logistic(double x)
    {
      // Stable for large |x|
      if (x >= 0.0)
        return 1.0 / (1.0 + std::exp(-x));
      const double e = std::exp(x);
      return e / (1.0 + e);
    }

    double tierDifficulty(DifficultyTier tier)
    {
      switch (tier)
      {
      case DifficultyTier::Easy:
        return -1.0;
      case DifficultyTier::Medium:
        return 0.0;
      case DifficultyTier::Hard:
        return 1.0;
      }
      return 0.0;
    }

    // Guessing outside [0, 1) has no meaning for the 3PL curve
    double boundedGuessing(double c)
    {
      return std::clamp(c, 0.0, 0.99);
    }
  }

  ItemParameters effectiveParameters(const Item& item)
  {
    ItemParameters p;
    if (item.irt)
    {
      p.a = item.irt->discrimination;
      p.b = item.irt->difficulty;
      p.c = item.irt->guessing;
    }
    else
    {
      p.b = tierDifficulty(item.difficulty);
    }
    return p;
  }

  double RaschInformationModel::probability(double theta, const ItemParameters& p) const
  {
    return logistic(theta - p.b);
  }

  double RaschInformationModel::information(double theta, const ItemParameters& p) const
  {
    const double P = probability(theta, p);
    return P * (1.0 - P);
  }

  double TwoPLInformationModel::probability(double theta, const ItemParameters& p) const
  {
    return logistic(p.a * (theta - p.b));
  }

  double TwoPLInformationModel::information(double theta, const ItemParameters& p) const
  {
    const double P = probability(theta, p);
    return p.a * p.a * P * (1.0 - P);
  }

  double ThreePLInformationModel::probability(double theta, const ItemParameters& p) const
  {
    const double c = boundedGuessing(p.c);
    return c + (1.0 - c) * logistic(p.a * (theta - p.b));
  }

  double ThreePLInformationModel::information(double theta, const ItemParameters& p) const
  {
    const double c = boundedGuessing(p.c);
    const double P = probability(theta, p);
    if (P <= 0.0)
      return 0.0;

    const double Q = 1.0 - P;
    const double ratio = (P - c) / (1.0 - c);
    return p.a * p.a * (Q / P) * ratio * ratio;
  }

  std::unique_ptr<IItemInformationModel> makeInformationModel(config::InformationModel model)
  {
    switch (model)
    {
    case config::InformationModel::OnePL:
      return std::make_unique<RaschInformationModel>();
    case config::InformationModel::ThreePL:
      return std::make_unique<ThreePLInformationModel>();
    case config::InformationModel::TwoPL:
      break;
    }
    return std::make_unique<TwoPLInformationModel>();
  }
} // namespace psychometrics::adaptive
