#pragma once

#include "PsychometricTypes.h"
#include "config/EngineConfiguration.h"

#include <memory>
#include <string>

namespace psychometrics::adaptive
{
  /**
   * @brief Parameters the information models evaluate.
   */
  struct ItemParameters
  {
    double a = 1.0;
    double b = 0.0;
    double c = 0.0;
  };

  /**
   * @brief Calibrated IRT parameters when present, otherwise a = 1 and b
   * placed by difficulty tier (easy -1, medium 0, hard +1).
   */
  ItemParameters effectiveParameters(const Item& item);

  /**
   * @brief Item response function and its Fisher information.
   *
   * Strategy seam for adaptive selection and ability estimation.
   */
  class IItemInformationModel
  {
  public:
    virtual ~IItemInformationModel() = default;

    /// Probability of a correct response at ability theta
    virtual double probability(double theta, const ItemParameters& p) const = 0;

    /// Fisher information at ability theta
    virtual double information(double theta, const ItemParameters& p) const = 0;

    virtual std::string name() const = 0;
  };

  /// One-parameter logistic; discrimination fixed at 1.
  class RaschInformationModel : public IItemInformationModel
  {
  public:
    double probability(double theta, const ItemParameters& p) const override;
    double information(double theta, const ItemParameters& p) const override;
    std::string name() const override
    {
      return "1PL";
    }
  };

  /// I(theta) = a^2 P (1 - P)
  class TwoPLInformationModel : public IItemInformationModel
  {
  public:
    double probability(double theta, const ItemParameters& p) const override;
    double information(double theta, const ItemParameters& p) const override;
    std::string name() const override
    {
      return "2PL";
    }
  };

  /// I(theta) = a^2 (Q / P) ((P - c) / (1 - c))^2
  class ThreePLInformationModel : public IItemInformationModel
  {
  public:
    double probability(double theta, const ItemParameters& p) const override;
    double information(double theta, const ItemParameters& p) const override;
    std::string name() const override
    {
      return "3PL";
    }
  };

  std::unique_ptr<IItemInformationModel> makeInformationModel(config::InformationModel model);
} // namespace psychometrics::adaptive
