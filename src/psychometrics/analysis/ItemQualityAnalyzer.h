#pragma once

#include "PsychometricTypes.h"
#include "analysis/DiscriminationTier.h"
#include "repository/IResponseRepository.h"

#include <cstddef>
#include <optional>
#include <string>

namespace psychometrics::analysis
{
  using psychometrics::repository::IResponseRepository;

  struct DiscriminationResult
  {
    ItemId itemId = 0;
    std::optional<double> value;          ///< null when insufficientData
    std::size_t responseCount = 0;        ///< responses from completed sessions
    std::optional<double> proportionCorrect;
    bool insufficientData = false;
    std::string message;
  };

  /**
   * @brief Measures how well an item separates strong from weak examinees.
   *
   * For every completed session that answered the item, the 0/1 correctness
   * on that item is paired with the session's total number correct and the
   * point-biserial correlation is taken across sessions.
   */
  class ItemQualityAnalyzer
  {
  public:
    explicit ItemQualityAnalyzer(const IResponseRepository& responses,
                                 std::size_t minResponses = 50);

    DiscriminationResult computeDiscrimination(ItemId itemId) const;

    static std::optional<DiscriminationTier> classify(std::optional<double> discrimination)
    {
      return classifyDiscrimination(discrimination);
    }

    std::size_t getMinResponses() const
    {
      return mMinResponses;
    }

  private:
    const IResponseRepository& mResponses;
    std::size_t mMinResponses;
  };
} // namespace psychometrics::analysis
