#pragma once

#include "PsychometricTypes.h"
#include "diagnostics/IQualityFlagObserver.h"
#include "repository/IItemRepository.h"
#include "utils/TimeUtils.h"

#include <optional>
#include <string>

namespace psychometrics::analysis
{
  using psychometrics::diagnostics::IQualityFlagObserver;
  using psychometrics::repository::IItemRepository;

  struct FlagDecision
  {
    ItemId itemId = 0;
    QualityFlag previousFlag = QualityFlag::Normal;
    QualityFlag currentFlag = QualityFlag::Normal;
    bool changed = false;
    std::optional<std::string> reason;
    std::optional<Timestamp> updatedAt;
  };

  /**
   * @brief Owns the quality_flag state machine of the item pool.
   *
   * Automatic evaluation only ever moves an item from normal to under_review.
   * The write is a conditional single-row update, so concurrent evaluations
   * of the same item produce one transition and one observer notification.
   */
  class QualityFlagController
  {
  public:
    QualityFlagController(IItemRepository& items,
                          IQualityFlagObserver& observer,
                          std::size_t minResponses = 50,
                          utils::Clock clock = utils::systemClock());

    /**
     * @brief Applies the auto-flag rule to an item snapshot.
     *
     * Flags when responseCount >= minResponses and discrimination < 0
     * (strict). Otherwise, or if the stored flag is no longer normal, the
     * call is a no-op.
     */
    FlagDecision evaluate(const Item& item) const;

    /// Loads the item and evaluates it. @throws NotFoundException
    FlagDecision evaluate(ItemId itemId) const;

    /**
     * @brief Operator override to any flag value.
     *
     * @throws NotFoundException for an unknown item
     * @throws InvalidInputException when setting deactivated without a
     *         non-empty reason
     */
    FlagDecision overrideFlag(ItemId itemId,
                              QualityFlag newFlag,
                              const std::optional<std::string>& reason) const;

    /**
     * @brief Manual request to put a normal item under review.
     *
     * A no-op for an item already under review.
     * @throws ConflictingStateException if the item is deactivated; only
     *         overrideFlag() may move it.
     */
    FlagDecision requestReview(ItemId itemId, const std::string& reason) const;

    static std::string negativeDiscriminationReason(double discrimination);

  private:
    Item loadItem(ItemId itemId) const;

    IItemRepository& mItems;
    IQualityFlagObserver& mObserver;
    std::size_t mMinResponses;
    utils::Clock mClock;
  };
} // namespace psychometrics::analysis
