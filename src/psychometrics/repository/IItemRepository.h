#pragma once

#include "PsychometricTypes.h"
#include <optional>
#include <string>
#include <vector>

namespace psychometrics::repository
{
  /**
   * @brief Storage boundary for the item pool.
   *
   * Implementations report storage errors with RepositoryFailureException and
   * unknown identifiers on mutating calls with NotFoundException.
   */
  class IItemRepository
  {
  public:
    virtual ~IItemRepository() = default;

    virtual std::optional<Item> findItem(ItemId itemId) const = 0;
    virtual std::vector<Item> allItems() const = 0;

    virtual void updateStatistics(ItemId itemId,
                                  std::optional<double> discrimination,
                                  std::size_t responseCount) = 0;

    /**
     * @brief Single-row conditional update of the quality flag.
     *
     * The flag changes to @p desired only if it currently equals
     * @p expected. Concurrent callers racing on the same item therefore see
     * exactly one winner.
     *
     * @return true if this call performed the transition, which is
     *         recorded with @p source.
     */
    virtual bool compareAndSetQualityFlag(ItemId itemId,
                                          QualityFlag expected,
                                          QualityFlag desired,
                                          const std::string& reason,
                                          const Timestamp& at,
                                          FlagSource source) = 0;

    /// Unconditional write, used for operator overrides. Recorded as manual.
    virtual void setQualityFlag(ItemId itemId,
                                QualityFlag flag,
                                const std::optional<std::string>& reason,
                                const Timestamp& at) = 0;

    /// Every recorded flag transition of the item, oldest first.
    virtual std::vector<FlagTransition> flagHistory(ItemId itemId) const = 0;
  };
} // namespace psychometrics::repository
