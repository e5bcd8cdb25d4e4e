#pragma once

#include "PsychometricTypes.h"
#include "adaptive/ItemInformation.h"
#include "config/EngineConfiguration.h"

#include <map>
#include <mutex>
#include <optional>
#include <ostream>
#include <set>
#include <vector>

namespace psychometrics::adaptive
{
  /// Discrimination bands tried in order when filling a fixed form.
  enum class DiscriminationBand
  {
    GoodOrBetter,     ///< >= 0.30
    AcceptableOrBetter, ///< >= 0.20
    Positive,         ///< > 0
    NonNegativeOrNew  ///< == 0 or null
  };

  std::string toString(DiscriminationBand band);

  struct FixedFormSelection
  {
    std::vector<Item> items;
    std::map<DifficultyTier, std::size_t> targetComposition;
    std::map<DifficultyTier, std::size_t> actualComposition;
    bool usedFallback = false;
  };

  struct RankedCandidate
  {
    Item item;
    double information = 0.0;
  };

  /**
   * @brief Domain coverage of a running session.
   *
   * While some item types are below minItemsPerDomain and the remaining
   * slots can still cover the total deficit, adaptive ranking is limited
   * to candidates of the deficient types.
   */
  struct ContentBalance
  {
    std::map<ItemType, std::size_t> coverage;
    std::size_t minItemsPerDomain = 0;   ///< 0 disables balancing
    std::size_t itemsRemaining = 0;
  };

  /**
   * @brief Chooses items for a session.
   *
   * Only items whose quality_flag is normal are ever eligible. Negative
   * discrimination is excluded from fixed forms entirely and used by the
   * adaptive ranking only when nothing else remains.
   */
  class ItemSelector
  {
  public:
    ItemSelector(const IItemInformationModel& model, std::ostream& os);

    static bool isEligible(const Item& item)
    {
      return item.qualityFlag == QualityFlag::Normal;
    }

    /**
     * @brief Stratified fixed form of @p count items.
     *
     * Targets are floor(count * share) for easy and hard with the remainder
     * going to medium. Within a tier items are ordered by discrimination
     * descending with nulls last; short tiers are filled from the other
     * tiers and the fallback is logged.
     */
    FixedFormSelection selectFixedForm(const std::vector<Item>& pool,
                                       std::size_t count,
                                       const config::FixedFormSettings& shares,
                                       const std::set<ItemId>& exclude = {}) const;

    /**
     * @brief Eligible, not yet administered items ranked for adaptive use.
     *
     * Content balancing narrows the candidates before ranking. Order:
     * information at theta descending, then discrimination descending
     * (null lowest), then responseCount ascending, then id.
     */
    std::vector<RankedCandidate> rankAdaptive(const std::vector<Item>& pool,
                                              double theta,
                                              const std::set<ItemId>& administered,
                                              const ContentBalance& balance = ContentBalance()) const;

    /// Head of rankAdaptive(), or nothing when the eligible pool is empty.
    std::optional<Item> selectNextAdaptive(const std::vector<Item>& pool,
                                           double theta,
                                           const std::set<ItemId>& administered,
                                           const ContentBalance& balance = ContentBalance()) const;

  private:
    void applyContentBalance(std::vector<RankedCandidate>& candidates,
                             const ContentBalance& balance) const;
    void log(const std::string& line) const;

    const IItemInformationModel& mModel;
    std::ostream& mLog;
    mutable std::mutex mLogMutex;
  };
} // namespace psychometrics::adaptive
