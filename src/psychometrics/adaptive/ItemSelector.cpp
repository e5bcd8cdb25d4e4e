#include "adaptive/ItemSelector.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace psychometrics::adaptive
{
  namespace
  {
    bool isNegative(const Item& item)
    {
      return item.discrimination && *item.discrimination < 0.0;
    }

    DiscriminationBand bandOf(const Item& item)
    {
      if (!item.discrimination)
        return DiscriminationBand::NonNegativeOrNew;

      const double d = *item.discrimination;
      if (d >= 0.30)
        return DiscriminationBand::GoodOrBetter;
      if (d >= 0.20)
        return DiscriminationBand::AcceptableOrBetter;
      if (d > 0.0)
        return DiscriminationBand::Positive;
      return DiscriminationBand::NonNegativeOrNew;
    }

    // Discrimination descending with nulls last, then least exposed, then id
    bool preferForForm(const Item& a, const Item& b)
    {
      if (a.discrimination.has_value() != b.discrimination.has_value())
        return a.discrimination.has_value();
      if (a.discrimination && *a.discrimination != *b.discrimination)
        return *a.discrimination > *b.discrimination;
      if (a.responseCount != b.responseCount)
        return a.responseCount < b.responseCount;
      return a.id < b.id;
    }

    std::size_t shareOf(std::size_t count, double share)
    {
      return static_cast<std::size_t>(std::floor(static_cast<double>(count) * share + 1e-9));
    }
  }

  std::string toString(DiscriminationBand band)
  {
    switch (band)
    {
    case DiscriminationBand::GoodOrBetter:
      return ">= 0.30";
    case DiscriminationBand::AcceptableOrBetter:
      return ">= 0.20";
    case DiscriminationBand::Positive:
      return "> 0";
    case DiscriminationBand::NonNegativeOrNew:
      return "0 or unmeasured";
    }
    return "unknown";
  }

  ItemSelector::ItemSelector(const IItemInformationModel& model, std::ostream& os)
    : mModel(model),
      mLog(os)
  {}

  void ItemSelector::log(const std::string& line) const
  {
    std::lock_guard<std::mutex> lock(mLogMutex);
    mLog << "[ItemSelector] " << line << "\n";
  }

  FixedFormSelection ItemSelector::selectFixedForm(const std::vector<Item>& pool,
                                                   std::size_t count,
                                                   const config::FixedFormSettings& shares,
                                                   const std::set<ItemId>& exclude) const
  {
    FixedFormSelection S;

    const std::size_t easy = shareOf(count, shares.easyShare);
    const std::size_t hard = shareOf(count, shares.hardShare);
    const std::size_t medium = count >= easy + hard ? count - easy - hard : 0;
    S.targetComposition[DifficultyTier::Easy] = easy;
    S.targetComposition[DifficultyTier::Medium] = medium;
    S.targetComposition[DifficultyTier::Hard] = hard;

    std::vector<Item> candidates;
    for (const auto& item : pool)
      if (isEligible(item) && !isNegative(item) && exclude.count(item.id) == 0)
        candidates.push_back(item);
    std::sort(candidates.begin(), candidates.end(), preferForForm);

    std::set<ItemId> chosen;
    for (DifficultyTier tier : kAllDifficultyTiers)
    {
      const std::size_t target = S.targetComposition[tier];
      std::map<DiscriminationBand, std::size_t> fallbackBands;
      std::size_t taken = 0;

      for (const auto& item : candidates)
      {
        if (taken == target)
          break;
        if (item.difficulty != tier)
          continue;

        S.items.push_back(item);
        chosen.insert(item.id);
        ++taken;

        const DiscriminationBand band = bandOf(item);
        if (band != DiscriminationBand::GoodOrBetter)
          ++fallbackBands[band];
      }

      for (const auto& entry : fallbackBands)
      {
        S.usedFallback = true;
        std::ostringstream os;
        os << "Fixed form: tier " << toString(tier) << " used fallback band "
           << toString(entry.first) << " for " << entry.second << " item(s)";
        log(os.str());
      }

      if (taken < target)
      {
        std::ostringstream os;
        os << "Fixed form: tier " << toString(tier) << " short by " << (target - taken)
           << " item(s)";
        log(os.str());
      }
    }

    // Cross-tier fill for tiers that ran dry
    std::size_t crossTier = 0;
    for (const auto& item : candidates)
    {
      if (S.items.size() >= count)
        break;
      if (chosen.count(item.id) != 0)
        continue;
      S.items.push_back(item);
      chosen.insert(item.id);
      ++crossTier;
    }

    if (crossTier > 0)
    {
      S.usedFallback = true;
      log("Fixed form: filled " + std::to_string(crossTier) + " item(s) across difficulty tiers");
    }

    if (S.items.size() < count)
      log("Fixed form: only " + std::to_string(S.items.size()) + " of " +
          std::to_string(count) + " items available");

    for (const auto& item : S.items)
      ++S.actualComposition[item.difficulty];

    return S;
  }

  void ItemSelector::applyContentBalance(std::vector<RankedCandidate>& candidates,
                                         const ContentBalance& balance) const
  {
    if (balance.minItemsPerDomain == 0)
      return;

    std::set<ItemType> deficient;
    std::size_t totalDeficit = 0;
    for (ItemType type : kAllItemTypes)
    {
      auto it = balance.coverage.find(type);
      const std::size_t covered = it != balance.coverage.end() ? it->second : 0;
      if (covered < balance.minItemsPerDomain)
      {
        deficient.insert(type);
        totalDeficit += balance.minItemsPerDomain - covered;
      }
    }

    // Too few slots left to cover every domain: rank on information alone
    if (deficient.empty() || totalDeficit > balance.itemsRemaining)
      return;

    std::vector<RankedCandidate> constrained;
    for (const auto& c : candidates)
      if (deficient.count(c.item.type) != 0)
        constrained.push_back(c);
    if (constrained.empty())
      return;

    std::ostringstream os;
    os << "Content balancing: " << deficient.size() << " domain(s) below "
       << balance.minItemsPerDomain << " item(s), " << constrained.size() << " of "
       << candidates.size() << " candidate(s) kept";
    log(os.str());
    candidates.swap(constrained);
  }

  std::vector<RankedCandidate> ItemSelector::rankAdaptive(const std::vector<Item>& pool,
                                                          double theta,
                                                          const std::set<ItemId>& administered,
                                                          const ContentBalance& balance) const
  {
    std::vector<RankedCandidate> primary;
    std::vector<RankedCandidate> negative;

    for (const auto& item : pool)
    {
      if (!isEligible(item) || administered.count(item.id) != 0)
        continue;

      const ItemParameters params = effectiveParameters(item);
      if (!(params.a > 0.0))
      {
        log("Skipping item " + std::to_string(item.id) + ": non-positive IRT discrimination");
        continue;
      }

      RankedCandidate c{item, mModel.information(theta, params)};
      if (isNegative(item))
        negative.push_back(std::move(c));
      else
        primary.push_back(std::move(c));
    }

    std::vector<RankedCandidate>& ranked = primary.empty() ? negative : primary;
    if (primary.empty() && !negative.empty())
      log("Eligible pool exhausted; falling back to " + std::to_string(negative.size()) +
          " negative-discrimination item(s)");

    applyContentBalance(ranked, balance);

    std::sort(ranked.begin(), ranked.end(),
              [](const RankedCandidate& a, const RankedCandidate& b) {
                if (a.information != b.information)
                  return a.information > b.information;

                const double da = a.item.discrimination.value_or(-2.0);
                const double db = b.item.discrimination.value_or(-2.0);
                if (da != db)
                  return da > db;

                if (a.item.responseCount != b.item.responseCount)
                  return a.item.responseCount < b.item.responseCount;
                return a.item.id < b.item.id;
              });

    return std::move(ranked);
  }

  std::optional<Item> ItemSelector::selectNextAdaptive(const std::vector<Item>& pool,
                                                       double theta,
                                                       const std::set<ItemId>& administered,
                                                       const ContentBalance& balance) const
  {
    const auto ranked = rankAdaptive(pool, theta, administered, balance);
    if (ranked.empty())
      return std::nullopt;
    return ranked.front().item;
  }
} // namespace psychometrics::adaptive
