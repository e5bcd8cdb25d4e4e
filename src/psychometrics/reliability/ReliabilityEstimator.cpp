#include "reliability/ReliabilityEstimator.h"
#include "PsychometricStats.h"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>

namespace psychometrics::reliability
{
  using stats::roundTo;

  namespace
  {
    std::string insufficient(const std::string& what, std::size_t have, std::size_t need)
    {
      std::ostringstream os;
      os << "Insufficient data: " << have << " " << what << " (minimum required: " << need << ")";
      return os.str();
    }

    std::size_t appearanceThreshold(std::size_t sessionCount,
                                    const config::ReliabilitySettings& settings)
    {
      const auto byRatio = static_cast<std::size_t>(
        std::floor(static_cast<double>(sessionCount) * settings.minItemAppearanceRatio));
      return std::max(settings.minItemAppearanceAbsolute, byRatio);
    }

    // Items answered in at least appearanceThreshold() sessions, ascending id
    std::vector<ItemId> eligibleItems(const std::vector<SessionResponses>& sessions,
                                      const config::ReliabilitySettings& settings)
    {
      std::map<ItemId, std::size_t> appearances;
      for (const auto& s : sessions)
      {
        std::set<ItemId> seen;
        for (const auto& r : s.responses)
          if (seen.insert(r.itemId).second)
            ++appearances[r.itemId];
      }

      const std::size_t threshold = appearanceThreshold(sessions.size(), settings);
      std::vector<ItemId> eligible;
      for (const auto& entry : appearances)
        if (entry.second >= threshold)
          eligible.push_back(entry.first);
      return eligible;
    }
  }

  ReliabilityEstimator::ReliabilityEstimator(const IResponseRepository& responses,
                                             const config::ReliabilitySettings& settings,
                                             std::ostream& os,
                                             utils::Clock clock)
    : mResponses(responses),
      mSettings(settings),
      mLog(os),
      mClock(clock),
      mCache(boost::posix_time::seconds(settings.cacheTtlSeconds), clock)
  {}

  // ------------------------------------------------------------------ alpha

  AlphaResult ReliabilityEstimator::calculateAlpha(const std::vector<SessionResponses>& sessions,
                                                   const config::ReliabilitySettings& settings)
  {
    AlphaResult R;
    R.numSessions = sessions.size();

    if (sessions.size() < settings.minSessions)
    {
      R.insufficientData = true;
      R.message = insufficient("completed sessions", sessions.size(), settings.minSessions);
      return R;
    }

    const std::vector<ItemId> items = eligibleItems(sessions, settings);
    R.numItems = items.size();
    if (items.size() < 2)
    {
      R.insufficientData = true;
      R.message = "Insufficient items: only " + std::to_string(items.size()) +
                  " items appear in enough sessions (need at least 2)";
      return R;
    }

    // session -> (item -> 0/1) restricted to eligible items
    std::vector<std::map<ItemId, int>> answered;
    answered.reserve(sessions.size());
    for (const auto& s : sessions)
    {
      std::map<ItemId, int> row;
      for (const auto& r : s.responses)
        if (std::binary_search(items.begin(), items.end(), r.itemId))
          row.emplace(r.itemId, r.isCorrect ? 1 : 0);
      answered.push_back(std::move(row));
    }

    // Prefer sessions that saw the whole eligible set; otherwise accept
    // sessions covering most of it.
    std::vector<const std::map<ItemId, int>*> rows;
    for (const auto& row : answered)
      if (row.size() == items.size())
        rows.push_back(&row);

    if (rows.size() < settings.minSessions)
    {
      rows.clear();
      const auto minCovered = static_cast<std::size_t>(
        std::floor(static_cast<double>(items.size()) * kSessionCompletionFallbackRatio));
      for (const auto& row : answered)
        if (row.size() >= std::max<std::size_t>(minCovered, 1))
          rows.push_back(&row);
    }

    R.numSessions = rows.size();
    if (rows.size() < settings.minSessions)
    {
      R.insufficientData = true;
      R.message = insufficient("sessions with enough common items", rows.size(), settings.minSessions);
      return R;
    }

    std::vector<double> totals;
    totals.reserve(rows.size());
    for (const auto* row : rows)
    {
      double total = 0.0;
      for (const auto& entry : *row)
        total += entry.second;
      totals.push_back(total);
    }

    // Per-item variance over the sessions that actually answered the item
    double sumItemVariances = 0.0;
    for (ItemId id : items)
    {
      std::vector<double> scores;
      std::vector<double> restTotals;
      for (std::size_t i = 0; i < rows.size(); ++i)
      {
        auto it = rows[i]->find(id);
        if (it == rows[i]->end())
          continue;
        scores.push_back(it->second);
        restTotals.push_back(totals[i] - it->second);
      }

      sumItemVariances += stats::sampleVariance(scores);

      const double r = stats::pearsonCorrelation(scores, restTotals).value_or(0.0);
      R.itemTotalCorrelations.push_back(ItemTotalCorrelation{id, roundTo(r, 4)});
    }

    const double totalVariance = stats::sampleVariance(totals);
    const double alpha = stats::cronbachsAlpha(items.size(), sumItemVariances, totalVariance);
    if (!(totalVariance > 0.0))
      R.message = "Zero variance in total scores; alpha reported as 0";

    R.alpha = roundTo(alpha, 4);
    R.interpretation = interpretAlpha(alpha);
    R.meetsThreshold = alphaMeetsMinimum(alpha);

    for (const auto& itc : R.itemTotalCorrelations)
    {
      if (itc.correlation < 0.0)
        R.problematicItems.push_back(ProblematicItem{
          itc.itemId, itc.correlation,
          "Negative item-total correlation: review or remove"});
      else if (itc.correlation < kLowItemTotalCorrelation)
        R.problematicItems.push_back(ProblematicItem{
          itc.itemId, itc.correlation,
          "Low item-total correlation: review item quality"});
    }
    std::stable_sort(R.problematicItems.begin(), R.problematicItems.end(),
                     [](const ProblematicItem& a, const ProblematicItem& b) {
                       return a.correlation < b.correlation;
                     });
    return R;
  }

  // ------------------------------------------------------------- split-half

  SplitHalfResult ReliabilityEstimator::calculateSplitHalf(const std::vector<SessionResponses>& sessions,
                                                           const config::ReliabilitySettings& settings)
  {
    SplitHalfResult R;
    R.numSessions = sessions.size();

    if (sessions.size() < settings.minSessions)
    {
      R.insufficientData = true;
      R.message = insufficient("completed sessions", sessions.size(), settings.minSessions);
      return R;
    }

    const std::vector<ItemId> items = eligibleItems(sessions, settings);
    R.numItems = items.size();
    if (items.size() < 4)
    {
      R.insufficientData = true;
      R.message = "Insufficient items: only " + std::to_string(items.size()) +
                  " items appear in enough sessions (need at least 4)";
      return R;
    }

    std::vector<double> oddScores;
    std::vector<double> evenScores;
    for (const auto& s : sessions)
    {
      std::vector<const ResponseRecord*> ordered;
      for (const auto& r : s.responses)
        if (std::binary_search(items.begin(), items.end(), r.itemId))
          ordered.push_back(&r);

      // Two items per half at least
      if (ordered.size() < 4)
        continue;

      std::stable_sort(ordered.begin(), ordered.end(),
                       [](const ResponseRecord* a, const ResponseRecord* b) {
                         return a->sequence < b->sequence;
                       });

      double oddCorrect = 0.0, evenCorrect = 0.0;
      std::size_t oddCount = 0, evenCount = 0;
      for (std::size_t i = 0; i < ordered.size(); ++i)
      {
        // Positions 1, 3, 5, ... form the odd half
        if (i % 2 == 0)
        {
          ++oddCount;
          oddCorrect += ordered[i]->isCorrect ? 1.0 : 0.0;
        }
        else
        {
          ++evenCount;
          evenCorrect += ordered[i]->isCorrect ? 1.0 : 0.0;
        }
      }
      oddScores.push_back(oddCorrect / static_cast<double>(oddCount));
      evenScores.push_back(evenCorrect / static_cast<double>(evenCount));
    }

    R.numSessions = oddScores.size();
    if (oddScores.size() < settings.minSessions)
    {
      R.insufficientData = true;
      R.message = insufficient("sessions with at least 4 eligible items",
                               oddScores.size(), settings.minSessions);
      return R;
    }

    const auto rHalf = stats::pearsonCorrelation(oddScores, evenScores);
    if (!rHalf)
    {
      R.message = "Could not correlate halves: zero variance in half scores";
      return R;
    }

    const double full = stats::spearmanBrown(*rHalf);
    R.halfCorrelation = roundTo(*rHalf, 4);
    R.spearmanBrown = roundTo(full, 4);
    R.interpretation = interpretSplitHalf(full);
    R.meetsThreshold = splitHalfMeetsMinimum(full);
    return R;
  }

  // ------------------------------------------------------------ test-retest

  TestRetestResult ReliabilityEstimator::calculateTestRetest(const std::vector<RetestPair>& pairs,
                                                             const config::ReliabilitySettings& settings)
  {
    TestRetestResult R;
    R.numPairs = pairs.size();

    if (pairs.size() < settings.minRetestPairs)
    {
      R.insufficientData = true;
      R.message = insufficient("retest pairs", pairs.size(), settings.minRetestPairs);
      return R;
    }

    std::vector<double> first, second, changes, intervals;
    for (const auto& p : pairs)
    {
      first.push_back(p.first.score);
      second.push_back(p.second.score);
      changes.push_back(p.second.score - p.first.score);
      intervals.push_back(p.intervalDays);
    }

    const auto r = stats::pearsonCorrelation(first, second);
    if (!r)
    {
      R.message = "Could not calculate correlation: zero variance in scores";
      return R;
    }

    const stats::SampleMoments change = stats::computeSampleMoments(changes);

    R.correlation = roundTo(*r, 4);
    R.interpretation = interpretTestRetest(*r);
    R.meetsThreshold = testRetestMeetsMinimum(*r);
    R.meanIntervalDays = roundTo(stats::computeSampleMoments(intervals).mean, 1);
    R.meanScoreChange = roundTo(change.mean, 2);
    R.scoreChangeSD = roundTo(std::sqrt(change.variance), 2);
    R.practiceEffectDetected = std::fabs(change.mean) > kLargePracticeEffect;
    return R;
  }

  // ------------------------------------------------------ repository-backed

  std::vector<SessionResponses> ReliabilityEstimator::loadCompletedSessions() const
  {
    std::vector<SessionResponses> sessions;
    for (SessionId id : mResponses.completedSessionIds())
    {
      SessionResponses s;
      s.sessionId = id;
      s.responses = mResponses.allResponsesForSession(id);
      sessions.push_back(std::move(s));
    }
    return sessions;
  }

  void ReliabilityEstimator::log(const std::string& line) const
  {
    std::lock_guard<std::mutex> lock(mLogMutex);
    mLog << "[Reliability] " << line << "\n";
  }

  AlphaResult ReliabilityEstimator::estimateAlpha(std::optional<std::size_t> minSessions) const
  {
    config::ReliabilitySettings settings = mSettings;
    if (minSessions)
      settings.minSessions = *minSessions;

    const AlphaResult R = calculateAlpha(loadCompletedSessions(), settings);

    std::ostringstream os;
    if (R.alpha)
      os << "Cronbach's alpha = " << std::fixed << std::setprecision(4) << *R.alpha
         << " (" << toString(*R.interpretation) << ") from " << R.numSessions
         << " sessions and " << R.numItems << " items";
    else
      os << "Cronbach's alpha skipped: " << R.message;
    log(os.str());
    return R;
  }

  SplitHalfResult ReliabilityEstimator::estimateSplitHalf(std::optional<std::size_t> minSessions) const
  {
    config::ReliabilitySettings settings = mSettings;
    if (minSessions)
      settings.minSessions = *minSessions;

    const SplitHalfResult R = calculateSplitHalf(loadCompletedSessions(), settings);

    std::ostringstream os;
    if (R.spearmanBrown)
      os << "Split-half r = " << std::fixed << std::setprecision(4) << *R.halfCorrelation
         << ", Spearman-Brown = " << *R.spearmanBrown
         << " (" << toString(*R.interpretation) << ") from " << R.numSessions << " sessions";
    else
      os << "Split-half skipped: " << R.message;
    log(os.str());
    return R;
  }

  TestRetestResult ReliabilityEstimator::estimateTestRetest(std::optional<std::size_t> minPairs) const
  {
    config::ReliabilitySettings settings = mSettings;
    if (minPairs)
      settings.minRetestPairs = *minPairs;

    const TestRetestResult R = calculateTestRetest(
      mResponses.sessionsWithMultipleCompletions(settings.retestMinDays, settings.retestMaxDays),
      settings);

    std::ostringstream os;
    if (R.correlation)
      os << "Test-retest r = " << std::fixed << std::setprecision(4) << *R.correlation
         << " (" << toString(*R.interpretation) << ") from " << R.numPairs
         << " pairs, mean interval " << std::setprecision(1) << *R.meanIntervalDays
         << " days, practice effect " << std::setprecision(2) << *R.meanScoreChange;
    else
      os << "Test-retest skipped: " << R.message;
    log(os.str());
    return R;
  }

  std::shared_ptr<const ReliabilitySnapshot> ReliabilityEstimator::currentReliability() const
  {
    if (auto cached = mCache.get())
      return cached;

    auto snapshot = std::make_shared<ReliabilitySnapshot>();
    snapshot->alpha = estimateAlpha();
    snapshot->splitHalf = estimateSplitHalf();
    snapshot->testRetest = estimateTestRetest();
    snapshot->computedAt = mClock();

    std::shared_ptr<const ReliabilitySnapshot> published = snapshot;
    mCache.put(published);
    return published;
  }

  void ReliabilityEstimator::invalidateCache() const
  {
    mCache.invalidate();
  }
} // namespace psychometrics::reliability
