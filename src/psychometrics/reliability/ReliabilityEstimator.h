#pragma once

#include "config/EngineConfiguration.h"
#include "reliability/ReliabilityCache.h"
#include "reliability/ReliabilityTypes.h"
#include "repository/IResponseRepository.h"
#include "utils/TimeUtils.h"

#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <vector>

namespace psychometrics::reliability
{
  using psychometrics::repository::IResponseRepository;

  /**
   * @brief Instrument reliability: Cronbach's alpha, odd/even split-half and
   * test-retest.
   *
   * The calculate* functions are pure and operate on already-fetched data.
   * The estimate* members load completed sessions from the response
   * repository, delegate to them and log one summary line each.
   *
   * Every calculation fails closed: a sample below its minimum produces
   * insufficientData = true and no coefficient.
   */
  class ReliabilityEstimator
  {
  public:
    ReliabilityEstimator(const IResponseRepository& responses,
                         const config::ReliabilitySettings& settings,
                         std::ostream& os,
                         utils::Clock clock = utils::systemClock());

    static AlphaResult calculateAlpha(const std::vector<SessionResponses>& sessions,
                                      const config::ReliabilitySettings& settings);

    static SplitHalfResult calculateSplitHalf(const std::vector<SessionResponses>& sessions,
                                              const config::ReliabilitySettings& settings);

    static TestRetestResult calculateTestRetest(const std::vector<RetestPair>& pairs,
                                                const config::ReliabilitySettings& settings);

    AlphaResult estimateAlpha(std::optional<std::size_t> minSessions = std::nullopt) const;
    SplitHalfResult estimateSplitHalf(std::optional<std::size_t> minSessions = std::nullopt) const;
    TestRetestResult estimateTestRetest(std::optional<std::size_t> minPairs = std::nullopt) const;

    /**
     * @brief Cached snapshot of all three coefficients.
     *
     * Recomputes when the cache is empty or older than the TTL. A refresh
     * is a pure recomputation; concurrent callers may both recompute and
     * the last one replaces the snapshot.
     */
    std::shared_ptr<const ReliabilitySnapshot> currentReliability() const;

    /// Drops the cached snapshot so the next read recomputes.
    void invalidateCache() const;

    std::vector<SessionResponses> loadCompletedSessions() const;

    const config::ReliabilitySettings& getSettings() const
    {
      return mSettings;
    }

  private:
    void log(const std::string& line) const;

    const IResponseRepository& mResponses;
    config::ReliabilitySettings mSettings;
    std::ostream& mLog;
    utils::Clock mClock;
    mutable ReliabilityCache mCache;
    mutable std::mutex mLogMutex;
  };
} // namespace psychometrics::reliability
