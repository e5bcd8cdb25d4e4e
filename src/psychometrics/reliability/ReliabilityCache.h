#pragma once

#include "reliability/ReliabilityTypes.h"
#include "utils/TimeUtils.h"

#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace psychometrics::reliability
{
  /**
   * @brief The three coefficients computed together at one point in time.
   */
  struct ReliabilitySnapshot
  {
    AlphaResult alpha;
    SplitHalfResult splitHalf;
    TestRetestResult testRetest;
    Timestamp computedAt;

    /// Alpha when available, else the Spearman-Brown split-half value.
    std::optional<double> internalConsistency() const
    {
      if (alpha.alpha)
        return alpha.alpha;
      return splitHalf.spearmanBrown;
    }
  };

  /**
   * @brief Value + timestamp + TTL holder for the latest snapshot.
   *
   * Readers receive a shared_ptr to an immutable snapshot, so a refresh
   * replaces the pointer without disturbing readers still holding the old
   * value.
   */
  class ReliabilityCache
  {
  public:
    ReliabilityCache(boost::posix_time::time_duration ttl,
                     utils::Clock clock = utils::systemClock())
      : mTtl(ttl),
        mClock(std::move(clock))
    {}

    /// The cached snapshot, or nullptr if empty or expired.
    std::shared_ptr<const ReliabilitySnapshot> get() const
    {
      std::lock_guard<std::mutex> lock(mMutex);
      if (!mSnapshot)
        return nullptr;
      if (mClock() - mSnapshot->computedAt >= mTtl)
        return nullptr;
      return mSnapshot;
    }

    void put(std::shared_ptr<const ReliabilitySnapshot> snapshot)
    {
      std::lock_guard<std::mutex> lock(mMutex);
      mSnapshot = std::move(snapshot);
    }

    void invalidate()
    {
      std::lock_guard<std::mutex> lock(mMutex);
      mSnapshot.reset();
    }

  private:
    boost::posix_time::time_duration mTtl;
    utils::Clock mClock;
    mutable std::mutex mMutex;
    std::shared_ptr<const ReliabilitySnapshot> mSnapshot;
  };
} // namespace psychometrics::reliability
