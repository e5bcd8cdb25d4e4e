#pragma once

#include "PsychometricTypes.h"
#include "adaptive/AdaptiveEngine.h"
#include "analysis/ItemStatisticsJob.h"
#include "utils/TimeUtils.h"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <random>
#include <vector>

namespace psychometrics::simulation
{
  /**
   * @brief Clock that only moves when told to.
   *
   * Shared by every component of a simulation (and by tests) so that
   * retest intervals and report windows can be driven deterministically.
   */
  class ManualClock
  {
  public:
    explicit ManualClock(const Timestamp& start)
      : mNow(std::make_shared<State>())
    {
      mNow->value = start;
    }

    Timestamp now() const
    {
      std::lock_guard<std::mutex> lock(mNow->mutex);
      return mNow->value;
    }

    void advance(const boost::posix_time::time_duration& by)
    {
      std::lock_guard<std::mutex> lock(mNow->mutex);
      mNow->value += by;
    }

    void set(const Timestamp& to)
    {
      std::lock_guard<std::mutex> lock(mNow->mutex);
      mNow->value = to;
    }

    /// Clock callable sharing this clock's time.
    utils::Clock asClock() const
    {
      auto state = mNow;
      return [state]() {
        std::lock_guard<std::mutex> lock(state->mutex);
        return state->value;
      };
    }

  private:
    struct State
    {
      std::mutex mutex;
      Timestamp value;
    };

    std::shared_ptr<State> mNow;
  };

  struct SimulationSettings
  {
    std::size_t poolSize = 120;
    std::size_t examinees = 300;
    double retestShare = 0.35;        ///< share of examinees who sit a second session
    int retestDelayDays = 21;
    double practiceGain = 0.10;       ///< theta gain on the second sitting
    double flawedItemShare = 0.05;    ///< items whose key is effectively reversed
    std::uint64_t seed = 20240825;
  };

  /**
   * @brief An item together with the generating parameters used to
   * simulate answers. The engine only sees @c item.
   */
  struct SimulatedItem
  {
    Item item;
    double trueDiscrimination = 1.0;
    double trueDifficulty = 0.0;
    bool flawed = false;
  };

  struct SimulationSummary
  {
    std::size_t sessionsCompleted = 0;
    std::size_t retestSessions = 0;
    std::size_t totalItemsAdministered = 0;
    std::size_t itemsAutoFlagged = 0;
    std::size_t sessionsWithInterval = 0;
    std::map<StoppingReason, std::size_t> stoppingReasons;

    double meanItemsPerSession() const
    {
      return sessionsCompleted == 0 ? 0.0
                                    : static_cast<double>(totalItemsAdministered) /
                                        static_cast<double>(sessionsCompleted);
    }
  };

  /**
   * @brief Drives a population of simulated examinees through the adaptive
   * engine.
   *
   * Answers follow a 2PL model on the generating parameters; flawed items
   * use a negative generating discrimination so the quality controller has
   * something to catch. After every completed session the item statistics
   * job refreshes the items that session touched.
   */
  class PopulationSimulator
  {
  public:
    PopulationSimulator(adaptive::AdaptiveEngine& engine,
                        analysis::ItemStatisticsJob& statisticsJob,
                        ManualClock& clock,
                        const SimulationSettings& settings,
                        std::ostream& os);

    /// Stratified pool: difficulty tiers and item types assigned round-robin.
    static std::vector<SimulatedItem> generateItemPool(const SimulationSettings& settings,
                                                       std::mt19937_64& rng);

    SimulationSummary run(const std::vector<SimulatedItem>& pool);

  private:
    void runSession(UserId userId, double trueTheta, SimulationSummary& summary);

    adaptive::AdaptiveEngine& mEngine;
    analysis::ItemStatisticsJob& mStatisticsJob;
    ManualClock& mClock;
    SimulationSettings mSettings;
    std::ostream& mLog;
    std::mt19937_64 mRng;
    std::map<ItemId, SimulatedItem> mPool;
  };
} // namespace psychometrics::simulation
