#include "simulation/PopulationSimulator.h"
#include "PsychometricExceptions.h"

#include <cmath>
#include <iomanip>

namespace psychometrics::simulation
{
  namespace
  {
    double tierCenter(DifficultyTier tier)
    {
      switch (tier)
      {
      case DifficultyTier::Easy:
        return -1.0;
      case DifficultyTier::Medium:
        return 0.0;
      case DifficultyTier::Hard:
        return 1.0;
      }
      return 0.0;
    }
  }

  PopulationSimulator::PopulationSimulator(adaptive::AdaptiveEngine& engine,
                                           analysis::ItemStatisticsJob& statisticsJob,
                                           ManualClock& clock,
                                           const SimulationSettings& settings,
                                           std::ostream& os)
    : mEngine(engine),
      mStatisticsJob(statisticsJob),
      mClock(clock),
      mSettings(settings),
      mLog(os),
      mRng(settings.seed)
  {
    if (settings.retestShare < 0.0 || settings.retestShare > 1.0)
      throw InvalidInputException("retestShare must lie in [0, 1]");
    if (settings.retestDelayDays <= 0)
      throw InvalidInputException("retestDelayDays must be positive");
  }

  std::vector<SimulatedItem> PopulationSimulator::generateItemPool(const SimulationSettings& settings,
                                                                   std::mt19937_64& rng)
  {
    if (settings.flawedItemShare < 0.0 || settings.flawedItemShare > 1.0)
      throw InvalidInputException("flawedItemShare must lie in [0, 1]");

    std::normal_distribution<double> offset(0.0, 0.35);
    std::lognormal_distribution<double> slope(0.0, 0.25);
    std::bernoulli_distribution flawed(settings.flawedItemShare);

    std::vector<SimulatedItem> pool;
    pool.reserve(settings.poolSize);
    for (std::size_t i = 0; i < settings.poolSize; ++i)
    {
      SimulatedItem s;
      s.item.id = static_cast<ItemId>(i + 1);
      s.item.difficulty = kAllDifficultyTiers[i % kAllDifficultyTiers.size()];
      s.item.type = kAllItemTypes[(i / kAllDifficultyTiers.size()) % kAllItemTypes.size()];
      s.flawed = flawed(rng);
      s.trueDifficulty = tierCenter(s.item.difficulty) + offset(rng);
      s.trueDiscrimination = s.flawed ? -0.8 * slope(rng) : slope(rng);
      pool.push_back(s);
    }
    return pool;
  }

  void PopulationSimulator::runSession(UserId userId, double trueTheta, SimulationSummary& summary)
  {
    std::uniform_real_distribution<double> uniform(0.0, 1.0);

    adaptive::AdaptiveStart start = mEngine.startAdaptive(userId);
    const SessionId sessionId = start.session.id;
    std::optional<Item> current = start.firstItem;
    std::optional<adaptive::SessionOutcome> outcome = start.outcome;
    std::size_t administered = 0;

    while (current)
    {
      const SimulatedItem& truth = mPool.at(current->id);
      const double z = truth.trueDiscrimination * (trueTheta - truth.trueDifficulty);
      const bool correct = uniform(mRng) < 1.0 / (1.0 + std::exp(-z));

      mClock.advance(boost::posix_time::seconds(45));
      adaptive::AdvanceResult r = mEngine.submitAndAdvance(sessionId, current->id, correct);
      ++administered;
      current = r.nextItem;
      if (r.testComplete)
      {
        outcome = r.outcome;
        break;
      }
    }

    if (!outcome)
      return;

    ++summary.sessionsCompleted;
    summary.totalItemsAdministered += administered;
    ++summary.stoppingReasons[outcome->stoppingReason];
    if (outcome->score.confidenceInterval)
      ++summary.sessionsWithInterval;

    const analysis::StatisticsJobResult job = mStatisticsJob.runForSession(sessionId);
    summary.itemsAutoFlagged += job.newlyFlagged.size();
  }

  SimulationSummary PopulationSimulator::run(const std::vector<SimulatedItem>& pool)
  {
    mPool.clear();
    for (const auto& s : pool)
      mPool.emplace(s.item.id, s);

    std::normal_distribution<double> ability(0.0, 1.0);
    std::vector<double> trueThetas(mSettings.examinees);
    for (auto& theta : trueThetas)
      theta = ability(mRng);

    SimulationSummary summary;
    for (std::size_t i = 0; i < trueThetas.size(); ++i)
    {
      runSession(static_cast<UserId>(i + 1), trueThetas[i], summary);
      mClock.advance(boost::posix_time::minutes(20));
    }

    const std::size_t retestCount =
      static_cast<std::size_t>(std::floor(mSettings.retestShare * static_cast<double>(trueThetas.size())));
    if (retestCount > 0)
    {
      mClock.advance(boost::posix_time::hours(24 * mSettings.retestDelayDays));
      const std::size_t before = summary.sessionsCompleted;
      for (std::size_t i = 0; i < retestCount; ++i)
      {
        runSession(static_cast<UserId>(i + 1), trueThetas[i] + mSettings.practiceGain, summary);
        mClock.advance(boost::posix_time::minutes(20));
      }
      summary.retestSessions = summary.sessionsCompleted - before;
    }

    mLog << "[Simulation] " << summary.sessionsCompleted << " sessions ("
         << summary.retestSessions << " retests), "
         << std::fixed << std::setprecision(2) << summary.meanItemsPerSession()
         << " items per session, " << summary.itemsAutoFlagged << " items auto-flagged\n";
    return summary;
  }
} // namespace psychometrics::simulation
