#include "adaptive/AdaptiveEngine.h"
#include "adaptive/ScoreConversion.h"
#include "PsychometricExceptions.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace psychometrics::adaptive
{
  std::string toString(EngineState state)
  {
    switch (state)
    {
    case EngineState::Initialized:
      return "initialized";
    case EngineState::Selecting:
      return "selecting";
    case EngineState::AwaitingResponse:
      return "awaiting_response";
    case EngineState::Updating:
      return "updating";
    case EngineState::Completed:
      return "completed";
    case EngineState::Abandoned:
      return "abandoned";
    }
    return "unknown";
  }

  AdaptiveEngine::AdaptiveEngine(repository::IItemRepository& items,
                                 repository::IResponseRepository& responses,
                                 repository::ISessionRepository& sessions,
                                 const ItemSelector& selector,
                                 const EapAbilityEstimator& estimator,
                                 const reliability::ReliabilityEstimator& reliability,
                                 const reliability::PrecisionCalculator& precision,
                                 const config::AdaptiveSettings& settings,
                                 std::ostream& os,
                                 utils::Clock clock)
    : mItems(items),
      mResponses(responses),
      mSessions(sessions),
      mSelector(selector),
      mEstimator(estimator),
      mReliability(reliability),
      mPrecision(precision),
      mSettings(settings),
      mLog(os),
      mClock(std::move(clock))
  {}

  void AdaptiveEngine::log(const std::string& line) const
  {
    std::lock_guard<std::mutex> lock(mLogMutex);
    mLog << "[AdaptiveEngine] " << line << "\n";
  }

  AdaptiveEngine::SessionLock::SessionLock(AdaptiveEngine& engine, SessionId sessionId)
    : mEngine(engine),
      mSessionId(sessionId)
  {
    std::lock_guard<std::mutex> lock(mEngine.mLocksMutex);
    auto& entry = mEngine.mSessionLocks[sessionId];
    if (!entry)
      entry = std::make_shared<std::mutex>();
    mMutex = entry;
  }

  AdaptiveEngine::SessionLock::~SessionLock()
  {
    // Copies are only made and dropped under mLocksMutex, so the count is exact
    std::lock_guard<std::mutex> lock(mEngine.mLocksMutex);
    mMutex.reset();
    auto it = mEngine.mSessionLocks.find(mSessionId);
    if (it != mEngine.mSessionLocks.end() && it->second.use_count() == 1)
      mEngine.mSessionLocks.erase(it);
  }

  std::size_t AdaptiveEngine::activeSessionLocks() const
  {
    std::lock_guard<std::mutex> lock(mLocksMutex);
    return mSessionLocks.size();
  }

  TestSession AdaptiveEngine::loadSession(SessionId sessionId) const
  {
    auto session = mSessions.findSession(sessionId);
    if (!session)
      throw NotFoundException("Session " + std::to_string(sessionId) + " not found");
    return *session;
  }

  std::map<ItemId, Item> AdaptiveEngine::itemsById() const
  {
    std::map<ItemId, Item> byId;
    for (auto& item : mItems.allItems())
      byId.emplace(item.id, std::move(item));
    return byId;
  }

  std::optional<double> AdaptiveEngine::currentReliability() const
  {
    try
    {
      return mReliability.currentReliability()->internalConsistency();
    }
    catch (const PsychometricException& e)
    {
      // The score is still reported, without an interval
      log(std::string("Reliability unavailable for confidence interval: ") + e.what());
      return std::nullopt;
    }
  }

  std::optional<Item> AdaptiveEngine::selectNext(const TestSession& session,
                                                 const std::map<ItemId, Item>& items) const
  {
    std::vector<Item> pool;
    pool.reserve(items.size());
    for (const auto& entry : items)
      pool.push_back(entry.second);

    ContentBalance balance;
    balance.minItemsPerDomain = mSettings.minItemsPerDomain;
    balance.itemsRemaining = mSettings.maxItems > session.itemsAdministered
                                 ? mSettings.maxItems - session.itemsAdministered
                                 : 0;
    for (const auto& answer : session.answers)
    {
      auto it = items.find(answer.itemId);
      if (it != items.end())
        ++balance.coverage[it->second.type];
    }

    const std::set<ItemId> administered(session.administeredItems.begin(),
                                        session.administeredItems.end());
    return mSelector.selectNextAdaptive(pool, session.theta, administered, balance);
  }

  SessionOutcome AdaptiveEngine::describeOutcome(const TestSession& session,
                                                 const std::map<ItemId, Item>& items) const
  {
    SessionOutcome O;
    O.stoppingReason = session.stoppingReason.value_or(StoppingReason::MaxItems);
    O.correctCount = session.correctCount;
    O.standardError = session.standardError;
    O.score.theta = session.theta;
    O.score.score = session.score.value_or(thetaToScore(session.theta, mPrecision.getSettings()));
    O.score.percentile = thetaToPercentile(session.theta);
    O.score.confidenceInterval = session.confidenceInterval;

    for (const auto& a : session.answers)
    {
      auto it = items.find(a.itemId);
      if (it == items.end())
        continue;
      DomainAccuracy& d = O.domainAccuracy[it->second.type];
      ++d.answered;
      d.correct += a.correct ? 1 : 0;
    }
    for (auto& entry : O.domainAccuracy)
      entry.second.accuracy = static_cast<double>(entry.second.correct) /
                              static_cast<double>(entry.second.answered);
    return O;
  }

  SessionOutcome AdaptiveEngine::complete(TestSession& session,
                                          StoppingReason reason,
                                          const std::map<ItemId, Item>& items)
  {
    session.status = SessionStatus::Completed;
    session.stoppingReason = reason;
    session.currentItemId.reset();
    session.completedAt = mClock();
    session.score = thetaToScore(session.theta, mPrecision.getSettings());
    session.confidenceInterval = mPrecision.intervalForScore(*session.score, currentReliability());
    return describeOutcome(session, items);
  }

  std::size_t AdaptiveEngine::publish(const TestSession& session)
  {
    std::size_t written = 0;
    for (std::size_t i = 0; i < session.answers.size(); ++i)
    {
      const SessionAnswer& a = session.answers[i];
      ResponseRecord record;
      record.sessionId = session.id;
      record.itemId = a.itemId;
      record.userId = session.userId;
      record.isCorrect = a.correct;
      record.abilityEstimateAtTime = a.thetaBefore;
      record.sequence = i + 1;
      if (mResponses.appendResponse(record))
        ++written;
    }

    // A session that ended before its first item has no score to report
    if (session.status == SessionStatus::Completed && session.itemsAdministered > 0 &&
        session.score && session.completedAt)
      mResponses.recordCompletion(CompletedSessionScore{session.userId, session.id,
                                                        static_cast<double>(*session.score),
                                                        *session.completedAt});
    return written;
  }

  AdvanceResult AdaptiveEngine::currentState(const TestSession& session,
                                             const std::map<ItemId, Item>& items) const
  {
    AdvanceResult R;
    R.testComplete = session.status != SessionStatus::InProgress;
    R.theta = session.theta;
    R.standardError = session.standardError;
    R.itemsAdministered = session.itemsAdministered;
    R.stoppingReason = session.stoppingReason;
    if (session.currentItemId)
    {
      auto it = items.find(*session.currentItemId);
      if (it != items.end())
        R.nextItem = it->second;
    }
    if (session.status == SessionStatus::Completed)
      R.outcome = describeOutcome(session, items);
    return R;
  }

  AdaptiveStart AdaptiveEngine::startAdaptive(UserId userId)
  {
    TestSession session = mSessions.createSession(userId, mClock());
    const AbilityEstimate prior = mEstimator.initialEstimate();
    session.theta = prior.theta;
    session.standardError = prior.standardError;

    const auto items = itemsById();

    AdaptiveStart S;
    S.firstItem = selectNext(session, items);
    if (S.firstItem)
      session.currentItemId = S.firstItem->id;
    else
      S.outcome = complete(session, StoppingReason::PoolExhausted, items);

    mSessions.updateSession(session);

    S.session = session;
    S.theta = session.theta;
    S.standardError = session.standardError;

    if (!S.firstItem)
      log("session " + std::to_string(session.id) + " started with an empty eligible pool");
    return S;
  }

  AdvanceResult AdaptiveEngine::submitAndAdvance(SessionId sessionId, ItemId itemId, bool correct)
  {
    SessionLock sessionLock(*this, sessionId);
    std::lock_guard<std::mutex> sessionGuard(sessionLock.mutex());

    TestSession session = loadSession(sessionId);
    const auto items = itemsById();

    auto answered = std::find_if(session.answers.begin(), session.answers.end(),
                                 [itemId](const SessionAnswer& a) { return a.itemId == itemId; });
    if (answered != session.answers.end())
    {
      if (answered->correct != correct)
        throw ConflictingStateException("Item " + std::to_string(itemId) +
                                        " was already answered " +
                                        (answered->correct ? "correctly" : "incorrectly") +
                                        " in session " + std::to_string(sessionId));

      const std::size_t repaired = publish(session);
      if (repaired > 0)
        log("session " + std::to_string(sessionId) + ": republished " +
            std::to_string(repaired) + " response(s) on retry");
      return currentState(session, items);
    }

    if (session.status != SessionStatus::InProgress)
      throw ConflictingStateException("Session " + std::to_string(sessionId) + " is " +
                                      toString(session.status));
    if (!session.currentItemId || *session.currentItemId != itemId)
      throw ConflictingStateException("Item " + std::to_string(itemId) +
                                      " is not awaiting a response in session " +
                                      std::to_string(sessionId));
    if (items.find(itemId) == items.end())
      throw NotFoundException("Item " + std::to_string(itemId) + " not found");

    struct UpdatingMark
    {
      AdaptiveEngine& engine;
      SessionId id;

      UpdatingMark(AdaptiveEngine& e, SessionId s) : engine(e), id(s)
      {
        std::lock_guard<std::mutex> lock(engine.mLocksMutex);
        engine.mUpdating.insert(id);
      }

      ~UpdatingMark()
      {
        std::lock_guard<std::mutex> lock(engine.mLocksMutex);
        engine.mUpdating.erase(id);
      }
    } updating(*this, sessionId);

    // Work on a copy; the stored row changes only at updateSession()
    TestSession updated = session;
    updated.answers.push_back(SessionAnswer{itemId, correct, session.theta});
    updated.administeredItems.push_back(itemId);
    updated.itemsAdministered = updated.administeredItems.size();
    updated.currentItemId.reset();

    std::vector<ScoredResponse> scored;
    scored.reserve(updated.answers.size());
    std::size_t correctCount = 0;
    for (const auto& a : updated.answers)
    {
      auto it = items.find(a.itemId);
      const ItemParameters params = it != items.end() ? effectiveParameters(it->second) : ItemParameters();
      scored.push_back(ScoredResponse{params, a.correct});
      correctCount += a.correct ? 1 : 0;
    }

    const AbilityEstimate estimate = mEstimator.estimate(scored);
    updated.theta = estimate.theta;
    updated.standardError = estimate.standardError;
    updated.correctCount = correctCount;

    AdvanceResult R;
    std::optional<StoppingReason> stop;
    if (updated.itemsAdministered >= mSettings.maxItems)
      stop = StoppingReason::MaxItems;
    else if (updated.standardError < mSettings.seThreshold)
      stop = StoppingReason::SeThreshold;

    if (!stop)
    {
      R.nextItem = selectNext(updated, items);
      if (R.nextItem)
        updated.currentItemId = R.nextItem->id;
      else
        stop = StoppingReason::PoolExhausted;
    }

    if (stop)
      R.outcome = complete(updated, *stop, items);

    mSessions.updateSession(updated);
    publish(updated);

    R.testComplete = stop.has_value();
    R.theta = updated.theta;
    R.standardError = updated.standardError;
    R.itemsAdministered = updated.itemsAdministered;
    R.stoppingReason = stop;

    if (stop)
    {
      std::ostringstream os;
      os << "session " << sessionId << " completed: reason=" << toString(*stop)
         << " items=" << updated.itemsAdministered
         << std::fixed << std::setprecision(3)
         << " theta=" << updated.theta << " se=" << updated.standardError
         << " score=" << *updated.score
         << (updated.confidenceInterval ? "" : " (no confidence interval)");
      log(os.str());
    }
    return R;
  }

  TestSession AdaptiveEngine::abandon(SessionId sessionId)
  {
    SessionLock sessionLock(*this, sessionId);
    std::lock_guard<std::mutex> sessionGuard(sessionLock.mutex());

    TestSession session = loadSession(sessionId);
    if (session.status == SessionStatus::Abandoned)
      return session;
    if (session.status == SessionStatus::Completed)
      throw ConflictingStateException("Session " + std::to_string(sessionId) +
                                      " already completed");

    session.status = SessionStatus::Abandoned;
    session.currentItemId.reset();
    session.completedAt = mClock();
    mSessions.updateSession(session);
    publish(session);

    log("session " + std::to_string(sessionId) + " abandoned after " +
        std::to_string(session.itemsAdministered) + " items");
    return session;
  }

  EngineState AdaptiveEngine::state(SessionId sessionId) const
  {
    {
      std::lock_guard<std::mutex> lock(mLocksMutex);
      if (mUpdating.count(sessionId) != 0)
        return EngineState::Updating;
    }

    const TestSession session = loadSession(sessionId);
    switch (session.status)
    {
    case SessionStatus::Completed:
      return EngineState::Completed;
    case SessionStatus::Abandoned:
      return EngineState::Abandoned;
    case SessionStatus::InProgress:
      break;
    }

    if (session.currentItemId)
      return EngineState::AwaitingResponse;
    return session.itemsAdministered == 0 ? EngineState::Initialized : EngineState::Selecting;
  }
} // namespace psychometrics::adaptive
