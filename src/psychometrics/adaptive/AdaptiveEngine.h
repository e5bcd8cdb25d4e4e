#pragma once

#include "PsychometricTypes.h"
#include "adaptive/AbilityEstimator.h"
#include "adaptive/ItemSelector.h"
#include "config/EngineConfiguration.h"
#include "reliability/PrecisionCalculator.h"
#include "reliability/ReliabilityEstimator.h"
#include "repository/IItemRepository.h"
#include "repository/IResponseRepository.h"
#include "repository/ISessionRepository.h"
#include "utils/TimeUtils.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <set>

namespace psychometrics::adaptive
{
  /**
   * @brief Lifecycle of an adaptive session.
   *
   *   Initialized -> Selecting -> AwaitingResponse -> Updating
   *       -> (Selecting | Completed)
   *
   * Abandoned is reachable from every non-terminal state.
   */
  enum class EngineState
  {
    Initialized,
    Selecting,
    AwaitingResponse,
    Updating,
    Completed,
    Abandoned
  };

  std::string toString(EngineState state);

  struct DomainAccuracy
  {
    std::size_t answered = 0;
    std::size_t correct = 0;
    double accuracy = 0.0;
  };

  struct SessionOutcome
  {
    StoppingReason stoppingReason = StoppingReason::MaxItems;
    std::size_t correctCount = 0;
    ScoreEstimate score;
    double standardError = 0.0;
    std::map<ItemType, DomainAccuracy> domainAccuracy;
  };

  struct AdaptiveStart
  {
    TestSession session;
    std::optional<Item> firstItem;
    double theta = 0.0;
    double standardError = 1.0;
    std::optional<SessionOutcome> outcome;   ///< set only if the pool was empty
  };

  struct AdvanceResult
  {
    std::optional<Item> nextItem;
    bool testComplete = false;
    double theta = 0.0;
    double standardError = 1.0;
    std::size_t itemsAdministered = 0;
    std::optional<StoppingReason> stoppingReason;
    std::optional<SessionOutcome> outcome;
  };

  /**
   * @brief Runs adaptive sessions against the repositories.
   *
   * The engine keeps no per-session state of its own: the session row is
   * the source of truth and carries the answers given so far. Updates of
   * one session are serialized by a per-session lock; different sessions
   * proceed in parallel.
   *
   * The session write is the commit point of an answer. Response rows and
   * the completion summary are derived from the committed row afterwards,
   * so a failed session write leaves nothing behind and a failed publish
   * is repaired by resubmitting the same answer.
   */
  class AdaptiveEngine
  {
  public:
    AdaptiveEngine(repository::IItemRepository& items,
                   repository::IResponseRepository& responses,
                   repository::ISessionRepository& sessions,
                   const ItemSelector& selector,
                   const EapAbilityEstimator& estimator,
                   const reliability::ReliabilityEstimator& reliability,
                   const reliability::PrecisionCalculator& precision,
                   const config::AdaptiveSettings& settings,
                   std::ostream& os,
                   utils::Clock clock = utils::systemClock());

    AdaptiveStart startAdaptive(UserId userId);

    /**
     * @brief Records the answer to the current item and advances the session.
     *
     * Resubmitting the committed answer of an item returns the current
     * state and republishes any response rows that are missing.
     *
     * @throws NotFoundException for an unknown session or item
     * @throws ConflictingStateException if the session is terminal,
     *         @p itemId is not the item awaiting a response, or @p itemId
     *         was already answered differently
     * @throws RepositoryFailureException if storage fails. When the session
     *         write itself failed nothing advanced.
     */
    AdvanceResult submitAndAdvance(SessionId sessionId, ItemId itemId, bool correct);

    /**
     * @brief One-way abandon transition. Waits for an in-flight update of
     * the same session. Abandoning twice is a no-op.
     *
     * @throws ConflictingStateException if the session already completed
     */
    TestSession abandon(SessionId sessionId);

    EngineState state(SessionId sessionId) const;

    /// Sessions with a caller inside or waiting on their lock
    std::size_t activeSessionLocks() const;

  private:
    /// Holds the mutex of one session; the last holder drops it from the map.
    class SessionLock
    {
    public:
      SessionLock(AdaptiveEngine& engine, SessionId sessionId);
      ~SessionLock();

      SessionLock(const SessionLock&) = delete;
      SessionLock& operator=(const SessionLock&) = delete;

      std::mutex& mutex() { return *mMutex; }

    private:
      AdaptiveEngine& mEngine;
      SessionId mSessionId;
      std::shared_ptr<std::mutex> mMutex;
    };

    TestSession loadSession(SessionId sessionId) const;
    std::map<ItemId, Item> itemsById() const;

    std::optional<Item> selectNext(const TestSession& session,
                                   const std::map<ItemId, Item>& items) const;

    /// Completes @p session in place; nothing is written.
    SessionOutcome complete(TestSession& session,
                            StoppingReason reason,
                            const std::map<ItemId, Item>& items);

    /**
     * Writes the response rows of a committed session that are not stored
     * yet, and its completion summary when it completed with at least one
     * item. Returns the number of response rows written.
     */
    std::size_t publish(const TestSession& session);

    AdvanceResult currentState(const TestSession& session,
                               const std::map<ItemId, Item>& items) const;

    SessionOutcome describeOutcome(const TestSession& session,
                                   const std::map<ItemId, Item>& items) const;

    std::optional<double> currentReliability() const;
    void log(const std::string& line) const;

    repository::IItemRepository& mItems;
    repository::IResponseRepository& mResponses;
    repository::ISessionRepository& mSessions;
    const ItemSelector& mSelector;
    const EapAbilityEstimator& mEstimator;
    const reliability::ReliabilityEstimator& mReliability;
    const reliability::PrecisionCalculator& mPrecision;
    config::AdaptiveSettings mSettings;
    std::ostream& mLog;
    utils::Clock mClock;

    mutable std::mutex mLocksMutex;
    std::map<SessionId, std::shared_ptr<std::mutex>> mSessionLocks;
    std::set<SessionId> mUpdating;
    mutable std::mutex mLogMutex;
  };
} // namespace psychometrics::adaptive
