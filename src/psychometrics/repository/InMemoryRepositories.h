#pragma once

#include "repository/IItemRepository.h"
#include "repository/IResponseRepository.h"
#include "repository/ISessionRepository.h"
#include "repository/IReliabilityMetricRepository.h"

#include <map>
#include <mutex>
#include <set>
#include <utility>
#include <vector>

/**
 * @file InMemoryRepositories.h
 * @brief Thread-safe in-process repositories used by the simulator and tests.
 *
 * Each repository guards its tables with a single mutex; every public call
 * is atomic with respect to the others.
 */
namespace psychometrics::repository
{
  class InMemoryItemRepository : public IItemRepository
  {
  public:
    InMemoryItemRepository() = default;

    /// @throws ConflictingStateException if the id is already present.
    void addItem(const Item& item);

    std::optional<Item> findItem(ItemId itemId) const override;
    std::vector<Item> allItems() const override;
    void updateStatistics(ItemId itemId,
                          std::optional<double> discrimination,
                          std::size_t responseCount) override;
    bool compareAndSetQualityFlag(ItemId itemId,
                                  QualityFlag expected,
                                  QualityFlag desired,
                                  const std::string& reason,
                                  const Timestamp& at,
                                  FlagSource source) override;
    void setQualityFlag(ItemId itemId,
                        QualityFlag flag,
                        const std::optional<std::string>& reason,
                        const Timestamp& at) override;
    std::vector<FlagTransition> flagHistory(ItemId itemId) const override;

  private:
    Item& itemOrThrow(ItemId itemId);

    mutable std::mutex mMutex;
    std::map<ItemId, Item> mItems;
    std::vector<FlagTransition> mTransitions;
  };

  class InMemoryResponseRepository : public IResponseRepository
  {
  public:
    InMemoryResponseRepository() = default;

    std::vector<ResponseRecord> allResponsesForItem(ItemId itemId) const override;
    std::vector<ResponseRecord> allResponsesForSession(SessionId sessionId) const override;
    bool appendResponse(const ResponseRecord& response) override;
    void recordCompletion(const CompletedSessionScore& completion) override;
    std::vector<SessionId> completedSessionIds() const override;
    std::vector<RetestPair> sessionsWithMultipleCompletions(int minDays, int maxDays) const override;

  private:
    mutable std::mutex mMutex;
    std::vector<ResponseRecord> mResponses;
    std::set<std::pair<SessionId, ItemId>> mAnswered;
    std::map<SessionId, CompletedSessionScore> mCompletions;
  };

  class InMemorySessionRepository : public ISessionRepository
  {
  public:
    InMemorySessionRepository() = default;

    TestSession createSession(UserId userId, const Timestamp& startedAt) override;
    std::optional<TestSession> findSession(SessionId sessionId) const override;
    void updateSession(const TestSession& session) override;

  private:
    mutable std::mutex mMutex;
    std::map<SessionId, TestSession> mSessions;
    SessionId mNextId = 1;
  };

  class InMemoryReliabilityMetricRepository : public IReliabilityMetricRepository
  {
  public:
    InMemoryReliabilityMetricRepository() = default;

    void append(const ReliabilityMetric& metric) override;
    std::vector<ReliabilityMetric> history(std::optional<MetricType> type,
                                           const Timestamp& since) const override;

  private:
    mutable std::mutex mMutex;
    std::vector<ReliabilityMetric> mMetrics;
  };
} // namespace psychometrics::repository
