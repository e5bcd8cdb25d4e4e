#include "repository/InMemoryRepositories.h"
#include "PsychometricExceptions.h"
#include "utils/TimeUtils.h"

#include <algorithm>
#include <iterator>

namespace psychometrics::repository
{
  // ---------------------------------------------------------------- items

  void InMemoryItemRepository::addItem(const Item& item)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    if (!mItems.emplace(item.id, item).second)
      throw ConflictingStateException("Item " + std::to_string(item.id) + " already exists");
  }

  Item& InMemoryItemRepository::itemOrThrow(ItemId itemId)
  {
    auto it = mItems.find(itemId);
    if (it == mItems.end())
      throw NotFoundException("Item " + std::to_string(itemId) + " not found");
    return it->second;
  }

  std::optional<Item> InMemoryItemRepository::findItem(ItemId itemId) const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = mItems.find(itemId);
    if (it == mItems.end())
      return std::nullopt;
    return it->second;
  }

  std::vector<Item> InMemoryItemRepository::allItems() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    std::vector<Item> items;
    items.reserve(mItems.size());
    for (const auto& entry : mItems)
      items.push_back(entry.second);
    return items;
  }

  void InMemoryItemRepository::updateStatistics(ItemId itemId,
                                                std::optional<double> discrimination,
                                                std::size_t responseCount)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    Item& item = itemOrThrow(itemId);
    item.discrimination = discrimination;
    // response_count never goes backwards
    item.responseCount = std::max(item.responseCount, responseCount);
  }

  bool InMemoryItemRepository::compareAndSetQualityFlag(ItemId itemId,
                                                        QualityFlag expected,
                                                        QualityFlag desired,
                                                        const std::string& reason,
                                                        const Timestamp& at,
                                                        FlagSource source)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    Item& item = itemOrThrow(itemId);
    if (item.qualityFlag != expected)
      return false;

    item.qualityFlag = desired;
    item.qualityFlagReason = reason;
    item.qualityFlagUpdatedAt = at;
    mTransitions.push_back(FlagTransition{itemId, expected, desired, reason, at, source});
    return true;
  }

  void InMemoryItemRepository::setQualityFlag(ItemId itemId,
                                              QualityFlag flag,
                                              const std::optional<std::string>& reason,
                                              const Timestamp& at)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    Item& item = itemOrThrow(itemId);
    const QualityFlag previous = item.qualityFlag;

    item.qualityFlag = flag;
    item.qualityFlagReason = reason;
    item.qualityFlagUpdatedAt = at;
    mTransitions.push_back(FlagTransition{itemId, previous, flag, reason.value_or(""), at, FlagSource::Manual});
  }

  std::vector<FlagTransition> InMemoryItemRepository::flagHistory(ItemId itemId) const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    std::vector<FlagTransition> history;
    std::copy_if(mTransitions.begin(), mTransitions.end(), std::back_inserter(history),
                 [itemId](const FlagTransition& t) { return t.itemId == itemId; });
    return history;
  }

  // ------------------------------------------------------------ responses

  std::vector<ResponseRecord> InMemoryResponseRepository::allResponsesForItem(ItemId itemId) const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    std::vector<ResponseRecord> out;
    std::copy_if(mResponses.begin(), mResponses.end(), std::back_inserter(out),
                 [itemId](const ResponseRecord& r) { return r.itemId == itemId; });
    return out;
  }

  std::vector<ResponseRecord> InMemoryResponseRepository::allResponsesForSession(SessionId sessionId) const
  {
    std::vector<ResponseRecord> out;
    {
      std::lock_guard<std::mutex> lock(mMutex);
      std::copy_if(mResponses.begin(), mResponses.end(), std::back_inserter(out),
                   [sessionId](const ResponseRecord& r) { return r.sessionId == sessionId; });
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const ResponseRecord& a, const ResponseRecord& b) { return a.sequence < b.sequence; });
    return out;
  }

  bool InMemoryResponseRepository::appendResponse(const ResponseRecord& response)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    if (!mAnswered.insert(std::make_pair(response.sessionId, response.itemId)).second)
      return false;

    mResponses.push_back(response);
    return true;
  }

  void InMemoryResponseRepository::recordCompletion(const CompletedSessionScore& completion)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mCompletions[completion.sessionId] = completion;
  }

  std::vector<SessionId> InMemoryResponseRepository::completedSessionIds() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    std::vector<SessionId> ids;
    ids.reserve(mCompletions.size());
    for (const auto& entry : mCompletions)
      ids.push_back(entry.first);
    return ids;
  }

  std::vector<RetestPair>
  InMemoryResponseRepository::sessionsWithMultipleCompletions(int minDays, int maxDays) const
  {
    std::map<UserId, std::vector<CompletedSessionScore>> byUser;
    {
      std::lock_guard<std::mutex> lock(mMutex);
      for (const auto& entry : mCompletions)
        byUser[entry.second.userId].push_back(entry.second);
    }

    const boost::posix_time::time_duration minInterval = boost::posix_time::hours(24 * minDays);
    const boost::posix_time::time_duration maxInterval = boost::posix_time::hours(24 * maxDays);

    std::vector<RetestPair> pairs;
    for (auto& entry : byUser)
    {
      auto& sessions = entry.second;
      if (sessions.size() < 2)
        continue;

      std::sort(sessions.begin(), sessions.end(),
                [](const CompletedSessionScore& a, const CompletedSessionScore& b) {
                  return a.completedAt < b.completedAt;
                });

      for (std::size_t i = 0; i + 1 < sessions.size(); ++i)
      {
        const auto interval = sessions[i + 1].completedAt - sessions[i].completedAt;
        if (interval >= minInterval && interval <= maxInterval)
          pairs.push_back(RetestPair{sessions[i], sessions[i + 1],
                                     utils::daysBetween(sessions[i].completedAt,
                                                        sessions[i + 1].completedAt)});
      }
    }
    return pairs;
  }

  // ------------------------------------------------------------- sessions

  TestSession InMemorySessionRepository::createSession(UserId userId, const Timestamp& startedAt)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    TestSession session;
    session.id = mNextId++;
    session.userId = userId;
    session.startedAt = startedAt;
    mSessions[session.id] = session;
    return session;
  }

  std::optional<TestSession> InMemorySessionRepository::findSession(SessionId sessionId) const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = mSessions.find(sessionId);
    if (it == mSessions.end())
      return std::nullopt;
    return it->second;
  }

  void InMemorySessionRepository::updateSession(const TestSession& session)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    auto it = mSessions.find(session.id);
    if (it == mSessions.end())
      throw NotFoundException("Session " + std::to_string(session.id) + " not found");
    it->second = session;
  }

  // -------------------------------------------------------------- metrics

  void InMemoryReliabilityMetricRepository::append(const ReliabilityMetric& metric)
  {
    std::lock_guard<std::mutex> lock(mMutex);
    mMetrics.push_back(metric);
  }

  std::vector<ReliabilityMetric>
  InMemoryReliabilityMetricRepository::history(std::optional<MetricType> type,
                                               const Timestamp& since) const
  {
    std::vector<ReliabilityMetric> out;
    {
      std::lock_guard<std::mutex> lock(mMutex);
      // Newest appended first so equal timestamps keep reverse insertion order
      for (auto it = mMetrics.rbegin(); it != mMetrics.rend(); ++it)
      {
        const ReliabilityMetric& m = *it;
        if (type && m.type != *type)
          continue;
        if (m.calculatedAt < since)
          continue;
        out.push_back(m);
      }
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const ReliabilityMetric& a, const ReliabilityMetric& b) {
                       return a.calculatedAt > b.calculatedAt;
                     });
    return out;
  }
} // namespace psychometrics::repository
