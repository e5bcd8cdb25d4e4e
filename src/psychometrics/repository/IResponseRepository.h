#pragma once

#include "PsychometricTypes.h"
#include <vector>

namespace psychometrics::repository
{
  class IResponseRepository
  {
  public:
    virtual ~IResponseRepository() = default;

    virtual std::vector<ResponseRecord> allResponsesForItem(ItemId itemId) const = 0;

    /// Responses of one session ordered by sequence.
    virtual std::vector<ResponseRecord> allResponsesForSession(SessionId sessionId) const = 0;

    /**
     * @brief Appends a response, idempotent on (sessionId, itemId).
     * @return false if a response for the pair already existed; nothing is written.
     */
    virtual bool appendResponse(const ResponseRecord& response) = 0;

    virtual void recordCompletion(const CompletedSessionScore& completion) = 0;
    virtual std::vector<SessionId> completedSessionIds() const = 0;

    /**
     * @brief Consecutive completed sessions of the same user whose interval
     * lies within [minDays, maxDays], inclusive.
     */
    virtual std::vector<RetestPair> sessionsWithMultipleCompletions(int minDays, int maxDays) const = 0;
  };
} // namespace psychometrics::repository
