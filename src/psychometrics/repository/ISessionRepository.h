#pragma once

#include "PsychometricTypes.h"
#include <optional>

namespace psychometrics::repository
{
  class ISessionRepository
  {
  public:
    virtual ~ISessionRepository() = default;

    /// Creates an in-progress session with a fresh identifier.
    virtual TestSession createSession(UserId userId, const Timestamp& startedAt) = 0;

    virtual std::optional<TestSession> findSession(SessionId sessionId) const = 0;

    /// Replaces the stored row. @throws NotFoundException for an unknown id.
    virtual void updateSession(const TestSession& session) = 0;
  };
} // namespace psychometrics::repository
