#pragma once

#include <stdexcept>
#include <string>

namespace psychometrics
{
  /**
   * @brief Root of every error raised by the measurement engine.
   *
   * "Not enough data" is deliberately absent from this hierarchy: statistical
   * results report it through an insufficientData field instead.
   */
  class PsychometricException : public std::runtime_error
  {
  public:
    explicit PsychometricException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    ~PsychometricException() override = default;
  };

  /// A value is outside its domain (reliability, confidence level, flag name, ...)
  class InvalidInputException : public PsychometricException
  {
  public:
    explicit InvalidInputException(const std::string& msg)
      : PsychometricException(msg)
    {}
  };

  /// Unknown item or session identifier
  class NotFoundException : public PsychometricException
  {
  public:
    explicit NotFoundException(const std::string& msg)
      : PsychometricException(msg)
    {}
  };

  /// The requested transition is not allowed from the entity's current state
  class ConflictingStateException : public PsychometricException
  {
  public:
    explicit ConflictingStateException(const std::string& msg)
      : PsychometricException(msg)
    {}
  };

  /// Opaque storage-layer failure
  class RepositoryFailureException : public PsychometricException
  {
  public:
    explicit RepositoryFailureException(const std::string& msg)
      : PsychometricException(msg)
    {}
  };
} // namespace psychometrics
