#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>

/**
 * @file PsychometricTypes.h
 * @brief Domain entities shared by every component of the measurement engine.
 */
namespace psychometrics
{
  using ItemId = std::int64_t;
  using SessionId = std::int64_t;
  using UserId = std::int64_t;
  using Timestamp = boost::posix_time::ptime;

  enum class DifficultyTier
  {
    Easy,
    Medium,
    Hard
  };

  enum class ItemType
  {
    Pattern,
    Logic,
    Spatial,
    Math,
    Verbal,
    Memory
  };

  /**
   * @brief Soft-delete state of an item.
   *
   * The engine only ever moves Normal -> UnderReview. Every other transition
   * is an operator override.
   */
  enum class QualityFlag
  {
    Normal,
    UnderReview,
    Deactivated
  };

  enum class SessionStatus
  {
    InProgress,
    Completed,
    Abandoned
  };

  enum class StoppingReason
  {
    SeThreshold,
    MaxItems,
    PoolExhausted
  };

  /// Who moved a quality flag
  enum class FlagSource
  {
    Automatic,   ///< the negative-discrimination rule
    Manual       ///< an operator override or review request
  };

  enum class MetricType
  {
    CronbachsAlpha,
    TestRetest,
    SplitHalf
  };

  inline constexpr std::array<DifficultyTier, 3> kAllDifficultyTiers = {
    DifficultyTier::Easy, DifficultyTier::Medium, DifficultyTier::Hard
  };

  inline constexpr std::array<ItemType, 6> kAllItemTypes = {
    ItemType::Pattern, ItemType::Logic, ItemType::Spatial,
    ItemType::Math, ItemType::Verbal, ItemType::Memory
  };

  inline constexpr std::array<MetricType, 3> kAllMetricTypes = {
    MetricType::CronbachsAlpha, MetricType::TestRetest, MetricType::SplitHalf
  };

  std::string toString(DifficultyTier tier);
  std::string toString(ItemType type);
  std::string toString(QualityFlag flag);
  std::string toString(SessionStatus status);
  std::string toString(StoppingReason reason);
  std::string toString(MetricType type);
  std::string toString(FlagSource source);


  /**
   * @brief Calibrated item response theory parameters.
   */
  struct IrtParameters
  {
    double discrimination = 1.0;   ///< a
    double difficulty = 0.0;       ///< b
    double guessing = 0.0;         ///< c, lower asymptote
  };

  struct Item
  {
    ItemId id = 0;
    DifficultyTier difficulty = DifficultyTier::Medium;
    ItemType type = ItemType::Pattern;
    std::optional<double> discrimination;   ///< point-biserial, null until measured
    std::size_t responseCount = 0;
    QualityFlag qualityFlag = QualityFlag::Normal;
    std::optional<std::string> qualityFlagReason;
    std::optional<Timestamp> qualityFlagUpdatedAt;
    std::optional<IrtParameters> irt;
  };

  /**
   * @brief One answered item. Immutable once written.
   */
  struct ResponseRecord
  {
    SessionId sessionId = 0;
    ItemId itemId = 0;
    UserId userId = 0;
    bool isCorrect = false;
    std::optional<double> abilityEstimateAtTime;
    std::size_t sequence = 0;   ///< 1-based administration order within the session
  };

  struct ConfidenceInterval
  {
    int lower = 0;
    int upper = 0;
    double confidenceLevel = 0.95;
    double sem = 0.0;
  };

  /// One answer as committed with its session
  struct SessionAnswer
  {
    ItemId itemId = 0;
    bool correct = false;
    double thetaBefore = 0.0;   ///< ability estimate when the item was administered
  };

  /**
   * @brief Adaptive session row. The answers travel with the row, so a
   * single session write commits an answer together with its estimate.
   */
  struct TestSession
  {
    SessionId id = 0;
    UserId userId = 0;
    SessionStatus status = SessionStatus::InProgress;
    std::vector<ItemId> administeredItems;
    std::vector<SessionAnswer> answers;   ///< parallel to administeredItems
    std::optional<ItemId> currentItemId;
    double theta = 0.0;
    double standardError = 1.0;
    std::size_t itemsAdministered = 0;
    std::size_t correctCount = 0;
    std::optional<StoppingReason> stoppingReason;
    Timestamp startedAt;
    std::optional<Timestamp> completedAt;
    std::optional<int> score;
    std::optional<ConfidenceInterval> confidenceInterval;   ///< fixed at completion
  };

  /**
   * @brief Append-only historical reliability measurement.
   */
  struct ReliabilityMetric
  {
    MetricType type = MetricType::CronbachsAlpha;
    double value = 0.0;
    std::size_t sampleSize = 0;
    Timestamp calculatedAt;
    std::map<std::string, std::string> details;
  };

  /**
   * @brief Final score of a session. The interval is absent, never
   * fabricated, when reliability is unavailable or too low.
   */
  struct ScoreEstimate
  {
    double theta = 0.0;
    int score = 100;
    double percentile = 50.0;
    std::optional<ConfidenceInterval> confidenceInterval;
  };

  struct CompletedSessionScore
  {
    UserId userId = 0;
    SessionId sessionId = 0;
    double score = 0.0;
    Timestamp completedAt;
  };

  /// Two consecutive completed sessions of the same user
  struct RetestPair
  {
    CompletedSessionScore first;
    CompletedSessionScore second;
    double intervalDays = 0.0;
  };

  struct FlagTransition
  {
    ItemId itemId = 0;
    QualityFlag from = QualityFlag::Normal;
    QualityFlag to = QualityFlag::Normal;
    std::string reason;
    Timestamp at;
    FlagSource source = FlagSource::Manual;
  };
} // namespace psychometrics
