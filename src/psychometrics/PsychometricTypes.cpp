#include "PsychometricTypes.h"

namespace psychometrics
{
  std::string toString(DifficultyTier tier)
  {
    switch (tier)
    {
    case DifficultyTier::Easy:
      return "easy";
    case DifficultyTier::Medium:
      return "medium";
    case DifficultyTier::Hard:
      return "hard";
    }
    return "unknown";
  }

  std::string toString(ItemType type)
  {
    switch (type)
    {
    case ItemType::Pattern:
      return "pattern";
    case ItemType::Logic:
      return "logic";
    case ItemType::Spatial:
      return "spatial";
    case ItemType::Math:
      return "math";
    case ItemType::Verbal:
      return "verbal";
    case ItemType::Memory:
      return "memory";
    }
    return "unknown";
  }

  std::string toString(QualityFlag flag)
  {
    switch (flag)
    {
    case QualityFlag::Normal:
      return "normal";
    case QualityFlag::UnderReview:
      return "under_review";
    case QualityFlag::Deactivated:
      return "deactivated";
    }
    return "unknown";
  }

  std::string toString(SessionStatus status)
  {
    switch (status)
    {
    case SessionStatus::InProgress:
      return "in_progress";
    case SessionStatus::Completed:
      return "completed";
    case SessionStatus::Abandoned:
      return "abandoned";
    }
    return "unknown";
  }

  std::string toString(StoppingReason reason)
  {
    switch (reason)
    {
    case StoppingReason::SeThreshold:
      return "se_threshold";
    case StoppingReason::MaxItems:
      return "max_items";
    case StoppingReason::PoolExhausted:
      return "pool_exhausted";
    }
    return "unknown";
  }

  std::string toString(MetricType type)
  {
    switch (type)
    {
    case MetricType::CronbachsAlpha:
      return "cronbachs_alpha";
    case MetricType::TestRetest:
      return "test_retest";
    case MetricType::SplitHalf:
      return "split_half";
    }
    return "unknown";
  }

  std::string toString(FlagSource source)
  {
    switch (source)
    {
    case FlagSource::Automatic:
      return "automatic";
    case FlagSource::Manual:
      return "manual";
    }
    return "unknown";
  }
} // namespace psychometrics
