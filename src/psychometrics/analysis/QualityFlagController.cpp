#include "analysis/QualityFlagController.h"
#include "PsychometricExceptions.h"

#include <boost/algorithm/string/trim.hpp>
#include <iomanip>
#include <sstream>
#include <utility>

namespace psychometrics::analysis
{
  QualityFlagController::QualityFlagController(IItemRepository& items,
                                               IQualityFlagObserver& observer,
                                               std::size_t minResponses,
                                               utils::Clock clock)
    : mItems(items),
      mObserver(observer),
      mMinResponses(minResponses),
      mClock(std::move(clock))
  {}

  std::string QualityFlagController::negativeDiscriminationReason(double discrimination)
  {
    std::ostringstream os;
    os << "Negative discrimination: " << std::fixed << std::setprecision(4) << discrimination;
    return os.str();
  }

  Item QualityFlagController::loadItem(ItemId itemId) const
  {
    auto item = mItems.findItem(itemId);
    if (!item)
      throw NotFoundException("Item " + std::to_string(itemId) + " not found");
    return *item;
  }

  FlagDecision QualityFlagController::evaluate(const Item& item) const
  {
    FlagDecision D;
    D.itemId = item.id;
    D.previousFlag = item.qualityFlag;
    D.currentFlag = item.qualityFlag;
    D.reason = item.qualityFlagReason;
    D.updatedAt = item.qualityFlagUpdatedAt;

    if (item.qualityFlag != QualityFlag::Normal)
      return D;
    if (item.responseCount < mMinResponses)
      return D;
    if (!item.discrimination || !(*item.discrimination < 0.0))
      return D;

    const double discrimination = *item.discrimination;
    const std::string reason = negativeDiscriminationReason(discrimination);
    const Timestamp now = mClock();

    // Losing the race means another evaluation already flagged the item
    if (!mItems.compareAndSetQualityFlag(item.id, QualityFlag::Normal, QualityFlag::UnderReview,
                                         reason, now, FlagSource::Automatic))
    {
      const Item current = loadItem(item.id);
      D.currentFlag = current.qualityFlag;
      D.reason = current.qualityFlagReason;
      D.updatedAt = current.qualityFlagUpdatedAt;
      return D;
    }

    D.currentFlag = QualityFlag::UnderReview;
    D.changed = true;
    D.reason = reason;
    D.updatedAt = now;

    diagnostics::QualityFlagEvent event;
    event.itemId = item.id;
    event.discrimination = discrimination;
    event.responseCount = item.responseCount;
    event.reason = reason;
    event.flaggedAt = now;
    mObserver.onItemFlagged(event);

    return D;
  }

  FlagDecision QualityFlagController::evaluate(ItemId itemId) const
  {
    return evaluate(loadItem(itemId));
  }

  FlagDecision QualityFlagController::overrideFlag(ItemId itemId,
                                                   QualityFlag newFlag,
                                                   const std::optional<std::string>& reason) const
  {
    const Item item = loadItem(itemId);

    std::optional<std::string> trimmed;
    if (reason)
    {
      trimmed = boost::algorithm::trim_copy(*reason);
      if (trimmed->empty())
        trimmed.reset();
    }

    if (newFlag == QualityFlag::Deactivated && !trimmed)
      throw InvalidInputException("A reason is required when deactivating item " +
                                  std::to_string(itemId));

    const Timestamp now = mClock();
    mItems.setQualityFlag(itemId, newFlag, trimmed, now);

    FlagDecision D;
    D.itemId = itemId;
    D.previousFlag = item.qualityFlag;
    D.currentFlag = newFlag;
    D.changed = item.qualityFlag != newFlag;
    D.reason = trimmed;
    D.updatedAt = now;
    return D;
  }

  FlagDecision QualityFlagController::requestReview(ItemId itemId, const std::string& reason) const
  {
    const Item item = loadItem(itemId);

    if (item.qualityFlag == QualityFlag::Deactivated)
      throw ConflictingStateException("Item " + std::to_string(itemId) +
                                      " is deactivated; use an explicit override");

    FlagDecision D;
    D.itemId = itemId;
    D.previousFlag = item.qualityFlag;
    D.currentFlag = item.qualityFlag;
    D.reason = item.qualityFlagReason;
    D.updatedAt = item.qualityFlagUpdatedAt;

    if (item.qualityFlag == QualityFlag::UnderReview)
      return D;

    const Timestamp now = mClock();
    if (mItems.compareAndSetQualityFlag(itemId, QualityFlag::Normal, QualityFlag::UnderReview,
                                        reason, now, FlagSource::Manual))
    {
      D.currentFlag = QualityFlag::UnderReview;
      D.changed = true;
      D.reason = reason;
      D.updatedAt = now;
      return D;
    }

    // Flag changed underneath us
    const Item current = loadItem(itemId);
    if (current.qualityFlag == QualityFlag::Deactivated)
      throw ConflictingStateException("Item " + std::to_string(itemId) +
                                      " is deactivated; use an explicit override");
    D.currentFlag = current.qualityFlag;
    D.reason = current.qualityFlagReason;
    D.updatedAt = current.qualityFlagUpdatedAt;
    return D;
  }
} // namespace psychometrics::analysis
