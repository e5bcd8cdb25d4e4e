#include "analysis/ItemStatisticsJob.h"

namespace psychometrics::analysis
{
  ItemStatisticsJob::ItemStatisticsJob(const ItemQualityAnalyzer& analyzer,
                                       const QualityFlagController& flagController,
                                       repository::IItemRepository& items,
                                       const repository::IResponseRepository& responses,
                                       std::ostream& os)
    : mAnalyzer(analyzer),
      mFlagController(flagController),
      mItems(items),
      mResponses(responses),
      mLog(os)
  {}

  void ItemStatisticsJob::refreshItem(ItemId itemId, StatisticsJobResult& result)
  {
    auto item = mItems.findItem(itemId);
    if (!item)
      return;

    const DiscriminationResult dr = mAnalyzer.computeDiscrimination(itemId);
    const std::optional<double> discrimination =
      dr.insufficientData ? item->discrimination : dr.value;

    mItems.updateStatistics(itemId, discrimination, dr.responseCount);
    ++result.itemsUpdated;
    if (dr.insufficientData)
      ++result.itemsWithInsufficientData;

    auto refreshed = mItems.findItem(itemId);
    if (!refreshed)
      return;

    FlagDecision decision = mFlagController.evaluate(*refreshed);
    if (decision.changed)
      result.newlyFlagged.push_back(decision);
  }

  StatisticsJobResult ItemStatisticsJob::runForSession(SessionId sessionId)
  {
    StatisticsJobResult result;
    for (const auto& response : mResponses.allResponsesForSession(sessionId))
      refreshItem(response.itemId, result);

    std::lock_guard<std::mutex> lock(mLogMutex);
    mLog << "[ItemStatistics] session " << sessionId
         << ": refreshed " << result.itemsUpdated << " items"
         << " (" << result.itemsWithInsufficientData << " below response minimum)"
         << ", newly flagged " << result.newlyFlagged.size() << "\n";
    return result;
  }

  StatisticsJobResult ItemStatisticsJob::runForAllItems()
  {
    StatisticsJobResult result;
    for (const auto& item : mItems.allItems())
      refreshItem(item.id, result);

    std::lock_guard<std::mutex> lock(mLogMutex);
    mLog << "[ItemStatistics] full refresh: " << result.itemsUpdated << " items, "
         << result.newlyFlagged.size() << " newly flagged\n";
    return result;
  }
} // namespace psychometrics::analysis
