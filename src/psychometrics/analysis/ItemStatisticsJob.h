#pragma once

#include "analysis/ItemQualityAnalyzer.h"
#include "analysis/QualityFlagController.h"
#include "repository/IItemRepository.h"
#include "repository/IResponseRepository.h"

#include <mutex>
#include <ostream>
#include <vector>

namespace psychometrics::analysis
{
  struct StatisticsJobResult
  {
    std::size_t itemsUpdated = 0;
    std::size_t itemsWithInsufficientData = 0;
    std::vector<FlagDecision> newlyFlagged;
  };

  /**
   * @brief Response-aggregation job run after a session completes.
   *
   * Refreshes discrimination and response_count of every item the session
   * touched, then lets the QualityFlagController evaluate the refreshed
   * snapshot. Items below the response minimum keep their previous
   * discrimination; only the counter moves.
   */
  class ItemStatisticsJob
  {
  public:
    ItemStatisticsJob(const ItemQualityAnalyzer& analyzer,
                      const QualityFlagController& flagController,
                      repository::IItemRepository& items,
                      const repository::IResponseRepository& responses,
                      std::ostream& os);

    StatisticsJobResult runForSession(SessionId sessionId);

    /// Recomputes every item in the pool.
    StatisticsJobResult runForAllItems();

  private:
    void refreshItem(ItemId itemId, StatisticsJobResult& result);

    const ItemQualityAnalyzer& mAnalyzer;
    const QualityFlagController& mFlagController;
    repository::IItemRepository& mItems;
    const repository::IResponseRepository& mResponses;
    std::ostream& mLog;
    std::mutex mLogMutex;
  };
} // namespace psychometrics::analysis
