#include "analysis/ItemQualityAnalyzer.h"
#include "PsychometricStats.h"

#include <map>
#include <set>
#include <vector>

namespace psychometrics::analysis
{
  ItemQualityAnalyzer::ItemQualityAnalyzer(const IResponseRepository& responses,
                                           std::size_t minResponses)
    : mResponses(responses),
      mMinResponses(minResponses)
  {}

  DiscriminationResult ItemQualityAnalyzer::computeDiscrimination(ItemId itemId) const
  {
    DiscriminationResult R;
    R.itemId = itemId;

    const auto completedIds = mResponses.completedSessionIds();
    const std::set<SessionId> completed(completedIds.begin(), completedIds.end());

    std::vector<int> itemScores;
    std::vector<double> totalScores;
    std::map<SessionId, double> totalsBySession;

    for (const auto& response : mResponses.allResponsesForItem(itemId))
    {
      if (completed.count(response.sessionId) == 0)
        continue;

      auto it = totalsBySession.find(response.sessionId);
      if (it == totalsBySession.end())
      {
        double total = 0.0;
        for (const auto& r : mResponses.allResponsesForSession(response.sessionId))
          total += r.isCorrect ? 1.0 : 0.0;
        it = totalsBySession.emplace(response.sessionId, total).first;
      }

      itemScores.push_back(response.isCorrect ? 1 : 0);
      totalScores.push_back(it->second);
    }

    R.responseCount = itemScores.size();
    if (!itemScores.empty())
    {
      std::size_t correct = 0;
      for (int s : itemScores)
        correct += static_cast<std::size_t>(s);
      R.proportionCorrect = static_cast<double>(correct) / static_cast<double>(itemScores.size());
    }

    if (R.responseCount < mMinResponses)
    {
      R.insufficientData = true;
      R.message = "Insufficient data: " + std::to_string(R.responseCount) +
                  " responses (minimum required: " + std::to_string(mMinResponses) + ")";
      return R;
    }

    R.value = stats::pointBiserialCorrelation(itemScores, totalScores);
    return R;
  }
} // namespace psychometrics::analysis
