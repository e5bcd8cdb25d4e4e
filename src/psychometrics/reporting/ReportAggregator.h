#pragma once

#include "analysis/QualityFlagController.h"
#include "config/EngineConfiguration.h"
#include "reliability/ReliabilityEstimator.h"
#include "reporting/ReportTypes.h"
#include "repository/IItemRepository.h"
#include "repository/IReliabilityMetricRepository.h"
#include "utils/TimeUtils.h"

#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace psychometrics
{
namespace reporting
{

/**
 * @brief Admin-facing read models composed from the engine components.
 *
 * Each report section is computed independently. A failing section is
 * marked Unavailable with its error and logged once here; the remaining
 * sections are still returned.
 */
class ReportAggregator
{
public:
    ReportAggregator(repository::IItemRepository& items,
                     repository::IReliabilityMetricRepository& metrics,
                     const reliability::ReliabilityEstimator& reliability,
                     const analysis::QualityFlagController& flagController,
                     const config::EngineConfiguration& config,
                     std::ostream& os,
                     utils::Clock clock = utils::systemClock());

    /**
     * @brief Tier summary, breakdowns, action lists and trends over items
     * with flag normal, measured discrimination and at least
     * @p minResponses responses.
     */
    DiscriminationReport discriminationReport(std::optional<std::size_t> minResponses = std::nullopt) const;

    /// @throws NotFoundException for an unknown item
    DiscriminationDetail discriminationDetail(ItemId itemId) const;

    /**
     * @brief Manual quality-flag override.
     * @throws NotFoundException, InvalidInputException (see QualityFlagController)
     */
    analysis::FlagDecision updateQualityFlag(ItemId itemId,
                                             QualityFlag newFlag,
                                             const std::optional<std::string>& reason) const;

    /**
     * @brief The three coefficients with interpretations and recommendations.
     *
     * With @p storeMetrics, one ReliabilityMetric per available coefficient
     * is appended to the history.
     */
    ReliabilityReport reliabilityReport(std::optional<std::size_t> minSessions = std::nullopt,
                                        std::optional<std::size_t> minRetestPairs = std::nullopt,
                                        bool storeMetrics = false) const;

    /**
     * @brief Stored metrics of the last @p days days, most recent first.
     * @throws InvalidInputException if days is not positive
     */
    std::vector<ReliabilityMetric> reliabilityHistory(std::optional<MetricType> type, int days) const;

private:
    void logFailure(const std::string& section, const std::string& what) const;
    std::size_t storeMetrics(const ReliabilityReport& report) const;
    std::vector<MetricTrend> metricTrends() const;

    repository::IItemRepository& mItems;
    repository::IReliabilityMetricRepository& mMetrics;
    const reliability::ReliabilityEstimator& mReliability;
    const analysis::QualityFlagController& mFlagController;
    config::EngineConfiguration mConfig;
    std::ostream& mLog;
    utils::Clock mClock;
    mutable std::mutex mLogMutex;
};

} // namespace reporting
} // namespace psychometrics
