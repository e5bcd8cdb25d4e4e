#pragma once

#include "PsychometricTypes.h"
#include "analysis/DiscriminationTier.h"
#include "reliability/ReliabilityRecommendations.h"
#include "reliability/ReliabilityTypes.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace psychometrics
{
namespace reporting
{

using analysis::DiscriminationTier;

enum class SectionStatus
{
    Available,
    Unavailable
};

/**
 * @brief One independently computed part of a report.
 *
 * An Unavailable section carries the failure message instead of a value so
 * the rest of the report still renders.
 */
template <class T>
struct ReportSection
{
    SectionStatus status = SectionStatus::Unavailable;
    std::optional<T> value;
    std::string error;

    bool available() const
    {
        return status == SectionStatus::Available && value.has_value();
    }
};

// ------------------------------------------------------------ discrimination

struct QualityDistribution
{
    double excellentPct = 0.0;
    double goodPct = 0.0;
    double acceptablePct = 0.0;
    double problematicPct = 0.0;   ///< poor, very_poor and negative together
};

struct DiscriminationSummary
{
    std::size_t totalItemsWithData = 0;
    std::map<DiscriminationTier, std::size_t> tierCounts;   ///< every tier present
    QualityDistribution distribution;
};

struct GroupStatistics
{
    std::size_t count = 0;
    std::optional<double> meanDiscrimination;
    std::size_t negativeCount = 0;
};

struct ActionItem
{
    ItemId itemId = 0;
    double discrimination = 0.0;
    std::size_t responseCount = 0;
    DifficultyTier difficulty = DifficultyTier::Medium;
    ItemType type = ItemType::Pattern;
    QualityFlag qualityFlag = QualityFlag::Normal;
};

struct ActionNeeded
{
    std::vector<ActionItem> immediateReview;   ///< negative, worst first
    std::vector<ActionItem> monitor;           ///< very_poor, worst first
};

struct DiscriminationTrends
{
    std::optional<double> meanDiscrimination;
    std::size_t newlyFlaggedLast7Days = 0;
    std::size_t newlyFlaggedLast30Days = 0;
};

struct DiscriminationReport
{
    Timestamp generatedAt;
    std::size_t minResponses = 0;
    ReportSection<DiscriminationSummary> summary;
    ReportSection<std::map<DifficultyTier, GroupStatistics>> byDifficulty;
    ReportSection<std::map<ItemType, GroupStatistics>> byType;
    ReportSection<ActionNeeded> actionNeeded;
    ReportSection<DiscriminationTrends> trends;
};

enum class Comparison
{
    Above,
    At,
    Below
};

std::string toString(Comparison comparison);

struct DiscriminationDetail
{
    ItemId itemId = 0;
    DifficultyTier difficulty = DifficultyTier::Medium;
    ItemType type = ItemType::Pattern;
    std::optional<double> discrimination;
    std::optional<DiscriminationTier> tier;
    std::size_t responseCount = 0;
    std::optional<int> percentileRank;
    std::optional<double> typeAverage;
    std::optional<double> difficultyAverage;
    std::optional<Comparison> comparedToType;
    std::optional<Comparison> comparedToDifficulty;
    QualityFlag qualityFlag = QualityFlag::Normal;
    std::optional<std::string> qualityFlagReason;
    std::optional<Timestamp> qualityFlagUpdatedAt;
    std::vector<FlagTransition> history;
};

// --------------------------------------------------------------- reliability

struct MetricTrend
{
    MetricType type = MetricType::CronbachsAlpha;
    std::optional<double> latest;
    std::optional<double> delta30Days;   ///< latest minus oldest in the window
    std::size_t observations = 0;
};

struct ReliabilityReport
{
    Timestamp generatedAt;
    ReportSection<reliability::AlphaResult> internalConsistency;
    ReportSection<reliability::TestRetestResult> testRetest;
    ReportSection<reliability::SplitHalfResult> splitHalf;
    reliability::OverallReliabilityStatus overallStatus =
        reliability::OverallReliabilityStatus::InsufficientData;
    std::vector<reliability::Recommendation> recommendations;
    ReportSection<std::vector<MetricTrend>> trends;
    std::size_t metricsStored = 0;
};

} // namespace reporting
} // namespace psychometrics
