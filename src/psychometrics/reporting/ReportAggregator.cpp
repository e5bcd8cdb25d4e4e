#include "reporting/ReportAggregator.h"
#include "PsychometricExceptions.h"
#include "PsychometricStats.h"

#include <algorithm>
#include <iomanip>
#include <map>
#include <sstream>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace psychometrics
{
namespace reporting
{

namespace
{
    constexpr double kComparisonTolerance = 0.05;

    template <class T, class Fn, class Log>
    ReportSection<T> computeSection(const std::string& name, Fn fn, Log logFailure)
    {
        ReportSection<T> section;
        try
        {
            section.value = fn();
            section.status = SectionStatus::Available;
        }
        catch (const std::exception& e)
        {
            section.status = SectionStatus::Unavailable;
            section.error = e.what();
            logFailure(name, e.what());
        }
        return section;
    }

    template <class T>
    ReportSection<T> unavailable(const std::string& error)
    {
        ReportSection<T> section;
        section.status = SectionStatus::Unavailable;
        section.error = error;
        return section;
    }

    double percentOf(std::size_t part, std::size_t total)
    {
        if (total == 0)
            return 0.0;
        return stats::roundTo(100.0 * static_cast<double>(part) / static_cast<double>(total), 1);
    }

    template <class Key, class KeyOf>
    std::map<Key, GroupStatistics> groupStatistics(const std::vector<Item>& items,
                                                   const std::vector<Key>& keys,
                                                   KeyOf keyOf)
    {
        std::map<Key, GroupStatistics> groups;
        std::map<Key, double> sums;
        for (const Key& k : keys)
        {
            groups[k] = GroupStatistics();
            sums[k] = 0.0;
        }

        for (const auto& item : items)
        {
            const Key k = keyOf(item);
            GroupStatistics& g = groups[k];
            ++g.count;
            sums[k] += *item.discrimination;
            if (*item.discrimination < 0.0)
                ++g.negativeCount;
        }

        for (auto& entry : groups)
            if (entry.second.count > 0)
                entry.second.meanDiscrimination =
                    stats::roundTo(sums[entry.first] / static_cast<double>(entry.second.count), 4);
        return groups;
    }

    ActionItem toActionItem(const Item& item)
    {
        ActionItem a;
        a.itemId = item.id;
        a.discrimination = *item.discrimination;
        a.responseCount = item.responseCount;
        a.difficulty = item.difficulty;
        a.type = item.type;
        a.qualityFlag = item.qualityFlag;
        return a;
    }

    std::optional<double> meanOf(const std::vector<double>& values)
    {
        if (values.empty())
            return std::nullopt;
        return stats::computeSampleMoments(values).mean;
    }

    std::optional<Comparison> compare(std::optional<double> value, std::optional<double> average)
    {
        if (!value || !average)
            return std::nullopt;
        const double diff = *value - *average;
        if (diff > kComparisonTolerance)
            return Comparison::Above;
        if (diff < -kComparisonTolerance)
            return Comparison::Below;
        return Comparison::At;
    }
}

std::string toString(Comparison comparison)
{
    switch (comparison)
    {
    case Comparison::Above:
        return "above";
    case Comparison::At:
        return "at";
    case Comparison::Below:
        return "below";
    }
    return "unknown";
}

ReportAggregator::ReportAggregator(repository::IItemRepository& items,
                                   repository::IReliabilityMetricRepository& metrics,
                                   const reliability::ReliabilityEstimator& reliability,
                                   const analysis::QualityFlagController& flagController,
                                   const config::EngineConfiguration& config,
                                   std::ostream& os,
                                   utils::Clock clock)
    : mItems(items),
      mMetrics(metrics),
      mReliability(reliability),
      mFlagController(flagController),
      mConfig(config),
      mLog(os),
      mClock(std::move(clock))
{}

void ReportAggregator::logFailure(const std::string& section, const std::string& what) const
{
    std::lock_guard<std::mutex> lock(mLogMutex);
    mLog << "[ReportAggregator] ERROR section '" << section << "' unavailable: " << what << "\n";
}

DiscriminationReport ReportAggregator::discriminationReport(std::optional<std::size_t> minResponses) const
{
    DiscriminationReport R;
    R.generatedAt = mClock();
    R.minResponses = minResponses.value_or(mConfig.discrimination.reportMinResponses);

    auto logger = [this](const std::string& s, const std::string& w) { logFailure(s, w); };

    std::vector<Item> all;
    try
    {
        all = mItems.allItems();
    }
    catch (const std::exception& e)
    {
        // One failure, logged once, shared by every section
        logFailure("discrimination items", e.what());
        R.summary = unavailable<DiscriminationSummary>(e.what());
        R.byDifficulty = unavailable<std::map<DifficultyTier, GroupStatistics>>(e.what());
        R.byType = unavailable<std::map<ItemType, GroupStatistics>>(e.what());
        R.actionNeeded = unavailable<ActionNeeded>(e.what());
        R.trends = unavailable<DiscriminationTrends>(e.what());
        return R;
    }

    std::vector<Item> reported;
    for (const auto& item : all)
        if (item.qualityFlag == QualityFlag::Normal && item.discrimination &&
            item.responseCount >= R.minResponses)
            reported.push_back(item);

    R.summary = computeSection<DiscriminationSummary>("summary", [&]() {
        DiscriminationSummary S;
        S.totalItemsWithData = reported.size();
        for (auto tier : {DiscriminationTier::Excellent, DiscriminationTier::Good,
                          DiscriminationTier::Acceptable, DiscriminationTier::Poor,
                          DiscriminationTier::VeryPoor, DiscriminationTier::Negative})
            S.tierCounts[tier] = 0;

        for (const auto& item : reported)
            ++S.tierCounts[*analysis::classifyDiscrimination(item.discrimination)];

        const std::size_t problematic = S.tierCounts[DiscriminationTier::Poor] +
                                        S.tierCounts[DiscriminationTier::VeryPoor] +
                                        S.tierCounts[DiscriminationTier::Negative];
        S.distribution.excellentPct = percentOf(S.tierCounts[DiscriminationTier::Excellent], reported.size());
        S.distribution.goodPct = percentOf(S.tierCounts[DiscriminationTier::Good], reported.size());
        S.distribution.acceptablePct = percentOf(S.tierCounts[DiscriminationTier::Acceptable], reported.size());
        S.distribution.problematicPct = percentOf(problematic, reported.size());
        return S;
    }, logger);

    R.byDifficulty = computeSection<std::map<DifficultyTier, GroupStatistics>>("by difficulty", [&]() {
        return groupStatistics(reported,
                               std::vector<DifficultyTier>(kAllDifficultyTiers.begin(), kAllDifficultyTiers.end()),
                               [](const Item& i) { return i.difficulty; });
    }, logger);

    R.byType = computeSection<std::map<ItemType, GroupStatistics>>("by type", [&]() {
        return groupStatistics(reported,
                               std::vector<ItemType>(kAllItemTypes.begin(), kAllItemTypes.end()),
                               [](const Item& i) { return i.type; });
    }, logger);

    R.actionNeeded = computeSection<ActionNeeded>("action needed", [&]() {
        ActionNeeded A;
        for (const auto& item : reported)
        {
            const auto tier = analysis::classifyDiscrimination(item.discrimination);
            if (tier == DiscriminationTier::Negative)
                A.immediateReview.push_back(toActionItem(item));
            else if (tier == DiscriminationTier::VeryPoor)
                A.monitor.push_back(toActionItem(item));
        }

        auto worstFirst = [](const ActionItem& a, const ActionItem& b) {
            if (a.discrimination != b.discrimination)
                return a.discrimination < b.discrimination;
            return a.itemId < b.itemId;
        };
        std::sort(A.immediateReview.begin(), A.immediateReview.end(), worstFirst);
        std::sort(A.monitor.begin(), A.monitor.end(), worstFirst);

        const std::size_t limit = mConfig.discrimination.actionListLimit;
        if (A.immediateReview.size() > limit)
            A.immediateReview.resize(limit);
        if (A.monitor.size() > limit)
            A.monitor.resize(limit);
        return A;
    }, logger);

    R.trends = computeSection<DiscriminationTrends>("trends", [&]() {
        DiscriminationTrends T;
        std::vector<double> values;
        for (const auto& item : reported)
            values.push_back(*item.discrimination);
        if (auto mean = meanOf(values))
            T.meanDiscrimination = stats::roundTo(*mean, 4);

        const Timestamp weekAgo = R.generatedAt - boost::gregorian::days(7);
        const Timestamp monthAgo = R.generatedAt - boost::gregorian::days(30);
        for (const auto& item : all)
        {
            if (item.qualityFlag != QualityFlag::UnderReview)
                continue;

            // Only items still held by the automatic rule count
            const auto history = mItems.flagHistory(item.id);
            if (history.empty())
                continue;
            const FlagTransition& last = history.back();
            if (last.source != FlagSource::Automatic || last.to != QualityFlag::UnderReview)
                continue;
            if (last.at >= weekAgo)
                ++T.newlyFlaggedLast7Days;
            if (last.at >= monthAgo)
                ++T.newlyFlaggedLast30Days;
        }
        return T;
    }, logger);

    return R;
}

DiscriminationDetail ReportAggregator::discriminationDetail(ItemId itemId) const
{
    auto found = mItems.findItem(itemId);
    if (!found)
        throw NotFoundException("Item " + std::to_string(itemId) + " not found");
    const Item& item = *found;

    DiscriminationDetail D;
    D.itemId = item.id;
    D.difficulty = item.difficulty;
    D.type = item.type;
    D.discrimination = item.discrimination;
    D.tier = analysis::classifyDiscrimination(item.discrimination);
    D.responseCount = item.responseCount;
    D.qualityFlag = item.qualityFlag;
    D.qualityFlagReason = item.qualityFlagReason;
    D.qualityFlagUpdatedAt = item.qualityFlagUpdatedAt;

    std::vector<double> allValues, sameType, sameDifficulty;
    for (const auto& other : mItems.allItems())
    {
        if (!other.discrimination)
            continue;
        allValues.push_back(*other.discrimination);
        if (other.type == item.type)
            sameType.push_back(*other.discrimination);
        if (other.difficulty == item.difficulty)
            sameDifficulty.push_back(*other.discrimination);
    }

    if (item.discrimination)
        D.percentileRank = stats::percentileRank(allValues, *item.discrimination);

    if (auto avg = meanOf(sameType))
        D.typeAverage = stats::roundTo(*avg, 4);
    if (auto avg = meanOf(sameDifficulty))
        D.difficultyAverage = stats::roundTo(*avg, 4);
    D.comparedToType = compare(item.discrimination, D.typeAverage);
    D.comparedToDifficulty = compare(item.discrimination, D.difficultyAverage);

    D.history = mItems.flagHistory(itemId);
    return D;
}

analysis::FlagDecision ReportAggregator::updateQualityFlag(ItemId itemId,
                                                           QualityFlag newFlag,
                                                           const std::optional<std::string>& reason) const
{
    return mFlagController.overrideFlag(itemId, newFlag, reason);
}

ReliabilityReport ReportAggregator::reliabilityReport(std::optional<std::size_t> minSessions,
                                                      std::optional<std::size_t> minRetestPairs,
                                                      bool storeMetrics) const
{
    using namespace psychometrics::reliability;

    ReliabilityReport R;
    R.generatedAt = mClock();

    auto logger = [this](const std::string& s, const std::string& w) { logFailure(s, w); };

    R.internalConsistency = computeSection<AlphaResult>("internal consistency", [&]() {
        return mReliability.estimateAlpha(minSessions);
    }, logger);
    R.testRetest = computeSection<TestRetestResult>("test-retest", [&]() {
        return mReliability.estimateTestRetest(minRetestPairs);
    }, logger);
    R.splitHalf = computeSection<SplitHalfResult>("split-half", [&]() {
        return mReliability.estimateSplitHalf(minSessions);
    }, logger);

    // Unavailable sections count as insufficient data downstream
    AlphaResult alpha;
    if (R.internalConsistency.available())
        alpha = *R.internalConsistency.value;
    else
    {
        alpha.insufficientData = true;
        alpha.message = R.internalConsistency.error;
    }

    TestRetestResult retest;
    if (R.testRetest.available())
        retest = *R.testRetest.value;
    else
    {
        retest.insufficientData = true;
        retest.message = R.testRetest.error;
    }

    SplitHalfResult split;
    if (R.splitHalf.available())
        split = *R.splitHalf.value;
    else
    {
        split.insufficientData = true;
        split.message = R.splitHalf.error;
    }

    R.overallStatus = determineOverallStatus(alpha, retest, split);
    R.recommendations = generateRecommendations(alpha, retest, split);

    if (storeMetrics)
    {
        try
        {
            R.metricsStored = this->storeMetrics(R);
        }
        catch (const std::exception& e)
        {
            logFailure("metric storage", e.what());
        }
    }

    R.trends = computeSection<std::vector<MetricTrend>>("trends", [&]() {
        return metricTrends();
    }, logger);

    return R;
}

std::size_t ReportAggregator::storeMetrics(const ReliabilityReport& report) const
{
    std::size_t stored = 0;
    const Timestamp now = report.generatedAt;

    if (report.internalConsistency.available() && report.internalConsistency.value->alpha)
    {
        const auto& a = *report.internalConsistency.value;
        ReliabilityMetric m;
        m.type = MetricType::CronbachsAlpha;
        m.value = *a.alpha;
        m.sampleSize = a.numSessions;
        m.calculatedAt = now;
        m.details["num_items"] = std::to_string(a.numItems);
        m.details["interpretation"] = reliability::toString(*a.interpretation);
        mMetrics.append(m);
        ++stored;
    }

    if (report.testRetest.available() && report.testRetest.value->correlation)
    {
        const auto& t = *report.testRetest.value;
        ReliabilityMetric m;
        m.type = MetricType::TestRetest;
        m.value = *t.correlation;
        m.sampleSize = t.numPairs;
        m.calculatedAt = now;
        m.details["interpretation"] = reliability::toString(*t.interpretation);
        std::ostringstream interval, change;
        interval << std::fixed << std::setprecision(1) << t.meanIntervalDays.value_or(0.0);
        change << std::fixed << std::setprecision(2) << t.meanScoreChange.value_or(0.0);
        m.details["mean_interval_days"] = interval.str();
        m.details["practice_effect"] = change.str();
        mMetrics.append(m);
        ++stored;
    }

    if (report.splitHalf.available() && report.splitHalf.value->spearmanBrown)
    {
        const auto& s = *report.splitHalf.value;
        ReliabilityMetric m;
        m.type = MetricType::SplitHalf;
        m.value = *s.spearmanBrown;
        m.sampleSize = s.numSessions;
        m.calculatedAt = now;
        std::ostringstream half;
        half << std::fixed << std::setprecision(4) << s.halfCorrelation.value_or(0.0);
        m.details["half_correlation"] = half.str();
        m.details["interpretation"] = reliability::toString(*s.interpretation);
        mMetrics.append(m);
        ++stored;
    }

    return stored;
}

std::vector<MetricTrend> ReportAggregator::metricTrends() const
{
    const auto history = reliabilityHistory(std::nullopt, 30);

    std::vector<MetricTrend> trends;
    for (MetricType type : kAllMetricTypes)
    {
        MetricTrend T;
        T.type = type;

        // history is most recent first
        std::vector<double> values;
        for (const auto& m : history)
            if (m.type == type)
                values.push_back(m.value);

        T.observations = values.size();
        if (!values.empty())
            T.latest = values.front();
        if (values.size() >= 2)
            T.delta30Days = stats::roundTo(values.front() - values.back(), 4);
        trends.push_back(T);
    }
    return trends;
}

std::vector<ReliabilityMetric> ReportAggregator::reliabilityHistory(std::optional<MetricType> type,
                                                                    int days) const
{
    if (days <= 0)
        throw InvalidInputException("History window must be a positive number of days");

    const Timestamp since = mClock() - boost::gregorian::days(days);
    return mMetrics.history(type, since);
}

} // namespace reporting
} // namespace psychometrics
