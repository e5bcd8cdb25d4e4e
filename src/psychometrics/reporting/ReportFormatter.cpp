#include "reporting/ReportFormatter.h"
#include "utils/TimeUtils.h"

#include <iomanip>
#include <sstream>

namespace psychometrics
{
namespace reporting
{

namespace
{
    std::string formatOptional(const std::optional<double>& value, int precision)
    {
        if (!value)
            return "n/a";
        std::ostringstream os;
        os << std::fixed << std::setprecision(precision) << *value;
        return os.str();
    }

    void writeGroup(std::ostream& os, const std::string& label, const GroupStatistics& g)
    {
        os << "  " << std::left << std::setw(10) << label << std::right
           << " count=" << std::setw(4) << g.count
           << " mean=" << std::setw(7) << formatOptional(g.meanDiscrimination, 4)
           << " negative=" << g.negativeCount << std::endl;
    }

    void writeActionItems(std::ostream& os, const std::string& title, const std::vector<ActionItem>& items)
    {
        os << title << " (" << items.size() << ")" << std::endl;
        for (const auto& a : items)
        {
            os << "  item " << a.itemId
               << std::fixed << std::setprecision(4)
               << " discrimination=" << a.discrimination
               << " responses=" << a.responseCount
               << " " << toString(a.difficulty) << "/" << toString(a.type) << std::endl;
        }
    }
}

void ReportFormatter::writeHeader(std::ostream& os, const std::string& title, const Timestamp& generatedAt)
{
    os << "=== " << title << " ===" << std::endl;
    os << "Generated: " << utils::formatTimestamp(generatedAt) << std::endl << std::endl;
}

void ReportFormatter::writeDiscriminationReport(std::ostream& os, const DiscriminationReport& report)
{
    writeHeader(os, "Item Discrimination Report", report.generatedAt);
    os << "Minimum responses: " << report.minResponses << std::endl << std::endl;

    if (!writeUnavailable(os, report.summary, "Summary"))
    {
        const auto& s = *report.summary.value;
        os << "Summary: " << s.totalItemsWithData << " items with data" << std::endl;
        for (const auto& entry : s.tierCounts)
            os << "  " << std::left << std::setw(12) << analysis::toString(entry.first)
               << std::right << entry.second << std::endl;
        os << std::fixed << std::setprecision(1)
           << "  excellent " << s.distribution.excellentPct << "%"
           << ", good " << s.distribution.goodPct << "%"
           << ", acceptable " << s.distribution.acceptablePct << "%"
           << ", problematic " << s.distribution.problematicPct << "%" << std::endl;
    }
    os << std::endl;

    if (!writeUnavailable(os, report.byDifficulty, "By difficulty"))
    {
        os << "By difficulty:" << std::endl;
        for (const auto& entry : *report.byDifficulty.value)
            writeGroup(os, toString(entry.first), entry.second);
    }
    os << std::endl;

    if (!writeUnavailable(os, report.byType, "By type"))
    {
        os << "By type:" << std::endl;
        for (const auto& entry : *report.byType.value)
            writeGroup(os, toString(entry.first), entry.second);
    }
    os << std::endl;

    if (!writeUnavailable(os, report.actionNeeded, "Action needed"))
    {
        writeActionItems(os, "Immediate review", report.actionNeeded.value->immediateReview);
        writeActionItems(os, "Monitor", report.actionNeeded.value->monitor);
    }
    os << std::endl;

    if (!writeUnavailable(os, report.trends, "Trends"))
    {
        const auto& t = *report.trends.value;
        os << "Mean discrimination: " << formatOptional(t.meanDiscrimination, 4) << std::endl;
        os << "Auto-flagged last 7 days: " << t.newlyFlaggedLast7Days
           << ", last 30 days: " << t.newlyFlaggedLast30Days << std::endl;
    }
}

void ReportFormatter::writeDiscriminationDetail(std::ostream& os, const DiscriminationDetail& d)
{
    os << "Item " << d.itemId << " (" << toString(d.difficulty) << ", " << toString(d.type) << ")" << std::endl;
    os << "  discrimination: " << formatOptional(d.discrimination, 4);
    if (d.tier)
        os << " [" << analysis::toString(*d.tier) << "]";
    os << std::endl;
    os << "  responses: " << d.responseCount << std::endl;
    os << "  percentile rank: " << (d.percentileRank ? std::to_string(*d.percentileRank) : "n/a") << std::endl;
    os << "  type average: " << formatOptional(d.typeAverage, 4);
    if (d.comparedToType)
        os << " (" << toString(*d.comparedToType) << ")";
    os << std::endl;
    os << "  difficulty average: " << formatOptional(d.difficultyAverage, 4);
    if (d.comparedToDifficulty)
        os << " (" << toString(*d.comparedToDifficulty) << ")";
    os << std::endl;
    os << "  quality flag: " << toString(d.qualityFlag);
    if (d.qualityFlagReason)
        os << " - " << *d.qualityFlagReason;
    os << std::endl;

    for (const auto& h : d.history)
        os << "    " << utils::formatTimestamp(h.at) << " " << toString(h.from)
           << " -> " << toString(h.to) << ": " << h.reason << std::endl;
}

void ReportFormatter::writeReliabilityReport(std::ostream& os, const ReliabilityReport& report)
{
    writeHeader(os, "Reliability Report", report.generatedAt);
    os << "Overall status: " << reliability::toString(report.overallStatus) << std::endl << std::endl;

    if (!writeUnavailable(os, report.internalConsistency, "Cronbach's alpha"))
    {
        const auto& a = *report.internalConsistency.value;
        os << "Cronbach's alpha: " << formatOptional(a.alpha, 4);
        if (a.interpretation)
            os << " (" << reliability::toString(*a.interpretation) << ")";
        os << " sessions=" << a.numSessions << " items=" << a.numItems << std::endl;
        if (a.insufficientData)
            os << "  " << a.message << std::endl;
        for (const auto& p : a.problematicItems)
            os << "  item " << p.itemId << std::fixed << std::setprecision(4)
               << " r=" << p.correlation << ": " << p.recommendation << std::endl;
    }

    if (!writeUnavailable(os, report.testRetest, "Test-retest"))
    {
        const auto& t = *report.testRetest.value;
        os << "Test-retest: " << formatOptional(t.correlation, 4);
        if (t.interpretation)
            os << " (" << reliability::toString(*t.interpretation) << ")";
        os << " pairs=" << t.numPairs
           << " interval=" << formatOptional(t.meanIntervalDays, 1) << "d"
           << " change=" << formatOptional(t.meanScoreChange, 2);
        if (t.practiceEffectDetected)
            os << " [practice effect]";
        os << std::endl;
        if (t.insufficientData)
            os << "  " << t.message << std::endl;
    }

    if (!writeUnavailable(os, report.splitHalf, "Split-half"))
    {
        const auto& s = *report.splitHalf.value;
        os << "Split-half: " << formatOptional(s.spearmanBrown, 4)
           << " (half r=" << formatOptional(s.halfCorrelation, 4) << ")";
        if (s.interpretation)
            os << " " << reliability::toString(*s.interpretation);
        os << std::endl;
        if (s.insufficientData)
            os << "  " << s.message << std::endl;
    }
    os << std::endl;

    os << "Recommendations:" << std::endl;
    if (report.recommendations.empty())
        os << "  none" << std::endl;
    for (const auto& r : report.recommendations)
        os << "  [" << reliability::toString(r.priority) << "] "
           << reliability::toString(r.category) << ": " << r.message << std::endl;

    if (!writeUnavailable(os, report.trends, "Trends"))
    {
        os << "Trends (30 days):" << std::endl;
        for (const auto& t : *report.trends.value)
            os << "  " << std::left << std::setw(16) << toString(t.type) << std::right
               << " latest=" << formatOptional(t.latest, 4)
               << " delta=" << formatOptional(t.delta30Days, 4)
               << " n=" << t.observations << std::endl;
    }

    if (report.metricsStored > 0)
        os << "Stored " << report.metricsStored << " metrics" << std::endl;
}

} // namespace reporting
} // namespace psychometrics
