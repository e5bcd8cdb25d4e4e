#include "reporting/ReportJsonSerializer.h"
#include "utils/TimeUtils.h"

#include <cstdint>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

using namespace rapidjson;

namespace psychometrics
{
namespace reporting
{

namespace
{
    using Allocator = Document::AllocatorType;

    Value stringValue(const std::string& s, Allocator& allocator)
    {
        return Value(s.c_str(), static_cast<SizeType>(s.size()), allocator);
    }

    Value count(std::size_t n)
    {
        return Value(static_cast<uint64_t>(n));
    }

    Value optionalValue(const std::optional<double>& v)
    {
        return v ? Value(*v) : Value(kNullType);
    }

    Value optionalValue(const std::optional<int>& v)
    {
        return v ? Value(*v) : Value(kNullType);
    }

    Value timestampValue(const Timestamp& ts, Allocator& allocator)
    {
        return stringValue(utils::formatTimestamp(ts), allocator);
    }

    template <class T, class Fn>
    Value sectionValue(const ReportSection<T>& section, Fn serialize, Allocator& allocator)
    {
        if (section.available())
            return serialize(*section.value);

        Value obj(kObjectType);
        obj.AddMember("status", "unavailable", allocator);
        obj.AddMember("error", stringValue(section.error, allocator), allocator);
        return obj;
    }
}

std::string ReportJsonSerializer::toJsonString(const Document& doc, bool pretty)
{
    StringBuffer buffer;
    if (pretty)
    {
        PrettyWriter<StringBuffer> writer(buffer);
        doc.Accept(writer);
    }
    else
    {
        Writer<StringBuffer> writer(buffer);
        doc.Accept(writer);
    }
    return buffer.GetString();
}

// ------------------------------------------------------------ discrimination

Value ReportJsonSerializer::serializeSummary(const DiscriminationSummary& summary, Allocator& allocator)
{
    Value obj(kObjectType);
    obj.AddMember("total_items_with_data", count(summary.totalItemsWithData), allocator);

    Value tiers(kObjectType);
    for (const auto& entry : summary.tierCounts)
        tiers.AddMember(stringValue(analysis::toString(entry.first), allocator), count(entry.second), allocator);
    obj.AddMember("tiers", tiers, allocator);

    Value distribution(kObjectType);
    distribution.AddMember("excellent_pct", summary.distribution.excellentPct, allocator);
    distribution.AddMember("good_pct", summary.distribution.goodPct, allocator);
    distribution.AddMember("acceptable_pct", summary.distribution.acceptablePct, allocator);
    distribution.AddMember("problematic_pct", summary.distribution.problematicPct, allocator);
    obj.AddMember("quality_distribution", distribution, allocator);
    return obj;
}

Value ReportJsonSerializer::serializeGroup(const GroupStatistics& group, Allocator& allocator)
{
    Value obj(kObjectType);
    obj.AddMember("count", count(group.count), allocator);
    obj.AddMember("mean_discrimination", optionalValue(group.meanDiscrimination), allocator);
    obj.AddMember("negative_count", count(group.negativeCount), allocator);
    return obj;
}

Value ReportJsonSerializer::serializeActionItem(const ActionItem& item, Allocator& allocator)
{
    Value obj(kObjectType);
    obj.AddMember("item_id", static_cast<int64_t>(item.itemId), allocator);
    obj.AddMember("discrimination", item.discrimination, allocator);
    obj.AddMember("response_count", count(item.responseCount), allocator);
    obj.AddMember("difficulty", stringValue(toString(item.difficulty), allocator), allocator);
    obj.AddMember("type", stringValue(toString(item.type), allocator), allocator);
    obj.AddMember("quality_flag", stringValue(toString(item.qualityFlag), allocator), allocator);
    return obj;
}

Value ReportJsonSerializer::serializeTrends(const DiscriminationTrends& trends, Allocator& allocator)
{
    Value obj(kObjectType);
    obj.AddMember("mean_discrimination", optionalValue(trends.meanDiscrimination), allocator);
    obj.AddMember("new_negative_last_7_days", count(trends.newlyFlaggedLast7Days), allocator);
    obj.AddMember("new_negative_last_30_days", count(trends.newlyFlaggedLast30Days), allocator);
    return obj;
}

std::string ReportJsonSerializer::discriminationReportToJson(const DiscriminationReport& report, bool pretty)
{
    Document doc;
    doc.SetObject();
    Allocator& allocator = doc.GetAllocator();

    doc.AddMember("generated_at", timestampValue(report.generatedAt, allocator), allocator);
    doc.AddMember("min_responses", count(report.minResponses), allocator);

    doc.AddMember("summary", sectionValue(report.summary, [&](const DiscriminationSummary& s) {
        return serializeSummary(s, allocator);
    }, allocator), allocator);

    doc.AddMember("by_difficulty", sectionValue(report.byDifficulty,
        [&](const std::map<DifficultyTier, GroupStatistics>& groups) {
            Value obj(kObjectType);
            for (const auto& entry : groups)
                obj.AddMember(stringValue(toString(entry.first), allocator),
                              serializeGroup(entry.second, allocator), allocator);
            return obj;
        }, allocator), allocator);

    doc.AddMember("by_type", sectionValue(report.byType,
        [&](const std::map<ItemType, GroupStatistics>& groups) {
            Value obj(kObjectType);
            for (const auto& entry : groups)
                obj.AddMember(stringValue(toString(entry.first), allocator),
                              serializeGroup(entry.second, allocator), allocator);
            return obj;
        }, allocator), allocator);

    doc.AddMember("action_needed", sectionValue(report.actionNeeded, [&](const ActionNeeded& a) {
        Value obj(kObjectType);
        Value immediate(kArrayType);
        for (const auto& item : a.immediateReview)
            immediate.PushBack(serializeActionItem(item, allocator), allocator);
        Value monitor(kArrayType);
        for (const auto& item : a.monitor)
            monitor.PushBack(serializeActionItem(item, allocator), allocator);
        obj.AddMember("immediate_review", immediate, allocator);
        obj.AddMember("monitor", monitor, allocator);
        return obj;
    }, allocator), allocator);

    doc.AddMember("trends", sectionValue(report.trends, [&](const DiscriminationTrends& t) {
        return serializeTrends(t, allocator);
    }, allocator), allocator);

    return toJsonString(doc, pretty);
}

std::string ReportJsonSerializer::discriminationDetailToJson(const DiscriminationDetail& detail, bool pretty)
{
    Document doc;
    doc.SetObject();
    Allocator& allocator = doc.GetAllocator();

    doc.AddMember("item_id", static_cast<int64_t>(detail.itemId), allocator);
    doc.AddMember("difficulty", stringValue(toString(detail.difficulty), allocator), allocator);
    doc.AddMember("type", stringValue(toString(detail.type), allocator), allocator);
    doc.AddMember("discrimination", optionalValue(detail.discrimination), allocator);
    doc.AddMember("tier", detail.tier ? stringValue(analysis::toString(*detail.tier), allocator)
                                      : Value(kNullType), allocator);
    doc.AddMember("response_count", count(detail.responseCount), allocator);
    doc.AddMember("percentile_rank", optionalValue(detail.percentileRank), allocator);

    Value comparison(kObjectType);
    comparison.AddMember("type_average", optionalValue(detail.typeAverage), allocator);
    comparison.AddMember("type_comparison",
                         detail.comparedToType ? stringValue(toString(*detail.comparedToType), allocator)
                                               : Value(kNullType), allocator);
    comparison.AddMember("difficulty_average", optionalValue(detail.difficultyAverage), allocator);
    comparison.AddMember("difficulty_comparison",
                         detail.comparedToDifficulty ? stringValue(toString(*detail.comparedToDifficulty), allocator)
                                                     : Value(kNullType), allocator);
    doc.AddMember("compared_to", comparison, allocator);

    doc.AddMember("quality_flag", stringValue(toString(detail.qualityFlag), allocator), allocator);
    doc.AddMember("quality_flag_reason",
                  detail.qualityFlagReason ? stringValue(*detail.qualityFlagReason, allocator) : Value(kNullType),
                  allocator);
    doc.AddMember("quality_flag_updated_at",
                  detail.qualityFlagUpdatedAt ? timestampValue(*detail.qualityFlagUpdatedAt, allocator)
                                              : Value(kNullType), allocator);

    Value history(kArrayType);
    for (const auto& t : detail.history)
    {
        Value entry(kObjectType);
        entry.AddMember("from", stringValue(toString(t.from), allocator), allocator);
        entry.AddMember("to", stringValue(toString(t.to), allocator), allocator);
        entry.AddMember("reason", stringValue(t.reason, allocator), allocator);
        entry.AddMember("at", timestampValue(t.at, allocator), allocator);
        entry.AddMember("source", stringValue(toString(t.source), allocator), allocator);
        history.PushBack(entry, allocator);
    }
    doc.AddMember("history", history, allocator);

    return toJsonString(doc, pretty);
}

// --------------------------------------------------------------- reliability

Value ReportJsonSerializer::serializeAlpha(const reliability::AlphaResult& alpha, Allocator& allocator)
{
    Value obj(kObjectType);
    obj.AddMember("cronbachs_alpha", optionalValue(alpha.alpha), allocator);
    obj.AddMember("interpretation",
                  alpha.interpretation ? stringValue(reliability::toString(*alpha.interpretation), allocator)
                                       : Value(kNullType), allocator);
    obj.AddMember("meets_threshold", alpha.meetsThreshold, allocator);
    obj.AddMember("num_sessions", count(alpha.numSessions), allocator);
    obj.AddMember("num_items", count(alpha.numItems), allocator);
    obj.AddMember("insufficient_data", alpha.insufficientData, allocator);
    if (!alpha.message.empty())
        obj.AddMember("message", stringValue(alpha.message, allocator), allocator);

    Value correlations(kObjectType);
    for (const auto& c : alpha.itemTotalCorrelations)
        correlations.AddMember(stringValue(std::to_string(c.itemId), allocator), Value(c.correlation), allocator);
    obj.AddMember("item_total_correlations", correlations, allocator);

    Value problematic(kArrayType);
    for (const auto& p : alpha.problematicItems)
    {
        Value entry(kObjectType);
        entry.AddMember("item_id", static_cast<int64_t>(p.itemId), allocator);
        entry.AddMember("correlation", p.correlation, allocator);
        entry.AddMember("recommendation", stringValue(p.recommendation, allocator), allocator);
        problematic.PushBack(entry, allocator);
    }
    obj.AddMember("problematic_items", problematic, allocator);
    return obj;
}

Value ReportJsonSerializer::serializeTestRetest(const reliability::TestRetestResult& retest, Allocator& allocator)
{
    Value obj(kObjectType);
    obj.AddMember("correlation", optionalValue(retest.correlation), allocator);
    obj.AddMember("interpretation",
                  retest.interpretation ? stringValue(reliability::toString(*retest.interpretation), allocator)
                                        : Value(kNullType), allocator);
    obj.AddMember("meets_threshold", retest.meetsThreshold, allocator);
    obj.AddMember("num_pairs", count(retest.numPairs), allocator);
    obj.AddMember("mean_interval_days", optionalValue(retest.meanIntervalDays), allocator);
    obj.AddMember("practice_effect", optionalValue(retest.meanScoreChange), allocator);
    obj.AddMember("score_change_sd", optionalValue(retest.scoreChangeSD), allocator);
    obj.AddMember("large_practice_effect", retest.practiceEffectDetected, allocator);
    obj.AddMember("insufficient_data", retest.insufficientData, allocator);
    if (!retest.message.empty())
        obj.AddMember("message", stringValue(retest.message, allocator), allocator);
    return obj;
}

Value ReportJsonSerializer::serializeSplitHalf(const reliability::SplitHalfResult& split, Allocator& allocator)
{
    Value obj(kObjectType);
    obj.AddMember("raw_correlation", optionalValue(split.halfCorrelation), allocator);
    obj.AddMember("spearman_brown", optionalValue(split.spearmanBrown), allocator);
    obj.AddMember("interpretation",
                  split.interpretation ? stringValue(reliability::toString(*split.interpretation), allocator)
                                       : Value(kNullType), allocator);
    obj.AddMember("meets_threshold", split.meetsThreshold, allocator);
    obj.AddMember("num_sessions", count(split.numSessions), allocator);
    obj.AddMember("num_items", count(split.numItems), allocator);
    obj.AddMember("insufficient_data", split.insufficientData, allocator);
    if (!split.message.empty())
        obj.AddMember("message", stringValue(split.message, allocator), allocator);
    return obj;
}

Value ReportJsonSerializer::serializeMetric(const ReliabilityMetric& metric, Allocator& allocator)
{
    Value obj(kObjectType);
    obj.AddMember("metric_type", stringValue(toString(metric.type), allocator), allocator);
    obj.AddMember("value", metric.value, allocator);
    obj.AddMember("sample_size", count(metric.sampleSize), allocator);
    obj.AddMember("calculated_at", timestampValue(metric.calculatedAt, allocator), allocator);

    Value details(kObjectType);
    for (const auto& entry : metric.details)
        details.AddMember(stringValue(entry.first, allocator), stringValue(entry.second, allocator), allocator);
    obj.AddMember("details", details, allocator);
    return obj;
}

std::string ReportJsonSerializer::reliabilityReportToJson(const ReliabilityReport& report, bool pretty)
{
    Document doc;
    doc.SetObject();
    Allocator& allocator = doc.GetAllocator();

    doc.AddMember("generated_at", timestampValue(report.generatedAt, allocator), allocator);

    doc.AddMember("internal_consistency", sectionValue(report.internalConsistency,
        [&](const reliability::AlphaResult& a) { return serializeAlpha(a, allocator); }, allocator), allocator);
    doc.AddMember("test_retest", sectionValue(report.testRetest,
        [&](const reliability::TestRetestResult& t) { return serializeTestRetest(t, allocator); }, allocator), allocator);
    doc.AddMember("split_half", sectionValue(report.splitHalf,
        [&](const reliability::SplitHalfResult& s) { return serializeSplitHalf(s, allocator); }, allocator), allocator);

    doc.AddMember("overall_status", stringValue(reliability::toString(report.overallStatus), allocator), allocator);

    Value recommendations(kArrayType);
    for (const auto& r : report.recommendations)
    {
        Value entry(kObjectType);
        entry.AddMember("type", stringValue(reliability::toString(r.category), allocator), allocator);
        entry.AddMember("priority", stringValue(reliability::toString(r.priority), allocator), allocator);
        entry.AddMember("message", stringValue(r.message, allocator), allocator);
        recommendations.PushBack(entry, allocator);
    }
    doc.AddMember("recommendations", recommendations, allocator);

    doc.AddMember("trends", sectionValue(report.trends, [&](const std::vector<MetricTrend>& trends) {
        Value obj(kObjectType);
        for (const auto& t : trends)
        {
            Value entry(kObjectType);
            entry.AddMember("latest", optionalValue(t.latest), allocator);
            entry.AddMember("delta_30_days", optionalValue(t.delta30Days), allocator);
            entry.AddMember("observations", count(t.observations), allocator);
            obj.AddMember(stringValue(toString(t.type), allocator), entry, allocator);
        }
        return obj;
    }, allocator), allocator);

    doc.AddMember("metrics_stored", count(report.metricsStored), allocator);

    return toJsonString(doc, pretty);
}

std::string ReportJsonSerializer::reliabilityHistoryToJson(const std::vector<ReliabilityMetric>& history, bool pretty)
{
    Document doc;
    doc.SetObject();
    Allocator& allocator = doc.GetAllocator();

    Value metrics(kArrayType);
    for (const auto& m : history)
        metrics.PushBack(serializeMetric(m, allocator), allocator);
    doc.AddMember("metrics", metrics, allocator);
    doc.AddMember("total_count", count(history.size()), allocator);

    return toJsonString(doc, pretty);
}

} // namespace reporting
} // namespace psychometrics
