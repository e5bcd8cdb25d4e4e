#pragma once

#include "reporting/ReportTypes.h"

#include <string>
#include <vector>
#include <rapidjson/document.h>

namespace psychometrics
{
namespace reporting
{

/**
 * @brief JSON rendering of the admin reports.
 *
 * Field names follow the snake_case vocabulary of the domain
 * ("immediate_review", "meets_threshold", ...). Missing values are written
 * as null, never as 0. An Unavailable section becomes
 * {"status": "unavailable", "error": "..."}.
 */
class ReportJsonSerializer
{
public:
    static std::string discriminationReportToJson(const DiscriminationReport& report, bool pretty = true);

    static std::string discriminationDetailToJson(const DiscriminationDetail& detail, bool pretty = true);

    static std::string reliabilityReportToJson(const ReliabilityReport& report, bool pretty = true);

    static std::string reliabilityHistoryToJson(const std::vector<ReliabilityMetric>& history, bool pretty = true);

private:
    using Allocator = rapidjson::Document::AllocatorType;

    static rapidjson::Value serializeSummary(const DiscriminationSummary& summary, Allocator& allocator);
    static rapidjson::Value serializeGroup(const GroupStatistics& group, Allocator& allocator);
    static rapidjson::Value serializeActionItem(const ActionItem& item, Allocator& allocator);
    static rapidjson::Value serializeTrends(const DiscriminationTrends& trends, Allocator& allocator);

    static rapidjson::Value serializeAlpha(const reliability::AlphaResult& alpha, Allocator& allocator);
    static rapidjson::Value serializeTestRetest(const reliability::TestRetestResult& retest, Allocator& allocator);
    static rapidjson::Value serializeSplitHalf(const reliability::SplitHalfResult& split, Allocator& allocator);
    static rapidjson::Value serializeMetric(const ReliabilityMetric& metric, Allocator& allocator);

    static std::string toJsonString(const rapidjson::Document& doc, bool pretty);
};

} // namespace reporting
} // namespace psychometrics
