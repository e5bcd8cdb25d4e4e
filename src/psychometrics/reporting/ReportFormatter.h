#pragma once

#include "reporting/ReportTypes.h"

#include <ostream>

namespace psychometrics
{
namespace reporting
{

/**
 * @brief Plain-text rendering of the admin reports.
 *
 * Unavailable sections are printed with their error so an operator can see
 * which part of a report failed.
 */
class ReportFormatter
{
public:
    static void writeDiscriminationReport(std::ostream& os, const DiscriminationReport& report);

    static void writeDiscriminationDetail(std::ostream& os, const DiscriminationDetail& detail);

    static void writeReliabilityReport(std::ostream& os, const ReliabilityReport& report);

private:
    static void writeHeader(std::ostream& os, const std::string& title, const Timestamp& generatedAt);

    template <class T>
    static bool writeUnavailable(std::ostream& os, const ReportSection<T>& section, const std::string& name)
    {
        if (section.available())
            return false;
        os << name << ": unavailable (" << section.error << ")" << std::endl;
        return true;
    }
};

} // namespace reporting
} // namespace psychometrics
