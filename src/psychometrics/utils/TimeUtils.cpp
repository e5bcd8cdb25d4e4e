#include "utils/TimeUtils.h"

namespace psychometrics
{
namespace utils
{

Timestamp currentTimestamp()
{
    return boost::posix_time::microsec_clock::universal_time();
}

Clock systemClock()
{
    return []() { return currentTimestamp(); };
}

double daysBetween(const Timestamp& from, const Timestamp& to)
{
    const boost::posix_time::time_duration d = to - from;
    return static_cast<double>(d.total_seconds()) / 86400.0;
}

std::string formatTimestamp(const Timestamp& ts)
{
    if (ts.is_not_a_date_time())
        return "n/a";
    return boost::posix_time::to_iso_extended_string(ts);
}

} // namespace utils
} // namespace psychometrics
