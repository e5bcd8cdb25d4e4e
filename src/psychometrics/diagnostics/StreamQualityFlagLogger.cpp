#include "StreamQualityFlagLogger.h"
#include <iomanip>
#include <sstream>

namespace psychometrics::diagnostics {

StreamQualityFlagLogger::StreamQualityFlagLogger(std::ostream& os)
    : m_os(os)
{}

void StreamQualityFlagLogger::onItemFlagged(const QualityFlagEvent& event)
{
    // Format outside the lock
    std::ostringstream line;
    line << "[QualityFlag] WARNING item " << event.itemId
         << " auto-flagged under_review: discrimination="
         << std::fixed << std::setprecision(4) << event.discrimination
         << " responses=" << event.responseCount
         << " at " << boost::posix_time::to_iso_extended_string(event.flaggedAt)
         << "\n";

    std::lock_guard<std::mutex> lock(m_mutex);
    m_os << line.str();
    m_os.flush();
}

} // namespace psychometrics::diagnostics
