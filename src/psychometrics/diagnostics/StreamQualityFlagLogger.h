#pragma once
#include "IQualityFlagObserver.h"
#include <mutex>
#include <ostream>

namespace psychometrics::diagnostics {

/**
 * @brief Writes one WARNING line per newly flagged item.
 *
 * Writes are serialized so lines from concurrent statistics jobs never
 * interleave.
 */
class StreamQualityFlagLogger : public IQualityFlagObserver {
public:
    explicit StreamQualityFlagLogger(std::ostream& os);
    ~StreamQualityFlagLogger() override = default;

    void onItemFlagged(const QualityFlagEvent& event) override;

private:
    std::ostream& m_os;
    std::mutex m_mutex;
};

} // namespace psychometrics::diagnostics
