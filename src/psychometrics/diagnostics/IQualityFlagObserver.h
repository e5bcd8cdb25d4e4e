#pragma once

#include "PsychometricTypes.h"
#include <string>

namespace psychometrics::diagnostics {

struct QualityFlagEvent {
    ItemId itemId = 0;
    double discrimination = 0.0;
    std::size_t responseCount = 0;
    std::string reason;
    Timestamp flaggedAt;
};

class IQualityFlagObserver {
public:
    virtual ~IQualityFlagObserver() = default;

    // Called once per item newly moved to under_review
    virtual void onItemFlagged(const QualityFlagEvent& event) = 0;
};

} // namespace psychometrics::diagnostics
