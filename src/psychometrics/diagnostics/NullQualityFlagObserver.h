#pragma once
#include "IQualityFlagObserver.h"

namespace psychometrics::diagnostics {

class NullQualityFlagObserver : public IQualityFlagObserver {
public:
    NullQualityFlagObserver() = default;
    ~NullQualityFlagObserver() override = default;

    void onItemFlagged(const QualityFlagEvent& /*event*/) override {}
};

} // namespace psychometrics::diagnostics
