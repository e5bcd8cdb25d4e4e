#pragma once

#include "PsychometricTypes.h"
#include <functional>
#include <string>

namespace psychometrics
{
namespace utils
{

/**
 * @brief Source of "now" for every component that stamps a record.
 *
 * Components take a Clock so tests can pin time and move it forward.
 */
using Clock = std::function<Timestamp()>;

/**
 * @brief Current UTC time with microsecond resolution
 */
Timestamp currentTimestamp();

/**
 * @brief Clock backed by currentTimestamp()
 */
Clock systemClock();

/**
 * @brief Fractional number of days from @p from to @p to (negative if to < from)
 */
double daysBetween(const Timestamp& from, const Timestamp& to);

/**
 * @brief ISO 8601 rendering, e.g. "2024-08-25T14:30:00"
 */
std::string formatTimestamp(const Timestamp& ts);

} // namespace utils
} // namespace psychometrics
