#pragma once

#include <vector>

#include "tempo/data/Event.hpp"
#include "tempo/data/TimeRange.hpp"

namespace tempo {
namespace engine {

// Gaps inside window of at least minDurationSecs that no busy range touches,
// earliest first. Busy ranges outside the window are ignored.
std::vector<data::TimeRange> findFreeSlots(const data::TimeRange &window, qint64 minDurationSecs,
                                           std::vector<data::TimeRange> busy);
std::vector<data::TimeRange> findFreeSlots(const data::TimeRange &window, qint64 minDurationSecs,
                                           const std::vector<data::CalendarEvent> &busyEvents);

} // namespace engine
} // namespace tempo
