#include "tempo/engine/FreeSlotFinder.hpp"

#include <algorithm>

namespace tempo {
namespace engine {

std::vector<data::TimeRange> findFreeSlots(const data::TimeRange &window, qint64 minDurationSecs,
                                           std::vector<data::TimeRange> busy)
{
    std::vector<data::TimeRange> slots;
    if (!window.isValid()) {
        return slots;
    }

    busy.erase(std::remove_if(busy.begin(), busy.end(),
                              [&window](const data::TimeRange &range) {
                                  return !range.isValid() || !range.overlaps(window);
                              }),
               busy.end());
    std::stable_sort(busy.begin(), busy.end(), [](const data::TimeRange &lhs, const data::TimeRange &rhs) {
        return lhs.start < rhs.start;
    });

    QDateTime cursor = window.start;
    for (const auto &range : busy) {
        if (cursor < range.start && cursor.secsTo(range.start) >= minDurationSecs) {
            slots.push_back({ cursor, range.start });
        }
        if (range.end > cursor) {
            cursor = range.end;
        }
    }
    if (cursor < window.end && cursor.secsTo(window.end) >= minDurationSecs) {
        slots.push_back({ cursor, window.end });
    }
    return slots;
}

std::vector<data::TimeRange> findFreeSlots(const data::TimeRange &window, qint64 minDurationSecs,
                                           const std::vector<data::CalendarEvent> &busyEvents)
{
    std::vector<data::TimeRange> busy;
    busy.reserve(busyEvents.size());
    for (const auto &event : busyEvents) {
        busy.push_back(event.range());
    }
    return findFreeSlots(window, minDurationSecs, std::move(busy));
}

} // namespace engine
} // namespace tempo
