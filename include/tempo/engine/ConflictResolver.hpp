#pragma once

#include <QUuid>
#include <vector>

#include "tempo/data/CategoryTable.hpp"
#include "tempo/data/Event.hpp"

namespace tempo {
namespace engine {

struct ResolutionResult
{
    std::vector<data::CalendarEvent> events;
    std::vector<QUuid> moved;
    // Left at their original, still conflicting time.
    std::vector<QUuid> unresolved;

    bool hasUnresolved() const { return !unresolved.empty(); }
    bool wasMoved(const QUuid &id) const;
    bool isUnresolved(const QUuid &id) const;
};

// Greedy priority resolution: events are visited by descending priority, then
// start. An event overlapping an already placed one is deferred and later moved
// into the earliest free slot of the same length within horizonDays of its
// original start. Fixed events and events without a slot keep their time and
// are reported as unresolved. context holds events that block slots but are
// never moved or returned.
ResolutionResult resolveConflicts(const std::vector<data::CalendarEvent> &events,
                                  const data::CategoryTable &categories, int horizonDays = 30,
                                  const std::vector<data::CalendarEvent> &context = {});

} // namespace engine
} // namespace tempo
