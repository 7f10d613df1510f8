#include "tempo/engine/ConflictResolver.hpp"

#include "tempo/core/Logging.hpp"
#include "tempo/engine/FreeSlotFinder.hpp"

#include <QSet>
#include <algorithm>

namespace tempo {
namespace engine {

bool ResolutionResult::wasMoved(const QUuid &id) const
{
    return std::find(moved.begin(), moved.end(), id) != moved.end();
}

bool ResolutionResult::isUnresolved(const QUuid &id) const
{
    return std::find(unresolved.begin(), unresolved.end(), id) != unresolved.end();
}

ResolutionResult resolveConflicts(const std::vector<data::CalendarEvent> &events,
                                  const data::CategoryTable &categories, int horizonDays,
                                  const std::vector<data::CalendarEvent> &context)
{
    ResolutionResult result;
    if (events.empty()) {
        return result;
    }

    std::vector<data::CalendarEvent> ordered = events;
    std::stable_sort(ordered.begin(), ordered.end(),
                     [&categories](const data::CalendarEvent &lhs, const data::CalendarEvent &rhs) {
                         const int lhsPriority = categories.priorityOf(lhs.category);
                         const int rhsPriority = categories.priorityOf(rhs.category);
                         if (lhsPriority != rhsPriority) {
                             return lhsPriority > rhsPriority;
                         }
                         return lhs.start < rhs.start;
                     });

    std::vector<data::CalendarEvent> finalized;
    std::vector<data::CalendarEvent> deferred;
    for (const auto &event : ordered) {
        const bool blocked = std::any_of(finalized.begin(), finalized.end(),
                                         [&event](const data::CalendarEvent &placed) { return event.overlaps(placed); });
        if (blocked) {
            deferred.push_back(event);
        } else {
            finalized.push_back(event);
        }
    }

    QSet<QUuid> resolvedIds;
    for (const auto &event : events) {
        resolvedIds.insert(event.id);
    }
    std::vector<data::CalendarEvent> background;
    for (const auto &event : context) {
        if (!resolvedIds.contains(event.id)) {
            background.push_back(event);
        }
    }

    for (auto event : deferred) {
        if (!event.flexible) {
            qCInfo(lcEngine) << "fixed event" << event.title << "left in conflict at" << event.start;
            result.unresolved.push_back(event.id);
            finalized.push_back(event);
            continue;
        }

        std::vector<data::CalendarEvent> busy = finalized;
        busy.insert(busy.end(), background.begin(), background.end());

        const qint64 duration = event.durationSecs();
        const data::TimeRange horizon{ event.start, event.start.addDays(horizonDays) };
        const auto slots = findFreeSlots(horizon, duration, busy);
        if (slots.empty()) {
            qCWarning(lcEngine) << "no free slot for" << event.title << "within" << horizonDays << "days";
            result.unresolved.push_back(event.id);
            finalized.push_back(event);
            continue;
        }

        const QDateTime newStart = slots.front().start;
        if (newStart != event.start) {
            qCDebug(lcEngine) << "moving" << event.title << "from" << event.start << "to" << newStart;
            event.start = newStart;
            event.end = newStart.addSecs(duration);
            result.moved.push_back(event.id);
        }
        finalized.push_back(event);
    }

    result.events = std::move(finalized);
    return result;
}

} // namespace engine
} // namespace tempo
