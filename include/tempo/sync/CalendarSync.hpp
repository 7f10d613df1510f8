#pragma once

#include "tempo/data/Event.hpp"

namespace tempo {
namespace sync {

// Remote calendar collaborator. Implementations may block and may throw;
// they are only called after the scheduling unit has committed.
class CalendarSync
{
public:
    virtual ~CalendarSync() = default;

    virtual void pushEvent(const data::CalendarEvent &event) = 0;
    virtual void removeEvent(const data::CalendarEvent &event) = 0;
};

} // namespace sync
} // namespace tempo
