#pragma once

#include <vector>

#include "tempo/data/Event.hpp"

namespace tempo {
namespace engine {

struct ConflictPair
{
    data::CalendarEvent first; // the earlier starting event
    data::CalendarEvent second;
};

// Every pair of events whose half-open ranges overlap, including nested ones.
std::vector<ConflictPair> detectConflicts(const std::vector<data::CalendarEvent> &events);

} // namespace engine
} // namespace tempo
