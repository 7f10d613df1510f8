#include "tempo/engine/ConflictDetector.hpp"

#include <algorithm>

namespace tempo {
namespace engine {

std::vector<ConflictPair> detectConflicts(const std::vector<data::CalendarEvent> &events)
{
    std::vector<data::CalendarEvent> sorted = events;
    std::stable_sort(sorted.begin(), sorted.end(), [](const data::CalendarEvent &lhs, const data::CalendarEvent &rhs) {
        return lhs.start < rhs.start;
    });

    std::vector<ConflictPair> conflicts;
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        const auto &current = sorted[i];
        for (std::size_t j = i + 1; j < sorted.size(); ++j) {
            const auto &later = sorted[j];
            // Nothing starting at or after current.end can overlap it.
            if (later.start >= current.end) {
                break;
            }
            if (current.overlaps(later)) {
                conflicts.push_back({ current, later });
            }
        }
    }
    return conflicts;
}

} // namespace engine
} // namespace tempo
