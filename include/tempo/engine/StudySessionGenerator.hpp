#pragma once

#include <vector>

#include "tempo/core/SchedulerSettings.hpp"
#include "tempo/data/Event.hpp"

namespace tempo {
namespace engine {

// Builds preparation sessions on the days right before an exam. The sessions
// are not stored; the engine inserts and reconciles them.
class StudySessionGenerator
{
public:
    explicit StudySessionGenerator(const core::SchedulerSettings &settings);

    std::vector<data::CalendarEvent> generate(const data::CalendarEvent &exam) const;
    std::vector<data::CalendarEvent> generate(const data::CalendarEvent &exam, int count, int durationMinutes) const;

private:
    const core::SchedulerSettings &m_settings;
};

} // namespace engine
} // namespace tempo
