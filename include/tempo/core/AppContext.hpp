#pragma once

#include <memory>

#include "tempo/core/SchedulerSettings.hpp"

namespace tempo {
namespace data {
class DataProvider;
class EventRepository;
class AuditLog;
}
namespace engine {
class SchedulingEngine;
}

namespace core {

class AppContext
{
public:
    explicit AppContext(SchedulerSettings settings);
    ~AppContext();

    data::EventRepository &eventRepository();
    data::AuditLog &auditLog();
    engine::SchedulingEngine &engine();
    const SchedulerSettings &settings() const;

private:
    SchedulerSettings m_settings;
    std::unique_ptr<data::DataProvider> m_dataProvider;
    std::unique_ptr<engine::SchedulingEngine> m_engine;
};

} // namespace core
} // namespace tempo
