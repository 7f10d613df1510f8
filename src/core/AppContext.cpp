#include "tempo/core/AppContext.hpp"

#include "tempo/data/DataProvider.hpp"
#include "tempo/engine/SchedulingEngine.hpp"

namespace tempo {
namespace core {

AppContext::AppContext(SchedulerSettings settings)
    : m_settings(std::move(settings))
    , m_dataProvider(std::make_unique<data::DataProvider>(m_settings.storagePath))
    , m_engine(std::make_unique<engine::SchedulingEngine>(m_dataProvider->eventRepository(),
                                                          m_dataProvider->auditLog(), m_settings))
{
}

AppContext::~AppContext() = default;

data::EventRepository &AppContext::eventRepository()
{
    return m_dataProvider->eventRepository();
}

data::AuditLog &AppContext::auditLog()
{
    return m_dataProvider->auditLog();
}

engine::SchedulingEngine &AppContext::engine()
{
    return *m_engine;
}

const SchedulerSettings &AppContext::settings() const
{
    return m_settings;
}

} // namespace core
} // namespace tempo
