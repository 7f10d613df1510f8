#include "tempo/sync/SyncDispatcher.hpp"

#include "tempo/core/Logging.hpp"
#include "tempo/sync/CalendarSync.hpp"

#include <exception>

namespace tempo {
namespace sync {

SyncDispatcher::SyncDispatcher(engine::SchedulingEngine &engine, CalendarSync &sync, QObject *parent)
    : QObject(parent)
    , m_sync(sync)
{
    connect(&engine, &engine::SchedulingEngine::changesCommitted, this, &SyncDispatcher::dispatch,
            Qt::QueuedConnection);
}

void SyncDispatcher::dispatch(const engine::CommitNotice &notice)
{
    qCDebug(lcSync) << "syncing" << notice.saved.size() << "saved and" << notice.removed.size()
                    << "removed events for" << notice.owner;

    // A failed event is reported and the remaining ones are still sent.
    for (const auto &event : notice.saved) {
        try {
            m_sync.pushEvent(event);
        } catch (const std::exception &error) {
            qCWarning(lcSync) << "push of" << event.id << "failed:" << error.what();
            emit syncFailed(event.id, QString::fromUtf8(error.what()));
        }
    }
    for (const auto &event : notice.removed) {
        try {
            m_sync.removeEvent(event);
        } catch (const std::exception &error) {
            qCWarning(lcSync) << "removal of" << event.id << "failed:" << error.what();
            emit syncFailed(event.id, QString::fromUtf8(error.what()));
        }
    }
    emit noticeDispatched(notice);
}

} // namespace sync
} // namespace tempo
