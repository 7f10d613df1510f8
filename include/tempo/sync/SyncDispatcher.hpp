#pragma once

#include <QObject>
#include <QString>
#include <QUuid>

#include "tempo/engine/SchedulingEngine.hpp"

namespace tempo {
namespace sync {

class CalendarSync;

// Forwards committed changes to a CalendarSync through a queued connection,
// so remote calls never run inside a scheduling unit.
class SyncDispatcher : public QObject
{
    Q_OBJECT

public:
    SyncDispatcher(engine::SchedulingEngine &engine, CalendarSync &sync, QObject *parent = nullptr);

signals:
    void noticeDispatched(const tempo::engine::CommitNotice &notice);
    void syncFailed(const QUuid &eventId, const QString &message);

private:
    void dispatch(const tempo::engine::CommitNotice &notice);

    CalendarSync &m_sync;
};

} // namespace sync
} // namespace tempo
