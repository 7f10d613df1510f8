#pragma once

#include <QHash>
#include <QMutex>
#include <QString>
#include <memory>

namespace tempo {
namespace core {

// One mutex per owner. Mutations of different owners never contend.
// Entries are never evicted; the registry grows with the number of distinct owners.
class OwnerLocks
{
public:
    OwnerLocks();
    ~OwnerLocks();

    QMutex *lockFor(const QString &owner);
    int size() const;

private:
    mutable QMutex m_registryMutex;
    QHash<QString, std::shared_ptr<QMutex>> m_locks;
};

} // namespace core
} // namespace tempo
