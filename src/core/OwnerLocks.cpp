#include "tempo/core/OwnerLocks.hpp"

#include <QMutexLocker>

namespace tempo {
namespace core {

OwnerLocks::OwnerLocks() = default;
OwnerLocks::~OwnerLocks() = default;

QMutex *OwnerLocks::lockFor(const QString &owner)
{
    QMutexLocker locker(&m_registryMutex);
    auto it = m_locks.find(owner);
    if (it == m_locks.end()) {
        it = m_locks.insert(owner, std::make_shared<QMutex>());
    }
    return it.value().get();
}

int OwnerLocks::size() const
{
    QMutexLocker locker(&m_registryMutex);
    return m_locks.size();
}

} // namespace core
} // namespace tempo
