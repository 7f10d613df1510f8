#include "tempo/data/CategoryTable.hpp"

#include "tempo/core/Errors.hpp"

#include <QObject>
#include <algorithm>

namespace tempo {
namespace data {

CategoryTable::CategoryTable(std::vector<Category> categories)
    : m_categories(std::move(categories))
{
    std::sort(m_categories.begin(), m_categories.end(), [](const Category &lhs, const Category &rhs) {
        return lhs.priority > rhs.priority;
    });
    for (std::size_t i = 0; i < m_categories.size(); ++i) {
        const Category &category = m_categories[i];
        if (category.name.trimmed().isEmpty()) {
            throw core::ValidationError(QObject::tr("Category name must not be empty"));
        }
        for (std::size_t j = i + 1; j < m_categories.size(); ++j) {
            if (m_categories[j].name.compare(category.name, Qt::CaseInsensitive) == 0) {
                throw core::ValidationError(QObject::tr("Duplicate category '%1'").arg(category.name));
            }
            if (m_categories[j].priority == category.priority) {
                throw core::ValidationError(QObject::tr("Categories '%1' and '%2' share priority %3")
                                                .arg(category.name, m_categories[j].name)
                                                .arg(category.priority));
            }
        }
    }
}

CategoryTable CategoryTable::defaultHierarchy()
{
    return CategoryTable({
        { QStringLiteral("Exam"), 5, QStringLiteral("#FF0000"), QStringLiteral("Exams and tests") },
        { QStringLiteral("Study"), 4, QStringLiteral("#FFA500"), QStringLiteral("Study sessions") },
        { QStringLiteral("Gym"), 3, QStringLiteral("#00FF00"), QStringLiteral("Gym and fitness activities") },
        { QStringLiteral("Social"), 2, QStringLiteral("#0000FF"), QStringLiteral("Social events and gatherings") },
        { QStringLiteral("Gaming"), 1, QStringLiteral("#800080"), QStringLiteral("Gaming and entertainment") },
    });
}

std::optional<Category> CategoryTable::find(const QString &name) const
{
    const auto it = std::find_if(m_categories.begin(), m_categories.end(), [&name](const Category &category) {
        return category.name.compare(name, Qt::CaseInsensitive) == 0;
    });
    if (it == m_categories.end()) {
        return std::nullopt;
    }
    return *it;
}

bool CategoryTable::contains(const QString &name) const
{
    return find(name).has_value();
}

int CategoryTable::priorityOf(const QString &name) const
{
    const auto category = find(name);
    return category ? category->priority : 0;
}

const std::vector<Category> &CategoryTable::categories() const
{
    return m_categories;
}

bool CategoryTable::isEmpty() const
{
    return m_categories.empty();
}

} // namespace data
} // namespace tempo
