#pragma once

#include <optional>
#include <vector>

#include "tempo/data/Category.hpp"

namespace tempo {
namespace data {

// Immutable priority hierarchy, ordered from most to least important.
// Names are unique (case-insensitive) and priorities form a strict total order.
class CategoryTable
{
public:
    CategoryTable() = default;
    explicit CategoryTable(std::vector<Category> categories);

    static CategoryTable defaultHierarchy();

    std::optional<Category> find(const QString &name) const;
    bool contains(const QString &name) const;
    int priorityOf(const QString &name) const;

    const std::vector<Category> &categories() const;
    bool isEmpty() const;

private:
    std::vector<Category> m_categories;
};

} // namespace data
} // namespace tempo
