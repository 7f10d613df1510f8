#pragma once

#include <QString>

namespace tempo {
namespace data {

struct Category
{
    QString name;
    int priority = 0; // higher wins a contested slot
    QString color;
    QString description;
};

} // namespace data
} // namespace tempo
